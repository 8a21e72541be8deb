/**
 * midiroute - MIDI endpoint routing and message coercion
 * Copyright (C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301 USA
 */

#pragma once
#include "formatterhelper.hpp"
#include <exception>
#include <string>

namespace midiroute {
class exception : public std::exception {
  std::string msg;

public:
  template <typename... Args>
  exception(FMT::format_string<Args...> msg, Args &&...args)
      : msg(FMT::format(msg, std::forward<Args>(args)...)) {}
  const char *what() const noexcept override { return msg.c_str(); }
};

/// Invalid byte layout for a MIDI message
class malformed_message : public exception {
public:
  using exception::exception;
};

/// The endpoint can not transmit, or can not receive, as requested
class unsupported_direction : public exception {
public:
  using exception::exception;
};

/// No device matches a name and capability query
class not_found : public exception {
public:
  using exception::exception;
};

/// Error reported by the platform MIDI stack. Keeps the platform error code.
class transport_failure : public exception {
  int code_ = 0;

public:
  template <typename... Args>
  transport_failure(int code, FMT::format_string<Args...> msg, Args &&...args)
      : exception("{} ({})",
                  FMT::format(msg, std::forward<Args>(args)...), code),
        code_(code) {}
  int code() const { return code_; }
};

class ini_exception : public exception {
public:
  template <typename... Args>
  ini_exception(const std::string &filename, int lineno,
                FMT::format_string<Args...> msg, Args &&...args)
      : exception("Error parsing INI configuration at {}:{}: {}", filename,
                  lineno, FMT::format(msg, std::forward<Args>(args)...)) {}
};
} // namespace midiroute
