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

#include <cstdint>
#include <cstring>
#include <string_view>

#ifdef USE_LIBFMT
#define FMT fmt
#define MIDIROUTE_FMT_STRING_VIEW fmt::string_view
#include <fmt/format.h>
#else
#define FMT std
#define MIDIROUTE_FMT_STRING_VIEW std::string_view
#include <format>
#endif

/**
 * Formatters for library types. The result is formatted as a string, so
 * width and alignment apply: FMT::format("{:<16}", event_type).
 */
#define BASIC_FORMATTER(T, FORMAT, ...)                                        \
  template <>                                                                  \
  struct FMT::formatter<T> : FMT::formatter<MIDIROUTE_FMT_STRING_VIEW> {       \
    auto format(const T &v, FMT::format_context &ctx) const {                  \
      return FMT::formatter<MIDIROUTE_FMT_STRING_VIEW>::format(                \
          FMT::format(FORMAT, __VA_ARGS__), ctx);                              \
    }                                                                          \
  }

/// For types with a to_string() method
#define TO_STRING_FORMATTER(T) BASIC_FORMATTER(T, "{}", v.to_string())

#define ENUM_FORMATTER_BEGIN(EnumType)                                         \
  template <>                                                                  \
  struct FMT::formatter<EnumType>                                              \
      : FMT::formatter<MIDIROUTE_FMT_STRING_VIEW> {                            \
    auto format(const EnumType &v, FMT::format_context &ctx) const {           \
      const char *name = "unknown";                                            \
      switch (v) {

#define ENUM_FORMATTER_ELEMENT(EnumValue, Str)                                 \
  case EnumValue:                                                              \
    name = Str;                                                                \
    break;

#define ENUM_FORMATTER_END()                                                   \
  }                                                                            \
  return FMT::formatter<MIDIROUTE_FMT_STRING_VIEW>::format(name, ctx);         \
  }                                                                            \
  }
