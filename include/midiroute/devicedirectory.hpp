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

#include "endpoint.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace midiroute {

/**
 * @short The platform MIDI stack, as seen by the directory
 *
 * devices() is a snapshot at call time. Order is whatever the platform
 * enumerates, and may change between calls.
 */
class transport_t {
public:
  virtual ~transport_t();
  virtual std::vector<std::shared_ptr<device_t>> devices() = 0;
  virtual const char *get_type() const = 0;
};

/**
 * @short Finds devices by name and direction
 *
 * An input is a device the program receives from, so it must be able to
 * transmit. An output is a device the program sends to, so it must be able to
 * receive. Names match by case sensitive substring.
 */
class device_directory_t {
  std::shared_ptr<transport_t> transport;

public:
  explicit device_directory_t(std::shared_ptr<transport_t> transport);

  std::vector<std::shared_ptr<device_t>> list_devices();
  std::vector<std::shared_ptr<device_t>> list_inputs();
  std::vector<std::shared_ptr<device_t>> list_outputs();

  /// nullptr if nothing matches
  std::shared_ptr<device_t> find_input(const std::string &name);
  /// nullptr if nothing matches
  std::shared_ptr<device_t> find_output(const std::string &name);

  /// As find_*, but throws not_found
  std::shared_ptr<device_t> get_input(const std::string &name);
  std::shared_ptr<device_t> get_output(const std::string &name);

  std::shared_ptr<device_t>
  find_first(const std::function<bool(const device_t &)> &pred);
};
} // namespace midiroute
