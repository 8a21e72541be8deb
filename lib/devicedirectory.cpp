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

#include <midiroute/devicedirectory.hpp>
#include <midiroute/exceptions.hpp>
#include <midiroute/logger.hpp>

namespace midiroute {

transport_t::~transport_t() {}

device_directory_t::device_directory_t(std::shared_ptr<transport_t> transport_)
    : transport(std::move(transport_)) {}

std::vector<std::shared_ptr<device_t>> device_directory_t::list_devices() {
  auto devices = transport->devices();
  DEBUG("Got {} devices from {}", devices.size(), transport->get_type());
  return devices;
}

std::vector<std::shared_ptr<device_t>> device_directory_t::list_inputs() {
  std::vector<std::shared_ptr<device_t>> ret;
  for (auto &device : list_devices()) {
    if (device->can_transmit())
      ret.push_back(device);
  }
  return ret;
}

std::vector<std::shared_ptr<device_t>> device_directory_t::list_outputs() {
  std::vector<std::shared_ptr<device_t>> ret;
  for (auto &device : list_devices()) {
    if (device->can_receive())
      ret.push_back(device);
  }
  return ret;
}

std::shared_ptr<device_t> device_directory_t::find_first(
    const std::function<bool(const device_t &)> &pred) {
  for (auto &device : list_devices()) {
    if (pred(*device))
      return device;
  }
  return nullptr;
}

std::shared_ptr<device_t> device_directory_t::find_input(const std::string &name) {
  auto device = find_first([&name](const device_t &device) {
    return device.name().find(name) != std::string::npos &&
           device.can_transmit();
  });
  if (!device)
    DEBUG("No input device matches \"{}\"", name);
  return device;
}

std::shared_ptr<device_t>
device_directory_t::find_output(const std::string &name) {
  auto device = find_first([&name](const device_t &device) {
    return device.name().find(name) != std::string::npos &&
           device.can_receive();
  });
  if (!device)
    DEBUG("No output device matches \"{}\"", name);
  return device;
}

std::shared_ptr<device_t> device_directory_t::get_input(const std::string &name) {
  auto device = find_input(name);
  if (!device) {
    throw not_found("No input device matches \"{}\"", name);
  }
  return device;
}

std::shared_ptr<device_t>
device_directory_t::get_output(const std::string &name) {
  auto device = find_output(name);
  if (!device) {
    throw not_found("No output device matches \"{}\"", name);
  }
  return device;
}

} // namespace midiroute
