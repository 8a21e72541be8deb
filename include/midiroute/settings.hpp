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
#include <string>

namespace midiroute {

struct settings_t {
  /// Name of our ALSA sequencer client
  std::string client_name = "midiroute";
  /// Show ALSA client 0 (System timer and announce ports)
  bool include_system_ports = false;
  /// Show our own private ports
  bool include_own_ports = false;
  // Increase seq client pool sizes to 2000, the maximum allowed by the kernel
  int pool_size = 2000;
  int input_buffer_size = 65536;
  int output_buffer_size = 65536;
  std::string log_level = "info";
};

/**
 * @short Reads an INI file over the given settings
 *
 * Sections [general] and [alsa]. Unknown sections or keys are an error,
 * thrown as ini_exception.
 */
void load_ini(const std::string &filename, settings_t &settings);
/// Same, from the text of the file. filename is only for error messages.
void parse_ini(const std::string &data, const std::string &filename,
               settings_t &settings);

bool str_to_bool(const std::string &value);
} // namespace midiroute

BASIC_FORMATTER(midiroute::settings_t, "settings_t[{}, {}, {}, {}, {}, {}, {}]",
                v.client_name, v.include_system_ports, v.include_own_ports,
                v.pool_size, v.input_buffer_size, v.output_buffer_size,
                v.log_level);
