/**
 * midiroute - MIDI endpoint routing and message coercion
 * Copyright (C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <midiroute/formatterhelper.hpp>
#include <midiroute/settings.hpp>
#include <string>
#include <vector>

namespace midiroute {

enum class action_e {
  LIST,
  MONITOR,
  CONNECT,
  SEND,
};

struct cli_options_t {
  settings_t settings;
  action_e action = action_e::LIST;
  /// Device name substring for monitor and send, or the input for connect
  std::string from;
  /// Output name substring for connect
  std::string to;
  /// Message for send, as hex bytes
  std::string data;
};

/// Parses the argv (without the program name). Exits on --help and
/// --version. Throws exception on bad arguments.
void parse_argv(const std::vector<std::string> &argv, cli_options_t *options);
} // namespace midiroute

ENUM_FORMATTER_BEGIN(midiroute::action_e);
ENUM_FORMATTER_ELEMENT(midiroute::action_e::LIST, "list");
ENUM_FORMATTER_ELEMENT(midiroute::action_e::MONITOR, "monitor");
ENUM_FORMATTER_ELEMENT(midiroute::action_e::CONNECT, "connect");
ENUM_FORMATTER_ELEMENT(midiroute::action_e::SEND, "send");
ENUM_FORMATTER_END();
