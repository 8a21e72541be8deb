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

#include "argv.hpp"
#include <functional>
#include <iostream>
#include <midiroute/exceptions.hpp>
#include <midiroute/logger.hpp>
#include <midiroute/settings.hpp>
#include <string>
#include <vector>

namespace midiroute {

#ifndef MIDIROUTE_VERSION
// NOLINTNEXTLINE
#define MIDIROUTE_VERSION "unknown"
#endif

// NOLINTNEXTLINE
const char *VERSION = MIDIROUTE_VERSION;

// NOLINTNEXTLINE (cppcoreguidelines-pro-bounds-pointer-arithmetic)
constexpr const char *const CMDLINE_HELP = &R"(
midiroute v{}
(C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
Lists, connects, monitors and sends to MIDI devices of the ALSA sequencer.

Device names are matched as case sensitive substrings, and the first
device with the needed direction is used.

Options:
)"[1];

struct argument_t {
  std::string arg;
  std::string comment;
  std::function<void(const std::vector<std::string> &)> fn;
  size_t value_count = 1;

  // NOLINTNEXTLINE
  argument_t(const std::string &arg, const std::string &comment,
             std::function<void(const std::vector<std::string> &)> fn,
             size_t value_count = 1)
      : arg(arg), comment(comment), fn(fn), value_count(value_count) {}
};

static void help(const std::vector<argument_t> &arguments) {
  std::cout << FMT::format(CMDLINE_HELP, VERSION);
  for (auto &argument : arguments) {
    std::cout << FMT::format("  {:<30} {}\n", argument.arg, argument.comment);
  }
}

// Setup the argument options
static void setup_arguments(cli_options_t *options,
                            std::vector<argument_t> &arguments) {
  auto *settings = &options->settings;

  arguments.emplace_back( //
      "--ini",            //
      "Loads an INI file as default configuration. Depending on order may "
      "overwrite other arguments",
      [settings](const std::vector<std::string> &values) {
        load_ini(values[0], *settings);
        logger.set_log_level(str_to_log_level(settings->log_level));
      });
  arguments.emplace_back( //
      "--name",           //
      "ALSA sequencer client name. Default `midiroute`",
      [settings](const std::vector<std::string> &values) {
        settings->client_name = values[0];
      });
  arguments.emplace_back( //
      "--log-level",      //
      "debug | info | warning | error",
      [settings](const std::vector<std::string> &values) {
        logger.set_log_level(str_to_log_level(values[0]));
        settings->log_level = values[0];
      });
  arguments.emplace_back( //
      "--system",         //
      "Also show the ALSA System client ports",
      [settings](const std::vector<std::string> &) {
        settings->include_system_ports = true;
      },
      0);
  arguments.emplace_back( //
      "--list",           //
      "Lists all devices with their directions. Default action.",
      [options](const std::vector<std::string> &) {
        options->action = action_e::LIST;
      },
      0);
  arguments.emplace_back( //
      "--monitor",        //
      "NAME. Prints all messages from the first input matching NAME",
      [options](const std::vector<std::string> &values) {
        options->action = action_e::MONITOR;
        options->from = values[0];
      });
  arguments.emplace_back( //
      "--connect",        //
      "FROM TO. Sends everything from input FROM to output TO",
      [options](const std::vector<std::string> &values) {
        options->action = action_e::CONNECT;
        options->from = values[0];
        options->to = values[1];
      },
      2);
  arguments.emplace_back( //
      "--send",           //
      "NAME HEX. Sends one message, as `\"90 40 7F\"`, to output NAME",
      [options](const std::vector<std::string> &values) {
        options->action = action_e::SEND;
        options->from = values[0];
        options->data = values[1];
      },
      2);
  arguments.emplace_back( //
      "--version",        //
      "Show version",
      [](const std::vector<std::string> &) {
        std::cout << FMT::format("midiroute version {}\n", VERSION);
        exit(0);
      },
      0);
  arguments.emplace_back( //
      "--help",           //
      "Show this help",
      [&](const std::vector<std::string> &) {
        help(arguments);
        exit(0);
      },
      0);
}

// Parses the argv and sets up the cli_options_t struct. Arguments with a
// single value accept both `--key value` and `--key=value`.
void parse_argv(const std::vector<std::string> &argv, cli_options_t *options) {
  std::vector<argument_t> arguments;
  setup_arguments(options, arguments);
  // Necesary for multi part arguments
  argument_t *current_argument = nullptr;
  std::vector<std::string> values;

  for (auto &key : argv) {
    auto parsed = false;
    if (current_argument) {
      values.push_back(key);
      parsed = true;
      if (values.size() == current_argument->value_count) {
        current_argument->fn(values);
        current_argument = nullptr;
        values.clear();
      }
    } else {
      // Checks all arguments
      for (auto &argument : arguments) {
        if (argument.value_count == 1) {
          auto keyeq = FMT::format("{}=", argument.arg);
          if (key.substr(0, keyeq.length()) == keyeq) {
            argument.fn({key.substr(keyeq.length())});
            parsed = true;
            break;
          }
        }
        if (key == argument.arg) {
          if (argument.value_count > 0) {
            current_argument = &argument;
          } else {
            argument.fn({});
          }
          parsed = true;
          break;
        }
      }
    }
    if (!parsed) {
      throw exception("Unknown argument: {}. Try help with --help.", key);
    }
  }
  if (current_argument) {
    throw exception("Missing values for {}. Try help with --help.",
                    current_argument->arg);
  }

  DEBUG("settings after argument parsing: {}, action: {}", options->settings,
        options->action);
}

} // namespace midiroute
