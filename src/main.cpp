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
#include <iostream>
#include <midiroute/alsa_transport.hpp>
#include <midiroute/connection.hpp>
#include <midiroute/devicedirectory.hpp>
#include <midiroute/exceptions.hpp>
#include <midiroute/logger.hpp>
#include <midiroute/midimessage.hpp>
#include <midiroute/receiverregistry.hpp>
#include <optional>
#include <signal.h>
#include <unistd.h>

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static volatile sig_atomic_t exiting = 0;

void sigterm_f(int) {
  if (exiting) {
    _exit(1);
  }
  exiting = 1;
}
void sigint_f(int) {
  if (exiting) {
    _exit(1);
  }
  exiting = 1;
}

static void wait_for_signal() {
  INFO("Press Ctrl-C to stop.");
  while (!exiting) {
    pause();
  }
  INFO("Signal received. Closing.");
}

class main_t {
protected:
  std::shared_ptr<midiroute::alsa_transport_t> transport;
  std::optional<midiroute::device_directory_t> directory;

public:
  void setup(const midiroute::settings_t &settings) {
    transport = std::make_shared<midiroute::alsa_transport_t>(settings);
    directory.emplace(transport);
  }

  void list() {
    for (auto &device : directory->list_devices()) {
      std::cout << FMT::format("{}{} {}\n", device->can_transmit() ? "I" : "-",
                               device->can_receive() ? "O" : "-",
                               device->name());
    }
  }

  void monitor(const std::string &name) {
    auto input = directory->get_input(name);
    midiroute::receiver_registry_t registry;
    registry.add_receiver(
        input, [](const std::vector<uint8_t> &bytes, int64_t millis) {
          std::cout << FMT::format("{:>10} {:<16} {}\n", millis,
                                   midiroute::classify(bytes),
                                   midiroute::hex(bytes))
                    << std::flush;
        });
    INFO("Monitoring {}", input->name());
    wait_for_signal();
  }

  void connect(const std::string &from, const std::string &to) {
    auto input = directory->get_input(from);
    auto output = directory->get_output(to);
    auto connection = midiroute::connect(input, output);
    wait_for_signal();
    connection.from->close();
  }

  void send(const std::string &name, const std::string &data) {
    auto output = directory->get_output(name);
    auto bytes = midiroute::parse_hex(data);
    midiroute::send(output, bytes);
    INFO("Sent {} to {}", midiroute::hex(bytes), output->name());
    output->as_receiver()->close();
  }
};

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; i++) {
    args.push_back(argv[i]);
  }

  midiroute::cli_options_t options;
  try {
    midiroute::parse_argv(args, &options);
  } catch (const midiroute::exception &exc) {
    ERROR("{}", exc.what());
    return 1;
  }

  signal(SIGINT, sigint_f);
  signal(SIGTERM, sigterm_f);

  main_t maindata;
  try {
    maindata.setup(options.settings);
    switch (options.action) {
    case midiroute::action_e::LIST:
      maindata.list();
      break;
    case midiroute::action_e::MONITOR:
      maindata.monitor(options.from);
      break;
    case midiroute::action_e::CONNECT:
      maindata.connect(options.from, options.to);
      break;
    case midiroute::action_e::SEND:
      maindata.send(options.from, options.data);
      break;
    }
  } catch (const std::exception &exc) {
    ERROR("Error on {}: {}", options.action, exc.what());
    return 1;
  }

  return 0;
}
