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

#include "test_case.hpp"
#include <midiroute/devicedirectory.hpp>
#include <midiroute/exceptions.hpp>
#include <midiroute/loopback.hpp>

static std::shared_ptr<midiroute::loopback_transport_t> make_transport() {
  auto transport = std::make_shared<midiroute::loopback_transport_t>();
  transport->add_device("Keyboard In", midiroute::UNLIMITED, 0);
  transport->add_device("Synth Out", 0, midiroute::UNLIMITED);
  transport->add_device("LoopMIDI Port");
  transport->add_device("LoopMIDI Port 2");
  return transport;
}

void test_list() {
  midiroute::device_directory_t directory(make_transport());

  ASSERT_EQUAL(directory.list_devices().size(), 4);

  auto inputs = directory.list_inputs();
  ASSERT_EQUAL(inputs.size(), 3);
  ASSERT_EQUAL(inputs[0]->name(), "Keyboard In");
  ASSERT_EQUAL(inputs[1]->name(), "LoopMIDI Port");

  auto outputs = directory.list_outputs();
  ASSERT_EQUAL(outputs.size(), 3);
  ASSERT_EQUAL(outputs[0]->name(), "Synth Out");
  for (auto &output : outputs) {
    ASSERT_TRUE(output->can_receive());
  }
}

void test_list_empty() {
  auto transport = std::make_shared<midiroute::loopback_transport_t>();
  midiroute::device_directory_t directory(transport);

  ASSERT_EQUAL(directory.list_devices().size(), 0);
  ASSERT_EQUAL(directory.list_inputs().size(), 0);
  ASSERT_FALSE(directory.find_input("Anything"));
  ASSERT_THROWS(midiroute::not_found, directory.get_output("Anything"));
}

void test_find_by_substring() {
  midiroute::device_directory_t directory(make_transport());

  auto input = directory.find_input("Keyboard");
  ASSERT_TRUE(input);
  ASSERT_EQUAL(input->name(), "Keyboard In");

  auto output = directory.find_output("Synth");
  ASSERT_TRUE(output);
  ASSERT_EQUAL(output->name(), "Synth Out");

  // First match in enumeration order
  auto loop = directory.find_input("LoopMIDI");
  ASSERT_TRUE(loop);
  ASSERT_EQUAL(loop->name(), "LoopMIDI Port");
  ASSERT_EQUAL(directory.find_input("Port 2")->name(), "LoopMIDI Port 2");

  // Empty name matches anything
  ASSERT_EQUAL(directory.find_output("")->name(), "Synth Out");
}

void test_find_checks_direction() {
  midiroute::device_directory_t directory(make_transport());

  // Exists, but with the other direction
  ASSERT_FALSE(directory.find_input("Synth"));
  ASSERT_FALSE(directory.find_output("Keyboard"));
  ASSERT_THROWS(midiroute::not_found, directory.get_input("Synth"));
  ASSERT_THROWS(midiroute::not_found, directory.get_output("Keyboard"));
}

void test_find_is_case_sensitive() {
  midiroute::device_directory_t directory(make_transport());

  ASSERT_FALSE(directory.find_input("keyboard"));
  ASSERT_FALSE(directory.find_input("USB"));
  ASSERT_THROWS(midiroute::not_found, directory.get_input("loopmidi"));
  ASSERT_TRUE(directory.get_input("LoopMIDI"));
}

void test_snapshot() {
  auto transport = make_transport();
  midiroute::device_directory_t directory(transport);

  auto before = directory.list_devices();
  transport->add_device("Hotplugged");
  ASSERT_EQUAL(before.size(), 4);
  ASSERT_EQUAL(directory.list_devices().size(), 5);
  ASSERT_TRUE(directory.find_output("Hotplugged"));

  transport->remove_device("Hotplugged");
  ASSERT_FALSE(directory.find_output("Hotplugged"));
}

void test_find_first() {
  midiroute::device_directory_t directory(make_transport());

  auto device = directory.find_first([](const midiroute::device_t &candidate) {
    return candidate.can_transmit() && candidate.can_receive();
  });
  ASSERT_TRUE(device);
  ASSERT_EQUAL(device->name(), "LoopMIDI Port");

  ASSERT_FALSE(directory.find_first(
      [](const midiroute::device_t &) { return false; }));
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_list),
      TEST(test_list_empty),
      TEST(test_find_by_substring),
      TEST(test_find_checks_direction),
      TEST(test_find_is_case_sensitive),
      TEST(test_snapshot),
      TEST(test_find_first),
  };

  testcase.run(argc, argv);
  return testcase.exit_code();
}
