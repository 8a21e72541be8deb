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
#include "test_utils.hpp"
#include <midiroute/connection.hpp>
#include <midiroute/devicedirectory.hpp>
#include <midiroute/exceptions.hpp>
#include <midiroute/loopback.hpp>
#include <midiroute/receiverregistry.hpp>

static midiroute::receiver_callback_t collect_to(received_messages_t &received) {
  return [&received](const std::vector<uint8_t> &bytes, int64_t millis) {
    received.push(bytes, millis);
  };
}

void test_timestamp_to_millis() {
  ASSERT_EQUAL(midiroute::timestamp_to_millis(0), 0);
  ASSERT_EQUAL(midiroute::timestamp_to_millis(999), 0);
  ASSERT_EQUAL(midiroute::timestamp_to_millis(1000), 1);
  ASSERT_EQUAL(midiroute::timestamp_to_millis(123456), 123);
  ASSERT_EQUAL(midiroute::timestamp_to_millis(midiroute::TIMESTAMP_NOW), -1);
}

void test_add_remove() {
  midiroute::loopback_transport_t transport;
  auto device = transport.add_device("Loop");
  midiroute::receiver_registry_t registry;

  received_messages_t received;
  auto id = registry.add_receiver(device, collect_to(received));
  ASSERT_NOT_EQUAL(id, midiroute::RECEIVER_ID_INVALID);
  ASSERT_TRUE(registry.contains(id));
  ASSERT_EQUAL(registry.size(), 1);
  ASSERT_EQUAL(device->transmitters().size(), 1);

  midiroute::send(device, std::vector<uint8_t>{0x90, 0x40, 0x7F}, 5000);
  ASSERT_EQUAL(received.size(), 1);
  ASSERT_EQUAL(midiroute::hex(received.at(0)), "90 40 7F");
  ASSERT_EQUAL(received.millis_at(0), 5);

  registry.remove_receiver(device, id);
  ASSERT_FALSE(registry.contains(id));
  ASSERT_EQUAL(registry.size(), 0);
  // The transmitter the device opened for it is closed too
  ASSERT_EQUAL(device->transmitters().size(), 0);

  midiroute::send(device, std::vector<uint8_t>{0x80, 0x40, 0x00});
  ASSERT_EQUAL(received.size(), 1);
}

void test_remove_unknown_is_noop() {
  midiroute::loopback_transport_t transport;
  auto device = transport.add_device("Loop");
  auto other = transport.add_device("Other");
  midiroute::receiver_registry_t registry;

  received_messages_t received;
  auto id = registry.add_receiver(device, collect_to(received));

  registry.remove_receiver(device, id + 100);
  registry.remove_receiver(device, midiroute::RECEIVER_ID_INVALID);
  // Right id, wrong port
  registry.remove_receiver(other, id);
  ASSERT_TRUE(registry.contains(id));

  midiroute::send(device, std::vector<uint8_t>{0xF8});
  ASSERT_EQUAL(received.size(), 1);

  registry.remove_receiver(device, id);
  // Twice is fine
  registry.remove_receiver(device, id);
  ASSERT_EQUAL(registry.size(), 0);
}

void test_ids_are_unique() {
  midiroute::loopback_transport_t transport;
  auto device = transport.add_device("Loop");
  midiroute::receiver_registry_t registry;

  received_messages_t received;
  auto id1 = registry.add_receiver(device, collect_to(received));
  auto id2 = registry.add_receiver(device, collect_to(received));
  registry.remove_receiver(device, id1);
  auto id3 = registry.add_receiver(device, collect_to(received));

  ASSERT_NOT_EQUAL(id1, id2);
  ASSERT_NOT_EQUAL(id1, id3);
  ASSERT_NOT_EQUAL(id2, id3);

  // Each callback on a device gets its own transmitter, so all get the message
  midiroute::send(device, std::vector<uint8_t>{0xFE});
  ASSERT_EQUAL(received.size(), 2);
}

void test_add_to_unsupported_direction() {
  midiroute::loopback_transport_t transport;
  auto output = transport.add_device("Synth", 0, midiroute::UNLIMITED);
  midiroute::receiver_registry_t registry;

  received_messages_t received;
  ASSERT_THROWS(midiroute::unsupported_direction,
                registry.add_receiver(output, collect_to(received)));
  ASSERT_THROWS(midiroute::unsupported_direction,
                registry.add_receiver(output->get_receiver(),
                                      collect_to(received)));
  ASSERT_EQUAL(registry.size(), 0);
}

void test_same_transmitter_replaces() {
  midiroute::loopback_transport_t transport;
  auto device = transport.add_device("Loop");
  auto transmitter = device->get_transmitter();
  midiroute::receiver_registry_t registry;

  received_messages_t received_a;
  received_messages_t received_b;
  auto id_a = registry.add_receiver(transmitter, collect_to(received_a));
  auto id_b = registry.add_receiver(transmitter, collect_to(received_b));

  // Only one slot, the first one is closed and forgotten
  ASSERT_FALSE(registry.contains(id_a));
  ASSERT_TRUE(registry.contains(id_b));
  ASSERT_EQUAL(registry.size(), 1);

  midiroute::send(device, std::vector<uint8_t>{0xC0, 0x05});
  ASSERT_EQUAL(received_a.size(), 0);
  ASSERT_EQUAL(received_b.size(), 1);

  // A transmitter given by the caller stays open after removal
  registry.remove_receiver(transmitter, id_b);
  ASSERT_FALSE(transmitter->get_receiver());
  ASSERT_EQUAL(device->transmitters().size(), 1);
}

void test_slot_taken_by_connect() {
  midiroute::loopback_transport_t transport;
  auto device = transport.add_device("Loop");
  auto synth = transport.add_device("Synth", 0, midiroute::UNLIMITED);
  auto transmitter = device->get_transmitter();
  midiroute::receiver_registry_t registry;

  received_messages_t received;
  auto id = registry.add_receiver(transmitter, collect_to(received));
  midiroute::connect(transmitter, synth);

  midiroute::send(device, std::vector<uint8_t>{0xF8});
  ASSERT_EQUAL(received.size(), 0);

  // Removing the callback leaves the new connection alone
  registry.remove_receiver(transmitter, id);
  ASSERT_TRUE(transmitter->get_receiver() == synth->get_receiver());
}

void test_clear() {
  midiroute::loopback_transport_t transport;
  auto a = transport.add_device("A");
  auto b = transport.add_device("B");

  received_messages_t received;
  {
    midiroute::receiver_registry_t registry;
    registry.add_receiver(a, collect_to(received));
    registry.add_receiver(b, collect_to(received));
    ASSERT_EQUAL(registry.size(), 2);

    registry.clear();
    ASSERT_EQUAL(registry.size(), 0);
    ASSERT_EQUAL(a->transmitters().size(), 0);
    ASSERT_EQUAL(b->transmitters().size(), 0);

    registry.add_receiver(a, collect_to(received));
    ASSERT_EQUAL(a->transmitters().size(), 1);
  }
  // Out of scope, all closed
  ASSERT_EQUAL(a->transmitters().size(), 0);
  midiroute::send(a, std::vector<uint8_t>{0xF8});
  ASSERT_EQUAL(received.size(), 0);
}

void test_callback_exception() {
  midiroute::loopback_transport_t transport;
  auto device = transport.add_device("Loop");
  midiroute::receiver_registry_t registry;

  registry.add_receiver(device, [](const std::vector<uint8_t> &, int64_t) {
    throw midiroute::exception("Callback failed");
  });

  // The loopback delivers on the sending thread, so the error comes back
  ASSERT_THROWS(midiroute::exception,
                midiroute::send(device, std::vector<uint8_t>{0xF8}));
}

void test_loopmidi_scenario() {
  auto transport = std::make_shared<midiroute::loopback_transport_t>();
  transport->add_device("Keyboard", midiroute::UNLIMITED, 0);
  transport->add_device("LoopMIDI Port");
  midiroute::device_directory_t directory(transport);

  auto input = directory.get_input("LoopMIDI");
  auto output = directory.get_output("LoopMIDI");
  ASSERT_TRUE(input == output);
  ASSERT_FALSE(directory.find_input("USB"));

  // Wire the port to itself, and watch it
  auto connection = midiroute::connect(input, output);
  ASSERT_TRUE(connection.is_active());

  received_messages_t received;
  midiroute::receiver_registry_t registry;
  auto id = registry.add_receiver(input, collect_to(received));

  midiroute::send(output, std::vector<uint8_t>{0x90, 0x40, 0x7F});
  ASSERT_TRUE(received.wait_for(1, std::chrono::milliseconds(100)));
  ASSERT_EQUAL(received.size(), 1);
  ASSERT_EQUAL(midiroute::hex(received.at(0)), "90 40 7F");
  ASSERT_GTE(received.millis_at(0), 0);

  midiroute::send(output, std::vector<uint8_t>{0xF0, 0x7D, 0x10, 0x20, 0xF7});
  ASSERT_EQUAL(received.size(), 2);
  ASSERT_EQUAL(midiroute::hex(received.at(1)), "F0 7D 10 20 F7");

  registry.remove_receiver(input, id);
  connection.disconnect();
  midiroute::send(output, std::vector<uint8_t>{0x80, 0x40, 0x00});
  ASSERT_EQUAL(received.size(), 2);
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_timestamp_to_millis),
      TEST(test_add_remove),
      TEST(test_remove_unknown_is_noop),
      TEST(test_ids_are_unique),
      TEST(test_add_to_unsupported_direction),
      TEST(test_same_transmitter_replaces),
      TEST(test_slot_taken_by_connect),
      TEST(test_clear),
      TEST(test_callback_exception),
      TEST(test_loopmidi_scenario),
  };

  testcase.run(argc, argv);
  return testcase.exit_code();
}
