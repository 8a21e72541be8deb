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
#include <midiroute/alsa_transport.hpp>
#include <midiroute/aseq.hpp>
#include <midiroute/connection.hpp>
#include <midiroute/devicedirectory.hpp>
#include <midiroute/exceptions.hpp>
#include <midiroute/receiverregistry.hpp>

// The sequencer is not always available (containers, CI)
static std::shared_ptr<midiroute::alsa_transport_t> open_transport() {
  midiroute::settings_t settings;
  settings.client_name = "midiroute-test";
  try {
    return std::make_shared<midiroute::alsa_transport_t>(settings);
  } catch (const midiroute::transport_failure &e) {
    SKIP(FMT::format("No ALSA sequencer: {}", e.what()));
  }
}

// Kernel client 14, present when snd-seq-dummy is loaded
static std::shared_ptr<midiroute::device_t>
find_midi_through(midiroute::device_directory_t &directory) {
  auto through = directory.find_output("Midi Through");
  if (!through) {
    SKIP("No Midi Through port");
  }
  return through;
}

void test_encode_events() {
  midiroute::mididata_to_alsaevents_t encoder;
  midiroute::mididata_to_alsaevents_t decoder;
  std::vector<int> types;
  std::vector<std::vector<uint8_t>> decoded;

  auto data = hex_to_bin("90 40 7F 80 40 00 F8 F0 7D 01 02 F7");
  encoder.mididata_to_evs_f(
      data.data(), data.size(), [&](snd_seq_event_t *ev) {
        types.push_back(ev->type);
        decoded.push_back(decoder.ev_to_mididata(ev));
      });

  ASSERT_EQUAL(types.size(), 4);
  ASSERT_EQUAL(types[0], (int)SND_SEQ_EVENT_NOTEON);
  ASSERT_EQUAL(types[1], (int)SND_SEQ_EVENT_NOTEOFF);
  ASSERT_EQUAL(types[2], (int)SND_SEQ_EVENT_CLOCK);
  ASSERT_EQUAL(types[3], (int)SND_SEQ_EVENT_SYSEX);

  ASSERT_EQUAL(midiroute::hex(decoded[0]), "90 40 7F");
  ASSERT_EQUAL(midiroute::hex(decoded[1]), "80 40 00");
  ASSERT_EQUAL(midiroute::hex(decoded[2]), "F8");
  ASSERT_EQUAL(midiroute::hex(decoded[3]), "F0 7D 01 02 F7");
}

void test_encode_running_status() {
  midiroute::mididata_to_alsaevents_t encoder;
  midiroute::mididata_to_alsaevents_t decoder;
  std::vector<std::vector<uint8_t>> decoded;

  // Second note without status byte
  auto data = hex_to_bin("90 40 7F 41 7F");
  encoder.mididata_to_evs_f(data.data(), data.size(),
                            [&](snd_seq_event_t *ev) {
                              decoded.push_back(decoder.ev_to_mididata(ev));
                            });

  ASSERT_EQUAL(decoded.size(), 2);
  ASSERT_EQUAL(midiroute::hex(decoded[1]), "90 41 7F");
}

void test_list_devices() {
  auto transport = open_transport();
  midiroute::device_directory_t directory(transport);

  auto devices = directory.list_devices();
  for (auto &device : devices) {
    INFO("Device: {} ({}{})", device->name(),
         device->can_transmit() ? "I" : "-", device->can_receive() ? "O" : "-");
    ASSERT_TRUE(device->can_transmit() || device->can_receive());
    // Our own client is not listed
    auto alsa_device =
        std::dynamic_pointer_cast<midiroute::alsa_device_t>(device);
    ASSERT_TRUE(alsa_device);
    ASSERT_NOT_EQUAL(alsa_device->get_port_info().address.client,
                     transport->get_aseq()->client_id);
    // Nor the System client
    ASSERT_NOT_EQUAL(alsa_device->get_port_info().address.client, 0);
  }

  // Same port, same device
  auto again = directory.list_devices();
  ASSERT_EQUAL(again.size(), devices.size());
  for (size_t i = 0; i < devices.size(); i++) {
    ASSERT_TRUE(again[i] == devices[i]);
  }
}

void test_midi_through() {
  auto transport = open_transport();
  midiroute::device_directory_t directory(transport);

  auto through = find_midi_through(directory);
  auto input = directory.get_input("Midi Through");
  ASSERT_TRUE(input == through);

  received_messages_t received;
  midiroute::receiver_registry_t registry;
  auto id = registry.add_receiver(
      input, [&received](const std::vector<uint8_t> &bytes, int64_t millis) {
        received.push(bytes, millis);
      });

  midiroute::send(through, std::vector<uint8_t>{0x90, 0x40, 0x7F});
  midiroute::send(through,
                  std::vector<uint8_t>{0xF0, 0x7D, 0x10, 0x20, 0x30, 0xF7});

  ASSERT_TRUE(received.wait_for(2, std::chrono::milliseconds(1000)));
  ASSERT_EQUAL(midiroute::hex(received.at(0)), "90 40 7F");
  ASSERT_EQUAL(midiroute::hex(received.at(1)), "F0 7D 10 20 30 F7");
  ASSERT_GTE(received.millis_at(0), 0);

  registry.remove_receiver(input, id);
  ASSERT_EQUAL(through->transmitters().size(), 0);

  midiroute::send(through, std::vector<uint8_t>{0x80, 0x40, 0x00});
  ASSERT_FALSE(received.wait_for(3, std::chrono::milliseconds(100)));
}

void test_closed_receiver() {
  auto transport = open_transport();
  midiroute::device_directory_t directory(transport);
  auto through = find_midi_through(directory);

  auto receiver = through->get_receiver();
  receiver->close();
  receiver->close();
  ASSERT_THROWS(midiroute::transport_failure,
                receiver->send(midiroute::encode(hex_to_bin("F8")),
                               midiroute::TIMESTAMP_NOW));
  ASSERT_FALSE(through->get_receiver() == receiver);
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_encode_events),
      TEST(test_encode_running_status),
      TEST(test_list_devices),
      TEST(test_midi_through),
      TEST(test_closed_receiver),
  };

  testcase.run(argc, argv);
  return testcase.exit_code();
}
