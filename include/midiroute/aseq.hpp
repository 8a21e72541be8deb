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
#include "formatterhelper.hpp"
#include "settings.hpp"
#include "utils.hpp"
#include <alsa/asoundlib.h>
#include <alsa/seq_midi_event.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace midiroute {

/**
 * @short Translates raw MIDI bytes to ALSA sequencer events and back
 *
 * Its just a intermediary to snd_midi_event functions. Not thread safe.
 */
class mididata_to_alsaevents_t {
  NON_COPYABLE_NOR_MOVABLE(mididata_to_alsaevents_t)
public:
  snd_midi_event_t *buffer = nullptr;
  std::vector<uint8_t> decode_buffer;

  explicit mididata_to_alsaevents_t(size_t buffer_size = 65536);
  ~mididata_to_alsaevents_t();

  /// Calls func for each event found at data. Throws malformed_message.
  void mididata_to_evs_f(const uint8_t *data, size_t size,
                         const std::function<void(snd_seq_event_t *)> &func);
  /// Returns the raw bytes for the event, empty if it is not MIDI data.
  std::vector<uint8_t> ev_to_mididata(const snd_seq_event_t *ev);
};

/**
 * @short Owns the ALSA sequencer client and its I/O thread
 *
 * Incoming events on our local ports are decoded to raw MIDI bytes and given
 * to the port event handler, at the I/O thread. Handlers are called without
 * any lock held, so they can send or remove ports.
 */
class aseq_t {
  NON_COPYABLE_NOR_MOVABLE(aseq_t)
public:
  struct port_t {
    uint8_t client = 0;
    uint8_t port = 0;

    port_t() = default;
    port_t(uint8_t a, uint8_t b) : client(a), port(b) {}

    bool operator<(const port_t &other) const {
      if (client != other.client)
        return client < other.client;
      return port < other.port;
    }
    bool operator==(const port_t &other) const {
      return client == other.client && port == other.port;
    }
    std::string to_string() const { return FMT::format("{}:{}", client, port); }
  };

  struct port_info_t {
    port_t address;
    std::string client_name;
    std::string port_name;
    unsigned int capability = 0;
    int client_type = 0;

    /// Many times the port name is just a copy of the client name
    std::string name() const;
    bool can_read() const;
    bool can_write() const;
  };

  using event_handler_t =
      std::function<void(const std::vector<uint8_t> &, timestamp_t)>;

  std::string name;
  uint8_t client_id = 0;

  explicit aseq_t(const settings_t &settings);
  ~aseq_t();

  /// Local port. caps are SND_SEQ_PORT_CAP_*.
  uint8_t create_port(const std::string &name, unsigned int caps);
  void remove_port(uint8_t port);

  void connect(const port_t &from, const port_t &to);
  void disconnect(const port_t &from, const port_t &to);

  /// All ports of all clients, in sequencer order
  std::vector<port_info_t> list_ports();

  void set_event_handler(uint8_t port, event_handler_t handler);
  void remove_event_handler(uint8_t port);

  /// Sends the raw bytes as events from the given local port to its
  /// subscribers, now.
  void send(uint8_t port, const std::vector<uint8_t> &data);

  /// Microseconds since the client was opened
  timestamp_t now() const;

private:
  snd_seq_t *seq = nullptr;
  int epollfd = -1;
  int stopfd = -1;
  std::thread io_thread;
  std::chrono::steady_clock::time_point created_at;

  // Protects seq and both translators
  std::mutex seq_mutex;
  mididata_to_alsaevents_t encoder;
  mididata_to_alsaevents_t decoder;

  std::mutex handlers_mutex;
  std::map<uint8_t, event_handler_t> event_handlers;

  void io_loop();
  void read_ready();
  void close_fds();
};
} // namespace midiroute

TO_STRING_FORMATTER(midiroute::aseq_t::port_t);
BASIC_FORMATTER(midiroute::aseq_t::port_info_t, "{} ({})", v.name(),
                v.address.to_string());
