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
#include "midimessage.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace midiroute {

/**
 * @short A transmitter wired to a receiver
 *
 * Only a record of what connect() did. The wiring itself lives in the
 * transmitter slot, so a later connect() on the same transmitter leaves this
 * one inactive.
 */
struct connection_t {
  std::shared_ptr<transmitter_t> from;
  std::shared_ptr<receiver_t> to;
  // connect() opened `from` on a device, so it is closed on disconnect
  bool owns_from = false;

  bool is_active() const { return from && to && from->get_receiver() == to; }
  /// Clears the transmitter slot if it is still ours, and closes the
  /// transmitter if connect() opened it
  void disconnect();
};

/// Throws unsupported_direction if from can not transmit or to can not receive
connection_t connect(const std::shared_ptr<endpoint_t> &from,
                     const std::shared_ptr<endpoint_t> &to);

/// Always succeeds, also if not connected
void disconnect(transmitter_t &transmitter);

void send(const std::shared_ptr<endpoint_t> &to, const midi_message_t &message,
          timestamp_t timestamp = TIMESTAMP_NOW);
void send(const std::shared_ptr<endpoint_t> &to, const midi_event_t &event,
          timestamp_t timestamp = TIMESTAMP_NOW);
void send(const std::shared_ptr<endpoint_t> &to,
          const std::vector<uint8_t> &bytes,
          timestamp_t timestamp = TIMESTAMP_NOW);
} // namespace midiroute
