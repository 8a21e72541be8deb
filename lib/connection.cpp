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

#include <midiroute/connection.hpp>
#include <midiroute/exceptions.hpp>
#include <midiroute/logger.hpp>

namespace midiroute {

void connection_t::disconnect() {
  if (is_active()) {
    midiroute::disconnect(*from);
  }
  if (owns_from && from) {
    from->close();
    owns_from = false;
  }
}

connection_t connect(const std::shared_ptr<endpoint_t> &from,
                     const std::shared_ptr<endpoint_t> &to) {
  // Receiver first: a failed coercion must not leave a transmitter open
  auto receiver = to->as_receiver();
  auto transmitter = from->as_transmitter();
  bool owns_from = transmitter != from;

  auto previous = transmitter->get_receiver();
  if (previous && previous != receiver) {
    DEBUG("Replacing {} at {} slot", previous->name(), transmitter->name());
  }
  transmitter->set_receiver(receiver);
  INFO("Connect {} ({}) -> {} ({})", transmitter->name(), transmitter->get_type(),
       receiver->name(), receiver->get_type());

  return connection_t{transmitter, receiver, owns_from};
}

void disconnect(transmitter_t &transmitter) {
  if (transmitter.get_receiver()) {
    INFO("Disconnect {}", transmitter.name());
  }
  transmitter.set_receiver(nullptr);
}

void send(const std::shared_ptr<endpoint_t> &to, const midi_message_t &message,
          timestamp_t timestamp) {
  to->as_receiver()->send(message, timestamp);
}

void send(const std::shared_ptr<endpoint_t> &to, const midi_event_t &event,
          timestamp_t timestamp) {
  send(to, encode(event), timestamp);
}

void send(const std::shared_ptr<endpoint_t> &to,
          const std::vector<uint8_t> &bytes, timestamp_t timestamp) {
  send(to, encode(bytes), timestamp);
}

} // namespace midiroute
