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

#include <midiroute/endpoint.hpp>
#include <midiroute/exceptions.hpp>
#include <midiroute/logger.hpp>

namespace midiroute {

endpoint_t::~endpoint_t() {}

std::shared_ptr<transmitter_t> receiver_t::as_transmitter() {
  throw unsupported_direction("{} is a receiver, can not transmit", name());
}

std::shared_ptr<receiver_t> receiver_t::as_receiver() {
  return std::static_pointer_cast<receiver_t>(shared_from_this());
}

void transmitter_t::set_receiver(std::shared_ptr<receiver_t> receiver_) {
  std::lock_guard<std::mutex> lock(slot_mutex);
  receiver = std::move(receiver_);
}

std::shared_ptr<receiver_t> transmitter_t::get_receiver() const {
  std::lock_guard<std::mutex> lock(slot_mutex);
  return receiver;
}

void transmitter_t::close() { set_receiver(nullptr); }

std::shared_ptr<transmitter_t> transmitter_t::as_transmitter() {
  return std::static_pointer_cast<transmitter_t>(shared_from_this());
}

std::shared_ptr<receiver_t> transmitter_t::as_receiver() {
  throw unsupported_direction("{} is a transmitter, can not receive", name());
}

bool transmitter_t::transmit(const midi_message_t &message,
                             timestamp_t timestamp) {
  // Keep a reference, the slot may change while the receiver runs
  auto current = get_receiver();
  if (!current) {
    return false;
  }
  current->send(message, timestamp);
  return true;
}

std::shared_ptr<transmitter_t> device_t::as_transmitter() {
  if (!can_transmit()) {
    throw unsupported_direction("Device {} can not transmit", name());
  }
  return get_transmitter();
}

std::shared_ptr<receiver_t> device_t::as_receiver() {
  if (!can_receive()) {
    throw unsupported_direction("Device {} can not receive", name());
  }
  return get_receiver();
}

} // namespace midiroute
