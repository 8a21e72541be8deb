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

#include <exception>
#include <midiroute/exceptions.hpp>
#include <midiroute/logger.hpp>
#include <midiroute/receiverregistry.hpp>

namespace midiroute {

int64_t timestamp_to_millis(timestamp_t timestamp) {
  if (timestamp < 0) {
    return TIMESTAMP_NOW;
  }
  return timestamp / 1000;
}

callback_receiver_t::callback_receiver_t(receiver_callback_t callback_,
                                         std::string name)
    : callback(std::move(callback_)), name_(std::move(name)) {}

void callback_receiver_t::send(const midi_message_t &message,
                               timestamp_t timestamp) {
  if (closed) {
    return;
  }
  callback(message.bytes(), timestamp_to_millis(timestamp));
}

void callback_receiver_t::close() { closed = true; }

receiver_registry_t::~receiver_registry_t() {
  try {
    clear();
  } catch (const std::exception &exc) {
    ERROR("Error closing receivers: {}", exc.what());
  }
}

receiver_id_t
receiver_registry_t::add_receiver(const std::shared_ptr<endpoint_t> &port,
                                  receiver_callback_t callback) {
  std::lock_guard<std::mutex> lock(mutex);

  auto transmitter = port->as_transmitter();

  // Same transmitter, same slot: the older callback would be silently
  // disconnected, so close it now
  for (auto it = bindings.begin(); it != bindings.end();) {
    if (it->second.transmitter == transmitter) {
      WARNING("Replacing callback id={} at {}", it->first, transmitter->name());
      auto previous = it->first;
      auto binding = std::move(it->second);
      it = bindings.erase(it);
      binding.receiver->close();
      DEBUG("Closed callback id={}", previous);
    } else {
      ++it;
    }
  }

  auto receiver = std::make_shared<callback_receiver_t>(
      std::move(callback), FMT::format("callback@{}", port->name()));
  transmitter->set_receiver(receiver);

  auto id = max_id++;
  bindings[id] = binding_t{port, transmitter, receiver};
  INFO("Added callback id={} at {}", id, port->name());
  return id;
}

void receiver_registry_t::remove_receiver(
    const std::shared_ptr<endpoint_t> &port, receiver_id_t id) {
  std::lock_guard<std::mutex> lock(mutex);

  auto it = bindings.find(id);
  if (it == bindings.end()) {
    DEBUG("No callback id={} to remove", id);
    return;
  }
  if (it->second.port != port) {
    WARNING("Callback id={} belongs to {}, not to {}. Not removed.", id,
            it->second.port->name(), port->name());
    return;
  }

  auto binding = std::move(it->second);
  bindings.erase(it);
  close_binding(id, binding);
}

void receiver_registry_t::close_binding(receiver_id_t id, binding_t &binding) {
  binding.receiver->close();
  // Another connect may have taken the slot meanwhile. Leave that one alone.
  if (binding.transmitter->get_receiver() == binding.receiver) {
    binding.transmitter->set_receiver(nullptr);
  }
  INFO("Removed callback id={} from {}", id, binding.port->name());
  // A device gave us this transmitter only for this callback. If the port was
  // already a transmitter, it belongs to the caller.
  if (binding.transmitter != binding.port) {
    binding.transmitter->close();
  }
}

bool receiver_registry_t::contains(receiver_id_t id) {
  std::lock_guard<std::mutex> lock(mutex);
  return bindings.find(id) != bindings.end();
}

size_t receiver_registry_t::size() {
  std::lock_guard<std::mutex> lock(mutex);
  return bindings.size();
}

void receiver_registry_t::clear() {
  std::lock_guard<std::mutex> lock(mutex);
  auto to_close = std::move(bindings);
  bindings.clear();

  std::exception_ptr first_error;
  for (auto &[id, binding] : to_close) {
    try {
      close_binding(id, binding);
    } catch (const transport_failure &exc) {
      ERROR("Error closing callback id={}: {}", id, exc.what());
      if (!first_error)
        first_error = std::current_exception();
    }
  }
  if (first_error)
    std::rethrow_exception(first_error);
}

} // namespace midiroute
