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
#include "utils.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace midiroute {

/// Raw message bytes and the timestamp in milliseconds (-1 if unknown)
using receiver_callback_t =
    std::function<void(const std::vector<uint8_t> &bytes, int64_t millis)>;

using receiver_id_t = uint32_t;
constexpr receiver_id_t RECEIVER_ID_INVALID = 0;

/// Microseconds to milliseconds, truncating. TIMESTAMP_NOW stays -1.
int64_t timestamp_to_millis(timestamp_t timestamp);

/**
 * @short Receiver that calls a function for every message
 *
 * The function runs on the thread that delivers the message. Once closed it
 * is never called again, except for a delivery that was already running.
 */
class callback_receiver_t : public receiver_t {
  NON_COPYABLE_NOR_MOVABLE(callback_receiver_t)

public:
  explicit callback_receiver_t(receiver_callback_t callback,
                               std::string name = "callback");

  std::string name() const override { return name_; }
  const char *get_type() const override { return "callback_receiver_t"; }

  void send(const midi_message_t &message, timestamp_t timestamp) override;
  void close() override;
  bool is_closed() const { return closed; }

private:
  receiver_callback_t callback;
  std::string name_;
  std::atomic<bool> closed{false};
};

/**
 * @short Keeps the callbacks attached to transmitting endpoints
 *
 * Owned by the application. add_receiver() returns the id to use at
 * remove_receiver(). Removing an unknown id does nothing, so a removal can
 * race with shutdown.
 *
 * If a new callback takes the slot of a transmitter that already had a
 * callback from this registry, the old binding is closed and forgotten first.
 */
class receiver_registry_t {
  NON_COPYABLE_NOR_MOVABLE(receiver_registry_t)

public:
  struct binding_t {
    std::shared_ptr<endpoint_t> port;
    std::shared_ptr<transmitter_t> transmitter;
    std::shared_ptr<callback_receiver_t> receiver;
  };

  receiver_registry_t() = default;
  ~receiver_registry_t();

  /// Throws unsupported_direction if the port can not transmit
  receiver_id_t add_receiver(const std::shared_ptr<endpoint_t> &port,
                             receiver_callback_t callback);
  /// Silent no-op if id is unknown, or was added for another port
  void remove_receiver(const std::shared_ptr<endpoint_t> &port,
                       receiver_id_t id);

  bool contains(receiver_id_t id);
  size_t size();
  /// Closes and removes every binding
  void clear();

private:
  // Must be called with the mutex held
  void close_binding(receiver_id_t id, binding_t &binding);

  std::mutex mutex;
  receiver_id_t max_id = 1;
  std::unordered_map<receiver_id_t, binding_t> bindings;
};
} // namespace midiroute
