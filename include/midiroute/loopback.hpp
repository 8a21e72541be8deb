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

#include "devicedirectory.hpp"
#include "endpoint.hpp"
#include "utils.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace midiroute {
class loopback_device_t;

/**
 * @short Virtual in process MIDI stack
 *
 * Each device loops whatever is sent to its receiver back out of all its open
 * transmitters, synchronously, on the sending thread. A message that comes
 * back to the same device while it is delivering it, as when the device is
 * connected to itself, is dropped.
 */
class loopback_transport_t : public transport_t {
  NON_COPYABLE_NOR_MOVABLE(loopback_transport_t)

public:
  loopback_transport_t() = default;

  std::shared_ptr<loopback_device_t>
  add_device(const std::string &name, int max_transmitters = UNLIMITED,
             int max_receivers = UNLIMITED);
  /// Closes all its transmitters and receivers
  void remove_device(const std::string &name);

  std::vector<std::shared_ptr<device_t>> devices() override;
  const char *get_type() const override { return "loopback_transport_t"; }

private:
  std::mutex mutex;
  std::vector<std::shared_ptr<loopback_device_t>> devices_;
};

class loopback_transmitter_t : public transmitter_t {
public:
  loopback_transmitter_t(std::weak_ptr<loopback_device_t> device,
                         std::string name);

  std::string name() const override { return name_; }
  const char *get_type() const override { return "loopback_transmitter_t"; }
  void close() override;

  /// Sends to whatever is in the slot
  void deliver(const midi_message_t &message, timestamp_t timestamp);

private:
  std::weak_ptr<loopback_device_t> device;
  std::string name_;
};

class loopback_receiver_t : public receiver_t {
public:
  loopback_receiver_t(std::weak_ptr<loopback_device_t> device,
                      std::string name);

  std::string name() const override { return name_; }
  const char *get_type() const override { return "loopback_receiver_t"; }
  void send(const midi_message_t &message, timestamp_t timestamp) override;
  void close() override;

private:
  std::weak_ptr<loopback_device_t> device;
  std::string name_;
};

class loopback_device_t : public device_t {
  NON_COPYABLE_NOR_MOVABLE(loopback_device_t)

public:
  loopback_device_t(std::string name, int max_transmitters,
                    int max_receivers);
  ~loopback_device_t() override;

  device_info_t info() const override { return info_; }
  int max_transmitters() const override { return max_transmitters_; }
  int max_receivers() const override { return max_receivers_; }
  const char *get_type() const override { return "loopback_device_t"; }

  std::shared_ptr<transmitter_t> get_transmitter() override;
  std::shared_ptr<receiver_t> get_receiver() override;
  std::vector<std::shared_ptr<transmitter_t>> transmitters() override;
  std::vector<std::shared_ptr<receiver_t>> receivers() override;

  /// Sends to all open transmitters. Returns how many had a receiver.
  int loop(const midi_message_t &message, timestamp_t timestamp);
  /// Microseconds since the device was created
  timestamp_t now() const;

  void close_all();

protected:
  friend class loopback_transmitter_t;
  friend class loopback_receiver_t;
  void transmitter_closed(loopback_transmitter_t *transmitter);
  void receiver_closed(loopback_receiver_t *receiver);

private:
  device_info_t info_;
  int max_transmitters_;
  int max_receivers_;
  std::chrono::steady_clock::time_point created_at;

  std::mutex mutex;
  std::vector<std::shared_ptr<loopback_transmitter_t>> open_transmitters;
  std::shared_ptr<loopback_receiver_t> receiver;
};
} // namespace midiroute
