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

#include <algorithm>
#include <cerrno>
#include <midiroute/exceptions.hpp>
#include <midiroute/logger.hpp>
#include <midiroute/loopback.hpp>

namespace midiroute {

// Devices currently delivering at this thread, to cut feedback loops
static thread_local std::vector<const loopback_device_t *> delivering;

namespace {
struct delivering_guard_t {
  explicit delivering_guard_t(const loopback_device_t *device) {
    delivering.push_back(device);
  }
  ~delivering_guard_t() { delivering.pop_back(); }
};
} // namespace

std::shared_ptr<loopback_device_t>
loopback_transport_t::add_device(const std::string &name, int max_transmitters,
                                 int max_receivers) {
  auto device = std::make_shared<loopback_device_t>(name, max_transmitters,
                                                    max_receivers);
  std::lock_guard<std::mutex> lock(mutex);
  devices_.push_back(device);
  INFO("Added loopback device {} transmitters={} receivers={}", name,
       max_transmitters, max_receivers);
  return device;
}

void loopback_transport_t::remove_device(const std::string &name) {
  std::vector<std::shared_ptr<loopback_device_t>> removed;
  {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = std::stable_partition(
        devices_.begin(), devices_.end(),
        [&name](const auto &device) { return device->name() != name; });
    removed.assign(it, devices_.end());
    devices_.erase(it, devices_.end());
  }
  for (auto &device : removed) {
    device->close_all();
    INFO("Removed loopback device {}", name);
  }
}

std::vector<std::shared_ptr<device_t>> loopback_transport_t::devices() {
  std::lock_guard<std::mutex> lock(mutex);
  return std::vector<std::shared_ptr<device_t>>(devices_.begin(),
                                                devices_.end());
}

loopback_transmitter_t::loopback_transmitter_t(
    std::weak_ptr<loopback_device_t> device_, std::string name)
    : device(std::move(device_)), name_(std::move(name)) {}

void loopback_transmitter_t::close() {
  transmitter_t::close();
  if (auto dev = device.lock()) {
    dev->transmitter_closed(this);
  }
  device.reset();
}

void loopback_transmitter_t::deliver(const midi_message_t &message,
                                     timestamp_t timestamp) {
  transmit(message, timestamp);
}

loopback_receiver_t::loopback_receiver_t(
    std::weak_ptr<loopback_device_t> device_, std::string name)
    : device(std::move(device_)), name_(std::move(name)) {}

void loopback_receiver_t::send(const midi_message_t &message,
                               timestamp_t timestamp) {
  auto dev = device.lock();
  if (!dev) {
    throw transport_failure(ENODEV, "Receiver {} is closed", name_);
  }
  dev->loop(message, timestamp);
}

void loopback_receiver_t::close() {
  if (auto dev = device.lock()) {
    dev->receiver_closed(this);
  }
  device.reset();
}

loopback_device_t::loopback_device_t(std::string name, int max_transmitters,
                                     int max_receivers)
    : info_{std::move(name), "midiroute", "Virtual loopback device", "1.0"},
      max_transmitters_(max_transmitters), max_receivers_(max_receivers),
      created_at(std::chrono::steady_clock::now()) {}

loopback_device_t::~loopback_device_t() {}

std::shared_ptr<transmitter_t> loopback_device_t::get_transmitter() {
  if (max_transmitters_ == 0) {
    throw unsupported_direction("Device {} can not transmit", info_.name);
  }
  std::lock_guard<std::mutex> lock(mutex);
  if (max_transmitters_ != UNLIMITED &&
      open_transmitters.size() >= (size_t)max_transmitters_) {
    throw transport_failure(EBUSY, "Device {} has no free transmitters",
                            info_.name);
  }
  auto self = std::static_pointer_cast<loopback_device_t>(shared_from_this());
  auto transmitter = std::make_shared<loopback_transmitter_t>(
      self, FMT::format("{} transmitter {}", info_.name,
                        open_transmitters.size() + 1));
  open_transmitters.push_back(transmitter);
  DEBUG("Opened {}", transmitter->name());
  return transmitter;
}

std::shared_ptr<receiver_t> loopback_device_t::get_receiver() {
  if (max_receivers_ == 0) {
    throw unsupported_direction("Device {} can not receive", info_.name);
  }
  std::lock_guard<std::mutex> lock(mutex);
  if (!receiver) {
    auto self =
        std::static_pointer_cast<loopback_device_t>(shared_from_this());
    receiver = std::make_shared<loopback_receiver_t>(
        self, FMT::format("{} receiver", info_.name));
    DEBUG("Opened {}", receiver->name());
  }
  return receiver;
}

std::vector<std::shared_ptr<transmitter_t>> loopback_device_t::transmitters() {
  std::lock_guard<std::mutex> lock(mutex);
  return std::vector<std::shared_ptr<transmitter_t>>(open_transmitters.begin(),
                                                     open_transmitters.end());
}

std::vector<std::shared_ptr<receiver_t>> loopback_device_t::receivers() {
  std::lock_guard<std::mutex> lock(mutex);
  if (!receiver) {
    return {};
  }
  return {receiver};
}

int loopback_device_t::loop(const midi_message_t &message,
                            timestamp_t timestamp) {
  if (std::find(delivering.begin(), delivering.end(), this) !=
      delivering.end()) {
    WARNING_RATE_LIMIT(10, "Feedback loop at {}, dropping {}", info_.name,
                       message.to_string());
    return 0;
  }
  delivering_guard_t guard(this);
  if (timestamp == TIMESTAMP_NOW) {
    timestamp = now();
  }
  std::vector<std::shared_ptr<loopback_transmitter_t>> current;
  {
    std::lock_guard<std::mutex> lock(mutex);
    current = open_transmitters;
  }
  int delivered = 0;
  for (auto &transmitter : current) {
    if (transmitter->get_receiver()) {
      transmitter->deliver(message, timestamp);
      delivered++;
    }
  }
  return delivered;
}

timestamp_t loopback_device_t::now() const {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::steady_clock::now() - created_at)
      .count();
}

void loopback_device_t::close_all() {
  std::vector<std::shared_ptr<loopback_transmitter_t>> transmitters_copy;
  std::shared_ptr<loopback_receiver_t> receiver_copy;
  {
    std::lock_guard<std::mutex> lock(mutex);
    transmitters_copy = open_transmitters;
    receiver_copy = receiver;
  }
  for (auto &transmitter : transmitters_copy) {
    transmitter->close();
  }
  if (receiver_copy) {
    receiver_copy->close();
  }
}

void loopback_device_t::transmitter_closed(
    loopback_transmitter_t *transmitter) {
  DEBUG("Closed {}", transmitter->name());
  std::lock_guard<std::mutex> lock(mutex);
  open_transmitters.erase(
      std::remove_if(open_transmitters.begin(), open_transmitters.end(),
                     [transmitter](const auto &t) {
                       return t.get() == transmitter;
                     }),
      open_transmitters.end());
}

void loopback_device_t::receiver_closed(loopback_receiver_t *receiver_) {
  std::lock_guard<std::mutex> lock(mutex);
  if (receiver.get() == receiver_) {
    receiver = nullptr;
    DEBUG("Closed {} receiver", info_.name);
  }
}

} // namespace midiroute
