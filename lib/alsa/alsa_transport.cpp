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
#include <midiroute/alsa_transport.hpp>
#include <midiroute/exceptions.hpp>
#include <midiroute/logger.hpp>

namespace midiroute {

alsa_transport_t::alsa_transport_t(const settings_t &settings_)
    : settings(settings_), aseq(std::make_shared<aseq_t>(settings_)) {}

alsa_transport_t::~alsa_transport_t() {
  std::map<aseq_t::port_t, std::shared_ptr<alsa_device_t>> devices_copy;
  {
    std::lock_guard<std::mutex> lock(mutex);
    devices_copy.swap(known_devices);
  }
  for (auto &item : devices_copy) {
    item.second->close_all();
  }
}

bool alsa_transport_t::is_visible(const aseq_t::port_info_t &port) const {
  if (port.capability & SND_SEQ_PORT_CAP_NO_EXPORT)
    return false;
  if (port.address.client == SND_SEQ_CLIENT_SYSTEM &&
      !settings.include_system_ports)
    return false;
  if (port.address.client == aseq->client_id && !settings.include_own_ports)
    return false;
  return port.can_read() || port.can_write();
}

std::vector<std::shared_ptr<device_t>> alsa_transport_t::devices() {
  auto ports = aseq->list_ports();

  std::vector<std::shared_ptr<device_t>> ret;
  std::map<aseq_t::port_t, std::shared_ptr<alsa_device_t>> current;

  std::lock_guard<std::mutex> lock(mutex);
  for (auto &port : ports) {
    if (!is_visible(port))
      continue;
    auto it = known_devices.find(port.address);
    std::shared_ptr<alsa_device_t> device;
    if (it != known_devices.end() &&
        it->second->get_port_info().name() == port.name()) {
      device = it->second;
    } else {
      device = std::make_shared<alsa_device_t>(aseq, port);
      DEBUG("New ALSA device {}", port);
    }
    current[port.address] = device;
    ret.push_back(device);
  }
  // Gone ports keep their open handles, until closed by their owners
  known_devices.swap(current);
  return ret;
}

alsa_transmitter_t::alsa_transmitter_t(std::shared_ptr<aseq_t> aseq_,
                                       std::weak_ptr<alsa_device_t> device_,
                                       uint8_t port_, std::string name)
    : aseq(std::move(aseq_)), device(std::move(device_)), port(port_),
      name_(std::move(name)) {}

alsa_transmitter_t::~alsa_transmitter_t() {
  if (!closed) {
    try {
      aseq->remove_port(port);
    } catch (const std::exception &e) {
      ERROR("Error removing ALSA port for {}: {}", name_, e.what());
    }
  }
}

void alsa_transmitter_t::start() {
  std::weak_ptr<endpoint_t> weak = shared_from_this();
  aseq->set_event_handler(
      port, [weak](const std::vector<uint8_t> &data, timestamp_t timestamp) {
        auto self = weak.lock();
        if (!self)
          return;
        std::static_pointer_cast<alsa_transmitter_t>(self)->data_ready(
            data, timestamp);
      });
}

void alsa_transmitter_t::data_ready(const std::vector<uint8_t> &data,
                                    timestamp_t timestamp) {
  normalizer.normalize_stream(
      data.data(), data.size(), [&](const std::vector<uint8_t> &bytes) {
        try {
          transmit(encode(bytes), timestamp);
        } catch (const malformed_message &e) {
          WARNING_RATE_LIMIT(10, "Dropping message from {}: {}", name_,
                             e.what());
        }
      });
}

void alsa_transmitter_t::close() {
  transmitter_t::close();
  if (closed.exchange(true))
    return;
  if (auto dev = device.lock()) {
    dev->transmitter_closed(this);
  }
  aseq->remove_port(port);
}

alsa_receiver_t::alsa_receiver_t(std::shared_ptr<aseq_t> aseq_,
                                 std::weak_ptr<alsa_device_t> device_,
                                 uint8_t port_, std::string name)
    : aseq(std::move(aseq_)), device(std::move(device_)), port(port_),
      name_(std::move(name)) {}

alsa_receiver_t::~alsa_receiver_t() {
  if (!closed) {
    try {
      aseq->remove_port(port);
    } catch (const std::exception &e) {
      ERROR("Error removing ALSA port for {}: {}", name_, e.what());
    }
  }
}

void alsa_receiver_t::send(const midi_message_t &message,
                           timestamp_t /*timestamp*/) {
  std::lock_guard<std::mutex> lock(mutex);
  if (closed) {
    throw transport_failure(ENODEV, "Receiver {} is closed", name_);
  }
  aseq->send(port, message.bytes());
}

void alsa_receiver_t::close() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed)
      return;
    closed = true;
  }
  if (auto dev = device.lock()) {
    dev->receiver_closed(this);
  }
  aseq->remove_port(port);
}

alsa_device_t::alsa_device_t(std::shared_ptr<aseq_t> aseq_,
                             aseq_t::port_info_t port_info_)
    : aseq(std::move(aseq_)), port_info(std::move(port_info_)) {}

alsa_device_t::~alsa_device_t() {}

device_info_t alsa_device_t::info() const {
  return device_info_t{
      port_info.name(), port_info.client_name,
      FMT::format("ALSA sequencer port {}", port_info.address),
      SND_LIB_VERSION_STR};
}

int alsa_device_t::max_transmitters() const {
  return port_info.can_read() ? UNLIMITED : 0;
}

int alsa_device_t::max_receivers() const {
  return port_info.can_write() ? UNLIMITED : 0;
}

std::shared_ptr<transmitter_t> alsa_device_t::get_transmitter() {
  if (!port_info.can_read()) {
    throw unsupported_direction("Device {} can not transmit", name());
  }
  auto self = std::static_pointer_cast<alsa_device_t>(shared_from_this());
  std::lock_guard<std::mutex> lock(mutex);
  auto tname =
      FMT::format("{} transmitter {}", name(), open_transmitters.size() + 1);
  auto port = aseq->create_port(tname, SND_SEQ_PORT_CAP_WRITE |
                                           SND_SEQ_PORT_CAP_SUBS_WRITE |
                                           SND_SEQ_PORT_CAP_NO_EXPORT);
  try {
    aseq->connect(port_info.address, aseq_t::port_t(aseq->client_id, port));
  } catch (const transport_failure &) {
    aseq->remove_port(port);
    throw;
  }
  auto transmitter =
      std::make_shared<alsa_transmitter_t>(aseq, self, port, tname);
  transmitter->start();
  open_transmitters.push_back(transmitter);
  DEBUG("Opened {} at port {}:{}", tname, aseq->client_id, port);
  return transmitter;
}

std::shared_ptr<receiver_t> alsa_device_t::get_receiver() {
  if (!port_info.can_write()) {
    throw unsupported_direction("Device {} can not receive", name());
  }
  auto self = std::static_pointer_cast<alsa_device_t>(shared_from_this());
  std::lock_guard<std::mutex> lock(mutex);
  if (receiver) {
    return receiver;
  }
  auto rname = FMT::format("{} receiver", name());
  auto port = aseq->create_port(rname, SND_SEQ_PORT_CAP_READ |
                                           SND_SEQ_PORT_CAP_SUBS_READ |
                                           SND_SEQ_PORT_CAP_NO_EXPORT);
  try {
    aseq->connect(aseq_t::port_t(aseq->client_id, port), port_info.address);
  } catch (const transport_failure &) {
    aseq->remove_port(port);
    throw;
  }
  receiver = std::make_shared<alsa_receiver_t>(aseq, self, port, rname);
  DEBUG("Opened {} at port {}:{}", rname, aseq->client_id, port);
  return receiver;
}

std::vector<std::shared_ptr<transmitter_t>> alsa_device_t::transmitters() {
  std::lock_guard<std::mutex> lock(mutex);
  return std::vector<std::shared_ptr<transmitter_t>>(open_transmitters.begin(),
                                                     open_transmitters.end());
}

std::vector<std::shared_ptr<receiver_t>> alsa_device_t::receivers() {
  std::lock_guard<std::mutex> lock(mutex);
  if (!receiver) {
    return {};
  }
  return {receiver};
}

void alsa_device_t::close_all() {
  std::vector<std::shared_ptr<alsa_transmitter_t>> transmitters_copy;
  std::shared_ptr<alsa_receiver_t> receiver_copy;
  {
    std::lock_guard<std::mutex> lock(mutex);
    transmitters_copy = open_transmitters;
    receiver_copy = receiver;
  }
  for (auto &transmitter : transmitters_copy) {
    try {
      transmitter->close();
    } catch (const transport_failure &e) {
      ERROR("Error closing {}: {}", transmitter->name(), e.what());
    }
  }
  if (receiver_copy) {
    try {
      receiver_copy->close();
    } catch (const transport_failure &e) {
      ERROR("Error closing {}: {}", receiver_copy->name(), e.what());
    }
  }
}

void alsa_device_t::transmitter_closed(alsa_transmitter_t *transmitter) {
  DEBUG("Closed {}", transmitter->name());
  std::lock_guard<std::mutex> lock(mutex);
  open_transmitters.erase(
      std::remove_if(open_transmitters.begin(), open_transmitters.end(),
                     [transmitter](const auto &t) {
                       return t.get() == transmitter;
                     }),
      open_transmitters.end());
}

void alsa_device_t::receiver_closed(alsa_receiver_t *receiver_) {
  std::lock_guard<std::mutex> lock(mutex);
  if (receiver.get() == receiver_) {
    receiver = nullptr;
    DEBUG("Closed {}", info().name);
  }
}

} // namespace midiroute
