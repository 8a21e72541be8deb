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

#include "aseq.hpp"
#include "devicedirectory.hpp"
#include "endpoint.hpp"
#include "midi_normalizer.hpp"
#include "settings.hpp"
#include "utils.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace midiroute {
class alsa_device_t;

/**
 * @short ALSA sequencer as a MIDI stack
 *
 * Each exported port of any other client is a device. Devices are cached by
 * address, so the same port keeps the same device between calls to
 * devices().
 */
class alsa_transport_t : public transport_t {
  NON_COPYABLE_NOR_MOVABLE(alsa_transport_t)

public:
  explicit alsa_transport_t(const settings_t &settings);
  ~alsa_transport_t() override;

  std::vector<std::shared_ptr<device_t>> devices() override;
  const char *get_type() const override { return "alsa_transport_t"; }

  std::shared_ptr<aseq_t> get_aseq() { return aseq; }

private:
  settings_t settings;
  std::shared_ptr<aseq_t> aseq;
  std::mutex mutex;
  std::map<aseq_t::port_t, std::shared_ptr<alsa_device_t>> known_devices;

  bool is_visible(const aseq_t::port_info_t &port) const;
};

/// Private local port subscribed to the device port, reads from it
class alsa_transmitter_t : public transmitter_t {
public:
  alsa_transmitter_t(std::shared_ptr<aseq_t> aseq,
                     std::weak_ptr<alsa_device_t> device, uint8_t port,
                     std::string name);
  ~alsa_transmitter_t() override;

  std::string name() const override { return name_; }
  const char *get_type() const override { return "alsa_transmitter_t"; }
  void close() override;

  /// Starts listening to events at the local port
  void start();
  uint8_t get_port() const { return port; }

private:
  std::shared_ptr<aseq_t> aseq;
  std::weak_ptr<alsa_device_t> device;
  uint8_t port;
  std::string name_;
  std::atomic<bool> closed{false};
  // Only used from the I/O thread
  midi_normalizer_t normalizer;

  void data_ready(const std::vector<uint8_t> &data, timestamp_t timestamp);
};

/// Private local port subscribed to the device port, writes to it
class alsa_receiver_t : public receiver_t {
  NON_COPYABLE_NOR_MOVABLE(alsa_receiver_t)

public:
  alsa_receiver_t(std::shared_ptr<aseq_t> aseq,
                  std::weak_ptr<alsa_device_t> device, uint8_t port,
                  std::string name);
  ~alsa_receiver_t() override;

  std::string name() const override { return name_; }
  const char *get_type() const override { return "alsa_receiver_t"; }
  /// Sends now. ALSA does the scheduling for queued events only.
  void send(const midi_message_t &message, timestamp_t timestamp) override;
  void close() override;

  uint8_t get_port() const { return port; }

private:
  std::shared_ptr<aseq_t> aseq;
  std::weak_ptr<alsa_device_t> device;
  uint8_t port;
  std::string name_;
  std::mutex mutex;
  bool closed = false;
};

class alsa_device_t : public device_t {
  NON_COPYABLE_NOR_MOVABLE(alsa_device_t)

public:
  alsa_device_t(std::shared_ptr<aseq_t> aseq, aseq_t::port_info_t port_info);
  ~alsa_device_t() override;

  device_info_t info() const override;
  int max_transmitters() const override;
  int max_receivers() const override;
  const char *get_type() const override { return "alsa_device_t"; }

  std::shared_ptr<transmitter_t> get_transmitter() override;
  std::shared_ptr<receiver_t> get_receiver() override;
  std::vector<std::shared_ptr<transmitter_t>> transmitters() override;
  std::vector<std::shared_ptr<receiver_t>> receivers() override;

  const aseq_t::port_info_t &get_port_info() const { return port_info; }
  void close_all();

protected:
  friend class alsa_transmitter_t;
  friend class alsa_receiver_t;
  void transmitter_closed(alsa_transmitter_t *transmitter);
  void receiver_closed(alsa_receiver_t *receiver);

private:
  std::shared_ptr<aseq_t> aseq;
  aseq_t::port_info_t port_info;

  std::mutex mutex;
  std::vector<std::shared_ptr<alsa_transmitter_t>> open_transmitters;
  std::shared_ptr<alsa_receiver_t> receiver;
};
} // namespace midiroute
