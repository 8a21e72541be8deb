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

#include "formatterhelper.hpp"
#include "midimessage.hpp"
#include "utils.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace midiroute {

/// Microseconds since a platform defined origin
using timestamp_t = int64_t;
/// Deliver as soon as possible
constexpr timestamp_t TIMESTAMP_NOW = -1;

/// For max_transmitters() and max_receivers(). 0 means not supported.
constexpr int UNLIMITED = -1;

class transmitter_t;
class receiver_t;

/**
 * @short Anything MIDI can come out of or go into
 *
 * Devices, transmitters and receivers are all endpoints, and each one says
 * which directions it can be coerced to. A failed coercion throws
 * unsupported_direction.
 */
class endpoint_t : public std::enable_shared_from_this<endpoint_t> {
public:
  virtual ~endpoint_t();

  virtual std::string name() const = 0;
  virtual bool can_transmit() const = 0;
  virtual bool can_receive() const = 0;
  virtual std::shared_ptr<transmitter_t> as_transmitter() = 0;
  virtual std::shared_ptr<receiver_t> as_receiver() = 0;
  virtual const char *get_type() const = 0;
};

/**
 * @short Receiving side of a connection
 *
 * send() may be called from any thread. Errors from the platform are thrown
 * as transport_failure.
 */
class receiver_t : public endpoint_t {
public:
  virtual void send(const midi_message_t &message, timestamp_t timestamp) = 0;
  /// Releases the platform resources. Calling it twice is harmless.
  virtual void close() = 0;

  bool can_transmit() const override { return false; }
  bool can_receive() const override { return true; }
  std::shared_ptr<transmitter_t> as_transmitter() override;
  std::shared_ptr<receiver_t> as_receiver() override;
};

/**
 * @short Transmitting side of a connection, with a single receiver slot
 *
 * Setting a receiver replaces the previous one, which is not told about it.
 * Platform backends call transmit() for every inbound message, on their own
 * I/O thread.
 */
class transmitter_t : public endpoint_t {
  NON_COPYABLE_NOR_MOVABLE(transmitter_t)

public:
  transmitter_t() = default;

  void set_receiver(std::shared_ptr<receiver_t> receiver);
  std::shared_ptr<receiver_t> get_receiver() const;
  virtual void close();

  bool can_transmit() const override { return true; }
  bool can_receive() const override { return false; }
  std::shared_ptr<transmitter_t> as_transmitter() override;
  std::shared_ptr<receiver_t> as_receiver() override;

protected:
  /// Returns false if there was nobody at the slot
  bool transmit(const midi_message_t &message, timestamp_t timestamp);

private:
  mutable std::mutex slot_mutex;
  std::shared_ptr<receiver_t> receiver;
};

struct device_info_t {
  std::string name;
  std::string vendor;
  std::string description;
  std::string version;
};

/**
 * @short A platform MIDI device or port
 *
 * The platform says how many transmitters and receivers it can open: 0 is
 * none, UNLIMITED is any. Each get_transmitter() opens a new transmitter,
 * with its own slot. get_receiver() gives the device receiver.
 */
class device_t : public endpoint_t {
public:
  virtual device_info_t info() const = 0;
  virtual int max_transmitters() const = 0;
  virtual int max_receivers() const = 0;
  virtual std::shared_ptr<transmitter_t> get_transmitter() = 0;
  virtual std::shared_ptr<receiver_t> get_receiver() = 0;
  /// Currently open transmitters
  virtual std::vector<std::shared_ptr<transmitter_t>> transmitters() = 0;
  /// Currently open receivers
  virtual std::vector<std::shared_ptr<receiver_t>> receivers() = 0;

  std::string name() const override { return info().name; }
  bool can_transmit() const override { return max_transmitters() != 0; }
  bool can_receive() const override { return max_receivers() != 0; }
  std::shared_ptr<transmitter_t> as_transmitter() override;
  std::shared_ptr<receiver_t> as_receiver() override;
};

} // namespace midiroute

BASIC_FORMATTER(midiroute::device_info_t, "{}", v.name);
