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

#include <midiroute/logger.hpp>
#include <midiroute/midi_normalizer.hpp>
#include <midiroute/midimessage.hpp>

// do nothing
#define DEBUG0(...)

namespace midiroute {
midi_normalizer_t::midi_normalizer_t() {
  m_buffer.reserve(4); // optimistic about no SysEx, so only quite
                       // small messages
}

midi_normalizer_t::~midi_normalizer_t() {}

void midi_normalizer_t::normalize_stream(const uint8_t *data, size_t size,
                                         const callback_t &callback) {
  DEBUG0("Input stream: {}", hex(data, size));
  for (size_t offset = 0; offset < size; offset++) {
    parse_midi_byte(data[offset], callback);
  }
}

void midi_normalizer_t::parse_midi_byte(const uint8_t byte,
                                        const callback_t &callback) {
  DEBUG0("Parsing byte: 0x{:02X}", byte);
  if (byte >= 0xF8) {
    std::vector<uint8_t> realtime{byte};
    callback(realtime);
    return;
  }

  if (byte & 0x80) {
    if (waiting_for_size == 0 && byte == SYSEX_END_BYTE) {
      DEBUG0("SysEx end");
      m_buffer.push_back(byte);
      callback(m_buffer);
      m_buffer.clear();
      waiting_for_size = -1;
      return;
    }
    if (!m_buffer.empty()) {
      WARNING_RATE_LIMIT(10, "Dropping incomplete MIDI message: {}",
                         hex(m_buffer));
      m_buffer.clear();
    }
    m_buffer.push_back(byte);
    waiting_for_size = expected_length(byte);
    // only channel messages can be continued by running status
    running_status = byte < 0xF0 ? byte : 0;
  } else {
    if (waiting_for_size == -1) {
      if (running_status == 0) {
        WARNING_RATE_LIMIT(10, "Data byte 0x{:02X} without status. Ignored.",
                           byte);
        return;
      }
      m_buffer.push_back(running_status);
      waiting_for_size = expected_length(running_status);
    }
    m_buffer.push_back(byte);
  }

  DEBUG0("Waiting for size: {}, at {}", waiting_for_size, m_buffer.size());
  if (waiting_for_size > 0 && m_buffer.size() == (size_t)waiting_for_size) {
    callback(m_buffer);
    m_buffer.clear();
    waiting_for_size = -1;
  }
}

void midi_normalizer_t::reset() {
  m_buffer.clear();
  running_status = 0;
  waiting_for_size = -1;
}
} // namespace midiroute
