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

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace midiroute {
/**
 * @short Splits a raw MIDI byte stream into single messages
 *
 * The stream can come in any chunking, so some state is kept between calls.
 * Real time bytes (0xF8 and up) are emitted as soon as seen, even in the
 * middle of another message. Running status is expanded so every emitted
 * message carries its status byte.
 */
class midi_normalizer_t {
public:
  using callback_t = std::function<void(const std::vector<uint8_t> &)>;

  midi_normalizer_t();
  ~midi_normalizer_t();

  void normalize_stream(const uint8_t *data, size_t size,
                        const callback_t &callback);
  void parse_midi_byte(const uint8_t byte, const callback_t &callback);

  /// Drops any partial message
  void reset();

protected:
  std::vector<uint8_t> m_buffer;
  uint8_t running_status = 0;
  int waiting_for_size = -1; // -1 is unknown, 0 is SysEx (until byte F7),
                             // 1-3 is the size of the packet
};
} // namespace midiroute
