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
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace midiroute {

constexpr uint8_t SYSEX_START_BYTE = 0xF0;
constexpr uint8_t SYSEX_END_BYTE = 0xF7;
constexpr uint8_t RESET_BYTE = 0xFF;

enum class event_type_e {
  NOTE_OFF,
  NOTE_ON,
  POLY_PRESSURE,
  CONTROL_CHANGE,
  PROGRAM_CHANGE,
  CHANNEL_PRESSURE,
  PITCH_BEND,
  SYSEX_START,
  MTC_QUARTER_FRAME,
  SONG_POSITION,
  SONG_SELECT,
  TUNE_REQUEST,
  SYSEX_END,
  TIMING_CLOCK,
  START,
  CONTINUE,
  STOP,
  ACTIVE_SENSING,
  RESET,
  // Only as given by callers. 0xFF on the wire is always RESET.
  META,
  // Anything else: data byte in status position, undefined system bytes
  SHORT,
};

/**
 * @short Structured form of a MIDI message
 *
 * data1 and data2 are only present for the kinds that carry them. For
 * SYSEX_START the whole byte sequence, including the leading 0xF0, is in
 * sysex.
 */
struct midi_event_t {
  uint8_t status = 0;
  std::optional<uint8_t> data1;
  std::optional<uint8_t> data2;
  event_type_e type = event_type_e::SHORT;
  std::vector<uint8_t> sysex;

  bool is_channel_message() const { return status >= 0x80 && status < 0xF0; }
  uint8_t channel() const { return status & 0x0F; }
};

/**
 * @short Native message as handed to and received from the platform
 *
 * Either a short message (1 to 3 bytes) or a variable length system
 * exclusive message. Immutable once built; build with encode().
 */
class midi_message_t {
public:
  enum kind_e { SHORT, SYSEX };

  static midi_message_t short_message(uint8_t status, uint8_t data1 = 0,
                                      uint8_t data2 = 0);
  static midi_message_t sysex_message(const uint8_t *data, size_t size);
  static midi_message_t sysex_message(const std::vector<uint8_t> &data) {
    return sysex_message(data.data(), data.size());
  }

  kind_e kind() const { return kind_; }
  const std::vector<uint8_t> &bytes() const { return bytes_; }
  size_t size() const { return bytes_.size(); }
  uint8_t status() const { return bytes_[0]; }
  uint8_t data1() const { return bytes_.size() > 1 ? bytes_[1] : 0; }
  uint8_t data2() const { return bytes_.size() > 2 ? bytes_[2] : 0; }

  bool operator==(const midi_message_t &other) const {
    return kind_ == other.kind_ && bytes_ == other.bytes_;
  }

  std::string to_string() const;

private:
  midi_message_t(kind_e kind, std::vector<uint8_t> bytes)
      : kind_(kind), bytes_(std::move(bytes)) {}

  kind_e kind_;
  std::vector<uint8_t> bytes_;
};

/// Total length of a short message with this status, 0 for sysex start
int expected_length(uint8_t status);

/// Which kind of message these bytes are. Throws malformed_message if empty.
event_type_e classify(const uint8_t *data, size_t size);
event_type_e classify(const std::vector<uint8_t> &data);

/// Never fails for non empty input. Unknown status gives event_type_e::SHORT.
midi_event_t decode(const uint8_t *data, size_t size);
midi_event_t decode(const std::vector<uint8_t> &data);
midi_event_t decode(const midi_message_t &message);

/**
 * @short Structured to native message
 *
 * 0xFF is always a one byte reset, never a file meta event. SYSEX_START gives
 * a sysex message with exactly the given bytes. Anything else is a short
 * message of the size the status asks for.
 *
 * Throws malformed_message on invalid layouts.
 */
midi_message_t encode(const midi_event_t &event);
midi_message_t encode(const uint8_t *data, size_t size);
midi_message_t encode(const std::vector<uint8_t> &data);

std::string hex(const uint8_t *data, size_t size);
inline std::string hex(const std::vector<uint8_t> &data) {
  return hex(data.data(), data.size());
}
/// "90 40 7F" or "90407F" to bytes. Throws malformed_message.
std::vector<uint8_t> parse_hex(const std::string &str);
} // namespace midiroute

ENUM_FORMATTER_BEGIN(midiroute::event_type_e);
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::NOTE_OFF, "note-off");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::NOTE_ON, "note-on");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::POLY_PRESSURE,
                       "poly-pressure");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::CONTROL_CHANGE,
                       "control-change");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::PROGRAM_CHANGE,
                       "program-change");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::CHANNEL_PRESSURE,
                       "channel-pressure");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::PITCH_BEND, "pitch-bend");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::SYSEX_START, "sysex-start");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::MTC_QUARTER_FRAME,
                       "mtc-quarter-frame");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::SONG_POSITION,
                       "song-position");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::SONG_SELECT, "song-select");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::TUNE_REQUEST, "tune-request");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::SYSEX_END, "sysex-end");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::TIMING_CLOCK, "timing-clock");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::START, "start");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::CONTINUE, "continue");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::STOP, "stop");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::ACTIVE_SENSING,
                       "active-sensing");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::RESET, "reset");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::META, "meta");
ENUM_FORMATTER_ELEMENT(midiroute::event_type_e::SHORT, "short");
ENUM_FORMATTER_END();

ENUM_FORMATTER_BEGIN(midiroute::midi_message_t::kind_e);
ENUM_FORMATTER_ELEMENT(midiroute::midi_message_t::SHORT, "short");
ENUM_FORMATTER_ELEMENT(midiroute::midi_message_t::SYSEX, "sysex");
ENUM_FORMATTER_END();

TO_STRING_FORMATTER(midiroute::midi_message_t);
BASIC_FORMATTER(midiroute::midi_event_t, "midi_event_t[{}, status={:02X}]",
                v.type, v.status);
