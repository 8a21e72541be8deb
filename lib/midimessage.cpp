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

#include <midiroute/exceptions.hpp>
#include <midiroute/logger.hpp>
#include <midiroute/midimessage.hpp>

namespace midiroute {

midi_message_t midi_message_t::short_message(uint8_t status, uint8_t data1,
                                             uint8_t data2) {
  if (status < 0x80) {
    throw malformed_message("Invalid status byte 0x{:02X}", status);
  }
  if (status == SYSEX_START_BYTE) {
    throw malformed_message("System exclusive is not a short message");
  }
  auto length = expected_length(status);
  std::vector<uint8_t> bytes{status};
  if (length > 1) {
    if (data1 > 0x7F) {
      throw malformed_message("Invalid data byte 0x{:02X}", data1);
    }
    bytes.push_back(data1);
  }
  if (length > 2) {
    if (data2 > 0x7F) {
      throw malformed_message("Invalid data byte 0x{:02X}", data2);
    }
    bytes.push_back(data2);
  }
  return midi_message_t(SHORT, std::move(bytes));
}

midi_message_t midi_message_t::sysex_message(const uint8_t *data,
                                             size_t size) {
  if (size == 0 || data[0] != SYSEX_START_BYTE) {
    throw malformed_message("System exclusive must start with 0xF0");
  }
  return midi_message_t(SYSEX, std::vector<uint8_t>(data, data + size));
}

std::string midi_message_t::to_string() const {
  return FMT::format("[{} {}]", kind_, hex(bytes_));
}

int expected_length(uint8_t status) {
  if (status < 0xF0) {
    switch (status & 0xF0) {
    case 0xC0:
    case 0xD0:
      return 2;
    default:
      // data bytes are also here, as if it was running status
      return 3;
    }
  }
  switch (status) {
  case 0xF0:
    return 0;
  case 0xF1:
  case 0xF3:
    return 2;
  case 0xF2:
    return 3;
  default:
    return 1;
  }
}

static event_type_e classify_status(uint8_t status) {
  switch (status & 0xF0) {
  case 0x80:
    return event_type_e::NOTE_OFF;
  case 0x90:
    return event_type_e::NOTE_ON;
  case 0xA0:
    return event_type_e::POLY_PRESSURE;
  case 0xB0:
    return event_type_e::CONTROL_CHANGE;
  case 0xC0:
    return event_type_e::PROGRAM_CHANGE;
  case 0xD0:
    return event_type_e::CHANNEL_PRESSURE;
  case 0xE0:
    return event_type_e::PITCH_BEND;
  case 0xF0:
    break;
  default:
    return event_type_e::SHORT;
  }

  switch (status) {
  case 0xF0:
    return event_type_e::SYSEX_START;
  case 0xF1:
    return event_type_e::MTC_QUARTER_FRAME;
  case 0xF2:
    return event_type_e::SONG_POSITION;
  case 0xF3:
    return event_type_e::SONG_SELECT;
  case 0xF6:
    return event_type_e::TUNE_REQUEST;
  case 0xF7:
    return event_type_e::SYSEX_END;
  case 0xF8:
    return event_type_e::TIMING_CLOCK;
  case 0xFA:
    return event_type_e::START;
  case 0xFB:
    return event_type_e::CONTINUE;
  case 0xFC:
    return event_type_e::STOP;
  case 0xFE:
    return event_type_e::ACTIVE_SENSING;
  case 0xFF:
    return event_type_e::RESET;
  default:
    return event_type_e::SHORT;
  }
}

event_type_e classify(const uint8_t *data, size_t size) {
  if (size == 0) {
    throw malformed_message("Empty MIDI message");
  }
  return classify_status(data[0]);
}

event_type_e classify(const std::vector<uint8_t> &data) {
  return classify(data.data(), data.size());
}

midi_event_t decode(const uint8_t *data, size_t size) {
  midi_event_t event;
  event.type = classify(data, size);
  event.status = data[0];

  if (event.type == event_type_e::SYSEX_START) {
    event.sysex.assign(data, data + size);
    return event;
  }

  // Unknown statuses keep whatever data they came with
  int length = event.type == event_type_e::SHORT
                   ? 3
                   : expected_length(event.status);
  if (length > 1 && size > 1) {
    event.data1 = data[1];
  }
  if (length > 2 && size > 2) {
    event.data2 = data[2];
  }
  return event;
}

midi_event_t decode(const std::vector<uint8_t> &data) {
  return decode(data.data(), data.size());
}

midi_event_t decode(const midi_message_t &message) {
  return decode(message.bytes());
}

midi_message_t encode(const midi_event_t &event) {
  // Live wire semantics: 0xFF is reset, there are no meta events here
  if (event.status == RESET_BYTE) {
    return midi_message_t::short_message(RESET_BYTE);
  }

  if (event.type == event_type_e::SYSEX_START) {
    if (event.sysex.empty()) {
      if (event.status != SYSEX_START_BYTE) {
        throw malformed_message("System exclusive must start with 0xF0, not "
                                "0x{:02X}",
                                event.status);
      }
      uint8_t only_start = SYSEX_START_BYTE;
      return midi_message_t::sysex_message(&only_start, 1);
    }
    return midi_message_t::sysex_message(event.sysex);
  }

  auto length = expected_length(event.status);
  if (length == 0) {
    throw malformed_message("0xF0 requires a sysex-start event, got {}",
                            event.type);
  }
  if (length > 1 && !event.data1) {
    throw malformed_message("Missing data1 for status 0x{:02X}", event.status);
  }
  if (length > 2 && !event.data2) {
    throw malformed_message("Missing data2 for status 0x{:02X}", event.status);
  }
  return midi_message_t::short_message(event.status, event.data1.value_or(0),
                                       event.data2.value_or(0));
}

midi_message_t encode(const uint8_t *data, size_t size) {
  // Any length, stored-file meta events included
  if (size > 0 && data[0] == RESET_BYTE) {
    return midi_message_t::short_message(RESET_BYTE);
  }
  auto event = decode(data, size);
  if (event.type != event_type_e::SYSEX_START && size > 3) {
    throw malformed_message("{} bytes for a {} message, at most 3 allowed",
                            size, event.type);
  }
  return encode(event);
}

midi_message_t encode(const std::vector<uint8_t> &data) {
  return encode(data.data(), data.size());
}

std::string hex(const uint8_t *data, size_t size) {
  std::string ret;
  ret.reserve(size * 3);
  for (size_t i = 0; i < size; i++) {
    if (i != 0) {
      ret += ' ';
    }
    ret += FMT::format("{:02X}", data[i]);
  }
  return ret;
}

static int hex_digit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::vector<uint8_t> parse_hex(const std::string &str) {
  std::vector<uint8_t> ret;
  int high = -1;
  for (auto c : str) {
    if (c == ' ' || c == ':' || c == ',') {
      if (high >= 0) {
        throw malformed_message("Odd number of hex digits at \"{}\"", str);
      }
      continue;
    }
    auto digit = hex_digit(c);
    if (digit < 0) {
      throw malformed_message("Invalid hex digit '{}' at \"{}\"", c, str);
    }
    if (high < 0) {
      high = digit;
    } else {
      ret.push_back((high << 4) | digit);
      high = -1;
    }
  }
  if (high >= 0) {
    throw malformed_message("Odd number of hex digits at \"{}\"", str);
  }
  return ret;
}

} // namespace midiroute
