/**
 * midiroute - MIDI endpoint routing and message coercion
 * Copyright (C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "./test_utils.hpp"
#include "./test_case.hpp"
#include <cctype>
#include <midiroute/exceptions.hpp>

static int char_to_nibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + c - 'A';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + c - 'a';
  }
  throw midiroute::exception("{} is not an HEX number", c);
}

/**
 * @short Simple hex to bin
 *
 * Allows easy to understand hex to be converted to bin. Allows strings, binary
 * and hex digits:
 *
 * Example:
 *
 * hex_to_bin(
 *  "F0 [0111 1101]" // Sysex, non commercial id
 *  "'HELLO'"
 *  "F7"
 * );
 *
 * Bin must be 8 bits.
 */
std::vector<uint8_t> hex_to_bin(const std::string &str) {
  std::vector<uint8_t> buffer;
  buffer.reserve(str.length());

  // A state machine that alternates between most significant nibble, and least
  // significant nibble
  bool msn = false;
  bool quote = false;
  bool sqbr = false;
  int lastd = 0;
  uint8_t n = 0;
  for (char c : str) {
    if (quote) {
      if (c == '\'') {
        quote = false;
      } else {
        buffer.push_back(c);
      }
    } else if (sqbr) {
      if (c == ']') {
        sqbr = false;
        buffer.push_back(n);
      } else if (c == '0' || c == '1') {
        n <<= 1;
        n |= (c == '1');
      }
    } else if (c == '\'') {
      quote = true;
    } else if (c == '[') {
      sqbr = true;
      n = 0;
    } else if (!isalnum(c)) {
      // skip non alnum
      continue;
    } else if (!msn) {
      lastd = char_to_nibble(c) << 4;
      msn = true;
    } else {
      lastd |= char_to_nibble(c);
      buffer.push_back(lastd);
      msn = false;
    }
  }

  return buffer;
}

void received_messages_t::push(const std::vector<uint8_t> &bytes,
                               int64_t millis_) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    messages.push_back(bytes);
    millis.push_back(millis_);
  }
  cv.notify_all();
}

bool received_messages_t::wait_for(size_t count,
                                   std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex);
  return cv.wait_for(lock, timeout,
                     [this, count] { return messages.size() >= count; });
}

size_t received_messages_t::size() {
  std::lock_guard<std::mutex> lock(mutex);
  return messages.size();
}

std::vector<uint8_t> received_messages_t::at(size_t n) {
  std::lock_guard<std::mutex> lock(mutex);
  if (n >= messages.size()) {
    FAIL(FMT::format("No message {}, only {} received", n, messages.size()));
  }
  return messages[n];
}

int64_t received_messages_t::millis_at(size_t n) {
  std::lock_guard<std::mutex> lock(mutex);
  if (n >= millis.size()) {
    FAIL(FMT::format("No message {}, only {} received", n, millis.size()));
  }
  return millis[n];
}
