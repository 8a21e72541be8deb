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
#include <cctype>
#include <midiroute/exceptions.hpp>
#include <midiroute/logger.hpp>
#include <string>

namespace midiroute {
midiroute::logger_t logger;

struct level_style_t {
  const char *name;
  const char *number;
  const char *color;
};

// Indexed by logger_level_t
static constexpr level_style_t level_styles[] = {
    {"debug", "0", "\033[1;34m"},
    {"info", "1", ""},
    {"warning", "2", "\033[1;33m"},
    {"error", "3", "\033[1;31m"},
};

static constexpr const char *basename(const char *filename) {
  const char *p = filename;
  for (; *filename; filename++) {
    if (*filename == '/') {
      p = filename + 1;
    }
  }
  return p;
}

logger_t::buffer_t::iterator
logger_t::log_preamble(logger_level_t level, const char *filename, int lineno) {
  auto it = FMT::format_to(buffer.begin(), "{}", level_styles[level].color);
  auto origin = it;
  it = FMT::format_to(it, "[{}] {}:{}", level, basename(filename), lineno);
  // Aligned message column
  while (it - origin < 40) {
    *it++ = ' ';
  }
  return FMT::format_to(it, " | ");
}

void logger_t::log_postamble(buffer_t::iterator it) {
  it = FMT::format_to(it, "\033[0m");
  *it = '\0';
  std::cerr << buffer.data() << std::endl;
}

logger_level_t str_to_log_level(const std::string &value) {
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  for (int level = DEBUG; level <= ERROR; level++) {
    const auto &style = level_styles[level];
    if (lower == style.name || lower == style.number) {
      return static_cast<logger_level_t>(level);
    }
  }
  throw midiroute::exception(
      "Invalid log level value: {}. Valid values: debug, info, warning, "
      "error, or 0-3",
      value);
}

} // namespace midiroute
