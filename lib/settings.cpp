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
#include <cstdlib>
#include <fstream>
#include <midiroute/exceptions.hpp>
#include <midiroute/settings.hpp>
#include <sstream>

namespace midiroute {

static std::string trim_copy(const std::string &s) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto start = std::find_if_not(s.begin(), s.end(), is_space);
  auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (start >= end) {
    return {};
  }
  return std::string(start, end);
}

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  return s;
}

bool str_to_bool(const std::string &value) {
  auto lower = to_lower(value);
  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1")
    return true;
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0")
    return false;
  throw exception("Invalid boolean value: {}", value);
}

static int str_to_positive_int(const std::string &filename, int lineno,
                               const std::string &value) {
  char *end = nullptr;
  long ret = std::strtol(value.c_str(), &end, 10);
  if (value.empty() || *end != '\0' || ret <= 0 || ret > 0x7FFFFFFF) {
    throw ini_exception(filename, lineno, "Invalid positive number: {}",
                        value);
  }
  return (int)ret;
}

void load_ini(const std::string &filename, settings_t &settings) {
  auto fd = std::ifstream(filename);
  if (!fd.is_open()) {
    throw exception("Cannot open ini file: {}", filename);
  }
  std::stringstream data;
  data << fd.rdbuf();
  parse_ini(data.str(), filename, settings);
}

void parse_ini(const std::string &data, const std::string &filename,
               settings_t &settings) {
  std::istringstream fd(data);
  std::string line;
  std::string section;
  std::string key;
  std::string value;

  int lineno = 0;
  while (std::getline(fd, line)) {
    lineno++;
    // Remove comments
    auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line = line.substr(0, comment_pos);
    }
    line = trim_copy(line);

    if (line.length() == 0) {
      continue;
    }
    if (line[0] == '[') {
      if (line[line.length() - 1] != ']') {
        throw ini_exception(filename, lineno, "Invalid section: {}", line);
      }
      section = trim_copy(line.substr(1, line.length() - 2));
      if (section != "general" && section != "alsa") {
        throw ini_exception(filename, lineno, "Invalid section: {}", section);
      }
      continue;
    }
    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      throw ini_exception(filename, lineno, "Invalid line: {}", line);
    }
    key = trim_copy(line.substr(0, eq_pos));
    value = trim_copy(line.substr(eq_pos + 1));

    try {
      if (section == "general") {
        if (key == "name") {
          settings.client_name = value;
        } else if (key == "log_level") {
          settings.log_level = value;
        } else {
          throw ini_exception(filename, lineno, "Invalid key: {}", key);
        }
      } else if (section == "alsa") {
        if (key == "name") {
          settings.client_name = value;
        } else if (key == "include_system_ports") {
          settings.include_system_ports = str_to_bool(value);
        } else if (key == "include_own_ports") {
          settings.include_own_ports = str_to_bool(value);
        } else if (key == "pool_size") {
          settings.pool_size = str_to_positive_int(filename, lineno, value);
        } else if (key == "input_buffer_size") {
          settings.input_buffer_size =
              str_to_positive_int(filename, lineno, value);
        } else if (key == "output_buffer_size") {
          settings.output_buffer_size =
              str_to_positive_int(filename, lineno, value);
        } else {
          throw ini_exception(filename, lineno, "Invalid key: {}", key);
        }
      } else {
        throw ini_exception(filename, lineno, "Key outside of a section: {}",
                            key);
      }
    } catch (const ini_exception &) {
      throw;
    } catch (const exception &e) {
      throw ini_exception(filename, lineno, "{}", e.what());
    }
  }
}

} // namespace midiroute
