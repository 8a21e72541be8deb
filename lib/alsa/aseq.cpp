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

#include <alsa/seq.h>
#include <alsa/seq_event.h>
#include <array>
#include <cerrno>
#include <cstdarg>
#include <cstring>
#include <midiroute/aseq.hpp>
#include <midiroute/exceptions.hpp>
#include <midiroute/logger.hpp>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace midiroute {
static void error_handler(const char *file, int line, const char *function,
                          int err, const char *fmt, ...) {
  // NOLINTNEXTLINE
  va_list arg;
  std::string msg;
  // NOLINTNEXTLINE
  char buffer[1024];

  if (err == ENOENT) /* Ignore those misleading "warnings" */
    return;
  // NOLINTNEXTLINE
  va_start(arg, fmt);
  // NOLINTNEXTLINE
  vsnprintf(buffer, sizeof(buffer), fmt, arg);
  // NOLINTNEXTLINE
  va_end(arg);
  msg += buffer;
  if (err) {
    msg += ": ";
    msg += snd_strerror(err);
  }
  ERROR("alsa/{}:{} {}: {}", file, line, function, msg);
}

std::string aseq_t::port_info_t::name() const {
  if (client_name == port_name)
    return client_name;
  return FMT::format("{}:{}", client_name, port_name);
}

bool aseq_t::port_info_t::can_read() const {
  return (capability & SND_SEQ_PORT_CAP_READ) &&
         (capability & SND_SEQ_PORT_CAP_SUBS_READ);
}

bool aseq_t::port_info_t::can_write() const {
  return (capability & SND_SEQ_PORT_CAP_WRITE) &&
         (capability & SND_SEQ_PORT_CAP_SUBS_WRITE);
}

aseq_t::aseq_t(const settings_t &settings)
    : name(settings.client_name),
      created_at(std::chrono::steady_clock::now()),
      encoder(settings.output_buffer_size),
      decoder(settings.input_buffer_size) {
  snd_lib_error_set_handler(error_handler);
  int res = snd_seq_open(&seq, "default", SND_SEQ_OPEN_DUPLEX, 0);
  if (res < 0) {
    throw transport_failure(
        -res, "Can't open sequencer. Maybe user has no permissions: {}",
        snd_strerror(res));
  }
  snd_seq_set_client_name(seq, name.c_str());

  snd_seq_client_pool_t *pool = nullptr;
  snd_seq_client_pool_alloca(&pool);
  if ((res = snd_seq_get_client_pool(seq, pool)) < 0) {
    ERROR("Failed to get pool: {}", snd_strerror(res));
  } else {
    snd_seq_client_pool_set_input_pool(pool, settings.pool_size);
    snd_seq_client_pool_set_output_pool(pool, settings.pool_size);

    if ((res = snd_seq_set_client_pool(seq, pool)) < 0) {
      ERROR("Failed to set pool: {}", snd_strerror(res));
    }
  }

  snd_seq_set_input_buffer_size(seq, settings.input_buffer_size);
  snd_seq_set_output_buffer_size(seq, settings.output_buffer_size);
  // Reads from the I/O thread must not block the writers
  snd_seq_nonblock(seq, 1);

  client_id = snd_seq_client_id(seq);

  epollfd = epoll_create1(0);
  stopfd = eventfd(0, 0);
  if (epollfd < 0 || stopfd < 0) {
    auto err = errno;
    close_fds();
    snd_seq_close(seq);
    throw transport_failure(err, "Could not start ALSA I/O loop: {}",
                            strerror(err));
  }

  auto poller_count = snd_seq_poll_descriptors_count(seq, POLLIN);
  // NOLINTNEXTLINE
  auto pfds = std::make_unique<struct pollfd[]>(poller_count);
  auto poller_count_check =
      snd_seq_poll_descriptors(seq, pfds.get(), poller_count, POLLIN);
  if (poller_count != poller_count_check) {
    close_fds();
    snd_seq_close(seq);
    throw transport_failure(EIO,
                            "ALSA seq poller count does not match. {} != {}",
                            poller_count, poller_count_check);
  }
  std::vector<int> fds;
  for (int i = 0; i < poller_count; i++) {
    fds.push_back(pfds[i].fd);
  }
  fds.push_back(stopfd);
  for (auto fd : fds) {
    struct epoll_event ev {};
    ev.events = EPOLLIN;
    ev.data.fd = fd;
    if (epoll_ctl(epollfd, EPOLL_CTL_ADD, fd, &ev) == -1) {
      auto err = errno;
      close_fds();
      snd_seq_close(seq);
      throw transport_failure(err, "Can't add fd {} to poller: {}", fd,
                              strerror(err));
    }
  }

  io_thread = std::thread([this] { io_loop(); });
  INFO("ALSA sequencer client {} opened as {}", name, client_id);
}

aseq_t::~aseq_t() {
  uint64_t one = 1;
  if (::write(stopfd, &one, sizeof(one)) != sizeof(one)) {
    ERROR("Could not stop ALSA I/O thread: {}", strerror(errno));
  }
  if (io_thread.joinable()) {
    io_thread.join();
  }
  close_fds();
  snd_seq_close(seq);
  snd_config_update_free_global();
  DEBUG("ALSA sequencer client {} closed", name);
}

void aseq_t::close_fds() {
  if (stopfd >= 0) {
    ::close(stopfd);
    stopfd = -1;
  }
  if (epollfd >= 0) {
    ::close(epollfd);
    epollfd = -1;
  }
}

void aseq_t::io_loop() {
  std::array<struct epoll_event, 8> events{};
  while (true) {
    auto nfds = epoll_wait(epollfd, events.data(), events.size(), -1);
    if (nfds < 0) {
      if (errno == EINTR)
        continue;
      ERROR("ALSA I/O loop failed: {}", strerror(errno));
      return;
    }
    for (int i = 0; i < nfds; i++) {
      if (events[i].data.fd == stopfd) {
        DEBUG("ALSA I/O loop stopped");
        return;
      }
    }
    read_ready();
  }
}

/**
 * @short data is ready at the sequencer to read
 *
 * Events are decoded under the sequencer lock, as ALSA reuses its input
 * buffer, and dispatched once it is released.
 */
void aseq_t::read_ready() {
  struct pending_t {
    uint8_t port;
    std::vector<uint8_t> data;
  };
  std::vector<pending_t> pending;
  timestamp_t timestamp = now();
  {
    std::lock_guard<std::mutex> lock(seq_mutex);
    snd_seq_event_t *ev = nullptr;
    int res;
    while ((res = snd_seq_event_input(seq, &ev)) >= 0 && ev) {
      switch (ev->type) {
      case SND_SEQ_EVENT_CLOCK:
      case SND_SEQ_EVENT_START:
      case SND_SEQ_EVENT_CONTINUE:
      case SND_SEQ_EVENT_STOP:
      case SND_SEQ_EVENT_NOTEOFF:
      case SND_SEQ_EVENT_NOTEON:
      case SND_SEQ_EVENT_KEYPRESS:
      case SND_SEQ_EVENT_CONTROLLER:
      case SND_SEQ_EVENT_PGMCHANGE:
      case SND_SEQ_EVENT_CHANPRESS:
      case SND_SEQ_EVENT_PITCHBEND:
      case SND_SEQ_EVENT_SONGPOS:
      case SND_SEQ_EVENT_SONGSEL:
      case SND_SEQ_EVENT_TUNE_REQUEST:
      case SND_SEQ_EVENT_RESET:
      case SND_SEQ_EVENT_SYSEX:
      case SND_SEQ_EVENT_QFRAME:
      case SND_SEQ_EVENT_SENSING: {
        auto data = decoder.ev_to_mididata(ev);
        if (!data.empty()) {
          pending.push_back(pending_t{ev->dest.port, std::move(data)});
        }
      } break;
      case SND_SEQ_EVENT_PORT_SUBSCRIBED:
      case SND_SEQ_EVENT_PORT_UNSUBSCRIBED:
      case SND_SEQ_EVENT_PORT_START:
      case SND_SEQ_EVENT_PORT_EXIT:
      case SND_SEQ_EVENT_CLIENT_START:
      case SND_SEQ_EVENT_CLIENT_EXIT:
        DEBUG("ALSA announce event {} from {}:{}", ev->type,
              ev->source.client, ev->source.port);
        break;
      default:
        static std::array<bool, SND_SEQ_EVENT_NONE + 1> warning_raised{};
        // NOLINTNEXTLINE
        if (!warning_raised[ev->type]) {
          // NOLINTNEXTLINE
          warning_raised[ev->type] = true;
          WARNING("This event type {} is not managed yet", ev->type);
        }
        break;
      }
    }
    if (res < 0 && res != -EAGAIN) {
      WARNING_RATE_LIMIT(10, "Error reading ALSA events: {}",
                         snd_strerror(res));
    }
  }

  for (auto &item : pending) {
    event_handler_t handler;
    {
      std::lock_guard<std::mutex> lock(handlers_mutex);
      auto it = event_handlers.find(item.port);
      if (it == event_handlers.end())
        continue;
      handler = it->second;
    }
    try {
      handler(item.data, timestamp);
    } catch (const std::exception &e) {
      ERROR("Error processing ALSA event at port {}: {}", item.port,
            e.what());
    }
  }
}

uint8_t aseq_t::create_port(const std::string &name, unsigned int caps) {
  std::lock_guard<std::mutex> lock(seq_mutex);
  auto port = snd_seq_create_simple_port(
      seq, name.c_str(), caps,
      SND_SEQ_PORT_TYPE_MIDI_GENERIC | SND_SEQ_PORT_TYPE_APPLICATION);
  if (port < 0) {
    throw transport_failure(-port, "Could not create ALSA port {}: {}", name,
                            snd_strerror(port));
  }
  DEBUG("Created ALSA port {}:{} {}", client_id, port, name);
  return port;
}

void aseq_t::remove_port(uint8_t port) {
  remove_event_handler(port);
  std::lock_guard<std::mutex> lock(seq_mutex);
  auto res = snd_seq_delete_simple_port(seq, port);
  if (res < 0) {
    throw transport_failure(-res, "Could not remove ALSA port {}:{}: {}",
                            client_id, port, snd_strerror(res));
  }
  DEBUG("Removed ALSA port {}:{}", client_id, port);
}

void aseq_t::connect(const port_t &from, const port_t &to) {
  DEBUG("Connect alsa ports {} -> {}", from, to);
  std::lock_guard<std::mutex> lock(seq_mutex);
  int res;
  if (from.client == client_id) {
    res = snd_seq_connect_to(seq, from.port, to.client, to.port);
  } else if (to.client == client_id) {
    res = snd_seq_connect_from(seq, to.port, from.client, from.port);
  } else {
    throw transport_failure(EINVAL, "Can not connect ports I'm not part of");
  }
  if (res == -EBUSY) {
    WARNING("ALSA seq error 16: {} -> {}. Already connected?", from, to);
    return;
  }
  if (res < 0) {
    throw transport_failure(-res, "Failed connection: {} -> {}: {}", from, to,
                            snd_strerror(res));
  }
}

void aseq_t::disconnect(const port_t &from, const port_t &to) {
  DEBUG("Disconnect alsa ports {} -> {}", from, to);
  std::lock_guard<std::mutex> lock(seq_mutex);
  int res;
  if (from.client == client_id) {
    res = snd_seq_disconnect_to(seq, from.port, to.client, to.port);
  } else if (to.client == client_id) {
    res = snd_seq_disconnect_from(seq, to.port, from.client, from.port);
  } else {
    throw transport_failure(EINVAL,
                            "Can not disconnect ports I'm not part of");
  }
  if (res < 0) {
    throw transport_failure(-res, "Failed disconnection: {} -> {}: {}", from,
                            to, snd_strerror(res));
  }
}

std::vector<aseq_t::port_info_t> aseq_t::list_ports() {
  std::vector<port_info_t> ret;
  std::lock_guard<std::mutex> lock(seq_mutex);

  snd_seq_client_info_t *cinfo = nullptr;
  snd_seq_port_info_t *pinfo = nullptr;

  snd_seq_client_info_alloca(&cinfo);
  snd_seq_port_info_alloca(&pinfo);
  snd_seq_client_info_set_client(cinfo, -1);

  while (snd_seq_query_next_client(seq, cinfo) >= 0) {
    int cid = snd_seq_client_info_get_client(cinfo);
    std::string client_name = snd_seq_client_info_get_name(cinfo);
    int client_type = snd_seq_client_info_get_type(cinfo);

    snd_seq_port_info_set_client(pinfo, cid);
    snd_seq_port_info_set_port(pinfo, -1);
    while (snd_seq_query_next_port(seq, pinfo) >= 0) {
      port_info_t info;
      info.address = port_t(cid, snd_seq_port_info_get_port(pinfo));
      info.client_name = client_name;
      info.port_name = snd_seq_port_info_get_name(pinfo);
      info.capability = snd_seq_port_info_get_capability(pinfo);
      info.client_type = client_type;
      ret.push_back(std::move(info));
    }
  }

  return ret;
}

void aseq_t::set_event_handler(uint8_t port, event_handler_t handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex);
  event_handlers[port] = std::move(handler);
}

void aseq_t::remove_event_handler(uint8_t port) {
  std::lock_guard<std::mutex> lock(handlers_mutex);
  event_handlers.erase(port);
}

void aseq_t::send(uint8_t port, const std::vector<uint8_t> &data) {
  std::lock_guard<std::mutex> lock(seq_mutex);
  encoder.mididata_to_evs_f(data.data(), data.size(), [&](snd_seq_event_t *ev) {
    snd_seq_ev_set_source(ev, port);
    snd_seq_ev_set_subs(ev);
    snd_seq_ev_set_direct(ev);
    auto res = snd_seq_event_output_direct(seq, ev);
    if (res < 0) {
      throw transport_failure(-res, "Could not send to ALSA port {}:{}: {}",
                              client_id, port, snd_strerror(res));
    }
  });
}

timestamp_t aseq_t::now() const {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::steady_clock::now() - created_at)
      .count();
}

mididata_to_alsaevents_t::mididata_to_alsaevents_t(size_t buffer_size)
    : decode_buffer(buffer_size, 0) {
  auto res = snd_midi_event_new(buffer_size, &buffer);
  if (res < 0) {
    throw transport_failure(-res, "Could not create ALSA MIDI parser: {}",
                            snd_strerror(res));
  }
  snd_midi_event_no_status(buffer, 1);
}

mididata_to_alsaevents_t::~mididata_to_alsaevents_t() {
  if (buffer)
    snd_midi_event_free(buffer);
}

void mididata_to_alsaevents_t::mididata_to_evs_f(
    const uint8_t *data, size_t size,
    const std::function<void(snd_seq_event_t *)> &func) {
  snd_seq_event_t ev;

  snd_midi_event_reset_encode(buffer);
  const uint8_t *end = data + size;

  while (data < end) {
    snd_seq_ev_clear(&ev);
    auto used = snd_midi_event_encode(buffer, data, end - data, &ev);
    if (used <= 0) {
      throw malformed_message("Fail encode event: {}, {}", used,
                              hex(data, end - data));
    }
    data += used;
    if (ev.type == SND_SEQ_EVENT_NONE) {
      // Incomplete, needs more data
      continue;
    }
    func(&ev);
  }
}

std::vector<uint8_t>
mididata_to_alsaevents_t::ev_to_mididata(const snd_seq_event_t *ev) {
  if (ev->type == SND_SEQ_EVENT_SYSEX) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-union-access)
    auto ptr = static_cast<const uint8_t *>(ev->data.ext.ptr);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-union-access)
    return std::vector<uint8_t>(ptr, ptr + ev->data.ext.len);
  }
  snd_midi_event_reset_decode(buffer);
  auto ret = snd_midi_event_decode(buffer, decode_buffer.data(),
                                   decode_buffer.size(), ev);
  if (ret < 0) {
    ERROR("Could not translate alsa seq event {}: {}", ev->type,
          snd_strerror(ret));
    return {};
  }
  return std::vector<uint8_t>(decode_buffer.begin(),
                              decode_buffer.begin() + ret);
}

} // namespace midiroute
