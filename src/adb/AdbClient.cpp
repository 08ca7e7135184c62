#include "adb/AdbClient.hpp"
#include "app/Errors.hpp"
#include "util/Log.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace spytrap::adb {

using app::DiscoveryError;

std::string encode_request(const std::string& payload) {
  if (payload.size() > 0xFFFF) throw DiscoveryError("adb request too long");
  char len[5];
  std::snprintf(len, sizeof(len), "%04zx", payload.size());
  return std::string(len) + payload;
}

static size_t parse_hex4(const char* p) {
  size_t v = 0;
  for (int i = 0; i < 4; ++i) {
    char c = p[i];
    int d = (c>='0'&&c<='9') ? c-'0' : (c>='a'&&c<='f') ? c-'a'+10 : (c>='A'&&c<='F') ? c-'A'+10 : -1;
    if (d < 0) throw DiscoveryError("malformed length in adb reply");
    v = v * 16 + (size_t)d;
  }
  return v;
}

std::vector<model::Device> parse_device_list(const std::string& payload) {
  std::vector<model::Device> out;
  size_t pos = 0;
  while (pos < payload.size()) {
    size_t nl = payload.find('\n', pos);
    std::string line = payload.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
    pos = (nl == std::string::npos) ? payload.size() : nl + 1;

    std::vector<std::string> fields;
    size_t i = 0;
    while (i < line.size()) {
      while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r')) ++i;
      size_t st = i;
      while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != '\r') ++i;
      if (i > st) fields.push_back(line.substr(st, i - st));
    }
    if (fields.size() < 2) continue;

    model::Device d;
    d.serial = fields[0];
    d.info["state"] = fields[1];
    for (size_t f = 2; f < fields.size(); ++f) {
      auto colon = fields[f].find(':');
      if (colon == std::string::npos || colon == 0) continue;
      d.info[fields[f].substr(0, colon)] = fields[f].substr(colon + 1);
    }
    if (fields[1] != "device") {
      SPYTRAP_LOG_DEBUG("adb", "skipping %s in state %s", d.serial.c_str(), fields[1].c_str());
      continue;
    }
    out.push_back(std::move(d));
  }
  return out;
}

AdbSocket::AdbSocket(const std::string& host, int port) {
  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* res = nullptr;
  const std::string port_s = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), port_s.c_str(), &hints, &res);
  if (rc != 0) throw DiscoveryError("cannot resolve adb host " + host + ": " + ::gai_strerror(rc));
  int last_err = 0;
  for (auto* ai = res; ai; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) { last_err = errno; continue; }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) { fd_ = fd; break; }
    last_err = errno;
    ::close(fd);
  }
  ::freeaddrinfo(res);
  if (fd_ < 0) {
    throw DiscoveryError("cannot connect to adb server at " + host + ":" + port_s + ": " +
                         std::strerror(last_err));
  }
}

AdbSocket::~AdbSocket() {
  if (fd_ >= 0) ::close(fd_);
}

void AdbSocket::read_exact(char* buf, size_t n) {
  size_t got = 0;
  while (got < n) {
    ssize_t r = ::read(fd_, buf + got, n - got);
    if (r < 0 && errno == EINTR) continue;
    if (r < 0) throw DiscoveryError(std::string("adb read failed: ") + std::strerror(errno));
    if (r == 0) throw DiscoveryError("adb server closed the connection");
    got += (size_t)r;
  }
}

void AdbSocket::request(const std::string& payload) {
  const std::string msg = encode_request(payload);
  size_t off = 0;
  while (off < msg.size()) {
    ssize_t w = ::send(fd_, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR) continue;
    if (w < 0) throw DiscoveryError(std::string("adb write failed: ") + std::strerror(errno));
    off += (size_t)w;
  }
  char status[4];
  read_exact(status, 4);
  if (std::memcmp(status, "OKAY", 4) == 0) return;
  if (std::memcmp(status, "FAIL", 4) == 0) {
    std::string why = read_hex_block();
    throw DiscoveryError("adb request '" + payload + "' failed: " + why);
  }
  throw DiscoveryError("unexpected adb status for '" + payload + "'");
}

std::string AdbSocket::read_hex_block() {
  char len[4];
  read_exact(len, 4);
  size_t n = parse_hex4(len);
  std::string body(n, '\0');
  if (n) read_exact(body.data(), n);
  return body;
}

std::string AdbSocket::read_to_end() {
  std::string out;
  char buf[4096];
  for (;;) {
    ssize_t r = ::read(fd_, buf, sizeof(buf));
    if (r < 0 && errno == EINTR) continue;
    if (r < 0) throw DiscoveryError(std::string("adb read failed: ") + std::strerror(errno));
    if (r == 0) break;
    out.append(buf, (size_t)r);
  }
  return out;
}

AdbConnection::AdbConnection(std::string host, int port, std::string serial)
    : host_(std::move(host)), port_(port), serial_(std::move(serial)) {}

std::string AdbConnection::shell(const std::string& cmd) {
  if (aborted_.load()) throw DiscoveryError("connection to " + serial_ + " was aborted");
  AdbSocket sock(host_, port_);
  {
    std::lock_guard<std::mutex> lk(mu_);
    // abort() may have run between the check above and here.
    if (aborted_.load()) throw DiscoveryError("connection to " + serial_ + " was aborted");
    active_fd_ = sock.fd();
  }
  struct Untrack {
    AdbConnection* self;
    ~Untrack() { std::lock_guard<std::mutex> lk(self->mu_); self->active_fd_ = -1; }
  } untrack{this};

  SPYTRAP_LOG_DEBUG("adb", "%s: shell %s", serial_.c_str(), cmd.c_str());
  sock.request("host:transport:" + serial_);
  sock.request("shell:" + cmd);
  std::string out = sock.read_to_end();
  if (aborted_.load()) throw DiscoveryError("connection to " + serial_ + " was aborted");

  std::string norm;
  norm.reserve(out.size());
  for (size_t i = 0; i < out.size(); ++i) {
    if (out[i] == '\r' && i + 1 < out.size() && out[i + 1] == '\n') continue;
    norm += out[i];
  }
  return norm;
}

void AdbConnection::abort() {
  if (aborted_.exchange(true)) return;
  std::lock_guard<std::mutex> lk(mu_);
  if (active_fd_ >= 0) (void)::shutdown(active_fd_, SHUT_RDWR);
  SPYTRAP_LOG_DEBUG("adb", "%s: connection aborted", serial_.c_str());
}

std::vector<model::Device> AdbHost::list_devices() {
  AdbSocket sock(host_, port_);
  sock.request("host:devices-l");
  auto devices = parse_device_list(sock.read_hex_block());
  SPYTRAP_LOG_DEBUG("adb", "%zu device(s) listed", devices.size());
  return devices;
}

std::shared_ptr<app::IConnection> AdbHost::connect(const std::string& serial) {
  {
    AdbSocket sock(host_, port_);
    sock.request("host:transport:" + serial);
  }
  return std::make_shared<AdbConnection>(host_, port_, serial);
}

} // namespace spytrap::adb
