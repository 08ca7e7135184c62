#pragma once
#include "app/Collaborators.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace spytrap::adb {

// Wire helpers. A request is a 4 hex digit length followed by the payload.
[[nodiscard]] std::string encode_request(const std::string& payload);

// Parse the payload of a host:devices-l reply. Only devices in the
// "device" state are returned; the state is kept as attribute "state".
[[nodiscard]] std::vector<model::Device> parse_device_list(const std::string& payload);

// Blocking socket to the adb server. Throws app::DiscoveryError.
class AdbSocket {
public:
  AdbSocket(const std::string& host, int port);
  ~AdbSocket();
  AdbSocket(const AdbSocket&) = delete;
  AdbSocket& operator=(const AdbSocket&) = delete;

  // Send one request and consume the OKAY/FAIL status.
  void request(const std::string& payload);
  // Read a length-prefixed reply body.
  [[nodiscard]] std::string read_hex_block();
  // Read until the server closes the stream.
  [[nodiscard]] std::string read_to_end();

  [[nodiscard]] int fd() const { return fd_; }

private:
  void read_exact(char* buf, size_t n);
  int fd_{-1};
};

class AdbConnection : public app::IConnection {
public:
  AdbConnection(std::string host, int port, std::string serial);

  [[nodiscard]] const std::string& serial() const override { return serial_; }
  [[nodiscard]] std::string shell(const std::string& cmd) override;
  void abort() override;
  [[nodiscard]] bool aborted() const { return aborted_.load(); }

private:
  std::string host_;
  int port_;
  std::string serial_;
  std::atomic<bool> aborted_{false};
  std::mutex mu_;
  int active_fd_{-1};
};

class AdbHost : public app::IDeviceDiscovery {
public:
  AdbHost(std::string host, int port) : host_(std::move(host)), port_(port) {}

  [[nodiscard]] std::vector<model::Device> list_devices() override;
  [[nodiscard]] std::shared_ptr<app::IConnection> connect(const std::string& serial) override;

private:
  std::string host_;
  int port_;
};

} // namespace spytrap::adb
