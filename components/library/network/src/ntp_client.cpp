/**
 * @file ntp_client.cpp
 * @brief SNTP request over lwIP BSD sockets
 */

#include <network/ntp_client.hpp>

#include <esp_log.h>
#include <lwip/netdb.h>
#include <lwip/sockets.h>

#include <cerrno>
#include <cstdio>
#include <memory>

namespace network {

namespace {

constexpr const char *TAG = "ntp";

/// Owns a socket descriptor
class Socket {
public:
  explicit Socket(int fd) : fd_(fd) {}
  ~Socket() {
    if (fd_ >= 0)
      close(fd_);
  }

  Socket(const Socket &) = delete;
  Socket &operator=(const Socket &) = delete;
  Socket(Socket &&) = delete;
  Socket &operator=(Socket &&) = delete;

  [[nodiscard]] bool valid() const { return fd_ >= 0; }
  [[nodiscard]] int fd() const { return fd_; }

private:
  int fd_;
};

struct AddrInfoDeleter {
  void operator()(addrinfo *info) const { freeaddrinfo(info); }
};

} // namespace

NtpTimeSource::NtpTimeSource(const NtpConfig &config)
    : server_(config.server), port_(config.port), timeout_(config.timeout) {}

core::Result<int64_t> NtpTimeSource::fetch_unix_time() {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;

  char port[8];
  std::snprintf(port, sizeof(port), "%u", static_cast<unsigned>(port_));

  addrinfo *raw = nullptr;
  if (int err = getaddrinfo(server_.c_str(), port, &hints, &raw);
      err != 0 || raw == nullptr) {
    ESP_LOGW(TAG, "DNS lookup for %s failed: %d", server_.c_str(), err);
    return core::Err(ESP_ERR_NOT_FOUND);
  }
  std::unique_ptr<addrinfo, AddrInfoDeleter> address(raw);

  Socket sock(socket(address->ai_family, address->ai_socktype, 0));
  if (!sock.valid()) {
    ESP_LOGW(TAG, "socket() failed: errno %d", errno);
    return core::Err(ESP_FAIL);
  }

  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout_.count() / 1000);
  tv.tv_usec =
      static_cast<decltype(tv.tv_usec)>((timeout_.count() % 1000) * 1000);
  setsockopt(sock.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  auto packet = ntp::make_request();
  if (sendto(sock.fd(), packet.data(), packet.size(), 0, address->ai_addr,
             address->ai_addrlen) < 0) {
    ESP_LOGW(TAG, "sendto failed: errno %d", errno);
    return core::Err(ESP_FAIL);
  }

  ssize_t received = recv(sock.fd(), packet.data(), packet.size(), 0);
  if (received < 0) {
    ESP_LOGW(TAG, "No reply within %lld ms (errno %d)",
             static_cast<long long>(timeout_.count()), errno);
    return core::Err(ESP_ERR_TIMEOUT);
  }

  return ntp::parse_unix_time(
      std::span<const uint8_t>(packet.data(), static_cast<size_t>(received)));
}

} // namespace network
