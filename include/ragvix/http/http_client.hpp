#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace ragvix::http {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  bool timeout = false;
  /// Set when no HTTP status was received (DNS, connect, TLS, timeout).
  bool network_error = false;
  std::string network_error_message;
};

/// Transport seam for remote embedding backends; tests substitute a scripted client.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
};

} // namespace ragvix::http
