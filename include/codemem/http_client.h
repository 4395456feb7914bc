#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace codemem {

struct HttpResponse {
  long status = 0;
  std::string body;
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// Transport used by remote embedding providers. Transport-level failures
// throw EmbedError(kProviderUnavailable); HTTP status codes are returned.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse PostJson(const std::string &url,
                                const HttpHeaders &headers,
                                const std::string &body) = 0;
};

class CurlHttpTransport : public HttpTransport {
public:
  explicit CurlHttpTransport(
      std::chrono::milliseconds timeout = std::chrono::seconds(60));

  HttpResponse PostJson(const std::string &url, const HttpHeaders &headers,
                        const std::string &body) override;

private:
  std::chrono::milliseconds timeout_;
};

// Maps a non-2xx provider response onto the matching EmbedError kind and
// throws it. Returns normally for success codes.
void ThrowForStatus(const std::string &provider, const HttpResponse &response);

} // namespace codemem
