#include <codemem/http_client.h>

#include <codemem/errors.h>

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace codemem {

namespace {
struct EasyDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

void EnsureGlobalInit() {
  static std::once_flag once;
  std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::size_t AppendBody(char *data, std::size_t size, std::size_t count,
                       void *user_data) {
  auto *body = static_cast<std::string *>(user_data);
  body->append(data, size * count);
  return size * count;
}

std::string Excerpt(const std::string &body) {
  constexpr std::size_t kMaxExcerpt = 200;
  return body.size() <= kMaxExcerpt ? body : body.substr(0, kMaxExcerpt);
}
} // namespace

CurlHttpTransport::CurlHttpTransport(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
  EnsureGlobalInit();
}

HttpResponse CurlHttpTransport::PostJson(const std::string &url,
                                         const HttpHeaders &headers,
                                         const std::string &body) {
  std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
  if (!handle) {
    throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                     "Failed to create HTTP handle");
  }

  std::unique_ptr<curl_slist, HeaderListDeleter> header_list(
      curl_slist_append(nullptr, "Content-Type: application/json"));
  if (!header_list) {
    throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                     "Failed to build HTTP headers");
  }
  for (const auto &[name, value] : headers) {
    const auto line = name + ": " + value;
    // Appending keeps the list head; a null result leaves the list intact.
    if (curl_slist_append(header_list.get(), line.c_str()) == nullptr) {
      throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                       "Failed to build HTTP headers");
    }
  }

  HttpResponse response;
  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(body.size()));
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &AppendBody);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS,
                   static_cast<long>(timeout_.count()));
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

  const auto code = curl_easy_perform(handle.get());
  if (code != CURLE_OK) {
    throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                     std::string("HTTP request failed: ") +
                         curl_easy_strerror(code));
  }
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

void ThrowForStatus(const std::string &provider, const HttpResponse &response) {
  if (response.status >= 200 && response.status < 300) {
    return;
  }
  const auto message = provider + " returned HTTP " +
                       std::to_string(response.status) + ": " +
                       Excerpt(response.body);
  if (response.status == 429) {
    throw EmbedError(EmbedErrorKind::kRateLimited, message);
  }
  if (response.status == 400 || response.status == 413 ||
      response.status == 422) {
    throw EmbedError(EmbedErrorKind::kInvalidInput, message);
  }
  throw EmbedError(EmbedErrorKind::kProviderUnavailable, message);
}

} // namespace codemem
