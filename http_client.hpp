#pragma once

#include <atomic>
#include <string>

namespace amo {

// curl_global_init/cleanup for the lifetime of main(). Must be constructed
// before any worker thread issues a request.
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal &) = delete;
  CurlGlobal &operator=(const CurlGlobal &) = delete;
};

struct HttpResponse {
  long status = 0;
  std::string body; // already gunzipped
};

// Blocking GET over the libcurl easy interface. Each call uses its own easy
// handle, so one client may be shared by several threads.
class HttpClient {
private:
  long timeoutSeconds_;
  std::string userAgent_;

public:
  explicit HttpClient(long timeoutSeconds,
                      std::string userAgent = "fetch-addons/1.0");

  // Throws FetchError on transport failure. When `cancelled` is given and
  // becomes true while the transfer is running, the transfer is aborted and
  // FetchError is thrown. HTTP error statuses are returned, not thrown.
  HttpResponse get(const std::string &url,
                   const std::atomic<bool> *cancelled = nullptr) const;
};

// Decodes a gzip response body. Throws FetchError naming `url` when the
// stream is truncated or corrupt.
std::string gunzip(const std::string &compressed, const std::string &url);

// Percent-encodes a query string component.
std::string urlEscape(const std::string &value);

} // namespace amo
