#include "http_client.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <curl/curl.h>

#include "errors.hpp"

namespace amo {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};
using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};
using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct Transfer {
  std::string body;
  bool gzipped = false;
  const std::atomic<bool> *cancelled = nullptr;
};

size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  Transfer *transfer = static_cast<Transfer *>(userdata);
  size_t totalSize = size * nmemb;
  transfer->body.append(ptr, totalSize);
  return totalSize;
}

// Redirects deliver one header block per hop; the last one wins.
size_t headerCallback(char *buffer, size_t size, size_t nitems,
                      void *userdata) {
  Transfer *transfer = static_cast<Transfer *>(userdata);
  size_t totalSize = size * nitems;
  std::string line(buffer, totalSize);

  std::string lower = line;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower.rfind("http/", 0) == 0) {
    transfer->gzipped = false;
  } else if (lower.rfind("content-encoding:", 0) == 0) {
    transfer->gzipped = lower.find("gzip") != std::string::npos;
  }
  return totalSize;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progressCallback(void *userdata, curl_off_t dltotal, curl_off_t dlnow,
                     curl_off_t ultotal, curl_off_t ulnow) {
  (void)dltotal;
  (void)dlnow;
  (void)ultotal;
  (void)ulnow;

  Transfer *transfer = static_cast<Transfer *>(userdata);
  return transfer->cancelled && transfer->cancelled->load() ? 1 : 0;
}

} // namespace

std::string gunzip(const std::string &compressed, const std::string &url) {
  try {
    boost::iostreams::filtering_istream in;
    in.push(boost::iostreams::gzip_decompressor());
    in.push(boost::iostreams::array_source(compressed.data(),
                                           compressed.size()));
    std::ostringstream out;
    boost::iostreams::copy(in, out);
    return out.str();
  } catch (const boost::iostreams::gzip_error &e) {
    throw FetchError("failed to decompress response from " + url + ": " +
                     e.what());
  } catch (const boost::iostreams::zlib_error &e) {
    throw FetchError("failed to decompress response from " + url + ": " +
                     e.what());
  }
}

CurlGlobal::CurlGlobal() {
  CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (res != CURLE_OK) {
    throw FetchError(std::string("Failed to initialize CURL: ") +
                     curl_easy_strerror(res));
  }
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

HttpClient::HttpClient(long timeoutSeconds, std::string userAgent)
    : timeoutSeconds_(timeoutSeconds), userAgent_(std::move(userAgent)) {}

HttpResponse HttpClient::get(const std::string &url,
                             const std::atomic<bool> *cancelled) const {
  CurlEasy curl(curl_easy_init());
  if (!curl) {
    throw FetchError("Failed to initialize CURL handle");
  }

  Transfer transfer;
  transfer.cancelled = cancelled;

  CurlSlist headers(curl_slist_append(nullptr, "Accept-Encoding: gzip"));
  if (!headers) {
    throw FetchError("Failed to build request headers");
  }

  CURL *h = curl.get();
  curl_easy_setopt(h, CURLOPT_URL, url.c_str());
  curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(h, CURLOPT_USERAGENT, userAgent_.c_str());
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &transfer);
  curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(h, CURLOPT_HEADERDATA, &transfer);
  curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progressCallback);
  curl_easy_setopt(h, CURLOPT_XFERINFODATA, &transfer);
  curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_TIMEOUT, timeoutSeconds_);
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT,
                   std::min(timeoutSeconds_, 30L));

  CURLcode res = curl_easy_perform(h);
  if (res == CURLE_ABORTED_BY_CALLBACK) {
    throw FetchError("request cancelled: " + url);
  }
  if (res != CURLE_OK) {
    throw FetchError("GET " + url + " failed: " + curl_easy_strerror(res));
  }

  HttpResponse response;
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
  response.body = transfer.gzipped ? gunzip(transfer.body, url)
                                   : std::move(transfer.body);
  return response;
}

std::string urlEscape(const std::string &value) {
  CurlEasy curl(curl_easy_init());
  if (!curl) {
    throw FetchError("Failed to initialize CURL handle");
  }
  char *escaped = curl_easy_escape(curl.get(), value.c_str(),
                                   static_cast<int>(value.size()));
  if (!escaped) {
    throw FetchError("Failed to escape query value: " + value);
  }
  std::string out(escaped);
  curl_free(escaped);
  return out;
}

} // namespace amo
