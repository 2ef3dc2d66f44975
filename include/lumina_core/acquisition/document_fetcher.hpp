#pragma once

#include <chrono>
#include <map>
#include <string>

#include "lumina_core/types/document.hpp"

namespace lumina_core {

struct FetchResponse {
  long status;
  // Header names are lowercased; a repeated header keeps its last value.
  std::map<std::string, std::string> headers;
  Bytes body;

  bool ok() const {
    return status >= 200 && status < 300;
  }
};

/**
 * @class DocumentFetcher
 * @brief One blocking GET per call, bounded by a timeout.
 *
 * Each call owns its own curl easy handle, so concurrent calls are
 * independent. Transport failures throw AcquisitionError; HTTP error
 * statuses are returned for the caller to judge. file:// URIs succeed with
 * status 200. curl_global_init must have run before the first call.
 */
class DocumentFetcher {
 public:
  explicit DocumentFetcher(std::chrono::seconds timeout = std::chrono::seconds(60));
  virtual ~DocumentFetcher() = default;

  virtual FetchResponse fetch(const std::string& uri);

  std::chrono::seconds timeout() const {
    return timeout_;
  }

 private:
  static size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp);
  static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);

  std::chrono::seconds timeout_;
};

// %XX escapes decoded; the text is returned unchanged if curl cannot decode it.
std::string percent_decode(const std::string& text);

// File name from a Content-Disposition value ("" when it names none).
std::string filename_from_disposition(const std::string& disposition);

// Percent-decoded last path segment of a URI ("" when there is none).
std::string filename_from_uri(const std::string& uri);

}  // namespace lumina_core
