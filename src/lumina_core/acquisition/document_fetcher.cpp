#include "lumina_core/acquisition/document_fetcher.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>

#include "lumina_core/errors.hpp"

namespace lumina_core {

namespace {

constexpr long MAX_REDIRECTS = 10;
constexpr const char* USER_AGENT = "lumina/1.0";

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string trim_value(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string strip_quotes(std::string value) {
  value = trim_value(value);
  while (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
    value.erase(0, 1);
  }
  while (!value.empty() && (value.back() == '"' || value.back() == '\'')) {
    value.pop_back();
  }
  return value;
}

std::string last_segment(const std::string& path) {
  std::string trimmed = path;
  while (!trimmed.empty() && trimmed.back() == '/') {
    trimmed.pop_back();
  }
  const auto slash = trimmed.rfind('/');
  return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

}  // namespace

std::string percent_decode(const std::string& text) {
  int length = 0;
  char* decoded = curl_easy_unescape(nullptr, text.c_str(), static_cast<int>(text.size()), &length);
  if (!decoded) {
    return text;
  }
  std::string result(decoded, static_cast<size_t>(length));
  curl_free(decoded);
  return result;
}

DocumentFetcher::DocumentFetcher(std::chrono::seconds timeout) : timeout_(timeout) {}

size_t DocumentFetcher::write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
  auto* body = static_cast<Bytes*>(userp);
  body->insert(body->end(), contents, contents + size * nmemb);
  return size * nmemb;
}

size_t DocumentFetcher::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
  auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
  const std::string line(buffer, size * nitems);
  // A new status line starts the headers of the next response in a redirect chain.
  if (line.rfind("HTTP/", 0) == 0) {
    headers->clear();
  }
  const auto colon = line.find(':');
  if (colon != std::string::npos) {
    (*headers)[lowercase(trim_value(line.substr(0, colon)))] = trim_value(line.substr(colon + 1));
  }
  return size * nitems;
}

FetchResponse DocumentFetcher::fetch(const std::string& uri) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
  if (!handle) {
    throw AcquisitionError("Failed to initialize CURL");
  }

  FetchResponse response{.status = 0, .headers = {}, .body = {}};
  CURL* curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, uri.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, MAX_REDIRECTS);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count() * 1000));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

  CURLcode result = curl_easy_perform(curl);
  if (result != CURLE_OK) {
    throw AcquisitionError("Failed to fetch " + uri + ": " + curl_easy_strerror(result));
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  if (response.status == 0) {
    // Non-HTTP transports (file://) have no status code.
    response.status = 200;
  }
  return response;
}

std::string filename_from_disposition(const std::string& disposition) {
  const std::string lowered = lowercase(disposition);

  // RFC 5987 form: filename*=UTF-8''name%20here
  auto extended = lowered.find("filename*=");
  if (extended != std::string::npos) {
    std::string value = disposition.substr(extended + 10);
    value = value.substr(0, value.find(';'));
    const auto quotes = value.find("''");
    if (quotes != std::string::npos) {
      value = value.substr(quotes + 2);
    }
    value = strip_quotes(percent_decode(strip_quotes(value)));
    if (!value.empty()) {
      return value;
    }
  }

  auto plain = lowered.find("filename=");
  if (plain != std::string::npos) {
    std::string value = disposition.substr(plain + 9);
    return strip_quotes(value.substr(0, value.find(';')));
  }
  return "";
}

std::string filename_from_uri(const std::string& uri) {
  std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> url(curl_url(), &curl_url_cleanup);
  if (url && curl_url_set(url.get(), CURLUPART_URL, uri.c_str(), CURLU_NON_SUPPORT_SCHEME) == CURLUE_OK) {
    char* path = nullptr;
    if (curl_url_get(url.get(), CURLUPART_PATH, &path, CURLU_URLDECODE) == CURLUE_OK && path) {
      std::string name = last_segment(path);
      curl_free(path);
      return name;
    }
  }

  // Not a parseable absolute URL: treat it as a bare path.
  std::string path = uri.substr(0, uri.find_first_of("?#"));
  return percent_decode(last_segment(path));
}

}  // namespace lumina_core
