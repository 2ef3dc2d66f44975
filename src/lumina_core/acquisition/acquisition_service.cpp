#include "lumina_core/acquisition/acquisition_service.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <iostream>
#include <sstream>

#include "lumina_core/errors.hpp"
#include "lumina_core/text/text_normalizer.hpp"

namespace lumina_core {

AcquisitionService::AcquisitionService(std::shared_ptr<DocumentFetcher> fetcher,
                                       std::shared_ptr<ContentExtractorFactory> extractor_factory)
    : fetcher_(std::move(fetcher)), extractor_factory_(std::move(extractor_factory)) {}

AcquiredDocument AcquisitionService::acquire(const std::string& uri) const {
  std::cout << "[Acquisition] Fetching " << uri << std::endl;
  FetchResponse response = fetcher_->fetch(uri);
  if (!response.ok()) {
    throw AcquisitionError("Failed to fetch " + uri + ": HTTP status " +
                           std::to_string(response.status));
  }

  RawDocument document{.bytes = std::move(response.body),
                       .declared_name = resolve_declared_name(uri, response.headers),
                       .origin = uri};
  AcquiredDocument acquired = process(std::move(document));
  std::cout << "[Acquisition] " << acquired.document.declared_name << ": " << acquired.size
            << " bytes, format " << to_string(acquired.format) << ", id " << acquired.content_id
            << std::endl;
  return acquired;
}

AcquiredDocument AcquisitionService::process(RawDocument document) const {
  const FormatTag format = detector_.detect(document.declared_name, document.bytes);
  const ContentExtractor& extractor = extractor_factory_->get_extractor_for(format);

  ExtractedText extracted{.raw = "", .format = format};
  try {
    extracted.raw = extractor.extract(document.bytes);
  } catch (const AcquisitionError&) {
    throw;
  } catch (const std::exception& e) {
    throw ExtractionError(format, e.what());
  }

  AcquiredDocument acquired{.document = std::move(document),
                            .format = format,
                            .content_id = "",
                            .size = 0,
                            .text = TextNormalizer::normalize(extracted.raw)};
  acquired.content_id = compute_content_id(acquired.document.bytes);
  acquired.size = acquired.document.bytes.size();
  return acquired;
}

std::string AcquisitionService::resolve_declared_name(
    const std::string& uri, const std::map<std::string, std::string>& headers) {
  auto disposition = headers.find("content-disposition");
  if (disposition != headers.end()) {
    std::string name = filename_from_disposition(disposition->second);
    if (!name.empty()) {
      return name;
    }
  }
  std::string name = filename_from_uri(uri);
  return name.empty() ? FALLBACK_NAME : name;
}

std::string AcquisitionService::compute_content_id(const Bytes& bytes) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw AcquisitionError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_md5(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw AcquisitionError("Failed to initialize MD5 digest");
  }

  if (EVP_DigestUpdate(mdctx, bytes.data(), bytes.size()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw AcquisitionError("Failed to update MD5 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw AcquisitionError("Failed to finalize MD5 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str().substr(0, CONTENT_ID_LENGTH);
}

}  // namespace lumina_core
