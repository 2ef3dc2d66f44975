#pragma once

#include <map>
#include <memory>
#include <string>

#include "lumina_core/acquisition/document_fetcher.hpp"
#include "lumina_core/detection/format_detector.hpp"
#include "lumina_core/extractors/content_extractor_factory.hpp"
#include "lumina_core/types/document.hpp"

namespace lumina_core {

/**
 * @class AcquisitionService
 * @brief Fetch, fingerprint, detect, extract and normalize one document.
 *
 * The single entry point callers use to turn a URI into normalized text.
 * Every failure surfaces as an AcquisitionError (or its ExtractionError
 * subclass); nothing is retried and no second extractor is tried.
 */
class AcquisitionService {
 public:
  static constexpr size_t CONTENT_ID_LENGTH = 12;
  static constexpr const char* FALLBACK_NAME = "document";

  AcquisitionService(std::shared_ptr<DocumentFetcher> fetcher,
                     std::shared_ptr<ContentExtractorFactory> extractor_factory);
  virtual ~AcquisitionService() = default;

  virtual AcquiredDocument acquire(const std::string& uri) const;

  // Detection, extraction and normalization of bytes already in hand.
  AcquiredDocument process(RawDocument document) const;

  static std::string resolve_declared_name(const std::string& uri,
                                           const std::map<std::string, std::string>& headers);

  // Short hex fingerprint of the bytes. An identifier, not a security digest.
  static std::string compute_content_id(const Bytes& bytes);

 private:
  std::shared_ptr<DocumentFetcher> fetcher_;
  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  FormatDetector detector_;
};

}  // namespace lumina_core
