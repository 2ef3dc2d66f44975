#pragma once

#include <array>
#include <memory>

#include "content_extractor.hpp"

namespace lumina_core {

/**
 * @class ContentExtractorFactory
 * @brief Owns one extractor per FormatTag and hands out the matching one.
 *
 * Every tag has an extractor; markdown and unrecognised content share the
 * plain text strategy. The factory is non-copyable and non-movable.
 */
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  /**
   * @brief Returns the extractor registered for a detected format.
   * @param format Tag produced by the FormatDetector.
   * @return A constant reference valid for the lifetime of the factory.
   */
  virtual const ContentExtractor& get_extractor_for(FormatTag format) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  static ContentExtractorPtr make_extractor(FormatTag format);

  std::array<ContentExtractorPtr, FORMAT_TAG_COUNT> extractors_;
};

}  // namespace lumina_core
