#include "lumina_core/extractors/content_extractor_factory.hpp"

#include <stdexcept>

#include "lumina_core/extractors/docx_extractor.hpp"
#include "lumina_core/extractors/epub_extractor.hpp"
#include "lumina_core/extractors/html_extractor.hpp"
#include "lumina_core/extractors/pdf_extractor.hpp"
#include "lumina_core/extractors/plaintext_extractor.hpp"
#include "lumina_core/extractors/pptx_extractor.hpp"
#include "lumina_core/extractors/rtf_extractor.hpp"
#include "lumina_core/extractors/xls_extractor.hpp"
#include "lumina_core/extractors/xlsx_extractor.hpp"

namespace lumina_core {

ContentExtractorFactory::ContentExtractorFactory() {
  for (size_t i = 0; i < FORMAT_TAG_COUNT; ++i) {
    extractors_[i] = make_extractor(static_cast<FormatTag>(i));
  }
}

// No default branch: a new FormatTag without an extractor fails to compile.
ContentExtractorPtr ContentExtractorFactory::make_extractor(FormatTag format) {
  switch (format) {
    case FormatTag::Pdf:
      return std::make_unique<PdfExtractor>();
    case FormatTag::WordDocument:
      return std::make_unique<DocxExtractor>();
    case FormatTag::Presentation:
      return std::make_unique<PptxExtractor>();
    case FormatTag::SpreadsheetModern:
      return std::make_unique<XlsxExtractor>();
    case FormatTag::SpreadsheetLegacy:
      return std::make_unique<XlsExtractor>();
    case FormatTag::Html:
      return std::make_unique<HtmlExtractor>();
    case FormatTag::Ebook:
      return std::make_unique<EpubExtractor>();
    case FormatTag::RichText:
      return std::make_unique<RtfExtractor>();
    case FormatTag::PlainText:
    case FormatTag::Markdown:
    case FormatTag::UnknownDefault:
      return std::make_unique<PlainTextExtractor>(format);
  }
  throw std::invalid_argument("Unknown format tag");
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(FormatTag format) const {
  const auto index = static_cast<size_t>(format);
  if (index >= extractors_.size()) {
    throw std::invalid_argument("Unknown format tag");
  }
  return *extractors_[index];
}

}  // namespace lumina_core
