#include "lumina_core/extractors/pdf_extractor.hpp"

#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-global.h>
#include <poppler/cpp/poppler-page.h>

#include <climits>
#include <memory>

namespace lumina_core {

std::string PdfExtractor::extract(const Bytes& bytes) const {
  if (bytes.size() > static_cast<size_t>(INT_MAX)) {
    fail("document too large");
  }

  std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
      reinterpret_cast<const char*>(bytes.data()), static_cast<int>(bytes.size())));
  if (!doc) {
    fail("not a readable PDF document");
  }
  if (doc->is_locked()) {
    fail("document is password protected");
  }

  std::string text;
  const int page_count = doc->pages();
  if (page_count <= 0) {
    fail("document has no pages");
  }
  for (int i = 0; i < page_count; ++i) {
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page) {
      continue;
    }
    poppler::byte_array page_text = page->text().to_utf8();
    if (i > 0) {
      text += "\n\n";
    }
    text.append(page_text.begin(), page_text.end());
  }
  return text;
}

}  // namespace lumina_core
