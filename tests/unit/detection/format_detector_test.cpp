#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

#include "lumina_core/detection/format_detector.hpp"
#include "../../common/utilities_test.hpp"

namespace lumina_core {

using lumina_tests::TestUtilities;

class FormatDetectorTest : public ::testing::Test {
 protected:
  FormatDetector detector_;
};

TEST_F(FormatDetectorTest, PdfSignatureBeatsUnknownExtension) {
  EXPECT_EQ(detector_.detect("report.unknown", TestUtilities::to_bytes("%PDF-1.4\n...")), FormatTag::Pdf);
}

TEST_F(FormatDetectorTest, PdfSignatureBeatsLyingExtension) {
  EXPECT_EQ(detector_.detect("notes.txt", TestUtilities::to_bytes("%PDF-1.7 rest")), FormatTag::Pdf);
  EXPECT_EQ(detector_.detect("", TestUtilities::to_bytes("%PDF-1.7 rest")), FormatTag::Pdf);
}

TEST_F(FormatDetectorTest, ZipWithWordPartIsWordDocumentDespiteZipExtension) {
  auto bytes = TestUtilities::build_zip({{"word/document.xml", "<w:document/>"}});
  EXPECT_EQ(detector_.detect("archive.zip", bytes), FormatTag::WordDocument);
}

TEST_F(FormatDetectorTest, ZipInnerMarkersSelectEachContainerFormat) {
  auto pptx = TestUtilities::build_zip({{"ppt/presentation.xml", "<p/>"}});
  auto xlsx = TestUtilities::build_zip({{"xl/workbook.xml", "<w/>"}});
  auto epub = TestUtilities::build_zip({{"mimetype", "application/epub+zip"}});

  EXPECT_EQ(detector_.detect("download", pptx), FormatTag::Presentation);
  EXPECT_EQ(detector_.detect("file.docx", xlsx), FormatTag::SpreadsheetModern);
  EXPECT_EQ(detector_.detect("book.bin", epub), FormatTag::Ebook);
}

TEST_F(FormatDetectorTest, ZipWithoutMarkersFallsBackToContainerExtension) {
  auto bytes = TestUtilities::build_zip({{"content.bin", "opaque"}});
  EXPECT_EQ(detector_.detect("slides.pptx", bytes), FormatTag::Presentation);
  EXPECT_EQ(detector_.detect("photos.zip", bytes), FormatTag::PlainText);
}

TEST_F(FormatDetectorTest, CompoundDocumentUsesExtensionTieBreak) {
  auto bytes = TestUtilities::build_compound_document({});
  EXPECT_EQ(detector_.detect("budget.xls", bytes), FormatTag::SpreadsheetLegacy);
  EXPECT_EQ(detector_.detect("letter.DOC", bytes), FormatTag::WordDocument);
  EXPECT_EQ(detector_.detect("deck.ppt", bytes), FormatTag::Presentation);
}

TEST_F(FormatDetectorTest, CompoundDocumentWithUninformativeNameDefaultsToLegacySpreadsheet) {
  auto bytes = TestUtilities::build_compound_document({});
  EXPECT_EQ(detector_.detect("download", bytes), FormatTag::SpreadsheetLegacy);
  EXPECT_EQ(detector_.detect("thing.bin", bytes), FormatTag::SpreadsheetLegacy);
}

TEST_F(FormatDetectorTest, RtfSignature) {
  EXPECT_EQ(detector_.detect("memo", TestUtilities::to_bytes("{\\rtf1\\ansi hello}")), FormatTag::RichText);
}

TEST_F(FormatDetectorTest, HtmlMarkerWithoutExtension) {
  EXPECT_EQ(detector_.detect("index", TestUtilities::to_bytes("  <!DOCTYPE html><p>x</p>")), FormatTag::Html);
  EXPECT_EQ(detector_.detect("page.php", TestUtilities::to_bytes("<HTML><body>x</body></HTML>")), FormatTag::Html);
}

TEST_F(FormatDetectorTest, HtmlMarkerBeyondSniffWindowIsIgnored) {
  std::string text(FormatDetector::SNIFF_WINDOW + 10, 'a');
  text += "<html>";
  EXPECT_EQ(detector_.detect("blob", TestUtilities::to_bytes(text)), FormatTag::PlainText);
}

TEST_F(FormatDetectorTest, TextExtensionsWithoutSignature) {
  EXPECT_EQ(detector_.detect("README.md", TestUtilities::to_bytes("# Title")), FormatTag::Markdown);
  EXPECT_EQ(detector_.detect("notes.TXT", TestUtilities::to_bytes("hello")), FormatTag::PlainText);
  EXPECT_EQ(detector_.detect("page.htm", TestUtilities::to_bytes("no tags at all")), FormatTag::Html);
}

TEST_F(FormatDetectorTest, BinaryExtensionWithoutSignatureIsPlainText) {
  EXPECT_EQ(detector_.detect("fake.pdf", TestUtilities::to_bytes("just words")), FormatTag::PlainText);
  EXPECT_EQ(detector_.detect("fake.docx", TestUtilities::to_bytes("just words")), FormatTag::PlainText);
}

TEST_F(FormatDetectorTest, EmptyInputIsPlainText) {
  EXPECT_EQ(detector_.detect("", Bytes{}), FormatTag::PlainText);
}

TEST_F(FormatDetectorTest, TotalOverRandomBytesAndNames) {
  std::mt19937 engine(1234);
  std::uniform_int_distribution<int> byte(0, 255);
  std::uniform_int_distribution<int> length(0, 64);
  const std::vector<std::string> names = {"", "a", "x.pdf", "y.", ".hidden", "weird.name.xlsx", "../up/doc.doc"};

  for (int round = 0; round < 500; ++round) {
    Bytes bytes(static_cast<size_t>(length(engine)));
    for (auto& b : bytes) {
      b = static_cast<std::uint8_t>(byte(engine));
    }
    const std::string& name = names[static_cast<size_t>(round) % names.size()];
    FormatTag tag = FormatTag::UnknownDefault;
    EXPECT_NO_THROW(tag = detector_.detect(name, bytes));
    EXPECT_LT(static_cast<size_t>(tag), FORMAT_TAG_COUNT);
  }
}

TEST(FormatDetectorExtensionTest, ExtensionTableIsCaseInsensitive) {
  EXPECT_EQ(FormatDetector::tag_for_extension("Report.PDF"), FormatTag::Pdf);
  EXPECT_EQ(FormatDetector::tag_for_extension("book.EPUB"), FormatTag::Ebook);
  EXPECT_FALSE(FormatDetector::tag_for_extension("noextension").has_value());
}

}  // namespace lumina_core
