#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "lumina_core/extractors/pptx_extractor.hpp"
#include "../../common/utilities_test.hpp"

namespace lumina_core {

using lumina_tests::TestUtilities;
using lumina_tests::ZipEntries;
using ::testing::ElementsAre;

namespace {

const std::string NAMESPACES =
    "xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" "
    "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\" "
    "xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\"";

// One shape per slide; each entry of paragraphs is a list of runs
std::string slide_xml(const std::vector<std::string>& paragraphs) {
  std::string body;
  for (const auto& paragraph : paragraphs) {
    body += "<a:p>" + paragraph + "</a:p>";
  }
  return "<p:sld " + NAMESPACES + "><p:cSld><p:spTree><p:sp><p:txBody><a:bodyPr/>" + body +
         "</p:txBody></p:sp></p:spTree></p:cSld></p:sld>";
}

std::string run(const std::string& text) {
  return "<a:r><a:rPr lang=\"en-US\"/><a:t>" + text + "</a:t></a:r>";
}

std::string presentation_xml(const std::vector<std::string>& relationship_ids) {
  std::string ids;
  unsigned id = 256;
  for (const auto& rel : relationship_ids) {
    ids += "<p:sldId id=\"" + std::to_string(id++) + "\" r:id=\"" + rel + "\"/>";
  }
  return "<p:presentation " + NAMESPACES + "><p:sldIdLst>" + ids + "</p:sldIdLst></p:presentation>";
}

std::string presentation_rels() {
  const std::string type = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slide";
  return "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
         "<Relationship Id=\"rId1\" Type=\"" + type + "\" Target=\"slides/slide1.xml\"/>"
         "<Relationship Id=\"rId2\" Type=\"" + type + "\" Target=\"slides/slide2.xml\"/>"
         "</Relationships>";
}

}  // namespace

class PptxExtractorTest : public ::testing::Test {
 protected:
  PptxExtractor extractor_;
};

TEST_F(PptxExtractorTest, SlidesFollowPresentationOrderWithMarkers) {
  auto bytes = TestUtilities::build_zip({
      {"ppt/presentation.xml", presentation_xml({"rId2", "rId1"})},
      {"ppt/_rels/presentation.xml.rels", presentation_rels()},
      {"ppt/slides/slide1.xml", slide_xml({run("Closing")})},
      {"ppt/slides/slide2.xml", slide_xml({run("Opening") + run(" title"), run("Line") + "<a:br/>" + run("Break")})},
  });

  EXPECT_EQ(extractor_.extract(bytes),
            "--- Slide 1 ---\nOpening title\nLine\nBreak\n\n--- Slide 2 ---\nClosing");
}

TEST_F(PptxExtractorTest, WithoutPresentationPartSlidesAreOrderedByNumber) {
  ZipEntries entries = {
      {"ppt/slides/slide10.xml", slide_xml({run("ten")})},
      {"ppt/slides/slide2.xml", slide_xml({run("two")})},
      {"ppt/slides/_rels/slide2.xml.rels", "<Relationships/>"},
      {"ppt/slides/slideLayout1.xml", slide_xml({run("layout")})},
  };
  auto bytes = TestUtilities::build_zip(entries);

  ZipArchive archive(bytes);
  EXPECT_THAT(PptxExtractor::slide_parts(archive), ElementsAre("ppt/slides/slide2.xml", "ppt/slides/slide10.xml"));
  EXPECT_EQ(extractor_.extract(bytes), "--- Slide 1 ---\ntwo\n\n--- Slide 2 ---\nten");
}

TEST_F(PptxExtractorTest, FieldTextIsIncludedAndEmptyParagraphsSkipped) {
  auto bytes = TestUtilities::build_zip({
      {"ppt/slides/slide1.xml",
       slide_xml({run("Page "), "", "<a:fld id=\"{1}\" type=\"slidenum\"><a:t>1</a:t></a:fld>"})},
  });
  EXPECT_EQ(extractor_.extract(bytes), "--- Slide 1 ---\nPage \n1");
}

TEST_F(PptxExtractorTest, SlideWithoutTextKeepsItsMarker) {
  auto bytes = TestUtilities::build_zip({
      {"ppt/slides/slide1.xml", slide_xml({})},
      {"ppt/slides/slide2.xml", slide_xml({run("text")})},
  });
  EXPECT_EQ(extractor_.extract(bytes), "--- Slide 1 ---\n\n\n--- Slide 2 ---\ntext");
}

TEST_F(PptxExtractorTest, PresentationWithoutSlidesFails) {
  auto bytes = TestUtilities::build_zip({{"ppt/presentation.xml", presentation_xml({})}});
  try {
    extractor_.extract(bytes);
    FAIL() << "Expected ExtractionError";
  } catch (const ExtractionError& e) {
    EXPECT_EQ(e.format(), FormatTag::Presentation);
  }
}

TEST_F(PptxExtractorTest, NotAZipContainerFails) {
  EXPECT_THROW(extractor_.extract(TestUtilities::to_bytes("not a zip at all")), ExtractionError);
}

}  // namespace lumina_core
