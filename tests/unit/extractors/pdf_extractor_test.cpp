#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include "lumina_core/extractors/pdf_extractor.hpp"
#include "../../common/utilities_test.hpp"

namespace lumina_core {

using lumina_tests::TestUtilities;
using ::testing::HasSubstr;

class PdfExtractorTest : public ::testing::Test {
 protected:
  PdfExtractor extractor_;
};

TEST_F(PdfExtractorTest, PagesAreExtractedInOrder) {
  std::string text = extractor_.extract(TestUtilities::build_pdf({"Alpha page", "Beta page", "Gamma page"}));

  auto alpha = text.find("Alpha page");
  auto beta = text.find("Beta page");
  auto gamma = text.find("Gamma page");
  ASSERT_NE(alpha, std::string::npos);
  ASSERT_NE(beta, std::string::npos);
  ASSERT_NE(gamma, std::string::npos);
  EXPECT_LT(alpha, beta);
  EXPECT_LT(beta, gamma);
}

TEST_F(PdfExtractorTest, PagesAreSeparatedByBlankLine) {
  std::string text = extractor_.extract(TestUtilities::build_pdf({"one", "two"}));
  auto one = text.find("one");
  auto two = text.find("two");
  ASSERT_NE(one, std::string::npos);
  ASSERT_NE(two, std::string::npos);
  EXPECT_NE(text.substr(one, two - one).find("\n\n"), std::string::npos);
}

TEST_F(PdfExtractorTest, GarbageFailsAsPdf) {
  try {
    extractor_.extract(TestUtilities::to_bytes("%PDF-1.4\nthis is not really a pdf"));
    FAIL() << "Expected ExtractionError";
  } catch (const ExtractionError& e) {
    EXPECT_EQ(e.format(), FormatTag::Pdf);
  }
}

TEST_F(PdfExtractorTest, EmptyInputFails) {
  EXPECT_THROW(extractor_.extract({}), ExtractionError);
}

}  // namespace lumina_core
