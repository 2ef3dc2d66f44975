#include <gtest/gtest.h>

#include <string>

#include "lumina_core/extractors/plaintext_extractor.hpp"
#include "lumina_core/extractors/text_decoder.hpp"
#include "../../common/utilities_test.hpp"

namespace lumina_core {

using lumina_tests::TestUtilities;

class PlainTextExtractorTest : public ::testing::Test {
 protected:
  PlainTextExtractor extractor_;
};

TEST_F(PlainTextExtractorTest, Utf8PassesThroughUnchanged) {
  const std::string text = "Caf\xC3\xA9 \xE2\x80\x94 na\xC3\xAFve\n\nsecond paragraph";
  EXPECT_EQ(extractor_.extract(TestUtilities::to_bytes(text)), text);
}

TEST_F(PlainTextExtractorTest, ByteOrderMarkIsRemoved) {
  EXPECT_EQ(extractor_.extract(TestUtilities::to_bytes("\xEF\xBB\xBFhello")), "hello");
}

TEST_F(PlainTextExtractorTest, Windows1252BytesAreDecoded) {
  // Smart quotes 0x93/0x94 and e-acute 0xE9
  Bytes bytes = {0x93, 'c', 'a', 'f', 0xE9, 0x94};
  EXPECT_EQ(extractor_.extract(bytes), "\xE2\x80\x9C" "caf\xC3\xA9" "\xE2\x80\x9D");
}

TEST_F(PlainTextExtractorTest, EmptyInputGivesEmptyText) {
  EXPECT_EQ(extractor_.extract({}), "");
}

TEST_F(PlainTextExtractorTest, KeepsTheTagItWasCreatedFor) {
  EXPECT_EQ(PlainTextExtractor().get_format(), FormatTag::PlainText);
  EXPECT_EQ(PlainTextExtractor(FormatTag::Markdown).get_format(), FormatTag::Markdown);
  EXPECT_EQ(PlainTextExtractor(FormatTag::UnknownDefault).get_format(), FormatTag::UnknownDefault);
}

TEST_F(PlainTextExtractorTest, MarkdownSyntaxIsLeftForTheModel) {
  PlainTextExtractor markdown(FormatTag::Markdown);
  const std::string text = "# Title\n\n- item **bold**\n";
  EXPECT_EQ(markdown.extract(TestUtilities::to_bytes(text)), text);
}

// Decoder chain

TEST(TextDecoderTest, ValidUtf8IsReportedAsUtf8) {
  auto decoded = TextDecoder::decode(std::string_view("plain ascii"));
  EXPECT_EQ(decoded.encoding, "UTF-8");
  EXPECT_FALSE(decoded.lossy);
  EXPECT_EQ(decoded.text, "plain ascii");
}

TEST(TextDecoderTest, InvalidUtf8FallsBackToWindows1252) {
  auto decoded = TextDecoder::decode(std::string_view("na\xEFve"));
  EXPECT_EQ(decoded.encoding, "WINDOWS-1252");
  EXPECT_FALSE(decoded.lossy);
  EXPECT_EQ(decoded.text, "na\xC3\xAFve");
}

TEST(TextDecoderTest, FallbackOrderIsFixed) {
  const auto& encodings = TextDecoder::fallback_encodings();
  ASSERT_EQ(encodings.size(), 2u);
  EXPECT_EQ(encodings[0], "WINDOWS-1252");
  EXPECT_EQ(encodings[1], "ISO-8859-1");
}

TEST(TextDecoderTest, LossyDecodeDropsOnlyInvalidSequences) {
  EXPECT_EQ(TextDecoder::decode_lossy("ab\xFF" "cd\xC3\xA9\xC3"), "abcd\xC3\xA9");
}

TEST(TextDecoderTest, SingleWindows1252Byte) {
  EXPECT_EQ(TextDecoder::decode_windows_1252_byte('A'), "A");
  EXPECT_EQ(TextDecoder::decode_windows_1252_byte(0x80), "\xE2\x82\xAC");
  EXPECT_EQ(TextDecoder::decode_windows_1252_byte(0xE9), "\xC3\xA9");
}

}  // namespace lumina_core
