#include <gtest/gtest.h>

#include <cctype>
#include <random>
#include <string>
#include <vector>

#include "lumina_core/text/text_normalizer.hpp"

namespace lumina_core {

namespace {

void expect_invariants(const std::string& text) {
  EXPECT_EQ(text.find("\n\n\n"), std::string::npos) << "three newlines in: " << text;
  EXPECT_EQ(text.find('\r'), std::string::npos);
  for (size_t i = 0; i + 1 < text.size(); ++i) {
    const bool a = text[i] == ' ' || text[i] == '\t';
    const bool b = text[i + 1] == ' ' || text[i + 1] == '\t';
    EXPECT_FALSE(a && b) << "repeated horizontal whitespace at " << i;
  }
  EXPECT_EQ(text.find('\t'), std::string::npos);
  if (!text.empty()) {
    EXPECT_FALSE(std::isspace(static_cast<unsigned char>(text.front())));
    EXPECT_FALSE(std::isspace(static_cast<unsigned char>(text.back())));
  }
}

}  // namespace

TEST(TextNormalizerTest, DropsPageNumberBetweenPages) {
  EXPECT_EQ(TextNormalizer::normalize("Page 1\n\n   42   \n\nPage 2"), "Page 1\n\nPage 2");
}

TEST(TextNormalizerTest, CollapsesBlankLineRuns) {
  EXPECT_EQ(TextNormalizer::normalize("a\n\n\n\n\nb"), "a\n\nb");
  EXPECT_EQ(TextNormalizer::normalize("a\n  \n\t\n b"), "a\n\n b");
}

TEST(TextNormalizerTest, KeepsSingleLineBreaks) {
  EXPECT_EQ(TextNormalizer::normalize("first line\nsecond line"), "first line\nsecond line");
}

TEST(TextNormalizerTest, CollapsesHorizontalWhitespace) {
  EXPECT_EQ(TextNormalizer::normalize("a \t  b\t\tc"), "a b c");
}

TEST(TextNormalizerTest, ConvertsWindowsAndOldMacLineEndings) {
  EXPECT_EQ(TextNormalizer::normalize("one\r\ntwo\r\n\r\n\r\nthree"), "one\ntwo\n\nthree");
  EXPECT_EQ(TextNormalizer::normalize("one\rtwo\r\r\r\rthree"), "one\ntwo\n\nthree");
}

TEST(TextNormalizerTest, TrimsSurroundingWhitespace) {
  EXPECT_EQ(TextNormalizer::normalize("\n\n  \t body text \n\n "), "body text");
  EXPECT_EQ(TextNormalizer::normalize("   "), "");
  EXPECT_EQ(TextNormalizer::normalize(""), "");
}

TEST(TextNormalizerTest, KeepsNumbersThatAreNotWholeLines) {
  EXPECT_EQ(TextNormalizer::normalize("Chapter\n12 apples\nend"), "Chapter\n12 apples\nend");
  EXPECT_EQ(TextNormalizer::normalize("Total: 42"), "Total: 42");
}

TEST(TextNormalizerTest, DropsInteriorNumericLinesButKeepsTextEdges) {
  EXPECT_EQ(TextNormalizer::normalize("intro\n7\nbody"), "intro\nbody");
  EXPECT_EQ(TextNormalizer::normalize("2024"), "2024");
  EXPECT_EQ(TextNormalizer::normalize("2024\nreport"), "2024\nreport");
}

TEST(TextNormalizerTest, KeepsNonAsciiText) {
  EXPECT_EQ(TextNormalizer::normalize("Caf\xC3\xA9  na\xC3\xAFve\n\n\n\xE2\x80\x94 fin"), "Caf\xC3\xA9 na\xC3\xAFve\n\n\xE2\x80\x94 fin");
}

TEST(TextNormalizerTest, IdempotentOnTrickyInputs) {
  const std::vector<std::string> inputs = {
      "Page 1\n\n   42   \n\nPage 2",
      "a\r5\rb",
      "\n\n42\n\nfoo",
      " x \r\n\r\n 3 \r\n\r\n y ",
      "\t\t1\n2\n3\n\t",
      "a\n \n \n \nb",
      "\r\r\r",
      "word\x0B\x0C word",
  };
  for (const auto& input : inputs) {
    const std::string once = TextNormalizer::normalize(input);
    EXPECT_EQ(TextNormalizer::normalize(once), once) << "input: " << input;
    expect_invariants(once);
  }
}

TEST(TextNormalizerTest, InvariantsAndIdempotenceOverRandomText) {
  const std::string alphabet = "ab1 2\t\n\r\x0B\x0C" "9";
  std::mt19937 engine(42);
  std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
  std::uniform_int_distribution<int> length(0, 80);

  for (int round = 0; round < 2000; ++round) {
    std::string input;
    const int n = length(engine);
    for (int i = 0; i < n; ++i) {
      input += alphabet[pick(engine)];
    }
    const std::string once = TextNormalizer::normalize(input);
    ASSERT_EQ(TextNormalizer::normalize(once), once) << "input: " << testing::PrintToString(input);
    expect_invariants(once);
  }
}

}  // namespace lumina_core
