#include <gtest/gtest.h>

#include <string>

#include "lumina_core/errors.hpp"
#include "lumina_core/generation/response_parser.hpp"
#include "../../common/mocks_test.hpp"

namespace lumina_core {

namespace MockUtilities = lumina_tests::MockUtilities;

TEST(ResponseParserTest, ParsesFencedObject) {
  Json value = ResponseParser::parse("```json\n{\"a\":1}\n```", ExpectedShape::Object);
  EXPECT_EQ(value, Json::parse(R"({"a":1})"));
}

TEST(ResponseParserTest, ToleratesEitherFenceMissing) {
  EXPECT_EQ(ResponseParser::parse("```\n{\"a\":1}", ExpectedShape::Object)["a"], 1);
  EXPECT_EQ(ResponseParser::parse("{\"a\":1}\n```", ExpectedShape::Object)["a"], 1);
  EXPECT_EQ(ResponseParser::parse("  \n {\"a\":1} \n\n", ExpectedShape::Object)["a"], 1);
}

TEST(ResponseParserTest, ParsesObjectFencedOnOneLine) {
  Json tagged = ResponseParser::parse("```json {\"overview\":\"x\"}```", ExpectedShape::Object);
  EXPECT_EQ(tagged, Json::parse(R"({"overview":"x"})"));

  Json untagged = ResponseParser::parse("```{\"overview\":\"x\"}\n```", ExpectedShape::Object);
  EXPECT_EQ(untagged, Json::parse(R"({"overview":"x"})"));
}

TEST(ResponseParserTest, ParsesArrayFencedOnOneLine) {
  Json value = ResponseParser::parse("```json[{\"front\":\"f\"}]```", ExpectedShape::Array);
  ASSERT_TRUE(value.is_array());
  EXPECT_EQ(value[0]["front"], "f");
}

TEST(ResponseParserTest, PassesOverRegionOfTheWrongShape) {
  Json value = ResponseParser::parse("Here are the [3] key points:\n{\"overview\":\"x\",\"keyPoints\":[]}",
                                     ExpectedShape::Object);
  EXPECT_EQ(value["overview"], "x");

  Json cards = ResponseParser::parse("Summary {\"count\": 1} then [{\"front\":\"f\"}]", ExpectedShape::Array);
  ASSERT_TRUE(cards.is_array());
  EXPECT_EQ(cards[0]["front"], "f");
}

TEST(ResponseParserTest, NestedArrayIsNotPulledOutOfAWrongShapedObject) {
  EXPECT_THROW(ResponseParser::parse(R"(Result: {"a": 1, "b": [1]} done)", ExpectedShape::Array), ParseError);
}

TEST(ResponseParserTest, FindsArrayInsideProse) {
  Json cards = ResponseParser::parse(MockUtilities::flashcards_reply(), ExpectedShape::Array);
  ASSERT_TRUE(cards.is_array());
  ASSERT_EQ(cards.size(), 2u);
  EXPECT_EQ(cards[0]["front"], "Q1");
  EXPECT_EQ(cards[1]["difficulty"], "hard");
}

TEST(ResponseParserTest, BracketsInsideStringsDoNotConfuseTheScanner) {
  Json value = ResponseParser::parse(R"(Sure! {"text": "a } tricky [ value", "n": [1, 2]} hope that helps)",
                                     ExpectedShape::Object);
  EXPECT_EQ(value["text"], "a } tricky [ value");
  EXPECT_EQ(value["n"].size(), 2u);
}

TEST(ResponseParserTest, SkipsBracketRegionsThatAreNotJson) {
  Json value = ResponseParser::parse("Note [see below]: {\"ok\": true}", ExpectedShape::Object);
  EXPECT_EQ(value["ok"], true);
}

TEST(ResponseParserTest, KeepsKeyOrderOfTheReply) {
  Json value = ResponseParser::parse(R"({"zeta":1,"alpha":2,"mid":3})", ExpectedShape::Object);
  EXPECT_EQ(value.dump(), R"({"zeta":1,"alpha":2,"mid":3})");
}

TEST(ResponseParserTest, ReplyWithoutBracesFails) {
  try {
    ResponseParser::parse("I cannot help with that.", ExpectedShape::Object);
    FAIL() << "Expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e.reply_excerpt(), "I cannot help with that.");
  }
}

TEST(ResponseParserTest, ExcerptIsBounded) {
  const std::string reply(1000, 'x');
  try {
    ResponseParser::parse(reply, ExpectedShape::Object);
    FAIL() << "Expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e.reply_excerpt().size(), ParseError::MAX_EXCERPT);
  }
}

TEST(ResponseParserTest, ScalarsAreNotArtifacts) {
  EXPECT_THROW(ResponseParser::parse("42", ExpectedShape::Object), ParseError);
  EXPECT_THROW(ResponseParser::parse("\"text\"", ExpectedShape::Array), ParseError);
}

TEST(ResponseParserTest, WrongShapeFails) {
  EXPECT_THROW(ResponseParser::parse("[1, 2]", ExpectedShape::Object), ParseError);
  EXPECT_THROW(ResponseParser::parse(R"({"a": 1, "b": [1]})", ExpectedShape::Array), ParseError);
}

TEST(ResponseParserTest, SingleWrappedArrayIsUnwrapped) {
  Json value = ResponseParser::parse(R"({"flashcards": [{"front": "f", "back": "b"}]})", ExpectedShape::Array);
  ASSERT_TRUE(value.is_array());
  EXPECT_EQ(value[0]["back"], "b");
}

TEST(ResponseParserTest, TruncatedReplyFails) {
  EXPECT_THROW(ResponseParser::parse(R"({"overview": "cut off mid)", ExpectedShape::Object), ParseError);
}

TEST(ResponseParserTest, StripFences) {
  EXPECT_EQ(ResponseParser::strip_fences("```json\n{}\n```"), "{}");
  EXPECT_EQ(ResponseParser::strip_fences("```\n[1]\n```\n"), "[1]");
  EXPECT_EQ(ResponseParser::strip_fences("no fences"), "no fences");
  EXPECT_EQ(ResponseParser::strip_fences("```"), "");
  EXPECT_EQ(ResponseParser::strip_fences("```json {\"a\":1}```"), "{\"a\":1}");
  EXPECT_EQ(ResponseParser::strip_fences("```[1]\n```"), "[1]");
}

TEST(ResponseParserTest, FindEmbeddedReturnsNulloptWithoutJson) {
  EXPECT_FALSE(ResponseParser::find_embedded("plain words").has_value());
  EXPECT_FALSE(ResponseParser::find_embedded("{ not json at all }").has_value());
}

TEST(ResponseParserTest, FindEmbeddedFallsBackToFirstRegionWhenNoneFits) {
  auto value = ResponseParser::find_embedded("a [1] b [2]", ExpectedShape::Object);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, Json::parse("[1]"));
}

TEST(ResponseParserTest, ParseForUsesShapeOfEachKind) {
  EXPECT_TRUE(ResponseParser::parse_for(ArtifactKind::Summary, MockUtilities::summary_reply()).is_object());
  EXPECT_TRUE(ResponseParser::parse_for(ArtifactKind::Notes, MockUtilities::notes_reply()).is_object());
  EXPECT_TRUE(ResponseParser::parse_for(ArtifactKind::Flashcards, MockUtilities::flashcards_reply()).is_array());
  EXPECT_TRUE(ResponseParser::parse_for(ArtifactKind::Quiz, MockUtilities::quiz_reply()).is_object());
  EXPECT_TRUE(ResponseParser::parse_for(ArtifactKind::ConceptMap, MockUtilities::concept_map_reply()).is_object());
}

TEST(ResponseParserTest, ConceptMapFallsBackToMermaidSource) {
  const std::string reply = "```mermaid\nmindmap\n  root((Cells))\n    Membrane\n```";
  Json value = ResponseParser::parse_for(ArtifactKind::ConceptMap, reply);
  EXPECT_EQ(value["format"], "mermaid");
  EXPECT_EQ(value["source"], "mindmap\n  root((Cells))\n    Membrane");
}

TEST(ResponseParserTest, MermaidFallbackIsOnlyForConceptMaps) {
  EXPECT_THROW(ResponseParser::parse_for(ArtifactKind::Summary, "mindmap\n  root"), ParseError);
  EXPECT_THROW(ResponseParser::parse_for(ArtifactKind::ConceptMap, "graph TD\n  A --> B"), ParseError);
}

}  // namespace lumina_core
