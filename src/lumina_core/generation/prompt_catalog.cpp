#include "lumina_core/generation/prompt_catalog.hpp"

#include <utf8.h>

#include <stdexcept>

namespace lumina_core {

namespace {

const KindProfile SUMMARY_PROFILE{.shape = ExpectedShape::Object, .text_budget = 15000, .max_output_tokens = 2000, .default_count = 0};
const KindProfile NOTES_PROFILE{.shape = ExpectedShape::Object, .text_budget = 15000, .max_output_tokens = 3000, .default_count = 0};
const KindProfile FLASHCARDS_PROFILE{.shape = ExpectedShape::Array, .text_budget = 15000, .max_output_tokens = 4000, .default_count = 30};
const KindProfile QUIZ_PROFILE{.shape = ExpectedShape::Object, .text_budget = 15000, .max_output_tokens = 4000, .default_count = 20};
const KindProfile CONCEPT_MAP_PROFILE{.shape = ExpectedShape::Object, .text_budget = 10000, .max_output_tokens = 1500, .default_count = 0};

constexpr const char* JSON_ONLY = "Respond with ONLY a JSON object (no markdown, no backticks) with this structure:\n";

std::string document_header(const ArtifactRequest& request) {
  return "Document: " + (request.document_name.empty() ? std::string("Unknown") : request.document_name) + "\n";
}

std::string source_block(const ArtifactRequest& request) {
  return "\nText:\n" + PromptCatalog::bound_text(request.source_text, PromptCatalog::profile(request.kind).text_budget) +
         "\n\n";
}

Prompt summary_prompt(const ArtifactRequest& request) {
  Prompt prompt;
  prompt.system_instruction =
      "You are an expert at creating concise, informative summaries of academic and professional documents.\n"
      "Generate summaries that capture the essence and main ideas.";
  prompt.user_prompt = "Create a comprehensive summary of this document in JSON format.\n\n" + document_header(request) +
                       source_block(request) + JSON_ONLY +
                       "{\n"
                       "    \"overview\": \"2-3 sentence overview of the entire document\",\n"
                       "    \"keyPoints\": [\n"
                       "        {\"point\": \"Main idea 1\", \"details\": \"Brief explanation\"},\n"
                       "        {\"point\": \"Main idea 2\", \"details\": \"Brief explanation\"}\n"
                       "    ],\n"
                       "    \"conclusion\": \"Final takeaway or conclusion\"\n"
                       "}";
  return prompt;
}

Prompt notes_prompt(const ArtifactRequest& request) {
  Prompt prompt;
  prompt.system_instruction =
      "You are an expert at creating Cornell Notes - a proven note-taking method with cues, notes, and summary sections.";
  prompt.user_prompt = "Create Cornell Notes from this document in JSON format.\n\n" + document_header(request) +
                       source_block(request) + JSON_ONLY +
                       "{\n"
                       "    \"cues\": [\"Question 1?\", \"Key term 2\", \"Question 3?\"],\n"
                       "    \"notes\": [\"Detailed explanation 1\", \"Detailed explanation 2\", \"Detailed explanation 3\"],\n"
                       "    \"summary\": \"Overall summary in 2-3 sentences\"\n"
                       "}\n\n"
                       "The n-th note answers the n-th cue. Generate 10-15 cue-note pairs that cover the main concepts.";
  return prompt;
}

Prompt flashcards_prompt(const ArtifactRequest& request) {
  const Difficulty difficulty = request.difficulty_hint.value_or(Difficulty::Mixed);
  const int count = request.count_hint.value_or(FLASHCARDS_PROFILE.default_count);

  Prompt prompt;
  prompt.system_instruction =
      "You are an expert at creating effective flashcards for spaced repetition learning (like Anki).\n"
      "Your flashcards should be clear, concise, and test understanding.";
  prompt.user_prompt = "Create " + std::to_string(count) + " flashcards from this document in JSON format.\n\n" +
                       document_header(request) + "Difficulty: " + to_string(difficulty) + " - " +
                       PromptCatalog::difficulty_guidance(difficulty) + "\n" + source_block(request) +
                       "Respond with ONLY a JSON array (no markdown, no backticks) with this structure:\n"
                       "[\n"
                       "    {\n"
                       "        \"front\": \"Clear, specific question\",\n"
                       "        \"back\": \"Concise answer (1-3 sentences)\",\n"
                       "        \"difficulty\": \"easy|medium|hard\",\n"
                       "        \"tags\": [\"topic1\", \"concept2\"]\n"
                       "    }\n"
                       "]\n\n"
                       "Make flashcards that test real understanding, not just memorization.";
  return prompt;
}

Prompt quiz_prompt(const ArtifactRequest& request) {
  const Difficulty difficulty = request.difficulty_hint.value_or(Difficulty::Mixed);
  const int count = request.count_hint.value_or(QUIZ_PROFILE.default_count);

  Prompt prompt;
  prompt.system_instruction = "You are an expert at creating effective multiple-choice questions that test understanding.";
  prompt.user_prompt = "Create a " + std::to_string(count) + "-question multiple-choice quiz from this document in JSON format.\n\n" +
                       document_header(request) + "Difficulty: " + to_string(difficulty) + "\n" + source_block(request) +
                       JSON_ONLY +
                       "{\n"
                       "    \"questions\": [\n"
                       "        {\n"
                       "            \"type\": \"multiple_choice\",\n"
                       "            \"question\": \"Clear question text\",\n"
                       "            \"options\": [\"A) First option\", \"B) Second option\", \"C) Third option\", \"D) Fourth option\"],\n"
                       "            \"correctAnswer\": \"A\",\n"
                       "            \"explanation\": \"Why this answer is correct\",\n"
                       "            \"difficulty\": \"easy|medium|hard\"\n"
                       "        }\n"
                       "    ]\n"
                       "}\n\n"
                       "Create questions that test understanding, not just recall.";
  return prompt;
}

Prompt concept_map_prompt(const ArtifactRequest& request) {
  Prompt prompt;
  prompt.system_instruction =
      "You are an expert at creating clear concept maps that show how the ideas of a document relate to each other.";
  prompt.user_prompt = "Create a concept map from this document in JSON format.\n\n" + document_header(request) +
                       source_block(request) + JSON_ONLY +
                       "{\n"
                       "    \"centralTopic\": \"Main topic\",\n"
                       "    \"branches\": [\n"
                       "        {\"topic\": \"Subtopic 1\", \"children\": [\"Detail A\", \"Detail B\"]},\n"
                       "        {\"topic\": \"Subtopic 2\", \"children\": [\"Detail C\", \"Detail D\"]}\n"
                       "    ]\n"
                       "}\n\n"
                       "Keep it clear and organized with 3-5 main branches.";
  return prompt;
}

}  // namespace

const KindProfile& PromptCatalog::profile(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::Summary:
      return SUMMARY_PROFILE;
    case ArtifactKind::Notes:
      return NOTES_PROFILE;
    case ArtifactKind::Flashcards:
      return FLASHCARDS_PROFILE;
    case ArtifactKind::Quiz:
      return QUIZ_PROFILE;
    case ArtifactKind::ConceptMap:
      return CONCEPT_MAP_PROFILE;
  }
  throw std::invalid_argument("Unknown artifact kind");
}

Prompt PromptCatalog::build(const ArtifactRequest& request) {
  Prompt prompt;
  switch (request.kind) {
    case ArtifactKind::Summary:
      prompt = summary_prompt(request);
      break;
    case ArtifactKind::Notes:
      prompt = notes_prompt(request);
      break;
    case ArtifactKind::Flashcards:
      prompt = flashcards_prompt(request);
      break;
    case ArtifactKind::Quiz:
      prompt = quiz_prompt(request);
      break;
    case ArtifactKind::ConceptMap:
      prompt = concept_map_prompt(request);
      break;
  }
  prompt.max_output_tokens = profile(request.kind).max_output_tokens;
  return prompt;
}

std::string PromptCatalog::bound_text(std::string_view text, size_t max_code_points) {
  auto it = text.begin();
  size_t taken = 0;
  while (it != text.end() && taken < max_code_points) {
    auto before = it;
    try {
      utf8::next(it, text.end());
    } catch (const utf8::exception&) {
      // Invalid input past this point is dropped rather than sent half-decoded.
      return std::string(text.begin(), before);
    }
    ++taken;
  }
  return std::string(text.begin(), it);
}

std::string PromptCatalog::difficulty_guidance(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::Easy:
      return "Focus on basic facts and definitions";
    case Difficulty::Medium:
      return "Balance facts with conceptual understanding";
    case Difficulty::Hard:
      return "Focus on complex concepts and applications";
    case Difficulty::Mixed:
      return "Mix of easy, medium, and hard questions";
  }
  return "";
}

}  // namespace lumina_core
