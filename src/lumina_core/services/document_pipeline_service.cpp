#include "lumina_core/services/document_pipeline_service.hpp"

#include <utf8.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "lumina_core/errors.hpp"

namespace lumina_core {

std::string to_string(RecordStatus status) {
  switch (status) {
    case RecordStatus::Success:
      return "success";
    case RecordStatus::Failed:
      return "failed";
    case RecordStatus::Skipped:
      return "skipped";
  }
  return "failed";
}

DocumentPipelineService::DocumentPipelineService(std::shared_ptr<AcquisitionService> acquisition_service,
                                                 std::shared_ptr<GenerationService> generation_service,
                                                 size_t min_content_length)
    : acquisition_service_(std::move(acquisition_service)),
      generation_service_(std::move(generation_service)),
      min_content_length_(min_content_length) {}

Json DocumentPipelineService::process(const std::string& uri, const GenerationOptions& options) const {
  AcquiredDocument document;
  try {
    document = acquisition_service_->acquire(uri);
  } catch (const AcquisitionError& e) {
    std::cerr << "[Pipeline] Error processing " << uri << ": " << e.what() << std::endl;
    return failed_record(uri, e.what(), utc_timestamp());
  }

  try {
    check_content(document.text);
  } catch (const InsufficientContentError& e) {
    std::cerr << "[Pipeline] Skipping " << uri << ": " << e.what() << std::endl;
    return skipped_record(document, e.what(), utc_timestamp());
  }

  std::cout << "[Pipeline] Extracted " << count_code_points(document.text) << " characters from "
            << document.document.declared_name << std::endl;
  GenerationResult generation =
      generation_service_->generate(document.text, document.document.declared_name, options);

  std::cout << "[Pipeline] Processed " << document.document.declared_name << ": "
            << generation.generated_kinds().size() << " of " << generation.outcomes.size()
            << " formats generated" << std::endl;
  return success_record(document, generation, utc_timestamp());
}

void DocumentPipelineService::check_content(const std::string& normalized_text) const {
  const size_t length = count_code_points(normalized_text);
  if (length < min_content_length_) {
    throw InsufficientContentError(length, min_content_length_);
  }
}

Json DocumentPipelineService::success_record(const AcquiredDocument& document,
                                             const GenerationResult& generation,
                                             const std::string& processed_at) {
  Json materials = Json::object();
  Json failures = Json::object();
  Json generated = Json::array();
  for (const auto& outcome : generation.outcomes) {
    if (outcome.ok()) {
      materials[to_string(outcome.kind)] = *outcome.artifact;
      generated.push_back(to_string(outcome.kind));
    } else {
      failures[to_string(outcome.kind)] = outcome.error;
    }
  }

  size_t flashcards = 0;
  if (const ParsedArtifact* cards = generation.artifact(ArtifactKind::Flashcards); cards && cards->is_array()) {
    flashcards = cards->size();
  }
  size_t questions = 0;
  if (const ParsedArtifact* quiz = generation.artifact(ArtifactKind::Quiz);
      quiz && quiz->is_object() && quiz->contains("questions") && quiz->at("questions").is_array()) {
    questions = quiz->at("questions").size();
  }

  const size_t words = count_words(document.text);
  Json record = Json::object();
  record["fileId"] = document.content_id;
  record["filename"] = document.document.declared_name;
  record["sourceUrl"] = document.document.origin;
  record["format"] = to_string(document.format);
  record["processedAt"] = processed_at;
  record["studyMaterials"] = std::move(materials);
  record["failures"] = std::move(failures);
  record["statistics"] = {{"textLength", count_code_points(document.text)},
                          {"wordCount", words},
                          {"estimatedReadTime", std::to_string(words / WORDS_PER_MINUTE) + "m"},
                          {"generatedFormats", std::move(generated)},
                          {"flashcardCount", flashcards},
                          {"quizQuestionCount", questions}};
  record["status"] = to_string(RecordStatus::Success);
  return record;
}

Json DocumentPipelineService::failed_record(const std::string& uri,
                                            const std::string& error,
                                            const std::string& processed_at) {
  Json record = Json::object();
  record["sourceUrl"] = uri;
  record["status"] = to_string(RecordStatus::Failed);
  record["error"] = error;
  record["processedAt"] = processed_at;
  return record;
}

Json DocumentPipelineService::skipped_record(const AcquiredDocument& document,
                                             const std::string& reason,
                                             const std::string& processed_at) {
  Json record = Json::object();
  record["fileId"] = document.content_id;
  record["filename"] = document.document.declared_name;
  record["sourceUrl"] = document.document.origin;
  record["format"] = to_string(document.format);
  record["processedAt"] = processed_at;
  record["statistics"] = {{"textLength", count_code_points(document.text)},
                          {"wordCount", count_words(document.text)}};
  record["status"] = to_string(RecordStatus::Skipped);
  record["error"] = reason;
  return record;
}

size_t DocumentPipelineService::count_code_points(std::string_view text) {
  size_t count = 0;
  auto it = text.begin();
  while (it != text.end()) {
    auto invalid = utf8::find_invalid(it, text.end());
    count += static_cast<size_t>(utf8::distance(it, invalid));
    if (invalid == text.end()) {
      break;
    }
    ++count;
    it = invalid + 1;
  }
  return count;
}

size_t DocumentPipelineService::count_words(std::string_view text) {
  size_t words = 0;
  bool in_word = false;
  for (char c : text) {
    const bool space = c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    if (!space && !in_word) {
      ++words;
    }
    in_word = !space;
  }
  return words;
}

std::string DocumentPipelineService::utc_timestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  std::ostringstream stream;
  stream << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return stream.str();
}

}  // namespace lumina_core
