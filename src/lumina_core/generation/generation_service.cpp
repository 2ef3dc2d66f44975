#include "lumina_core/generation/generation_service.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <system_error>

#include "lumina_core/errors.hpp"
#include "lumina_core/generation/prompt_catalog.hpp"
#include "lumina_core/generation/response_parser.hpp"

namespace lumina_core {

std::vector<ArtifactKind> GenerationResult::generated_kinds() const {
  std::vector<ArtifactKind> kinds;
  for (const auto& outcome : outcomes) {
    if (outcome.ok()) {
      kinds.push_back(outcome.kind);
    }
  }
  return kinds;
}

const ParsedArtifact* GenerationResult::artifact(ArtifactKind kind) const {
  for (const auto& outcome : outcomes) {
    if (outcome.kind == kind && outcome.ok()) {
      return &*outcome.artifact;
    }
  }
  return nullptr;
}

GenerationService::GenerationService(std::shared_ptr<OllamaClient> ollama_client)
    : ollama_client_(std::move(ollama_client)) {}

ArtifactRequest GenerationService::make_request(ArtifactKind kind,
                                                const std::string& normalized_text,
                                                const std::string& document_name,
                                                const GenerationOptions& options) {
  ArtifactRequest request{.kind = kind,
                          .source_text = PromptCatalog::bound_text(
                              normalized_text, PromptCatalog::profile(kind).text_budget),
                          .document_name = document_name,
                          .count_hint = std::nullopt,
                          .difficulty_hint = std::nullopt,
                          .timeout = options.timeout};
  if (kind == ArtifactKind::Flashcards) {
    request.count_hint = options.flashcard_count;
    request.difficulty_hint = options.difficulty;
  } else if (kind == ArtifactKind::Quiz) {
    request.count_hint = options.quiz_question_count;
    request.difficulty_hint = options.difficulty;
  }
  return request;
}

KindOutcome GenerationService::run_unit(const ArtifactRequest& request) const {
  KindOutcome outcome{.kind = request.kind, .artifact = std::nullopt, .error = ""};
  std::cout << "[Generation] Generating " << to_string(request.kind) << std::endl;

  try {
    const Prompt prompt = PromptCatalog::build(request);
    ArtifactReply reply{.kind = request.kind, .raw_text = ""};
    try {
      reply.raw_text = ollama_client_->generate(prompt.system_instruction, prompt.user_prompt,
                                                prompt.max_output_tokens, request.timeout);
    } catch (const std::exception& e) {
      throw GenerationError(request.kind, e.what());
    }
    outcome.artifact = ResponseParser::parse_for(reply.kind, reply.raw_text);
  } catch (const std::exception& e) {
    outcome.error = e.what();
    std::cerr << "[Generation] " << to_string(request.kind) << " failed: " << outcome.error
              << std::endl;
  }
  return outcome;
}

GenerationResult GenerationService::generate(const std::string& normalized_text,
                                             const std::string& document_name,
                                             const GenerationOptions& options) const {
  std::vector<ArtifactKind> kinds;
  for (ArtifactKind kind : options.kinds) {
    if (std::find(kinds.begin(), kinds.end(), kind) == kinds.end()) {
      kinds.push_back(kind);
    }
  }

  std::vector<ArtifactRequest> requests;
  for (ArtifactKind kind : kinds) {
    requests.push_back(make_request(kind, normalized_text, document_name, options));
  }

  GenerationResult result;
  if (!options.parallel || requests.size() < 2) {
    for (const auto& request : requests) {
      result.outcomes.push_back(run_unit(request));
    }
    return result;
  }

  std::vector<std::future<KindOutcome>> pending;
  for (const auto& request : requests) {
    try {
      pending.push_back(std::async(std::launch::async, [this, &request] { return run_unit(request); }));
    } catch (const std::system_error& e) {
      std::cerr << "[Generation] Could not start a worker for " << to_string(request.kind)
                << ", running inline: " << e.what() << std::endl;
      std::promise<KindOutcome> inline_result;
      inline_result.set_value(run_unit(request));
      pending.push_back(inline_result.get_future());
    }
  }
  for (auto& future : pending) {
    result.outcomes.push_back(future.get());
  }
  return result;
}

}  // namespace lumina_core
