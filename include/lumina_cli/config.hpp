#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lumina_core/types/artifact.hpp"

namespace lumina_cli {

class Config {
 public:
  static constexpr const char* DEFAULT_FILE = "luminarc.json";

  std::string ollama_url;
  std::string generation_model;
  double temperature;
  int fetch_timeout_seconds;
  int generation_timeout_seconds;
  int min_content_length;
  bool parallel_generation;

  // Generation defaults, overridable per run from the command line
  std::vector<lumina_core::ArtifactKind> output_formats;
  int num_flashcards;
  int num_quiz_questions;
  lumina_core::Difficulty difficulty;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    try {
      return from_json(json_config);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid value in config file '") + filename + "': " + e.what());
    }
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Configuration must be a JSON object");
    }
    Config config;

    // Apply defaults when keys are missing
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.generation_model = json_config.value("generation_model", std::string("llama3.1"));
    config.temperature = json_config.value("temperature", 0.7);
    config.fetch_timeout_seconds = json_config.value("fetch_timeout_seconds", 60);
    config.generation_timeout_seconds = json_config.value("generation_timeout_seconds", 180);
    config.min_content_length = json_config.value("min_content_length", 100);
    config.parallel_generation = json_config.value("parallel_generation", true);
    config.num_flashcards = json_config.value("num_flashcards", 30);
    config.num_quiz_questions = json_config.value("num_quiz_questions", 20);

    std::string difficulty = json_config.value("difficulty", std::string("mixed"));
    auto parsed_difficulty = lumina_core::difficulty_from_string(difficulty);
    if (!parsed_difficulty) {
      throw std::runtime_error("difficulty must be one of easy, medium, hard, mixed (got '" + difficulty + "')");
    }
    config.difficulty = *parsed_difficulty;

    if (json_config.contains("output_formats")) {
      config.output_formats = parse_formats(json_config.at("output_formats").get<std::vector<std::string>>());
    } else {
      config.output_formats = lumina_core::all_artifact_kinds();
    }

    config.validate();
    return config;
  }

  // Artifact kind names to kinds. Throws on an unknown name.
  static std::vector<lumina_core::ArtifactKind> parse_formats(const std::vector<std::string>& names) {
    std::vector<lumina_core::ArtifactKind> kinds;
    for (const auto& name : names) {
      auto kind = lumina_core::artifact_kind_from_string(name);
      if (!kind) {
        throw std::runtime_error("Unknown output format: " + name);
      }
      kinds.push_back(*kind);
    }
    return kinds;
  }

 private:
  void validate() const {
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty");
    }
    if (temperature < 0.0 || temperature > 2.0) {
      throw std::runtime_error("temperature must be between 0 and 2");
    }
    if (fetch_timeout_seconds <= 0) {
      throw std::runtime_error("fetch_timeout_seconds must be greater than 0");
    }
    if (generation_timeout_seconds <= 0) {
      throw std::runtime_error("generation_timeout_seconds must be greater than 0");
    }
    if (min_content_length < 0) {
      throw std::runtime_error("min_content_length cannot be negative");
    }
    if (output_formats.empty()) {
      throw std::runtime_error("output_formats cannot be empty");
    }
    if (num_flashcards <= 0) {
      throw std::runtime_error("num_flashcards must be greater than 0");
    }
    if (num_quiz_questions <= 0) {
      throw std::runtime_error("num_quiz_questions must be greater than 0");
    }
  }
};

}  // namespace lumina_cli
