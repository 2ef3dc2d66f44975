#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>

#include "lumina_cli/config.hpp"

using lumina_cli::Config;
using lumina_core::ArtifactKind;
using lumina_core::Difficulty;
using ::testing::ElementsAre;

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/lumina_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5);  // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

}  // namespace

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {{"ollama_url", "http://gpu-box:11434"},
                      {"generation_model", "mistral"},
                      {"temperature", 0.2},
                      {"fetch_timeout_seconds", 30},
                      {"generation_timeout_seconds", 90},
                      {"min_content_length", 50},
                      {"parallel_generation", false},
                      {"output_formats", {"summary", "quiz"}},
                      {"num_flashcards", 10},
                      {"num_quiz_questions", 5},
                      {"difficulty", "hard"}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.ollama_url, "http://gpu-box:11434");
  EXPECT_EQ(cfg.generation_model, "mistral");
  EXPECT_DOUBLE_EQ(cfg.temperature, 0.2);
  EXPECT_EQ(cfg.fetch_timeout_seconds, 30);
  EXPECT_EQ(cfg.generation_timeout_seconds, 90);
  EXPECT_EQ(cfg.min_content_length, 50);
  EXPECT_FALSE(cfg.parallel_generation);
  EXPECT_THAT(cfg.output_formats, ElementsAre(ArtifactKind::Summary, ArtifactKind::Quiz));
  EXPECT_EQ(cfg.num_flashcards, 10);
  EXPECT_EQ(cfg.num_quiz_questions, 5);
  EXPECT_EQ(cfg.difficulty, Difficulty::Hard);
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  nlohmann::json j = nlohmann::json::object();

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.generation_model, "llama3.1");
  EXPECT_DOUBLE_EQ(cfg.temperature, 0.7);
  EXPECT_EQ(cfg.fetch_timeout_seconds, 60);
  EXPECT_EQ(cfg.generation_timeout_seconds, 180);
  EXPECT_EQ(cfg.min_content_length, 100);
  EXPECT_TRUE(cfg.parallel_generation);
  EXPECT_EQ(cfg.output_formats, lumina_core::all_artifact_kinds());
  EXPECT_EQ(cfg.num_flashcards, 30);
  EXPECT_EQ(cfg.num_quiz_questions, 20);
  EXPECT_EQ(cfg.difficulty, Difficulty::Mixed);
}

TEST(ConfigTest, FormatAliasesAreAccepted) {
  Config cfg = Config::from_json({{"output_formats", {"notes", "conceptMap", "cornellNotes", "mindMap"}}});
  EXPECT_THAT(cfg.output_formats,
              ElementsAre(ArtifactKind::Notes, ArtifactKind::ConceptMap, ArtifactKind::Notes, ArtifactKind::ConceptMap));
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "ollama_url": "http://localhost:11500",
    "generation_model": "llama3.2",
    "output_formats": ["flashcards"],
    "num_flashcards": 12
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.ollama_url, "http://localhost:11500");
  EXPECT_EQ(cfg.generation_model, "llama3.2");
  EXPECT_THAT(cfg.output_formats, ElementsAre(ArtifactKind::Flashcards));
  EXPECT_EQ(cfg.num_flashcards, 12);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({ (void)Config::from_file("/nonexistent/path/luminarc.json"); }, std::runtime_error);
}

TEST(ConfigTest, MalformedFileThrows) {
  std::string path = write_temp_file("{ \"ollama_url\": ");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, WrongValueTypeInFileThrows) {
  std::string path = write_temp_file(R"({"num_flashcards": "many"})");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"ollama_url", ""}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"generation_model", ""}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"output_formats", nlohmann::json::array()}}); }, std::runtime_error);
}

TEST(ConfigTest, OutOfRangeValuesThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"temperature", 3.5}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"fetch_timeout_seconds", 0}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"generation_timeout_seconds", -1}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"num_quiz_questions", 0}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"min_content_length", -5}}); }, std::runtime_error);
}

TEST(ConfigTest, UnknownNamesThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"output_formats", {"summary", "poem"}}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"difficulty", "brutal"}}); }, std::runtime_error);
}

TEST(ConfigTest, NonObjectThrows) {
  EXPECT_THROW({ (void)Config::from_json(nlohmann::json::array()); }, std::runtime_error);
}
