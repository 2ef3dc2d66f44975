#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "lumina_cli/config.hpp"
#include "lumina_core/acquisition/acquisition_service.hpp"
#include "lumina_core/generation/generation_service.hpp"
#include "lumina_core/types/artifact.hpp"

namespace lumina_cli {

enum class Command { Process, Extract, Help };

struct CliOptions {
  Command command = Command::Help;
  std::vector<std::string> urls;
  std::string input_file;
  std::optional<std::vector<lumina_core::ArtifactKind>> formats;
  std::optional<int> num_flashcards;
  std::optional<int> num_quiz_questions;
  std::optional<lumina_core::Difficulty> difficulty;
  std::optional<std::string> config_path;
  std::string output_path;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  // Wires the real fetcher and backend client from the configuration.
  explicit CliHandler(const Config& config);
  CliHandler(const Config& config,
             std::shared_ptr<lumina_core::AcquisitionService> acquisition_service,
             std::shared_ptr<lumina_core::GenerationService> generation_service);

  CliHandler(const CliHandler&) = delete;
  CliHandler& operator=(const CliHandler&) = delete;

  static CliOptions parse_arguments(int argc, char* argv[]);

  // Loads the file named by --config, else luminarc.json when present, else defaults.
  static Config load_config(const CliOptions& options);

  // Process exit code: 0 when no document failed.
  int execute_command(const CliOptions& options, std::ostream& out);

  // One URL per line; blank lines and surrounding whitespace ignored.
  static std::vector<std::string> read_url_list(const std::string& path);

  lumina_core::GenerationOptions generation_options(const CliOptions& options) const;

 private:
  int handle_process_command(const CliOptions& options, std::ostream& out);
  int handle_extract_command(const CliOptions& options, std::ostream& out);
  void print_help(std::ostream& out) const;
  std::vector<std::string> collect_urls(const CliOptions& options) const;

  Config config_;
  std::shared_ptr<lumina_core::AcquisitionService> acquisition_service_;
  std::shared_ptr<lumina_core::GenerationService> generation_service_;
};

}  // namespace lumina_cli
