#include "lumina_cli/cli_handler.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "lumina_core/errors.hpp"
#include "lumina_core/extractors/content_extractor_factory.hpp"
#include "lumina_core/services/document_pipeline_service.hpp"

namespace lumina_cli {

namespace {

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    const auto first = item.find_first_not_of(" \t");
    if (first == std::string::npos) {
      continue;
    }
    const auto last = item.find_last_not_of(" \t");
    items.push_back(item.substr(first, last - first + 1));
  }
  return items;
}

int parse_positive(const std::string& flag, const std::string& value) {
  int parsed = 0;
  try {
    size_t consumed = 0;
    parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError(flag + " expects a whole number, got '" + value + "'");
    }
  } catch (const std::logic_error&) {
    throw CliError(flag + " expects a whole number, got '" + value + "'");
  }
  if (parsed <= 0) {
    throw CliError(flag + " must be greater than 0");
  }
  return parsed;
}

}  // namespace

CliHandler::CliHandler(const Config& config)
    : CliHandler(config,
                 std::make_shared<lumina_core::AcquisitionService>(
                     std::make_shared<lumina_core::DocumentFetcher>(
                         std::chrono::seconds(config.fetch_timeout_seconds)),
                     std::make_shared<lumina_core::ContentExtractorFactory>()),
                 std::make_shared<lumina_core::GenerationService>(std::make_shared<lumina_core::OllamaClient>(
                     config.ollama_url, config.generation_model, config.temperature))) {}

CliHandler::CliHandler(const Config& config,
                       std::shared_ptr<lumina_core::AcquisitionService> acquisition_service,
                       std::shared_ptr<lumina_core::GenerationService> generation_service)
    : config_(config),
      acquisition_service_(std::move(acquisition_service)),
      generation_service_(std::move(generation_service)) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
  CliOptions options;
  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];
  if (command == "process" || command == "p") {
    options.command = Command::Process;
  } else if (command == "extract" || command == "x") {
    options.command = Command::Extract;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; i += 2) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    std::string value = argv[i + 1];

    if (flag == "--url" || flag == "-u") {
      options.urls.push_back(value);
    } else if (flag == "--input" || flag == "-i") {
      options.input_file = value;
    } else if (flag == "--config" || flag == "-c") {
      options.config_path = value;
    } else if (flag == "--output" || flag == "-o") {
      options.output_path = value;
    } else if (options.command == Command::Process && (flag == "--formats" || flag == "-f")) {
      try {
        options.formats = Config::parse_formats(split_list(value));
      } catch (const std::runtime_error& e) {
        throw CliError(e.what());
      }
      if (options.formats->empty()) {
        throw CliError("--formats needs at least one format");
      }
    } else if (options.command == Command::Process && flag == "--flashcards") {
      options.num_flashcards = parse_positive(flag, value);
    } else if (options.command == Command::Process && flag == "--questions") {
      options.num_quiz_questions = parse_positive(flag, value);
    } else if (options.command == Command::Process && (flag == "--difficulty" || flag == "-d")) {
      options.difficulty = lumina_core::difficulty_from_string(value);
      if (!options.difficulty) {
        throw CliError("--difficulty must be one of easy, medium, hard, mixed");
      }
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  if (options.urls.empty() && options.input_file.empty()) {
    throw CliError("At least one document is required. Usage: " + command +
                   " --url <url> [--url <url>...] or --input <file>");
  }
  return options;
}

Config CliHandler::load_config(const CliOptions& options) {
  if (options.config_path) {
    return Config::from_file(*options.config_path);
  }
  if (std::filesystem::exists(Config::DEFAULT_FILE)) {
    return Config::from_file(Config::DEFAULT_FILE);
  }
  return Config::from_json(nlohmann::json::object());
}

std::vector<std::string> CliHandler::read_url_list(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw CliError("Failed to open URL list: " + path);
  }
  std::vector<std::string> urls;
  std::string line;
  while (std::getline(file, line)) {
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
      continue;
    }
    const auto last = line.find_last_not_of(" \t\r");
    urls.push_back(line.substr(first, last - first + 1));
  }
  return urls;
}

lumina_core::GenerationOptions CliHandler::generation_options(const CliOptions& options) const {
  return lumina_core::GenerationOptions{
      .kinds = options.formats.value_or(config_.output_formats),
      .flashcard_count = options.num_flashcards.value_or(config_.num_flashcards),
      .quiz_question_count = options.num_quiz_questions.value_or(config_.num_quiz_questions),
      .difficulty = options.difficulty.value_or(config_.difficulty),
      .timeout = std::chrono::seconds(config_.generation_timeout_seconds),
      .parallel = config_.parallel_generation};
}

std::vector<std::string> CliHandler::collect_urls(const CliOptions& options) const {
  std::vector<std::string> urls = options.urls;
  if (!options.input_file.empty()) {
    for (auto& url : read_url_list(options.input_file)) {
      urls.push_back(std::move(url));
    }
  }
  if (urls.empty()) {
    throw CliError("No document URLs provided");
  }
  return urls;
}

int CliHandler::execute_command(const CliOptions& options, std::ostream& out) {
  switch (options.command) {
    case Command::Process:
      return handle_process_command(options, out);
    case Command::Extract:
      return handle_extract_command(options, out);
    case Command::Help:
      print_help(out);
      return 0;
  }
  return 1;
}

int CliHandler::handle_process_command(const CliOptions& options, std::ostream& out) {
  const std::vector<std::string> urls = collect_urls(options);
  const lumina_core::GenerationOptions generation = generation_options(options);
  lumina_core::DocumentPipelineService pipeline(acquisition_service_, generation_service_,
                                                static_cast<size_t>(config_.min_content_length));

  std::ofstream file;
  if (!options.output_path.empty()) {
    file.open(options.output_path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
      throw CliError("Failed to open output file: " + options.output_path);
    }
  }
  std::ostream& sink = options.output_path.empty() ? out : file;

  std::cout << "[CLI] Processing " << urls.size() << " document(s)" << std::endl;
  int failed = 0;
  for (size_t i = 0; i < urls.size(); ++i) {
    std::cout << "[CLI] [" << (i + 1) << "/" << urls.size() << "] " << urls[i] << std::endl;
    lumina_core::Json record = pipeline.process(urls[i], generation);
    if (record.value("status", std::string()) == lumina_core::to_string(lumina_core::RecordStatus::Failed)) {
      ++failed;
    }
    sink << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    sink.flush();
  }

  std::cout << "[CLI] Done: " << (urls.size() - failed) << " of " << urls.size() << " document(s) processed"
            << std::endl;
  return failed == 0 ? 0 : 1;
}

int CliHandler::handle_extract_command(const CliOptions& options, std::ostream& out) {
  int failed = 0;
  for (const auto& url : collect_urls(options)) {
    try {
      lumina_core::AcquiredDocument document = acquisition_service_->acquire(url);
      out << "=== " << document.document.declared_name << " (" << lumina_core::to_string(document.format)
          << ", " << document.size << " bytes, id " << document.content_id << ") ===\n"
          << document.text << "\n\n";
    } catch (const lumina_core::AcquisitionError& e) {
      std::cerr << "[CLI] Error extracting " << url << ": " << e.what() << std::endl;
      ++failed;
    }
  }
  return failed == 0 ? 0 : 1;
}

void CliHandler::print_help(std::ostream& out) const {
  out << R"(
Lumina - Document Study Companion

Usage: lumina <command> [options]

Commands:
  process, p    Fetch documents and generate study materials (JSON Lines output)
    --url, -u <url>          Document URL (repeatable; http, https or file)
    --input, -i <file>       File with one document URL per line
    --formats, -f <list>     Comma separated: summary, cornellNotes, flashcards, quiz, mindMap
    --flashcards <num>       Number of flashcards (default from config: 30)
    --questions <num>        Number of quiz questions (default from config: 20)
    --difficulty, -d <level> easy, medium, hard or mixed
    --output, -o <path>      Write records to a file instead of stdout
    --config, -c <path>      Configuration file (default: luminarc.json if present)

  extract, x    Fetch documents and print their normalized text, no generation
    --url, -u <url>          Document URL (repeatable)
    --input, -i <file>       File with one document URL per line
    --config, -c <path>      Configuration file

  help, h       Show this help message

Exit status is 1 when any document failed, 0 otherwise.
)";
}

}  // namespace lumina_cli
