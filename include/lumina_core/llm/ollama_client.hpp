#pragma once

#include <chrono>
#include <string>

namespace lumina_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class OllamaClient
 * @brief Generation backend: system instruction + user prompt in, reply text out.
 *
 * Server URL and model are fixed at construction. Every call opens its own
 * connection with its own read timeout, so calls from several threads do not
 * interfere. Backend failures throw OllamaError.
 */
class OllamaClient {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &generation_model, double temperature = 0.7);
  virtual ~OllamaClient() = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  virtual std::string generate(const std::string &system_instruction,
                               const std::string &prompt,
                               int max_output_tokens,
                               std::chrono::seconds timeout);

  virtual bool is_server_available();

  const std::string &model() const {
    return generation_model_;
  }

 private:
  std::string ollama_url_;
  std::string generation_model_;
  double temperature_;
};

}  // namespace lumina_core
