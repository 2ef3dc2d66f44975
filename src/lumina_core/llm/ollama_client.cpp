#include "lumina_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace lumina_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &generation_model, double temperature)
    : ollama_url_(ollama_url), generation_model_(generation_model), temperature_(temperature) {}

std::string OllamaClient::generate(const std::string &system_instruction,
                                   const std::string &prompt,
                                   int max_output_tokens,
                                   std::chrono::seconds timeout) {
  Ollama server(ollama_url_);
  server.setReadTimeout(static_cast<int>(timeout.count()));

  ollama::messages messages = {ollama::message("system", system_instruction),
                               ollama::message("user", prompt)};
  ollama::options options;
  options["num_predict"] = max_output_tokens;
  options["temperature"] = temperature_;

  try {
    ollama::response response = server.chat(generation_model_, messages, options);
    std::string reply = response.as_simple_string();
    if (reply.empty()) {
      throw OllamaError("Backend returned an empty reply");
    }
    return reply;
  } catch (const ollama::exception &e) {
    throw OllamaError("Generation request failed: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  Ollama server(ollama_url_);
  return server.is_running();
}

}  // namespace lumina_core
