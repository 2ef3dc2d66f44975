#pragma once

#include <exception>
#include <string>

#include "lumina_core/types/artifact.hpp"
#include "lumina_core/types/format_tag.hpp"

namespace lumina_core {

// Fatal for one document: fetch failed or its bytes could not be turned into text.
class AcquisitionError : public std::exception {
 public:
  explicit AcquisitionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class ExtractionError : public AcquisitionError {
 public:
  ExtractionError(FormatTag format, const std::string& cause)
      : AcquisitionError("Failed to extract " + to_string(format) + " text: " + cause),
        format_(format),
        cause_(cause) {}

  FormatTag format() const {
    return format_;
  }
  const std::string& cause() const {
    return cause_;
  }

 private:
  FormatTag format_;
  std::string cause_;
};

// Normalized text too short to generate from. The document is skipped, not failed.
class InsufficientContentError : public std::exception {
 public:
  InsufficientContentError(size_t length, size_t minimum)
      : message_("Insufficient text extracted: " + std::to_string(length) +
                 " characters, need at least " + std::to_string(minimum)) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class GenerationError : public std::exception {
 public:
  GenerationError(ArtifactKind kind, const std::string& cause)
      : message_("Generation of " + to_string(kind) + " failed: " + cause), kind_(kind) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }
  ArtifactKind kind() const {
    return kind_;
  }

 private:
  std::string message_;
  ArtifactKind kind_;
};

class ParseError : public std::exception {
 public:
  static constexpr size_t MAX_EXCERPT = 200;

  ParseError(const std::string& reason, const std::string& reply)
      : reply_excerpt_(reply.substr(0, MAX_EXCERPT)),
        message_("Could not parse structured data from reply (" + reason + "): " +
                 reply_excerpt_) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }
  const std::string& reply_excerpt() const {
    return reply_excerpt_;
  }

 private:
  std::string reply_excerpt_;
  std::string message_;
};

}  // namespace lumina_core
