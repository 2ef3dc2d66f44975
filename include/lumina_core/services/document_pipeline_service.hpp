#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "lumina_core/acquisition/acquisition_service.hpp"
#include "lumina_core/generation/generation_service.hpp"
#include "lumina_core/types/artifact.hpp"

namespace lumina_core {

enum class RecordStatus { Success, Failed, Skipped };

std::string to_string(RecordStatus status);

/**
 * @class DocumentPipelineService
 * @brief One document from URI to caller-facing summary record.
 *
 * Acquisition completes before any generation starts. An acquisition failure
 * yields a "failed" record, text shorter than the minimum a "skipped" one.
 * Otherwise the record is "success" and lists per-kind failures next to the
 * artifacts that were produced. process() never throws for document errors.
 */
class DocumentPipelineService {
 public:
  static constexpr int WORDS_PER_MINUTE = 200;

  DocumentPipelineService(std::shared_ptr<AcquisitionService> acquisition_service,
                          std::shared_ptr<GenerationService> generation_service,
                          size_t min_content_length = 100);

  Json process(const std::string& uri, const GenerationOptions& options) const;

  // Fails with InsufficientContentError when the text is below the minimum length.
  void check_content(const std::string& normalized_text) const;

  static Json success_record(const AcquiredDocument& document,
                             const GenerationResult& generation,
                             const std::string& processed_at);
  static Json failed_record(const std::string& uri, const std::string& error, const std::string& processed_at);
  static Json skipped_record(const AcquiredDocument& document,
                             const std::string& reason,
                             const std::string& processed_at);

  // Unicode code points; invalid sequences count one per byte.
  static size_t count_code_points(std::string_view text);
  static size_t count_words(std::string_view text);
  // Current UTC time as 2024-01-31T12:00:00Z.
  static std::string utc_timestamp();

 private:
  std::shared_ptr<AcquisitionService> acquisition_service_;
  std::shared_ptr<GenerationService> generation_service_;
  size_t min_content_length_;
};

}  // namespace lumina_core
