#include "lumina_core/extractors/zip_archive.hpp"

#include <sstream>
#include <stdexcept>

namespace lumina_core {

ZipArchive::ZipArchive(const Bytes& bytes) : archive_(nullptr) {
  zip_error_t error;
  zip_error_init(&error);

  zip_source_t* source = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &error);
  if (!source) {
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    throw std::runtime_error("Failed to create ZIP source: " + message);
  }

  archive_ = zip_open_from_source(source, ZIP_RDONLY, &error);
  if (!archive_) {
    std::string message = zip_error_strerror(&error);
    zip_source_free(source);
    zip_error_fini(&error);
    throw std::runtime_error("Failed to open ZIP container: " + message);
  }
  zip_error_fini(&error);
}

ZipArchive::~ZipArchive() {
  if (archive_) {
    zip_discard(archive_);
  }
}

bool ZipArchive::contains(const std::string& name) const {
  return zip_name_locate(archive_, name.c_str(), ZIP_FL_NOCASE) >= 0;
}

std::string ZipArchive::read(const std::string& name) const {
  zip_stat_t stat;
  zip_stat_init(&stat);
  if (zip_stat(archive_, name.c_str(), ZIP_FL_NOCASE, &stat) != 0) {
    throw std::runtime_error("Missing container entry: " + name);
  }

  zip_file_t* file = zip_fopen(archive_, name.c_str(), ZIP_FL_NOCASE);
  if (!file) {
    throw std::runtime_error("Failed to open container entry " + name + ": " +
                             zip_strerror(archive_));
  }

  std::string content;
  if (stat.valid & ZIP_STAT_SIZE) {
    content.reserve(stat.size);
  }
  char buffer[8192];
  zip_int64_t bytes_read = 0;
  while ((bytes_read = zip_fread(file, buffer, sizeof(buffer))) > 0) {
    content.append(buffer, static_cast<size_t>(bytes_read));
  }
  if (bytes_read < 0) {
    std::string message = zip_file_strerror(file);
    zip_fclose(file);
    throw std::runtime_error("Failed to read container entry " + name + ": " + message);
  }
  zip_fclose(file);
  return content;
}

std::vector<std::string> ZipArchive::entry_names() const {
  std::vector<std::string> names;
  zip_int64_t count = zip_get_num_entries(archive_, 0);
  for (zip_int64_t i = 0; i < count; ++i) {
    const char* name = zip_get_name(archive_, static_cast<zip_uint64_t>(i), 0);
    if (name) {
      names.emplace_back(name);
    }
  }
  return names;
}

std::string resolve_part_path(const std::string& base_part, const std::string& target) {
  if (!target.empty() && target.front() == '/') {
    return target.substr(1);
  }

  std::vector<std::string> segments;
  auto push_segments = [&segments](const std::string& path) {
    std::stringstream stream(path);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
      if (segment.empty() || segment == ".") {
        continue;
      }
      if (segment == "..") {
        if (!segments.empty()) {
          segments.pop_back();
        }
        continue;
      }
      segments.push_back(segment);
    }
  };

  auto slash = base_part.rfind('/');
  if (slash != std::string::npos) {
    push_segments(base_part.substr(0, slash));
  }
  push_segments(target);

  std::string resolved;
  for (const auto& segment : segments) {
    if (!resolved.empty()) {
      resolved += '/';
    }
    resolved += segment;
  }
  return resolved;
}

}  // namespace lumina_core
