#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docqa_core {

class HashingError : public std::exception {
 public:
  explicit HashingError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Lower-case hex SHA-256 of an in-memory buffer.
std::string sha256_hex(std::string_view content);

// Streams the file in 4096-byte blocks.
std::string sha256_file(const std::filesystem::path& file_path);

}  // namespace docqa_core
