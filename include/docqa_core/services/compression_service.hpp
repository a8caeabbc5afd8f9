#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace docqa_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Zstandard framing for chunk text stored in the documents table.
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  /**
   * @brief Compresses chunk text.
   * @param data Text to compress. Empty input yields an empty buffer.
   * @param compression_level zstd level, clamped by zstd to its supported range.
   * @throws CompressionError if zstd reports a failure.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = DEFAULT_LEVEL);

  /**
   * @brief Restores text written by compress().
   * @throws CompressionError if the buffer is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char>& compressed_data);
};

}  // namespace docqa_core
