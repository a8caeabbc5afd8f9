#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "docqa_core/cache/kv_cache.hpp"
#include "docqa_core/llm/ollama_client.hpp"

namespace docqa_core {

class EmbedderError : public std::exception {
 public:
  explicit EmbedderError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class EmbeddingDimensionMismatch : public EmbedderError {
 public:
  EmbeddingDimensionMismatch(size_t expected, size_t actual)
      : EmbedderError("Embedding dimension mismatch: expected " + std::to_string(expected) +
                      ", got " + std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const noexcept { return expected_; }
  size_t actual() const noexcept { return actual_; }

 private:
  size_t expected_;
  size_t actual_;
};

struct EmbedderOptions {
  size_t dimension = 768;
  std::string cache_prefix = "docqa";
  std::chrono::seconds cache_ttl{86400};
};

// Text to L2-normalized vectors of a fixed dimension.
class Embedder {
 public:
  // cache may be null; when set, query vectors are memoized under the
  // embedding namespace.
  Embedder(OllamaClient& client, EmbedderOptions options, KeyValueCache* cache = nullptr);
  virtual ~Embedder() = default;

  Embedder(const Embedder&) = delete;
  Embedder& operator=(const Embedder&) = delete;

  // Throws EmbeddingDimensionMismatch if any vector has the wrong size and
  // EmbedderError when the model call fails.
  virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts);

  // Never throws: a failed call or a wrong-sized vector yields all zeros.
  virtual std::vector<float> embed_query(const std::string& text);

  size_t dimension() const { return options_.dimension; }

  // 32 below an average of 500 characters, 16 below 1000, else 8.
  static size_t batch_size_for(const std::vector<std::string>& texts);

  static void normalize(std::vector<float>& vector);

 private:
  OllamaClient& client_;
  EmbedderOptions options_;
  KeyValueCache* cache_;
};

}  // namespace docqa_core
