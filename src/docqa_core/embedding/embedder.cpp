#include "docqa_core/embedding/embedder.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <nlohmann/json.hpp>

namespace docqa_core {

Embedder::Embedder(OllamaClient& client, EmbedderOptions options, KeyValueCache* cache)
    : client_(client), options_(std::move(options)), cache_(cache) {}

size_t Embedder::batch_size_for(const std::vector<std::string>& texts) {
  size_t total = 0;
  for (const auto& text : texts) {
    total += text.size();
  }
  const double average = static_cast<double>(total) / static_cast<double>(std::max<size_t>(1, texts.size()));
  if (average < 500) return 32;
  if (average < 1000) return 16;
  return 8;
}

void Embedder::normalize(std::vector<float>& vector) {
  double norm = 0.0;
  for (float value : vector) {
    norm += static_cast<double>(value) * value;
  }
  norm = std::sqrt(norm);
  if (norm == 0.0) return;
  for (float& value : vector) {
    value = static_cast<float>(value / norm);
  }
}

std::vector<std::vector<float>> Embedder::embed(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> result;
  if (texts.empty()) return result;
  result.reserve(texts.size());

  const size_t batch_size = batch_size_for(texts);
  std::cout << "[Embedder] Generating embeddings for " << texts.size() << " texts (batch size "
            << batch_size << ")" << std::endl;

  for (size_t start = 0; start < texts.size(); start += batch_size) {
    const size_t end = std::min(texts.size(), start + batch_size);
    std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                   texts.begin() + static_cast<std::ptrdiff_t>(end));
    std::vector<std::vector<float>> vectors;
    try {
      vectors = client_.get_embeddings(batch);
    } catch (const OllamaError& e) {
      throw EmbedderError(e.what());
    }
    if (vectors.size() != batch.size()) {
      throw EmbedderError("Embedding count mismatch: expected " + std::to_string(batch.size()) +
                          ", got " + std::to_string(vectors.size()));
    }
    for (auto& vector : vectors) {
      if (vector.size() != options_.dimension) {
        throw EmbeddingDimensionMismatch(options_.dimension, vector.size());
      }
      normalize(vector);
      result.push_back(std::move(vector));
    }
  }
  return result;
}

std::vector<float> Embedder::embed_query(const std::string& text) {
  std::string cache_key;
  if (cache_) {
    cache_key = make_cache_key(options_.cache_prefix, CacheKind::Embedding, text);
    try {
      if (auto cached = cache_->get(cache_key)) {
        auto vector = nlohmann::json::parse(*cached).get<std::vector<float>>();
        if (vector.size() == options_.dimension) {
          return vector;
        }
      }
    } catch (const std::exception& e) {
      std::cerr << "[Embedder] Warning: embedding cache read failed: " << e.what() << std::endl;
    }
  }

  std::vector<float> vector;
  try {
    vector = client_.get_embedding(text);
  } catch (const std::exception& e) {
    std::cerr << "[Embedder] Error generating query embedding: " << e.what() << std::endl;
    return std::vector<float>(options_.dimension, 0.0f);
  }
  if (vector.size() != options_.dimension) {
    std::cerr << "[Embedder] Warning: query embedding dimension mismatch: expected "
              << options_.dimension << ", got " << vector.size() << std::endl;
    return std::vector<float>(options_.dimension, 0.0f);
  }
  normalize(vector);

  if (cache_) {
    try {
      cache_->set(cache_key, nlohmann::json(vector).dump(), options_.cache_ttl);
    } catch (const std::exception& e) {
      std::cerr << "[Embedder] Warning: embedding cache write failed: " << e.what() << std::endl;
    }
  }
  return vector;
}

}  // namespace docqa_core
