#include "docqa_core/core/resource_registry.hpp"

#include <iostream>

namespace docqa_core {

ResourceRegistry::ResourceRegistry(ResourceOptions options, ChunkStore& chunk_store, KeyValueCache* cache)
    : options_(std::move(options)), chunk_store_(chunk_store), cache_(cache) {
  options_.embedder.dimension = options_.index.dimension;
}

void ResourceRegistry::init_index() {
  auto index = std::make_unique<VectorIndex>(options_.index, options_.index_dir, options_.index_name);
  if (index->load()) {
    std::cout << "[ResourceRegistry] Loaded " << to_string(options_.index.type) << " index with "
              << index->count() << " vectors" << std::endl;
  } else {
    const auto stored = chunk_store_.load_vectors(options_.index.dimension);
    if (!stored.empty()) {
      std::vector<std::vector<float>> vectors;
      std::vector<long long> ids;
      vectors.reserve(stored.size());
      ids.reserve(stored.size());
      for (const auto& entry : stored) {
        ids.push_back(entry.id);
        vectors.push_back(entry.vector);
      }
      index->add(vectors, ids);
      index->save();
      std::cout << "[ResourceRegistry] Rebuilt index from " << stored.size() << " stored embeddings"
                << std::endl;
    } else {
      std::cout << "[ResourceRegistry] No existing index, starting empty" << std::endl;
    }
  }
  index_ = std::move(index);
}

void ResourceRegistry::init_embedder() {
  ollama_client_ = std::make_unique<OllamaClient>(options_.ollama_url, options_.embedding_model);
  embedder_ = std::make_unique<Embedder>(*ollama_client_, options_.embedder, cache_);
}

VectorIndex& ResourceRegistry::index() {
  std::call_once(index_once_, [this] { init_index(); });
  return *index_;
}

OllamaClient& ResourceRegistry::ollama_client() {
  std::call_once(embedder_once_, [this] { init_embedder(); });
  return *ollama_client_;
}

Embedder& ResourceRegistry::embedder() {
  std::call_once(embedder_once_, [this] { init_embedder(); });
  return *embedder_;
}

const Tokenizer& ResourceRegistry::tokenizer() {
  std::call_once(tokenizer_once_, [this] { tokenizer_ = std::make_unique<WhitespaceTokenizer>(); });
  return *tokenizer_;
}

void ResourceRegistry::warm_up() {
  std::cout << "[ResourceRegistry] Warming up resources..." << std::endl;
  index();
  tokenizer();
  embedder();
  try {
    ollama_client().ensure_server_available();
    std::cout << "[ResourceRegistry] Embedding server is reachable" << std::endl;
  } catch (const OllamaError& e) {
    std::cerr << "[ResourceRegistry] Warning: " << e.what() << std::endl;
  }
  std::cout << "[ResourceRegistry] Resources initialized" << std::endl;
}

}  // namespace docqa_core
