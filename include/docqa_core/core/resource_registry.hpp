#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "docqa_core/cache/kv_cache.hpp"
#include "docqa_core/db/chunk_store.hpp"
#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/embedding/tokenizer.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/llm/ollama_client.hpp"

namespace docqa_core {

struct ResourceOptions {
  std::filesystem::path index_dir = "./data/embeddings";
  std::string index_name = "document_index";
  VectorIndexOptions index;
  std::string ollama_url = "http://localhost:11434";
  std::string embedding_model = "nomic-embed-text";
  EmbedderOptions embedder;
};

// Process-wide heavy resources, each built on first use exactly once even
// under concurrent first access. The index is loaded from disk, or rebuilt
// from the embeddings kept in the chunk store when no index file exists.
class ResourceRegistry {
 public:
  ResourceRegistry(ResourceOptions options, ChunkStore& chunk_store, KeyValueCache* cache = nullptr);

  ResourceRegistry(const ResourceRegistry&) = delete;
  ResourceRegistry& operator=(const ResourceRegistry&) = delete;

  VectorIndex& index();
  OllamaClient& ollama_client();
  Embedder& embedder();
  const Tokenizer& tokenizer();

  // Builds everything up front and probes the embedding server.
  void warm_up();

 private:
  void init_index();
  void init_embedder();

  ResourceOptions options_;
  ChunkStore& chunk_store_;
  KeyValueCache* cache_;

  std::once_flag index_once_;
  std::once_flag embedder_once_;
  std::once_flag tokenizer_once_;

  std::unique_ptr<VectorIndex> index_;
  std::unique_ptr<OllamaClient> ollama_client_;
  std::unique_ptr<Embedder> embedder_;
  std::unique_ptr<Tokenizer> tokenizer_;
};

}  // namespace docqa_core
