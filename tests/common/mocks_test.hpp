#pragma once

#include <gmock/gmock.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/cache/kv_cache.hpp"
#include "docqa_core/db/conversation_store.hpp"
#include "docqa_core/llm/chat_client.hpp"
#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/services/search_service.hpp"

namespace docqa_tests {

/**
 * Mock class for OllamaClient to use in tests
 */
class MockOllamaClient : public docqa_core::OllamaClient {
 public:
  explicit MockOllamaClient(size_t dimension = 8)
      : docqa_core::OllamaClient("http://localhost:11434", "nomic-embed-text") {
    std::vector<float> default_embedding(dimension, 0.1f);
    default_embedding[0] = 0.5f;

    ON_CALL(*this, get_embedding(testing::_)).WillByDefault(testing::Return(default_embedding));
    ON_CALL(*this, get_embeddings(testing::_))
        .WillByDefault([default_embedding](const std::vector<std::string>& texts) {
          return std::vector<std::vector<float>>(texts.size(), default_embedding);
        });
    ON_CALL(*this, is_server_available()).WillByDefault(testing::Return(true));
  }

  MOCK_METHOD(std::vector<float>, get_embedding, (const std::string& text), (override));
  MOCK_METHOD(std::vector<std::vector<float>>, get_embeddings, (const std::vector<std::string>& texts),
              (override));
  MOCK_METHOD(bool, is_server_available, (), (override));
};

/**
 * Mock class for the answer-generation model
 */
class MockChatClient : public docqa_core::ChatClient {
 public:
  MOCK_METHOD(std::string, complete,
              (const std::vector<docqa_core::ChatMessage>& messages,
               const docqa_core::GenerationParams& params),
              (override));
  MOCK_METHOD(bool, is_available, (), (override));
};

class MockKeyValueCache : public docqa_core::KeyValueCache {
 public:
  MOCK_METHOD(std::optional<std::string>, get, (const std::string& key), (override));
  MOCK_METHOD(void, set, (const std::string& key, const std::string& value, std::chrono::seconds ttl),
              (override));
  MOCK_METHOD(void, erase, (const std::string& key), (override));
};

class MockConversationStore : public docqa_core::ConversationStore {
 public:
  MOCK_METHOD(void, append_turn, (const docqa_core::ConversationTurn& turn), (override));
  MOCK_METHOD(std::vector<docqa_core::ConversationTurn>, last_turns,
              (const std::string& device_id, size_t limit), (override));
  MOCK_METHOD(std::vector<docqa_core::ConversationTurn>, turns_for_chat,
              (const std::string& chat_id, size_t page, size_t page_size), (override));
};

/**
 * SearchService with a mocked search(); rank() stays real.
 */
class MockSearchService : public docqa_core::SearchService {
 public:
  MockSearchService(docqa_core::Embedder& embedder, docqa_core::VectorIndex& index,
                    docqa_core::ChunkStore& chunk_store)
      : docqa_core::SearchService(embedder, index, chunk_store) {
    ON_CALL(*this, search(testing::_, testing::_, testing::_))
        .WillByDefault(testing::Return(std::vector<docqa_core::RetrievalResult>{}));
  }

  MOCK_METHOD(std::vector<docqa_core::RetrievalResult>, search,
              (const std::string& query, int top_k, const std::vector<std::string>& prioritize_files),
              (override));
};

/**
 * In-memory cache; ttl is recorded but never expires entries.
 */
class FakeKeyValueCache : public docqa_core::KeyValueCache {
 public:
  std::optional<std::string> get(const std::string& key) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
  }

  void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = value;
    ttls_[key] = ttl;
  }

  void erase(const std::string& key) override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
    ttls_.erase(key);
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  std::chrono::seconds ttl_of(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ttls_.find(key);
    return it == ttls_.end() ? std::chrono::seconds(0) : it->second;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> entries_;
  std::map<std::string, std::chrono::seconds> ttls_;
};

/**
 * In-memory turn log.
 */
class FakeConversationStore : public docqa_core::ConversationStore {
 public:
  void append_turn(const docqa_core::ConversationTurn& turn) override {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.push_back(turn);
  }

  std::vector<docqa_core::ConversationTurn> last_turns(const std::string& device_id, size_t limit) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<docqa_core::ConversationTurn> matching;
    for (const auto& turn : turns_) {
      if (turn.device_id == device_id) matching.push_back(turn);
    }
    if (matching.size() > limit) {
      matching.erase(matching.begin(), matching.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return matching;
  }

  std::vector<docqa_core::ConversationTurn> turns_for_chat(const std::string& chat_id, size_t page,
                                                           size_t page_size) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<docqa_core::ConversationTurn> matching;
    for (const auto& turn : turns_) {
      if (turn.chat_id == chat_id) matching.push_back(turn);
    }
    const size_t begin = std::min(matching.size(), page * page_size);
    const size_t end = std::min(matching.size(), begin + page_size);
    return {matching.begin() + static_cast<std::ptrdiff_t>(begin),
            matching.begin() + static_cast<std::ptrdiff_t>(end)};
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<docqa_core::ConversationTurn> turns_;
};

}  // namespace docqa_tests
