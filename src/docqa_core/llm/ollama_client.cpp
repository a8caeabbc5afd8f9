#include "docqa_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace docqa_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {}

void OllamaClient::ensure_server_available() {
  if (!is_server_available()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::setServerURL(ollama_url_);
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }

    // Either an array of vectors (take the first) or a single vector.
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw OllamaError("Embeddings field is not an array");
    }
    if (!embeddings.empty() && embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(get_embedding(text));
  }
  return vectors;
}

bool OllamaClient::is_server_available() {
  try {
    ollama::setServerURL(ollama_url_);
    return ollama::is_running();
  } catch (const ollama::exception &e) {
    return false;
  }
}

}  // namespace docqa_core
