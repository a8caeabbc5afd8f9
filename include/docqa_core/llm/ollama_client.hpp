#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace docqa_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Embedding inference against an Ollama server. Construction does not touch
// the network; call ensure_server_available() to fail fast.
class OllamaClient {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  virtual ~OllamaClient() = default;

  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  virtual std::vector<float> get_embedding(const std::string &text);

  // One request per text; results are in input order.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts);

  virtual bool is_server_available();

  // Throws OllamaError when the server does not answer.
  void ensure_server_available();

  const std::string &model() const { return embedding_model_; }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
};

}  // namespace docqa_core
