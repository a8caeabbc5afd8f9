#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docqa_core/extractors/text_decoder.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/services/context_assembler.hpp"

namespace docqa_cli {

class Config {
 public:
  // Paths
  std::string data_dir;
  std::string raw_dir;
  std::string processed_dir;
  std::string embeddings_dir;
  std::string backup_dir;
  std::string database_path;
  std::string database_key;
  std::string index_name;
  std::string version_file;

  // Chunking and extraction
  int chunk_size;
  int chunk_overlap;
  bool include_overlap_in_chunk;
  int max_file_size_mb;
  std::vector<std::string> text_encodings;

  // Embedding
  std::string ollama_url;
  std::string embedding_model;
  int vector_dimension;

  // Index
  std::string index_type;
  int ivf_nlist;
  int ivf_nprobe;

  // Ingestion
  int num_workers;
  int ingest_batch_size;
  bool auto_reindex_on_update;
  int max_document_versions;

  // Retrieval
  double similarity_threshold;
  int max_vector_search_top_k;
  int max_context_documents;
  int context_max_tokens;
  int min_viable_chunk_chars;
  docqa_core::PolicyKeywords policy_keywords;
  int context_retry_attempts;
  int context_retry_delay_ms;

  // Generation
  std::string llm_api_url;
  std::string llm_api_key;
  std::string llm_model;
  int llm_max_tokens;
  double llm_temperature;
  double llm_top_p;
  double llm_frequency_penalty;
  double llm_presence_penalty;
  int llm_timeout_seconds;
  int max_retries;
  int health_cache_seconds;
  std::string system_prompt;

  // Conversation
  int max_history_messages;
  int history_turns_in_prompt;
  double intent_confidence_threshold;
  std::vector<std::string> supported_languages;

  // Cache
  bool cache_enabled;
  int cache_ttl_query_seconds;
  int cache_ttl_embedding_seconds;
  int cache_ttl_response_seconds;
  std::string cache_key_prefix;

  // Escalation
  bool enable_escalation;
  std::vector<std::string> hr_emails;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    config.data_dir = json_config.value("data_dir", std::string("./data"));
    config.raw_dir = json_config.value("raw_dir", config.data_dir + "/raw");
    config.processed_dir = json_config.value("processed_dir", config.data_dir + "/processed");
    config.embeddings_dir = json_config.value("embeddings_dir", config.data_dir + "/embeddings");
    config.backup_dir = json_config.value("backup_dir", config.data_dir + "/backups");
    config.database_path = json_config.value("database_path", config.data_dir + "/docqa.db");
    config.index_name = json_config.value("index_name", std::string("document_index"));
    config.version_file = json_config.value("version_file", config.data_dir + "/document_versions.json");

    // The key may stay out of the file.
    config.database_key = json_config.value("database_key", std::string());
    if (config.database_key.empty()) {
      const char* env_key = std::getenv("DOCQA_DATABASE_KEY");
      config.database_key = env_key ? env_key : "";
    }

    config.chunk_size = json_config.value("chunk_size", 1200);
    config.chunk_overlap = json_config.value("chunk_overlap", 300);
    config.include_overlap_in_chunk = json_config.value("include_overlap_in_chunk", true);
    config.max_file_size_mb = json_config.value("max_file_size_mb", 50);
    config.text_encodings = json_config.value(
        "text_encodings", std::vector<std::string>{"utf-8", "cp1252", "latin-1"});

    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("nomic-embed-text"));
    config.vector_dimension = json_config.value("vector_dimension", 768);

    config.index_type = json_config.value("index_type", std::string("flat"));
    config.ivf_nlist = json_config.value("ivf_nlist", 100);
    config.ivf_nprobe = json_config.value("ivf_nprobe", 10);

    // Handle integer with default and basic type safety
    try {
      config.num_workers = json_config.contains("num_workers") ? json_config.at("num_workers").get<int>() : 0;
    } catch (const std::exception&) {
      config.num_workers = 0;
    }
    config.ingest_batch_size = json_config.value("ingest_batch_size", 10);
    config.auto_reindex_on_update = json_config.value("auto_reindex_on_update", true);
    config.max_document_versions = json_config.value("max_document_versions", 5);

    config.similarity_threshold = json_config.value("similarity_threshold", 0.45);
    config.max_vector_search_top_k = json_config.value("max_vector_search_top_k", 20);
    config.max_context_documents = json_config.value("max_context_documents", 5);
    config.context_max_tokens = json_config.value("context_max_tokens", 1500);
    config.min_viable_chunk_chars = json_config.value("min_viable_chunk_chars", 300);
    config.context_retry_attempts = json_config.value("context_retry_attempts", 3);
    config.context_retry_delay_ms = json_config.value("context_retry_delay_ms", 1000);
    // An array of {"topic", "keywords"} keeps its order; an object is read in key order.
    config.policy_keywords = docqa_core::default_policy_keywords();
    if (json_config.contains("policy_keywords")) {
      const auto& table = json_config["policy_keywords"];
      config.policy_keywords.clear();
      if (table.is_array()) {
        for (const auto& entry : table) {
          config.policy_keywords.emplace_back(entry.at("topic").get<std::string>(),
                                              entry.at("keywords").get<std::vector<std::string>>());
        }
      } else if (table.is_object()) {
        for (const auto& item : table.items()) {
          config.policy_keywords.emplace_back(item.key(), item.value().get<std::vector<std::string>>());
        }
      } else {
        throw std::runtime_error("policy_keywords must be an array or an object");
      }
    }

    config.llm_api_url = json_config.value("llm_api_url", std::string("https://api.groq.com/openai/v1"));
    config.llm_api_key = json_config.value("llm_api_key", std::string());
    if (config.llm_api_key.empty()) {
      const char* env_key = std::getenv("DOCQA_LLM_API_KEY");
      config.llm_api_key = env_key ? env_key : "";
    }
    config.llm_model = json_config.value("llm_model", std::string("llama-3.1-8b-instant"));
    config.llm_max_tokens = json_config.value("llm_max_tokens", 700);
    config.llm_temperature = json_config.value("llm_temperature", 0.1);
    config.llm_top_p = json_config.value("llm_top_p", 0.9);
    config.llm_frequency_penalty = json_config.value("llm_frequency_penalty", 0.2);
    config.llm_presence_penalty = json_config.value("llm_presence_penalty", 0.6);
    config.llm_timeout_seconds = json_config.value("llm_timeout_seconds", 60);
    config.max_retries = json_config.value("max_retries", 2);
    config.health_cache_seconds = json_config.value("health_cache_seconds", 300);
    config.system_prompt = json_config.value("system_prompt", std::string());

    config.max_history_messages = json_config.value("max_history_messages", 10);
    config.history_turns_in_prompt = json_config.value("history_turns_in_prompt", 5);
    config.intent_confidence_threshold = json_config.value("intent_confidence_threshold", 0.6);
    config.supported_languages =
        json_config.value("supported_languages", std::vector<std::string>{"en", "es", "fr", "de"});

    config.cache_enabled = json_config.value("cache_enabled", true);
    config.cache_ttl_query_seconds = json_config.value("cache_ttl_query_seconds", 3600);
    config.cache_ttl_embedding_seconds = json_config.value("cache_ttl_embedding_seconds", 86400);
    config.cache_ttl_response_seconds = json_config.value("cache_ttl_response_seconds", 1800);
    config.cache_key_prefix = json_config.value("cache_key_prefix", std::string("docqa"));

    config.enable_escalation = json_config.value("enable_escalation", true);
    config.hr_emails = json_config.value("hr_emails", std::vector<std::string>{});

    config.validate();
    return config;
  }

  std::vector<docqa_core::TextEncoding> encoding_ladder() const {
    std::vector<docqa_core::TextEncoding> ladder;
    for (const auto& name : text_encodings) {
      ladder.push_back(docqa_core::text_encoding_from_string(name));
    }
    return ladder;
  }

  docqa_core::IndexType vector_index_type() const {
    return docqa_core::index_type_from_string(index_type);
  }

 private:
  void validate() const {
    if (data_dir.empty() || processed_dir.empty() || embeddings_dir.empty()) {
      throw std::runtime_error("data_dir, processed_dir and embeddings_dir cannot be empty");
    }
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (index_name.empty()) {
      throw std::runtime_error("index_name cannot be empty");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and smaller than chunk_size");
    }
    if (max_file_size_mb <= 0) {
      throw std::runtime_error("max_file_size_mb must be greater than 0");
    }
    if (text_encodings.empty()) {
      throw std::runtime_error("text_encodings cannot be empty");
    }
    try {
      encoding_ladder();
      vector_index_type();
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (vector_dimension <= 0) {
      throw std::runtime_error("vector_dimension must be greater than 0");
    }
    if (ivf_nlist <= 0 || ivf_nprobe <= 0) {
      throw std::runtime_error("ivf_nlist and ivf_nprobe must be greater than 0");
    }
    if (num_workers < 0) {
      throw std::runtime_error("num_workers cannot be negative");
    }
    if (ingest_batch_size <= 0) {
      throw std::runtime_error("ingest_batch_size must be greater than 0");
    }
    if (max_document_versions < 1) {
      throw std::runtime_error("max_document_versions must be at least 1");
    }
    if (similarity_threshold < 0.0 || similarity_threshold > 1.0) {
      throw std::runtime_error("similarity_threshold must be between 0 and 1");
    }
    if (max_vector_search_top_k <= 0 || max_context_documents <= 0) {
      throw std::runtime_error("max_vector_search_top_k and max_context_documents must be greater than 0");
    }
    if (context_max_tokens <= 0) {
      throw std::runtime_error("context_max_tokens must be greater than 0");
    }
    if (context_retry_attempts < 1 || context_retry_delay_ms < 0) {
      throw std::runtime_error("context_retry_attempts must be at least 1 and context_retry_delay_ms non-negative");
    }
    if (llm_api_url.empty() || llm_model.empty()) {
      throw std::runtime_error("llm_api_url and llm_model cannot be empty");
    }
    if (llm_max_tokens <= 0 || llm_timeout_seconds <= 0) {
      throw std::runtime_error("llm_max_tokens and llm_timeout_seconds must be greater than 0");
    }
    if (max_retries < 0) {
      throw std::runtime_error("max_retries cannot be negative");
    }
    if (max_history_messages < 1 || history_turns_in_prompt < 0) {
      throw std::runtime_error("max_history_messages must be at least 1");
    }
    if (intent_confidence_threshold < 0.0 || intent_confidence_threshold > 1.0) {
      throw std::runtime_error("intent_confidence_threshold must be between 0 and 1");
    }
    if (supported_languages.empty()) {
      throw std::runtime_error("supported_languages cannot be empty");
    }
    if (cache_ttl_query_seconds <= 0 || cache_ttl_embedding_seconds <= 0 || cache_ttl_response_seconds <= 0) {
      throw std::runtime_error("cache TTLs must be greater than 0");
    }
  }
};

}  // namespace docqa_cli
