#include "docqa_core/llm/chat_client.hpp"

#include <curl/curl.h>

#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

namespace docqa_core {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

CurlHandle make_handle() {
  CurlHandle handle(curl_easy_init(), &curl_easy_cleanup);
  if (!handle) {
    throw LlmError("Failed to initialize CURL");
  }
  return handle;
}

std::string trim_slash(std::string url) {
  while (!url.empty() && url.back() == '/') url.pop_back();
  return url;
}

}  // namespace

HttpChatClient::HttpChatClient(std::string api_url, std::string api_key, std::string model)
    : api_url_(trim_slash(std::move(api_url))), api_key_(std::move(api_key)), model_(std::move(model)) {}

size_t HttpChatClient::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
  userp->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

std::string HttpChatClient::build_request_body(const std::vector<ChatMessage>& messages,
                                               const GenerationParams& params) const {
  nlohmann::json body;
  body["model"] = model_;
  body["max_tokens"] = params.max_tokens;
  body["temperature"] = params.temperature;
  body["top_p"] = params.top_p;
  body["frequency_penalty"] = params.frequency_penalty;
  body["presence_penalty"] = params.presence_penalty;
  body["messages"] = nlohmann::json::array();
  for (const auto& message : messages) {
    body["messages"].push_back({{"role", message.role}, {"content", message.content}});
  }
  return body.dump();
}

std::string HttpChatClient::parse_completion(const std::string& body) {
  try {
    auto json = nlohmann::json::parse(body);
    if (json.contains("error")) {
      const auto& error = json["error"];
      std::string message = error.is_object() ? error.value("message", error.dump()) : error.dump();
      throw LlmError("API error: " + message);
    }
    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
      throw LlmError("Response does not contain choices");
    }
    const auto& message = json["choices"][0]["message"];
    if (!message.contains("content") || !message["content"].is_string()) {
      throw LlmError("Response choice has no text content");
    }
    return message["content"].get<std::string>();
  } catch (const nlohmann::json::exception& e) {
    throw LlmError("Invalid JSON response: " + std::string(e.what()));
  }
}

std::string HttpChatClient::complete(const std::vector<ChatMessage>& messages,
                                     const GenerationParams& params) {
  CurlHandle curl = make_handle();
  const std::string url = api_url_ + "/chat/completions";
  const std::string payload = build_request_body(messages, params);
  std::string response;

  HeaderList headers(nullptr, &curl_slist_free_all);
  headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));
  if (!api_key_.empty()) {
    const std::string auth = "Authorization: Bearer " + api_key_;
    headers.reset(curl_slist_append(headers.release(), auth.c_str()));
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(params.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());
  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw LlmError("Request timeout after " + std::to_string(params.timeout.count()) + " seconds");
  }
  if (res != CURLE_OK) {
    throw LlmError("Connection error: " + std::string(curl_easy_strerror(res)));
  }

  long response_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
  if (response_code != 200) {
    std::cerr << "[ChatClient] HTTP " << response_code << " from " << url << std::endl;
    std::string detail = response;
    try {
      auto json = nlohmann::json::parse(response);
      if (json.contains("error") && json["error"].is_object()) {
        detail = json["error"].value("message", response);
      }
    } catch (const nlohmann::json::exception&) {
      // Non-JSON error body; keep it verbatim.
    }
    throw LlmError("HTTP " + std::to_string(response_code) + ": " + detail, response_code);
  }
  return parse_completion(response);
}

bool HttpChatClient::is_available() {
  try {
    CurlHandle curl = make_handle();
    const std::string url = api_url_ + "/models";
    std::string response;

    HeaderList headers(nullptr, &curl_slist_free_all);
    if (!api_key_.empty()) {
      const std::string auth = "Authorization: Bearer " + api_key_;
      headers.reset(curl_slist_append(headers.release(), auth.c_str()));
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, PROBE_TIMEOUT_SECONDS);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
      std::cerr << "[ChatClient] Health probe failed: " << curl_easy_strerror(res) << std::endl;
      return false;
    }
    long response_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
    if (response_code != 200) {
      std::cerr << "[ChatClient] Health probe returned status " << response_code << std::endl;
      return false;
    }
    return true;
  } catch (const LlmError& e) {
    std::cerr << "[ChatClient] Health probe failed: " << e.what() << std::endl;
    return false;
  }
}

}  // namespace docqa_core
