#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "docqa_core/llm/chat_client.hpp"

namespace docqa_core {

TEST(HttpChatClientTest, RequestBodyCarriesModelParamsAndMessages) {
  HttpChatClient client("https://api.example.com/v1/", "secret", "gpt-4o-mini");
  GenerationParams params;
  params.max_tokens = 300;

  auto body = nlohmann::json::parse(
      client.build_request_body({{"system", "Be brief."}, {"user", "How many sick days?"}}, params));

  EXPECT_EQ(body["model"], "gpt-4o-mini");
  EXPECT_EQ(body["max_tokens"], 300);
  EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.1);
  EXPECT_DOUBLE_EQ(body["presence_penalty"].get<double>(), 0.6);
  ASSERT_EQ(body["messages"].size(), 2u);
  EXPECT_EQ(body["messages"][0]["role"], "system");
  EXPECT_EQ(body["messages"][1]["content"], "How many sick days?");
}

TEST(HttpChatClientTest, ParseCompletionReturnsFirstChoice) {
  const std::string body =
      R"({"choices":[{"message":{"role":"assistant","content":"You get 10 sick days."}},)"
      R"({"message":{"role":"assistant","content":"ignored"}}]})";
  EXPECT_EQ(HttpChatClient::parse_completion(body), "You get 10 sick days.");
}

TEST(HttpChatClientTest, ParseCompletionRejectsBadResponses) {
  EXPECT_THROW(HttpChatClient::parse_completion("not json"), LlmError);
  EXPECT_THROW(HttpChatClient::parse_completion(R"({"choices":[]})"), LlmError);
  EXPECT_THROW(HttpChatClient::parse_completion(R"({"choices":[{"message":{"role":"assistant"}}]})"), LlmError);

  try {
    HttpChatClient::parse_completion(R"({"error":{"message":"quota exceeded"}})");
    FAIL() << "Expected LlmError";
  } catch (const LlmError& e) {
    EXPECT_NE(std::string(e.what()).find("quota exceeded"), std::string::npos);
    EXPECT_EQ(e.http_status(), 0);
  }
}

TEST(HttpChatClientTest, UnreachableServerIsNotAvailable) {
  HttpChatClient client("http://127.0.0.1:9", "", "model");
  EXPECT_FALSE(client.is_available());
}

}  // namespace docqa_core
