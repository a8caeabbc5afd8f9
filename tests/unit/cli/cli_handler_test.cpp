#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docqa_cli/cli_handler.hpp"

namespace docqa_cli {

namespace {

CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "docqa");
  std::vector<char*> argv;
  for (auto& arg : args) argv.push_back(arg.data());
  return CliHandler::parse_arguments(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(CliHandlerTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST(CliHandlerTest, CommandAliases) {
  EXPECT_EQ(parse({"i"}).command, Command::Ingest);
  EXPECT_EQ(parse({"a", "-q", "hello"}).command, Command::Ask);
  EXPECT_EQ(parse({"s", "-q", "leave"}).command, Command::Search);
  EXPECT_EQ(parse({"w"}).command, Command::WarmUp);
  EXPECT_THROW(parse({"serve"}), CliError);
}

TEST(CliHandlerTest, IngestFlags) {
  auto options = parse({"ingest", "--dir", "/srv/docs", "--force", "-c", "/etc/docqa.json"});
  EXPECT_EQ(options.directory, "/srv/docs");
  EXPECT_TRUE(options.force);
  EXPECT_EQ(options.config_path, "/etc/docqa.json");

  EXPECT_THROW(parse({"ingest", "--dir", "/a", "--file", "/b.txt"}), CliError);
}

TEST(CliHandlerTest, AskCollectsAttachmentsAndSession) {
  auto options = parse({"ask", "--query", "How many sick days?", "-f", "/docs/a.pdf", "--file", "/docs/b.txt",
                        "--device", "laptop-7", "--chat", "chat-42"});
  EXPECT_EQ(options.query, "How many sick days?");
  EXPECT_EQ(options.attached_files, (std::vector<std::string>{"/docs/a.pdf", "/docs/b.txt"}));
  EXPECT_TRUE(options.file_path.empty());
  EXPECT_EQ(options.device_id, "laptop-7");
  EXPECT_EQ(options.chat_id, "chat-42");
}

TEST(CliHandlerTest, SearchTopK) {
  EXPECT_EQ(parse({"search", "-q", "leave", "-k", "7"}).top_k, 7);
  EXPECT_EQ(parse({"search", "-q", "leave"}).top_k, 0);
  EXPECT_THROW(parse({"search", "-q", "leave", "--top-k", "seven"}), CliError);
}

TEST(CliHandlerTest, RequiredValuesAreEnforced) {
  EXPECT_THROW(parse({"ask"}), CliError);
  EXPECT_THROW(parse({"search", "--query"}), CliError);
  EXPECT_THROW(parse({"versions"}), CliError);
  EXPECT_THROW(parse({"backup"}), CliError);
  EXPECT_THROW(parse({"restore", "--backup", "/b/policy_20240101_090000.txt"}), CliError);
  EXPECT_THROW(parse({"ingest", "--verbose", "yes"}), CliError);
}

TEST(CliHandlerTest, RestoreTakesBackupAndTarget) {
  auto options = parse({"r", "--backup", "/b/policy_20240101_090000.txt", "--target", "/docs/policy.txt"});
  EXPECT_EQ(options.command, Command::Restore);
  EXPECT_EQ(options.backup_path, "/b/policy_20240101_090000.txt");
  EXPECT_EQ(options.target_path, "/docs/policy.txt");
}

TEST(CliHandlerTest, HelpRunsWithoutBuildingThePipeline) {
  CliHandler handler(Config::from_json(nlohmann::json::object()));
  CliOptions options;
  options.command = Command::Help;
  EXPECT_EQ(handler.execute_command(options), 0);
}

}  // namespace docqa_cli
