#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_cli/config.hpp"

namespace docqa_cli
{

  enum class Command
  {
    Ingest,
    Ask,
    Search,
    Versions,
    Backup,
    Restore,
    WarmUp,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string config_path = "docqa.json";
    std::string directory;
    std::string file_path;
    std::vector<std::string> attached_files;
    std::string query;
    std::string device_id = "cli";
    std::string chat_id;
    std::string backup_path;
    std::string target_path;
    int top_k = 0;  // 0 = max_context_documents
    bool force = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  // Wiring of the whole pipeline; defined in cli_handler.cpp.
  struct Runtime;

  class CliHandler
  {
  public:
    explicit CliHandler(Config config);
    ~CliHandler();

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command; returns the process exit code
    int execute_command(const CliOptions &options);

    const Config &config() const { return config_; }

  private:
    Config config_;
    std::unique_ptr<Runtime> runtime_;

    // Built on first use so help works without a database.
    Runtime &runtime();

    // Command handlers
    int handle_ingest_command(const CliOptions &options);
    int handle_ask_command(const CliOptions &options);
    int handle_search_command(const CliOptions &options);
    int handle_versions_command(const CliOptions &options);
    int handle_backup_command(const CliOptions &options);
    int handle_restore_command(const CliOptions &options);
    int handle_warm_up_command(const CliOptions &options);
    int handle_help_command(const CliOptions &options);

    static void print_error(const std::string &error);
    static void print_help();
  };

} // namespace docqa_cli
