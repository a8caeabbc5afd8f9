#include <curl/curl.h>

#include <iostream>

#include "docqa_cli/cli_handler.hpp"

int main(int argc, char *argv[])
{
  curl_global_init(CURL_GLOBAL_DEFAULT);
  int exit_code = 0;
  try
  {
    // Parse command line arguments
    docqa_cli::CliOptions options = docqa_cli::CliHandler::parse_arguments(argc, argv);

    if (options.command == docqa_cli::Command::Help)
    {
      docqa_cli::CliHandler handler(docqa_cli::Config::from_json(nlohmann::json::object()));
      exit_code = handler.execute_command(options);
    }
    else
    {
      docqa_cli::CliHandler handler(docqa_cli::Config::from_file(options.config_path));
      exit_code = handler.execute_command(options);
    }
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }
  curl_global_cleanup();
  return exit_code;
}
