#include <curl/curl.h>

#include <iostream>

#include "lumina_cli/cli_handler.hpp"

int main(int argc, char *argv[])
{
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
  {
    std::cerr << "Error: Failed to initialize CURL" << std::endl;
    return 1;
  }

  int exit_code = 0;
  try
  {
    // Parse command line arguments
    lumina_cli::CliOptions options = lumina_cli::CliHandler::parse_arguments(argc, argv);

    lumina_cli::Config config = lumina_cli::CliHandler::load_config(options);
    lumina_cli::CliHandler handler(config);

    // Execute the command
    exit_code = handler.execute_command(options, std::cout);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }

  curl_global_cleanup();
  return exit_code;
}
