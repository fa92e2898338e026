#pragma once

#include <iostream>
#include <string>
#include "config/session_config.hpp"

namespace jigsaw {
namespace cli {

struct CommandLine {
  std::string command;
  config::OptionMap options;
  bool valid{false};
};

// Accepts "<command> --flag value ..." and "--flag=value"
CommandLine parse_command_line(int argc, char* argv[]);

void print_usage(const std::string& program_name, std::ostream& out);

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CLI(std::ostream& out = std::cout);


  // ---- STARTUP ----
  // Returns the process exit status
  int run(const CommandLine& command_line);

private:
  // ---- PARAMETERS ----
  std::ostream& out_;


  // ---- COMMAND PROCESSING ----
  int process_command(const CommandLine& command_line);
  int handle_encode_command(const config::OptionMap& options);
  int handle_decode_command(const config::OptionMap& options);
  int handle_estimate_command(const config::OptionMap& options);
  void handle_help_command();
  void setup_logging(const config::OptionMap& options, unsigned int verbosity);
  // Empty string when the option is absent
  static std::string option(const config::OptionMap& options, const std::string& key);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace jigsaw
