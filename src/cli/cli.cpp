#include "cli/cli.hpp"
#include <filesystem>
#include <boost/log/trivial.hpp>
#include "errors/jigsaw_error.hpp"
#include "logger/logger.hpp"
#include "pipeline/decode_pipeline.hpp"
#include "pipeline/encode_pipeline.hpp"
#include "slicer/block_slicer.hpp"

namespace jigsaw {
namespace cli {

//==============================================
// ARGUMENT PARSING
//==============================================

CommandLine parse_command_line(int argc, char* argv[]) {
  CommandLine command_line;
  if (argc < 2) {
    std::cerr << "Error: No command given\n";
    return command_line;
  }

  command_line.command = argv[1];

  for (int i = 2; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (flag.size() < 3 || flag.compare(0, 2, "--") != 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      return command_line;
    }

    // --flag=value
    const std::size_t equals = flag.find('=');
    if (equals != std::string::npos) {
      command_line.options[flag.substr(2, equals - 2)] = flag.substr(equals + 1);
      continue;
    }

    // --flag value
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      return command_line;
    }
    command_line.options[flag.substr(2)] = argv[++i];
  }

  command_line.valid = true;
  return command_line;
}

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " <command> [--option value ...]\n"
      << "Commands:\n"
      << "  encode   Split a file into Jigsaw files and a key file\n"
      << "           --filename <file> [--slicer even|uneven] [--blocksize <bytes>]\n"
      << "           [--max_blocksize <bytes>] [--filenamelength <n>] [--hashlength <n>]\n"
      << "           [--version 1] [--verbose <n>] [--output_dir <dir>]\n"
      << "  decode   Reassemble a file from its key file\n"
      << "           --keyfilename <file.jgk> [--outputfile <file>] [--encrypt_dir <dir>]\n"
      << "           [--strict true|false] [--verbose <n>]\n"
      << "  obs      Estimate the block size needed to reach AES-256 key permutations\n"
      << "           --filename <file>\n"
      << "  help     Display this help message\n"
      << "All commands accept --log_file <file> (default jigsaw.log)\n"
      << "Example: " << program_name
      << " encode --slicer even --blocksize 262144 --filename data.xlsx --output_dir ./out\n";
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(std::ostream& out)
  : out_(out) {}


//==============================================
// STARTUP
//==============================================

int CLI::run(const CommandLine& command_line) {
  if (!command_line.valid) {
    print_usage("jigsaw", out_);
    return 1;
  }

  if (command_line.command == "help") {
    handle_help_command();
    return 0;
  }

  try {
    const config::DecodeOptions options = config::parse_decode_options(command_line.options);
    setup_logging(command_line.options, options.verbosity);
  } catch (const std::exception& e) {
    out_ << "Error: " << e.what() << std::endl;
    return 1;
  }

  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command_line.command;
  return process_command(command_line);
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::process_command(const CommandLine& command_line) {
  if (command_line.command == "encode") {
    return handle_encode_command(command_line.options);
  }
  if (command_line.command == "decode") {
    return handle_decode_command(command_line.options);
  }
  if (command_line.command == "obs") {
    return handle_estimate_command(command_line.options);
  }

  out_ << "Unknown command: " << command_line.command << std::endl;
  print_usage("jigsaw", out_);
  return 1;
}

int CLI::handle_encode_command(const config::OptionMap& options) {
  const std::string filename = option(options, "filename");
  if (filename.empty()) {
    out_ << "Error: encode requires --filename" << std::endl;
    return 1;
  }

  try {
    const config::SessionConfig session = config::parse_session_config(options);
    pipeline::EncodePipeline encoder(session);
    const std::filesystem::path key_file = encoder.encode(filename, option(options, "output_dir"));
    out_ << "Key file: " << key_file.string() << std::endl;
    return 0;
  } catch (const std::exception& e) {
    log_and_display_error("Error encoding file", e.what());
    return 1;
  }
}

int CLI::handle_decode_command(const config::OptionMap& options) {
  const std::string key_file = option(options, "keyfilename");
  if (key_file.empty()) {
    out_ << "Error: decode requires --keyfilename" << std::endl;
    return 1;
  }

  try {
    pipeline::DecodePipeline decoder(config::parse_decode_options(options));
    const pipeline::FidelityReport report =
      decoder.decode(key_file, option(options, "outputfile"), option(options, "encrypt_dir"));

    out_ << "Output file: " << report.output_file.string() << std::endl;
    out_ << "Audit file: " << report.audit_file.string() << std::endl;
    report.write_summary(out_);
    if (!report.ok()) {
      out_ << "Warning: decoded file does not match the key file, see the audit file" << std::endl;
    }
    return 0;
  } catch (const std::exception& e) {
    log_and_display_error("Error decoding file", e.what());
    return 1;
  }
}

int CLI::handle_estimate_command(const config::OptionMap& options) {
  const std::string filename = option(options, "filename");
  if (filename.empty()) {
    out_ << "Error: obs requires --filename" << std::endl;
    return 1;
  }

  try {
    const std::filesystem::path path = std::filesystem::absolute(filename);
    const std::uintmax_t block_size = slicer::estimate_minimum_block_size(path);
    out_ << "Size of " << path.string() << " is " << std::filesystem::file_size(path) << " bytes" << std::endl;
    out_ << "Minimum block size to reach AES-256 is " << block_size << std::endl;
    return 0;
  } catch (const std::exception& e) {
    log_and_display_error("Error estimating block size", e.what());
    return 1;
  }
}

void CLI::handle_help_command() {
  print_usage("jigsaw", out_);
}

void CLI::setup_logging(const config::OptionMap& options, unsigned int verbosity) {
  std::string log_file = option(options, "log_file");
  if (log_file.empty()) {
    log_file = "jigsaw.log";
  }
  logging::init_logging(log_file, logging::severity_for_verbosity(verbosity), true);
}

std::string CLI::option(const config::OptionMap& options, const std::string& key) {
  auto it = options.find(key);
  return it != options.end() ? it->second : std::string();
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace jigsaw
