#ifndef JIGSAW_CONFIG_SESSION_CONFIG_HPP
#define JIGSAW_CONFIG_SESSION_CONFIG_HPP

#include <cstddef>
#include <map>
#include <string>
#include "errors/jigsaw_error.hpp"

namespace jigsaw {
namespace config {

enum class SlicerMode {
  Even,    // fixed size blocks
  Uneven   // randomized size blocks
};

const char* to_string(SlicerMode mode);

// Options as given on the command line, flag name without dashes -> value
using OptionMap = std::map<std::string, std::string>;

struct SessionConfig {
  // ---- DEFAULTS ----
  static constexpr std::size_t DEFAULT_BLOCK_SIZE = 32768;
  static constexpr std::size_t DEFAULT_NAME_LENGTH = 30;
  static constexpr std::size_t DEFAULT_DIGEST_LENGTH = 16;
  static constexpr unsigned int DEFAULT_VERBOSITY = 2;
  static constexpr unsigned int SUPPORTED_VERSION = 1;

  SlicerMode slicer = SlicerMode::Even;
  // Block size in even mode, lower bound in uneven mode
  std::size_t block_size = DEFAULT_BLOCK_SIZE;
  // Exclusive upper bound in uneven mode; 0 means twice block_size
  std::size_t max_block_size = 0;
  std::size_t name_length = DEFAULT_NAME_LENGTH;
  std::size_t digest_length = DEFAULT_DIGEST_LENGTH;
  unsigned int version = SUPPORTED_VERSION;
  unsigned int verbosity = DEFAULT_VERBOSITY;

  // ---- DERIVED VALUES ----
  std::size_t min_block() const { return block_size; }
  std::size_t max_block() const { return max_block_size != 0 ? max_block_size : block_size * 2; }
  // Version tag written into the key file header
  std::string version_tag() const;

  // Throws ConfigError if the settings cannot drive an encode
  void validate() const;
};

struct DecodeOptions {
  unsigned int verbosity = SessionConfig::DEFAULT_VERBOSITY;
  // Abort on the first fragment or whole-file fidelity mismatch
  bool strict = false;
};

// Version tag for a numeric version, throws ConfigError for unknown versions
std::string version_tag(unsigned int version);

// Builds a validated SessionConfig from command line options.
// Recognized keys: slicer, blocksize, max_blocksize, filenamelength,
// hashlength, version, verbose. Missing keys keep their defaults.
SessionConfig parse_session_config(const OptionMap& options);

DecodeOptions parse_decode_options(const OptionMap& options);

} // namespace config
} // namespace jigsaw

#endif // JIGSAW_CONFIG_SESSION_CONFIG_HPP
