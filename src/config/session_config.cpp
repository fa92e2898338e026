#include "config/session_config.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <boost/log/trivial.hpp>

namespace jigsaw {
namespace config {

namespace {

[[noreturn]] void reject(const std::string& message) {
  BOOST_LOG_TRIVIAL(error) << "Config: " << message;
  throw ConfigError(message);
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// Signed input is accepted and its magnitude used
std::size_t parse_size(const std::string& key, const std::string& value) {
  try {
    std::size_t consumed = 0;
    long long parsed = std::stoll(value, &consumed);
    if (consumed != value.size() || parsed == std::numeric_limits<long long>::min()) {
      reject("Invalid value for " + key + ": " + value);
    }
    const unsigned long long magnitude = static_cast<unsigned long long>(parsed < 0 ? -parsed : parsed);
    if (magnitude > std::numeric_limits<std::size_t>::max()) {
      reject("Value out of range for " + key + ": " + value);
    }
    return static_cast<std::size_t>(magnitude);
  } catch (const std::logic_error&) {
    // std::invalid_argument and std::out_of_range from std::stoll
    reject("Invalid value for " + key + ": " + value);
  }
}

unsigned int parse_unsigned(const std::string& key, const std::string& value) {
  const std::size_t parsed = parse_size(key, value);
  if (parsed > std::numeric_limits<unsigned int>::max()) {
    reject("Value out of range for " + key + ": " + value);
  }
  return static_cast<unsigned int>(parsed);
}

bool parse_flag(const std::string& key, const std::string& value) {
  const std::string lowered = to_lower(value);
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    return false;
  }
  reject("Invalid value for " + key + ": " + value);
}

} // namespace

const char* to_string(SlicerMode mode) {
  switch (mode) {
    case SlicerMode::Even:   return "even";
    case SlicerMode::Uneven: return "uneven";
    default:                 return "unknown";
  }
}

std::string version_tag(unsigned int version) {
  if (version == 1) {
    return "JigsawFileONE";
  }
  reject("Unsupported version: " + std::to_string(version));
}

std::string SessionConfig::version_tag() const {
  return config::version_tag(version);
}

void SessionConfig::validate() const {
  if (block_size == 0) {
    reject("Block size must be positive");
  }
  if (slicer == SlicerMode::Uneven && max_block() <= min_block()) {
    reject("Maximum block size " + std::to_string(max_block()) +
           " must exceed block size " + std::to_string(min_block()));
  }
  if (name_length == 0) {
    reject("Filename length must be positive");
  }
  if (digest_length == 0) {
    reject("Hash length must be positive");
  }
  // Throws for versions without an implementation
  version_tag();
}

SessionConfig parse_session_config(const OptionMap& options) {
  SessionConfig config;

  for (const auto& [key, value] : options) {
    if (key == "slicer") {
      // Anything other than "uneven" selects the even slicer
      config.slicer = to_lower(value) == "uneven" ? SlicerMode::Uneven : SlicerMode::Even;
    } else if (key == "blocksize") {
      config.block_size = parse_size(key, value);
    } else if (key == "max_blocksize") {
      config.max_block_size = parse_size(key, value);
    } else if (key == "filenamelength") {
      config.name_length = parse_size(key, value);
    } else if (key == "hashlength") {
      config.digest_length = parse_size(key, value);
    } else if (key == "version") {
      config.version = parse_unsigned(key, value);
    } else if (key == "verbose") {
      config.verbosity = parse_unsigned(key, value);
    }
  }

  config.validate();
  BOOST_LOG_TRIVIAL(debug) << "Config: slicer=" << to_string(config.slicer)
                           << " block_size=" << config.block_size
                           << " max_block_size=" << config.max_block()
                           << " name_length=" << config.name_length
                           << " digest_length=" << config.digest_length
                           << " version=" << config.version
                           << " verbosity=" << config.verbosity;
  return config;
}

DecodeOptions parse_decode_options(const OptionMap& options) {
  DecodeOptions decode_options;
  if (auto it = options.find("verbose"); it != options.end()) {
    decode_options.verbosity = parse_unsigned(it->first, it->second);
  }
  if (auto it = options.find("strict"); it != options.end()) {
    decode_options.strict = parse_flag(it->first, it->second);
  }
  return decode_options;
}

} // namespace config
} // namespace jigsaw
