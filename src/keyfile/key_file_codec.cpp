#include "keyfile/key_file_codec.hpp"
#include <cctype>
#include <cstring>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace jigsaw {
namespace keyfile {

namespace {

const char* const FIELD_VERSION = "version";
const char* const FIELD_INPUT_DIR = "inputdir";
const char* const FIELD_INPUT_FILE = "infile";
const char* const FIELD_DIGEST_LENGTH = "hashlength";

// scheme, sequence, byte length, directory, filename, digest
constexpr std::size_t FRAGMENT_FIELD_COUNT = 6;

const std::string& require_field(const HeaderFields& fields, const std::string& name) {
  auto it = fields.find(name);
  if (it == fields.end()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Key file header is missing field: " << name;
    throw FormatError("Key file header is missing field: " + name);
  }
  return it->second;
}

} // namespace

//==============================================
// KEY FILE HEADER
//==============================================

std::vector<std::pair<std::string, std::string>> KeyFileHeader::to_fields() const {
  std::vector<std::pair<std::string, std::string>> fields = {
    {FIELD_VERSION, version},
    {FIELD_INPUT_DIR, input_dir},
    {FIELD_INPUT_FILE, input_file},
    {FIELD_DIGEST_LENGTH, std::to_string(digest_length)}
  };
  for (std::size_t i = 0; i < digest::WHOLE_FILE_DIGEST_COUNT; ++i) {
    fields.emplace_back(digest::to_string(digest::WHOLE_FILE_ALGORITHMS[i]), digests[i]);
  }
  return fields;
}

KeyFileHeader KeyFileHeader::from_fields(const HeaderFields& fields) {
  KeyFileHeader header;
  header.version = require_field(fields, FIELD_VERSION);
  header.input_dir = require_field(fields, FIELD_INPUT_DIR);
  header.input_file = require_field(fields, FIELD_INPUT_FILE);

  const std::string& digest_length = require_field(fields, FIELD_DIGEST_LENGTH);
  try {
    std::size_t consumed = 0;
    header.digest_length = std::stoul(digest_length, &consumed);
    if (consumed != digest_length.size()) {
      throw FormatError("Invalid hashlength: " + digest_length);
    }
  } catch (const std::logic_error&) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid hashlength: " << digest_length;
    throw FormatError("Invalid hashlength: " + digest_length);
  }

  for (std::size_t i = 0; i < digest::WHOLE_FILE_DIGEST_COUNT; ++i) {
    header.digests[i] = require_field(fields, digest::to_string(digest::WHOLE_FILE_ALGORITHMS[i]));
  }
  return header;
}


//==============================================
// SERIALIZATION
//==============================================

std::string KeyFileCodec::encode_header_line(const std::string& field, const std::string& value) const {
  return std::string(1, HEADER_PREFIX) + field + DELIMITER + value;
}

std::string KeyFileCodec::encode_fragment_line(const store::Fragment& fragment,
                                               const std::string& scheme) const {
  std::ostringstream line;
  line << scheme << DELIMITER
       << fragment.sequence << DELIMITER
       << fragment.byte_length << DELIMITER
       << fragment.directory << DELIMITER
       << fragment.filename << DELIMITER
       << fragment.digest;
  return line.str();
}

void KeyFileCodec::write_header(std::ostream& output, const KeyFileHeader& header) const {
  for (const auto& [field, value] : header.to_fields()) {
    write_line(output, encode_header_line(field, value));
  }
  output.flush();
  BOOST_LOG_TRIVIAL(debug) << "Codec: Key file header written";
}

void KeyFileCodec::write_fragment(std::ostream& output, const store::Fragment& fragment,
                                  const std::string& scheme) const {
  write_line(output, encode_fragment_line(fragment, scheme));
}

void KeyFileCodec::write_line(std::ostream& output, const std::string& line) const {
  if (!(output << line << '\n')) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write key file line";
    throw IOError("Failed to write to key file");
  }
}


//==============================================
// DESERIALIZATION
//==============================================

KeyFile KeyFileCodec::parse(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw IOError("Key file stream is not readable");
  }

  HeaderFields fields;
  Manifest manifest;
  std::string raw;
  std::size_t line_number = 0;

  while (std::getline(input, raw)) {
    ++line_number;
    const std::string line = trim(raw);
    if (line.empty()) {
      continue;
    }

    try {
      if (line.front() == HEADER_PREFIX) {
        parse_header_line(line, fields);
      } else {
        parse_fragment_line(line, manifest);
      }
    } catch (const FormatError& e) {
      BOOST_LOG_TRIVIAL(error) << "Codec: Line " << line_number << ": " << e.what();
      throw;
    }
  }

  if (input.bad()) {
    throw IOError("Failed to read key file");
  }

  KeyFile key_file;
  key_file.header = KeyFileHeader::from_fields(fields);
  key_file.fields = std::move(fields);
  key_file.manifest = std::move(manifest);

  std::size_t fragment_count = 0;
  for (const auto& [scheme, fragments] : key_file.manifest) {
    fragment_count += fragments.size();
  }
  BOOST_LOG_TRIVIAL(info) << "Codec: Parsed key file with " << key_file.fields.size()
                          << " header fields and " << fragment_count << " fragments";
  return key_file;
}

KeyFile KeyFileCodec::read(const std::filesystem::path& path) const {
  BOOST_LOG_TRIVIAL(info) << "Codec: Reading key file: " << path.string();
  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to open key file: " << path.string();
    throw IOError("Failed to open key file: " + path.string());
  }
  return parse(file);
}

bool KeyFileCodec::is_known_scheme(const std::string& scheme) {
  return scheme == BASE_SCHEME;
}

void KeyFileCodec::parse_header_line(const std::string& line, HeaderFields& fields) const {
  const std::size_t delimiter = line.find(DELIMITER);
  if (delimiter == std::string::npos) {
    throw FormatError("Header line without delimiter: " + line);
  }

  const std::string field = trim(line.substr(1, delimiter - 1));
  const std::string value = trim(line.substr(delimiter + std::strlen(DELIMITER)));
  fields[field] = value;
}

void KeyFileCodec::parse_fragment_line(const std::string& line, Manifest& manifest) const {
  const std::vector<std::string> parts = split(line);
  if (parts.size() != FRAGMENT_FIELD_COUNT) {
    throw FormatError("Expected " + std::to_string(FRAGMENT_FIELD_COUNT) + " fields but found " +
                      std::to_string(parts.size()) + ": " + line);
  }

  const std::string& scheme = parts[0];
  if (!is_known_scheme(scheme)) {
    throw FormatError("Unknown scheme code: " + scheme);
  }

  store::Fragment fragment;
  fragment.sequence = parse_number("sequence", parts[1]);
  fragment.byte_length = parse_number("byte length", parts[2]);
  fragment.directory = parts[3];
  fragment.filename = parts[4];
  fragment.digest = parts[5];

  auto& fragments = manifest[scheme];
  if (!fragments.emplace(fragment.sequence, fragment).second) {
    throw FormatError("Duplicate sequence number " + std::to_string(fragment.sequence) +
                      " in scheme " + scheme);
  }
}


//==============================================
// UTILITY METHODS
//==============================================

std::vector<std::string> KeyFileCodec::split(const std::string& line) {
  std::vector<std::string> parts;
  const std::size_t delimiter_length = std::strlen(DELIMITER);
  std::size_t start = 0;

  while (true) {
    const std::size_t pos = line.find(DELIMITER, start);
    if (pos == std::string::npos) {
      parts.push_back(trim(line.substr(start)));
      break;
    }
    parts.push_back(trim(line.substr(start, pos - start)));
    start = pos + delimiter_length;
  }
  return parts;
}

std::string KeyFileCodec::trim(const std::string& value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(begin, end - begin);
}

std::uint64_t KeyFileCodec::parse_number(const std::string& field, const std::string& value) {
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
    throw FormatError("Invalid " + field + ": " + value);
  }
  try {
    std::size_t consumed = 0;
    const std::uint64_t parsed = std::stoull(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::logic_error&) {
    // fall through to the format error below
  }
  throw FormatError("Invalid " + field + ": " + value);
}


//==============================================
// KEY FILE WRITER
//==============================================

KeyFileWriter::KeyFileWriter(const std::filesystem::path& path, const KeyFileHeader& header)
  : path_(path)
  , output_(path, std::ios::out | std::ios::trunc) {
  if (!output_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to create key file: " << path_.string();
    throw IOError("Failed to create key file: " + path_.string());
  }
  BOOST_LOG_TRIVIAL(info) << "Codec: Writing key file: " << path_.string();
  codec_.write_header(output_, header);
}

KeyFileWriter::~KeyFileWriter() {
  if (output_.is_open()) {
    output_.close();
  }
}

std::string KeyFileWriter::append(const store::Fragment& fragment) {
  std::string line = codec_.encode_fragment_line(fragment);
  if (!(output_ << line << '\n')) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to append to key file: " << path_.string();
    throw IOError("Failed to write to key file: " + path_.string());
  }
  ++entries_written_;
  return line;
}

void KeyFileWriter::close() {
  if (!output_.is_open()) {
    return;
  }
  output_.flush();
  output_.close();
  if (!output_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to close key file: " << path_.string();
    throw IOError("Failed to finish key file: " + path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Codec: Key file closed after " << entries_written_ << " entries";
}

} // namespace keyfile
} // namespace jigsaw
