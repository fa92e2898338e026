#ifndef JIGSAW_KEYFILE_KEY_FILE_CODEC_HPP
#define JIGSAW_KEYFILE_KEY_FILE_CODEC_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "digest/digest_service.hpp"
#include "errors/jigsaw_error.hpp"
#include "store/fragment.hpp"

namespace jigsaw {
namespace keyfile {

// Header field name (without '#') -> value
using HeaderFields = std::map<std::string, std::string>;
// Fragments of one scheme ordered by sequence number
using SchemeManifest = std::map<std::uint64_t, store::Fragment>;
// Scheme code -> fragments
using Manifest = std::map<std::string, SchemeManifest>;

struct KeyFileHeader {
  std::string version;
  std::string input_dir;
  std::string input_file;
  std::size_t digest_length = 0;
  digest::FileDigests digests;

  // Fields in the order they are written to the key file
  std::vector<std::pair<std::string, std::string>> to_fields() const;
  // Throws FormatError when a required field is absent or malformed
  static KeyFileHeader from_fields(const HeaderFields& fields);
};

struct KeyFile {
  HeaderFields fields;
  KeyFileHeader header;
  Manifest manifest;
};

class KeyFileCodec {
public:
  // Separates fields on every line; must not occur in paths or values
  static constexpr const char* DELIMITER = ">>";
  static constexpr char HEADER_PREFIX = '#';
  static constexpr const char* BASE_SCHEME = "AA";
  static constexpr const char* KEY_FILE_EXTENSION = ".jgk";

  // ---- SERIALIZATION ----
  std::string encode_header_line(const std::string& field, const std::string& value) const;
  std::string encode_fragment_line(const store::Fragment& fragment,
                                   const std::string& scheme = BASE_SCHEME) const;
  void write_header(std::ostream& output, const KeyFileHeader& header) const;
  void write_fragment(std::ostream& output, const store::Fragment& fragment,
                      const std::string& scheme = BASE_SCHEME) const;


  // ---- DESERIALIZATION ----
  // Parses a whole key file, throws FormatError on malformed content
  KeyFile parse(std::istream& input) const;
  KeyFile read(const std::filesystem::path& path) const;

  static bool is_known_scheme(const std::string& scheme);

private:
  // Splits on every occurrence of DELIMITER and trims each field
  static std::vector<std::string> split(const std::string& line);
  static std::string trim(const std::string& value);
  static std::uint64_t parse_number(const std::string& field, const std::string& value);

  void parse_header_line(const std::string& line, HeaderFields& fields) const;
  void parse_fragment_line(const std::string& line, Manifest& manifest) const;

  void write_line(std::ostream& output, const std::string& line) const;
};

// Owns the key file stream for the duration of an encode. The header is
// flushed on construction; the stream is closed on close() or destruction.
class KeyFileWriter {
public:
  KeyFileWriter(const std::filesystem::path& path, const KeyFileHeader& header);
  ~KeyFileWriter();

  KeyFileWriter(const KeyFileWriter&) = delete;
  KeyFileWriter& operator=(const KeyFileWriter&) = delete;

  // Appends one manifest line and returns it
  std::string append(const store::Fragment& fragment);
  // Flushes and closes, throws IOError if anything failed to reach the file
  void close();

  const std::filesystem::path& path() const { return path_; }
  std::size_t entries_written() const { return entries_written_; }

private:
  std::filesystem::path path_;
  std::ofstream output_;
  KeyFileCodec codec_;
  std::size_t entries_written_ = 0;
};

} // namespace keyfile
} // namespace jigsaw

#endif // JIGSAW_KEYFILE_KEY_FILE_CODEC_HPP
