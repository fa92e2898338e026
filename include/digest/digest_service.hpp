#ifndef JIGSAW_DIGEST_SERVICE_HPP
#define JIGSAW_DIGEST_SERVICE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "errors/jigsaw_error.hpp"

namespace jigsaw {
namespace digest {

enum class Algorithm {
  MD5,
  SHA1,
  SHA224,
  SHA256,
  SHA384,
  SHA512
};

constexpr std::size_t WHOLE_FILE_DIGEST_COUNT = 6;

// Order of the whole-file digests, weakest first
constexpr std::array<Algorithm, WHOLE_FILE_DIGEST_COUNT> WHOLE_FILE_ALGORITHMS = {
  Algorithm::MD5,
  Algorithm::SHA1,
  Algorithm::SHA224,
  Algorithm::SHA256,
  Algorithm::SHA384,
  Algorithm::SHA512
};

// Hex digests indexed like WHOLE_FILE_ALGORITHMS
using FileDigests = std::array<std::string, WHOLE_FILE_DIGEST_COUNT>;

// Lowercase algorithm name, also used as the key file header field
const char* to_string(Algorithm algorithm);

class DigestService {
public:
  static constexpr std::size_t CHUNK_SIZE = 4096;

  // ---- WHOLE FILE DIGESTS ----
  // Streams the file once through all six algorithms
  FileDigests whole_file_digests(const std::filesystem::path& path) const;


  // ---- BLOCK DIGESTS ----
  // First `length` hex characters of the SHA-256 digest of data
  std::string truncated_digest(const std::uint8_t* data, std::size_t size, std::size_t length) const;
  std::string truncated_digest(const std::vector<std::uint8_t>& block, std::size_t length) const {
    return truncated_digest(block.data(), block.size(), length);
  }

  // Full hex digest of a buffer
  std::string hex_digest(Algorithm algorithm, const std::uint8_t* data, std::size_t size) const;
};

} // namespace digest
} // namespace jigsaw

#endif // JIGSAW_DIGEST_SERVICE_HPP
