#ifndef JIGSAW_STORE_FRAGMENT_HPP
#define JIGSAW_STORE_FRAGMENT_HPP

#include <cstdint>
#include <string>

namespace jigsaw {
namespace store {

// One fragment file and its place in the original byte stream
struct Fragment {
  std::uint64_t sequence = 0;
  std::uint64_t byte_length = 0;
  std::string directory;
  std::string filename;
  // Truncated SHA-256 of the fragment contents
  std::string digest;

  bool operator==(const Fragment& other) const {
    return sequence == other.sequence
        && byte_length == other.byte_length
        && directory == other.directory
        && filename == other.filename
        && digest == other.digest;
  }
  bool operator!=(const Fragment& other) const { return !(*this == other); }
};

} // namespace store
} // namespace jigsaw

#endif // JIGSAW_STORE_FRAGMENT_HPP
