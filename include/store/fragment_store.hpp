#ifndef JIGSAW_STORE_FRAGMENT_STORE_HPP
#define JIGSAW_STORE_FRAGMENT_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>
#include "digest/digest_service.hpp"
#include "errors/jigsaw_error.hpp"
#include "store/fragment.hpp"

namespace jigsaw {
namespace store {

// Fragment filenames already taken in the output directory or this run
using NameRegistry = std::unordered_set<std::string>;

class FragmentStore {
public:
  static constexpr const char* FRAGMENT_EXTENSION = ".jig";
  static constexpr const char* NAME_ALPHABET = "123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabdeghqrt";
  static constexpr std::size_t MAX_NAME_ATTEMPTS = 1000;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // name_length and digest_length are only used by write()
  explicit FragmentStore(const std::filesystem::path& base_path,
                         std::size_t name_length = 30,
                         std::size_t digest_length = 16);


  // ---- CORE STORAGE OPERATIONS ----
  // Persists block under a fresh random name, which is added to names
  Fragment write(std::uint64_t sequence, const std::vector<std::uint8_t>& block,
                 NameRegistry& names);
  // Reads the full contents of one fragment file
  std::vector<std::uint8_t> read(const std::string& filename) const;


  // ---- QUERY OPERATIONS ----
  // Fragment files already present in a directory
  static NameRegistry existing_names(const std::filesystem::path& directory);

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  std::size_t name_length_;
  std::size_t digest_length_;
  std::mt19937 generator_;
  digest::DigestService digests_;

  // Random name plus extension, not yet in names
  std::string generate_name(const NameRegistry& names);

  void check_directory_exists(const std::filesystem::path& path) const;
  void verify_file_exists(const std::filesystem::path& file_path) const;
};

} // namespace store
} // namespace jigsaw

#endif // JIGSAW_STORE_FRAGMENT_STORE_HPP
