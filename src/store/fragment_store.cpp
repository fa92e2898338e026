#include "store/fragment_store.hpp"
#include <cstring>
#include <fstream>
#include <boost/log/trivial.hpp>

namespace jigsaw {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FragmentStore::FragmentStore(const std::filesystem::path& base_path,
                             std::size_t name_length, std::size_t digest_length)
  : base_path_(base_path)
  , name_length_(name_length)
  , digest_length_(digest_length)
  , generator_(std::random_device{}()) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Initializing FragmentStore with base path: " << base_path_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

Fragment FragmentStore::write(std::uint64_t sequence, const std::vector<std::uint8_t>& block,
                              NameRegistry& names) {
  check_directory_exists(base_path_);

  Fragment fragment;
  fragment.sequence = sequence;
  fragment.byte_length = block.size();
  fragment.directory = base_path_.string();
  fragment.filename = generate_name(names);
  fragment.digest = digests_.truncated_digest(block, digest_length_);

  const std::filesystem::path file_path = base_path_ / fragment.filename;

  // Open output file in binary mode for cross-platform consistency
  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create file: " << file_path.string();
    throw IOError("Failed to create fragment file: " + file_path.string());
  }

  if (!block.empty()) {
    file.write(reinterpret_cast<const char*>(block.data()), static_cast<std::streamsize>(block.size()));
  }
  file.close();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to write file: " << file_path.string();
    throw IOError("Failed to write fragment file: " + file_path.string());
  }

  names.insert(fragment.filename);
  BOOST_LOG_TRIVIAL(debug) << "Store: Stored " << block.size() << " bytes as " << fragment.filename;
  return fragment;
}

std::vector<std::uint8_t> FragmentStore::read(const std::string& filename) const {
  const std::filesystem::path file_path = base_path_ / filename;
  verify_file_exists(file_path);

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to open file: " << file_path.string();
    throw IOError("Failed to open fragment file: " + file_path.string());
  }

  std::vector<std::uint8_t> data;
  char buffer[4096];

  // Read file in chunks to handle large fragments
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    const auto bytes_read = static_cast<std::size_t>(file.gcount());
    const std::size_t offset = data.size();
    data.resize(offset + bytes_read);
    std::memcpy(data.data() + offset, buffer, bytes_read);
  }

  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Read failure on file: " << file_path.string();
    throw IOError("Failed to read fragment file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Read " << data.size() << " bytes from " << filename;
  return data;
}


//==============================================
// QUERY OPERATIONS
//==============================================

NameRegistry FragmentStore::existing_names(const std::filesystem::path& directory) {
  NameRegistry names;
  if (!std::filesystem::is_directory(directory)) {
    return names;
  }

  for (const auto& entry : std::filesystem::directory_iterator(directory)) {
    if (entry.is_regular_file() && entry.path().extension() == FRAGMENT_EXTENSION) {
      names.insert(entry.path().filename().string());
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Found " << names.size() << " existing fragments in "
                           << directory.string();
  return names;
}


//==============================================
// NAME GENERATION
//==============================================

std::string FragmentStore::generate_name(const NameRegistry& names) {
  const std::size_t alphabet_size = std::strlen(NAME_ALPHABET);
  std::uniform_int_distribution<std::size_t> dist(0, alphabet_size - 1);

  for (std::size_t attempt = 0; attempt < MAX_NAME_ATTEMPTS; ++attempt) {
    std::string name;
    name.reserve(name_length_ + std::strlen(FRAGMENT_EXTENSION));
    for (std::size_t i = 0; i < name_length_; ++i) {
      name += NAME_ALPHABET[dist(generator_)];
    }
    name += FRAGMENT_EXTENSION;

    if (names.count(name) == 0) {
      return name;
    }
    BOOST_LOG_TRIVIAL(trace) << "Store: Name collision on " << name << ", retrying";
  }

  BOOST_LOG_TRIVIAL(error) << "Store: No free fragment name after " << MAX_NAME_ATTEMPTS
                           << " attempts with length " << name_length_;
  throw NameCollisionError("No free fragment name of length " + std::to_string(name_length_) +
                           " after " + std::to_string(MAX_NAME_ATTEMPTS) + " attempts");
}


//==============================================
// UTILITY METHODS
//==============================================

void FragmentStore::check_directory_exists(const std::filesystem::path& path) const {
  try {
    if (!std::filesystem::exists(path)) {
      std::filesystem::create_directories(path);
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create directory: " << e.what();
    throw IOError("Failed to create directory " + path.string() + ": " + e.what());
  }
}

void FragmentStore::verify_file_exists(const std::filesystem::path& file_path) const {
  if (!std::filesystem::is_regular_file(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: File not found: " << file_path.string();
    throw IOError("Fragment not found: " + file_path.string());
  }
}

} // namespace store
} // namespace jigsaw
