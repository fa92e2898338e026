#include "slicer/block_slicer.hpp"
#include <algorithm>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace jigsaw {
namespace slicer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlockSlicer::BlockSlicer(const std::filesystem::path& path, std::size_t block_size)
  : path_(path)
  , randomized_(false)
  , min_block_size_(block_size)
  , max_block_size_(block_size) {
  if (block_size == 0) {
    throw ConfigError("Slicer: Block size must be positive");
  }
  open();
  BOOST_LOG_TRIVIAL(debug) << "Slicer: Even slicing of " << path_.string()
                           << " into blocks of " << block_size << " bytes";
}

BlockSlicer::BlockSlicer(const std::filesystem::path& path, std::size_t min_block_size,
                         std::size_t max_block_size)
  : path_(path)
  , randomized_(true)
  , min_block_size_(min_block_size)
  , max_block_size_(max_block_size)
  , generator_(std::random_device{}()) {
  if (min_block_size == 0 || max_block_size <= min_block_size) {
    throw ConfigError("Slicer: Invalid block size range [" + std::to_string(min_block_size) +
                      ", " + std::to_string(max_block_size) + ")");
  }
  open();
  BOOST_LOG_TRIVIAL(debug) << "Slicer: Uneven slicing of " << path_.string()
                           << " into blocks of [" << min_block_size << ", "
                           << max_block_size << ") bytes";
}

BlockSlicer BlockSlicer::from_config(const std::filesystem::path& path,
                                     const config::SessionConfig& config) {
  if (config.slicer == config::SlicerMode::Uneven) {
    return BlockSlicer(path, config.min_block(), config.max_block());
  }
  return BlockSlicer(path, config.block_size);
}

void BlockSlicer::open() {
  file_.open(path_, std::ios::binary);
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Slicer: Failed to open file: " << path_.string();
    throw IOError("Failed to open file for slicing: " + path_.string());
  }

  std::error_code ec;
  remaining_ = std::filesystem::file_size(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Slicer: Cannot determine size of " << path_.string() << ": " << ec.message();
    throw IOError("Cannot determine size of " + path_.string());
  }
}


//==============================================
// SLICING
//==============================================

bool BlockSlicer::next(std::vector<std::uint8_t>& block) {
  block.clear();
  if (exhausted_) {
    return false;
  }

  const std::size_t requested = randomized_ ? draw_block_size() : min_block_size_;
  // Never allocate beyond what is left in the file
  const auto to_read = static_cast<std::size_t>(
    std::min<std::uintmax_t>(requested, remaining_));
  block.resize(to_read);
  if (to_read > 0) {
    file_.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(to_read));
  }
  const auto bytes_read = static_cast<std::size_t>(to_read > 0 ? file_.gcount() : 0);
  remaining_ -= std::min<std::uintmax_t>(bytes_read, remaining_);

  if (file_.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Slicer: Read failure on " << path_.string();
    throw IOError("Failed to read from " + path_.string());
  }

  // A short read means end of file; the terminal empty read is dropped
  if (bytes_read < requested) {
    exhausted_ = true;
    file_.close();
  }
  if (bytes_read == 0) {
    block.clear();
    return false;
  }

  block.resize(bytes_read);
  ++blocks_produced_;
  bytes_produced_ += bytes_read;
  BOOST_LOG_TRIVIAL(trace) << "Slicer: Block " << (blocks_produced_ - 1) << " of "
                           << bytes_read << " bytes";
  return true;
}

std::size_t BlockSlicer::draw_block_size() {
  std::uniform_int_distribution<std::size_t> dist(min_block_size_, max_block_size_ - 1);
  return dist(generator_);
}


//==============================================
// BLOCK SIZE ESTIMATE
//==============================================

std::uintmax_t estimate_minimum_block_size(const std::filesystem::path& path) {
  std::error_code ec;
  const std::uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Slicer: Cannot determine size of " << path.string() << ": " << ec.message();
    throw IOError("Cannot determine size of " + path.string());
  }

  const std::uintmax_t block_size = size / 50;
  BOOST_LOG_TRIVIAL(info) << "Slicer: Size of " << path.string() << " is " << size
                          << " bytes, minimum block size to reach AES-256 is " << block_size;
  return block_size;
}

} // namespace slicer
} // namespace jigsaw
