#ifndef JIGSAW_SLICER_BLOCK_SLICER_HPP
#define JIGSAW_SLICER_BLOCK_SLICER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>
#include "config/session_config.hpp"
#include "errors/jigsaw_error.hpp"

namespace jigsaw {
namespace slicer {

// Forward-only producer of consecutive blocks of a file. The file is opened
// on construction and closed when the slicer is destroyed; a slicer cannot
// be rewound.
class BlockSlicer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Fixed size blocks
  BlockSlicer(const std::filesystem::path& path, std::size_t block_size);
  // Block sizes drawn uniformly from [min_block_size, max_block_size)
  BlockSlicer(const std::filesystem::path& path, std::size_t min_block_size,
              std::size_t max_block_size);

  static BlockSlicer from_config(const std::filesystem::path& path,
                                 const config::SessionConfig& config);

  BlockSlicer(BlockSlicer&&) = default;
  BlockSlicer& operator=(BlockSlicer&&) = default;


  // ---- SLICING ----
  // Fills block with the next slice; returns false once the file is exhausted.
  // An empty block is never produced.
  bool next(std::vector<std::uint8_t>& block);


  // ---- GETTERS ----
  std::size_t blocks_produced() const { return blocks_produced_; }
  std::uintmax_t bytes_produced() const { return bytes_produced_; }
  bool randomized() const { return randomized_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  std::ifstream file_;
  bool randomized_;
  std::size_t min_block_size_;
  std::size_t max_block_size_;
  std::mt19937 generator_;
  bool exhausted_ = false;
  // Bytes not yet read, reads are capped to this
  std::uintmax_t remaining_ = 0;
  std::size_t blocks_produced_ = 0;
  std::uintmax_t bytes_produced_ = 0;

  void open();
  std::size_t draw_block_size();
};

// Block size at which the number of fragment permutations is estimated to
// match the AES-256 key space (94**32 keys)
std::uintmax_t estimate_minimum_block_size(const std::filesystem::path& path);

} // namespace slicer
} // namespace jigsaw

#endif // JIGSAW_SLICER_BLOCK_SLICER_HPP
