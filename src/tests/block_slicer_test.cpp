#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <limits>
#include "slicer/block_slicer.hpp"
#include "test_utils.hpp"

using namespace jigsaw;
using namespace jigsaw::slicer;
using ::testing::ElementsAre;

class BlockSlicerTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("slicer_test");
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  std::filesystem::path make_source(std::size_t size, const std::string& name = "source.bin") {
    std::filesystem::path path = test_dir / name;
    write_file(path, random_bytes(size));
    return path;
  }

  // Drains the slicer, returning every block in order
  static std::vector<std::vector<std::uint8_t>> drain(BlockSlicer& slicer) {
    std::vector<std::vector<std::uint8_t>> blocks;
    std::vector<std::uint8_t> block;
    while (slicer.next(block)) {
      blocks.push_back(block);
    }
    return blocks;
  }

  static std::vector<std::size_t> sizes(const std::vector<std::vector<std::uint8_t>>& blocks) {
    std::vector<std::size_t> result;
    for (const auto& block : blocks) {
      result.push_back(block.size());
    }
    return result;
  }

  static std::vector<std::uint8_t> concat(const std::vector<std::vector<std::uint8_t>>& blocks) {
    std::vector<std::uint8_t> result;
    for (const auto& block : blocks) {
      result.insert(result.end(), block.begin(), block.end());
    }
    return result;
  }
};

TEST_F(BlockSlicerTest, EvenSlicingWithRemainder) {
  std::filesystem::path source = make_source(10000);
  BlockSlicer slicer(source, 4096);

  auto blocks = drain(slicer);
  EXPECT_THAT(sizes(blocks), ElementsAre(4096u, 4096u, 1808u));
  EXPECT_EQ(concat(blocks), read_file(source));
  EXPECT_EQ(slicer.blocks_produced(), 3u);
  EXPECT_EQ(slicer.bytes_produced(), 10000u);
}

TEST_F(BlockSlicerTest, EvenSlicingExactMultipleHasNoEmptyTail) {
  std::filesystem::path source = make_source(8192);
  BlockSlicer slicer(source, 4096);

  auto blocks = drain(slicer);
  EXPECT_THAT(sizes(blocks), ElementsAre(4096u, 4096u));
  EXPECT_EQ(concat(blocks), read_file(source));
}

TEST_F(BlockSlicerTest, BlockSizeLargerThanFileReadsOnlyFile) {
  std::filesystem::path source = make_source(10);
  const std::size_t huge = std::numeric_limits<std::size_t>::max() / 2;

  BlockSlicer even(source, huge);
  auto blocks = drain(even);
  EXPECT_THAT(sizes(blocks), ElementsAre(10u));
  EXPECT_EQ(concat(blocks), read_file(source));

  BlockSlicer uneven(source, huge, huge + 1000);
  EXPECT_THAT(sizes(drain(uneven)), ElementsAre(10u));
}

TEST_F(BlockSlicerTest, EmptyFileYieldsNothing) {
  std::filesystem::path source = make_source(0);
  BlockSlicer even(source, 4096);
  BlockSlicer uneven(source, 10, 20);

  EXPECT_TRUE(drain(even).empty());
  EXPECT_TRUE(drain(uneven).empty());
}

TEST_F(BlockSlicerTest, UnevenSlicingStaysWithinBounds) {
  const std::size_t file_size = 100000;
  const std::size_t min_size = 1000;
  const std::size_t max_size = 3000;
  std::filesystem::path source = make_source(file_size);

  // Randomized, so repeat a few times
  for (int run = 0; run < 5; ++run) {
    BlockSlicer slicer(source, min_size, max_size);
    auto blocks = drain(slicer);
    ASSERT_FALSE(blocks.empty());

    for (std::size_t i = 0; i + 1 < blocks.size(); ++i) {
      EXPECT_GE(blocks[i].size(), min_size);
      EXPECT_LT(blocks[i].size(), max_size);
    }
    EXPECT_GT(blocks.back().size(), 0u);
    EXPECT_LT(blocks.back().size(), max_size);
    EXPECT_EQ(concat(blocks), read_file(source));
  }
}

TEST_F(BlockSlicerTest, ExhaustedSlicerStaysExhausted) {
  std::filesystem::path source = make_source(100);
  BlockSlicer slicer(source, 64);

  std::vector<std::uint8_t> block;
  EXPECT_TRUE(slicer.next(block));
  EXPECT_TRUE(slicer.next(block));
  EXPECT_EQ(block.size(), 36u);
  EXPECT_FALSE(slicer.next(block));
  EXPECT_TRUE(block.empty());
  EXPECT_FALSE(slicer.next(block));
}

TEST_F(BlockSlicerTest, FromConfigSelectsMode) {
  std::filesystem::path source = make_source(5000);

  config::SessionConfig config;
  config.block_size = 1000;
  EXPECT_FALSE(BlockSlicer::from_config(source, config).randomized());

  config.slicer = config::SlicerMode::Uneven;
  BlockSlicer uneven = BlockSlicer::from_config(source, config);
  EXPECT_TRUE(uneven.randomized());
  auto blocks = drain(uneven);
  for (std::size_t i = 0; i + 1 < blocks.size(); ++i) {
    EXPECT_GE(blocks[i].size(), 1000u);
    EXPECT_LT(blocks[i].size(), 2000u);
  }
}

TEST_F(BlockSlicerTest, InvalidArguments) {
  std::filesystem::path source = make_source(10);
  EXPECT_THROW(BlockSlicer(source, 0), ConfigError);
  EXPECT_THROW(BlockSlicer(source, 10, 10), ConfigError);
  EXPECT_THROW(BlockSlicer(test_dir / "missing.bin", 10), IOError);
}

TEST_F(BlockSlicerTest, EstimateMinimumBlockSize) {
  EXPECT_EQ(estimate_minimum_block_size(make_source(1048576, "a.bin")), 20971u);
  EXPECT_EQ(estimate_minimum_block_size(make_source(49, "b.bin")), 0u);
  EXPECT_THROW(estimate_minimum_block_size(test_dir / "missing.bin"), IOError);
}
