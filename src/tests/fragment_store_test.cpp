#include <gtest/gtest.h>
#include <filesystem>
#include <set>
#include "store/fragment_store.hpp"
#include "test_utils.hpp"

using namespace jigsaw;
using namespace jigsaw::store;

class FragmentStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<FragmentStore> store;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("fragment_store_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
    store = std::make_unique<FragmentStore>(test_dir, 30, 16);
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Helper to write a block and read it back
  Fragment write_and_verify(std::uint64_t sequence, const std::vector<std::uint8_t>& data,
                            NameRegistry& names) {
    Fragment fragment;
    EXPECT_NO_THROW(fragment = store->write(sequence, data, names)) << "Failed to write fragment " << sequence;
    EXPECT_TRUE(std::filesystem::is_regular_file(test_dir / fragment.filename))
      << "Fragment should exist after writing: " << fragment.filename;
    EXPECT_EQ(store->read(fragment.filename), data) << "Data mismatch for fragment: " << fragment.filename;
    return fragment;
  }
};

TEST_F(FragmentStoreTest, BasicOperations) {
  NameRegistry names;
  const std::string text = "Hello, Store!";
  std::vector<std::uint8_t> data(text.begin(), text.end());

  Fragment fragment = write_and_verify(7, data, names);

  EXPECT_EQ(fragment.sequence, 7u);
  EXPECT_EQ(fragment.byte_length, data.size());
  EXPECT_EQ(fragment.directory, test_dir.string());
  EXPECT_EQ(fragment.digest.size(), 16u);
  EXPECT_EQ(std::filesystem::file_size(test_dir / fragment.filename), data.size());
  EXPECT_EQ(names.count(fragment.filename), 1u);
}

TEST_F(FragmentStoreTest, GeneratedNamesUseAlphabetAndExtension) {
  NameRegistry names;
  Fragment fragment = write_and_verify(0, random_bytes(64), names);

  const std::string extension = FragmentStore::FRAGMENT_EXTENSION;
  ASSERT_EQ(fragment.filename.size(), 30u + extension.size());
  EXPECT_EQ(fragment.filename.substr(30), extension);

  const std::string alphabet = FragmentStore::NAME_ALPHABET;
  for (char c : fragment.filename.substr(0, 30)) {
    EXPECT_NE(alphabet.find(c), std::string::npos) << "Unexpected character: " << c;
  }
}

TEST_F(FragmentStoreTest, NamesAreUniqueWithinRun) {
  NameRegistry names;
  std::set<std::string> seen;

  for (std::uint64_t i = 0; i < 200; ++i) {
    Fragment fragment = store->write(i, random_bytes(16, static_cast<unsigned int>(i)), names);
    EXPECT_TRUE(seen.insert(fragment.filename).second) << "Duplicate name: " << fragment.filename;
  }
  EXPECT_EQ(names.size(), 200u);
}

TEST_F(FragmentStoreTest, ShortNamesExhaustNamespace) {
  // One character names give 44 possibilities
  FragmentStore tiny(test_dir, 1, 16);
  NameRegistry names;

  EXPECT_THROW({
    for (std::uint64_t i = 0; i < 1000; ++i) {
      tiny.write(i, random_bytes(1), names);
    }
  }, NameCollisionError);
  EXPECT_EQ(names.size(), 44u);
}

TEST_F(FragmentStoreTest, EmptyBlock) {
  NameRegistry names;
  Fragment fragment = write_and_verify(0, {}, names);
  EXPECT_EQ(fragment.byte_length, 0u);
  EXPECT_EQ(std::filesystem::file_size(test_dir / fragment.filename), 0u);
}

TEST_F(FragmentStoreTest, LargeBlock) {
  NameRegistry names;
  write_and_verify(0, random_bytes(1024 * 1024), names);
}

TEST_F(FragmentStoreTest, MissingFragmentThrows) {
  EXPECT_THROW(store->read("nonexistent.jig"), IOError);
  // A directory with the fragment's name is not a fragment
  std::filesystem::create_directories(test_dir / "folder.jig");
  EXPECT_THROW(store->read("folder.jig"), IOError);
}

TEST_F(FragmentStoreTest, ExistingNamesOnlyCountsFragments) {
  write_file(test_dir / "AAAA.jig", {1, 2, 3});
  write_file(test_dir / "BBBB.jig", {4});
  write_file(test_dir / "notes.txt", {5});
  std::filesystem::create_directories(test_dir / "sub.jig");

  NameRegistry names = FragmentStore::existing_names(test_dir);
  EXPECT_EQ(names, (NameRegistry{"AAAA.jig", "BBBB.jig"}));

  EXPECT_TRUE(FragmentStore::existing_names(test_dir / "missing").empty());
}

TEST_F(FragmentStoreTest, CreatesMissingBaseDirectory) {
  FragmentStore nested(test_dir / "a" / "b", 8, 16);
  NameRegistry names;
  Fragment fragment = nested.write(0, {9, 9, 9}, names);
  EXPECT_TRUE(std::filesystem::exists(test_dir / "a" / "b" / fragment.filename));
}
