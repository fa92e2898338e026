#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <sstream>
#include "cli/cli.hpp"
#include "test_utils.hpp"

using namespace jigsaw;
using namespace jigsaw::cli;
using ::testing::HasSubstr;

namespace {

// Builds argv from strings, program name first
CommandLine parse(std::vector<std::string> args) {
  args.insert(args.begin(), "jigsaw");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return parse_command_line(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST(CommandLineTest, ParsesBothFlagForms) {
  CommandLine command_line = parse({"encode", "--filename", "data.bin", "--blocksize=4096"});

  EXPECT_TRUE(command_line.valid);
  EXPECT_EQ(command_line.command, "encode");
  EXPECT_EQ(command_line.options.at("filename"), "data.bin");
  EXPECT_EQ(command_line.options.at("blocksize"), "4096");
}

TEST(CommandLineTest, EmptyValueWithEquals) {
  CommandLine command_line = parse({"decode", "--outputfile="});
  EXPECT_TRUE(command_line.valid);
  EXPECT_EQ(command_line.options.at("outputfile"), "");
}

TEST(CommandLineTest, RejectsMalformedArguments) {
  EXPECT_FALSE(parse({}).valid);
  EXPECT_FALSE(parse({"encode", "filename"}).valid);
  EXPECT_FALSE(parse({"encode", "--filename"}).valid);
  EXPECT_FALSE(parse({"encode", "-f", "x"}).valid);
}

class CLITest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::ostringstream out;
  CLI cli{out};

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("cli_test");
  }

  void TearDown() override {
    boost::log::core::get()->remove_all_sinks();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Runs a command with logging directed into the scratch directory
  int run(std::vector<std::string> args) {
    args.push_back("--log_file");
    args.push_back((test_dir / "jigsaw.log").string());
    return cli.run(parse(args));
  }
};

TEST_F(CLITest, HelpPrintsUsage) {
  EXPECT_EQ(cli.run(parse({"help"})), 0);
  EXPECT_THAT(out.str(), HasSubstr("Usage: jigsaw"));
  EXPECT_THAT(out.str(), HasSubstr("encode"));
  EXPECT_THAT(out.str(), HasSubstr("decode"));
}

TEST_F(CLITest, InvalidCommandLinePrintsUsage) {
  EXPECT_EQ(cli.run(parse({"encode", "stray"})), 1);
  EXPECT_THAT(out.str(), HasSubstr("Usage: jigsaw"));
}

TEST_F(CLITest, UnknownCommand) {
  EXPECT_EQ(run({"shuffle"}), 1);
  EXPECT_THAT(out.str(), HasSubstr("Unknown command: shuffle"));
}

TEST_F(CLITest, EncodeThenDecode) {
  const std::filesystem::path source = test_dir / "notes.txt";
  const std::vector<std::uint8_t> data = random_bytes(20000);
  write_file(source, data);
  const std::filesystem::path fragments = test_dir / "fragments";

  ASSERT_EQ(run({"encode", "--filename", source.string(), "--blocksize", "3000",
                 "--output_dir", fragments.string(), "--verbose", "1"}), 0);
  const std::filesystem::path key_path = fragments / "notes.txt.jgk";
  EXPECT_THAT(out.str(), HasSubstr("Key file: " + key_path.string()));
  ASSERT_TRUE(std::filesystem::exists(key_path));
  EXPECT_TRUE(std::filesystem::exists(test_dir / "jigsaw.log"));

  const std::filesystem::path restored = test_dir / "restored.txt";
  out.str("");
  ASSERT_EQ(run({"decode", "--keyfilename", key_path.string(), "--outputfile", restored.string()}), 0);
  EXPECT_EQ(read_file(restored), data);
  EXPECT_THAT(out.str(), HasSubstr("Output file: " + restored.string()));
  EXPECT_THAT(out.str(), HasSubstr("7 Jigsaw files processed"));
  EXPECT_THAT(out.str(), ::testing::Not(HasSubstr("Warning")));
}

TEST_F(CLITest, DecodeReportsMismatch) {
  const std::filesystem::path source = test_dir / "notes.txt";
  write_file(source, random_bytes(5000));
  ASSERT_EQ(run({"encode", "--filename", source.string(), "--blocksize", "1000"}), 0);

  // Alter the recorded md5 so it no longer matches the decoded file
  const std::filesystem::path key_path = test_dir / "notes.txt.jgk";
  std::string key_text = read_text(key_path);
  const std::string md5_field = "#md5>>";
  const std::size_t pos = key_text.find(md5_field) + md5_field.size();
  key_text[pos] = key_text[pos] == '0' ? '1' : '0';
  std::ofstream(key_path, std::ios::trunc) << key_text;

  out.str("");
  EXPECT_EQ(run({"decode", "--keyfilename", key_path.string(), "--outputfile", "copy.txt"}), 0);
  EXPECT_THAT(out.str(), HasSubstr("(MISMATCH)"));
  EXPECT_THAT(out.str(), HasSubstr("Warning: decoded file does not match"));

  out.str("");
  EXPECT_EQ(run({"decode", "--keyfilename", key_path.string(), "--outputfile", "copy.txt",
                 "--strict", "true"}), 1);
  EXPECT_THAT(out.str(), HasSubstr("Error decoding file"));
}

TEST_F(CLITest, MissingRequiredArguments) {
  EXPECT_EQ(run({"encode"}), 1);
  EXPECT_THAT(out.str(), HasSubstr("encode requires --filename"));
  EXPECT_EQ(run({"decode"}), 1);
  EXPECT_THAT(out.str(), HasSubstr("decode requires --keyfilename"));
  EXPECT_EQ(run({"obs"}), 1);
}

TEST_F(CLITest, EncodeErrorsAreReported) {
  EXPECT_EQ(run({"encode", "--filename", (test_dir / "missing.bin").string()}), 1);
  EXPECT_THAT(out.str(), HasSubstr("Error encoding file"));

  out.str("");
  EXPECT_EQ(run({"encode", "--filename", "x", "--blocksize", "lots"}), 1);
  EXPECT_THAT(out.str(), HasSubstr("Configuration error"));
}

TEST_F(CLITest, EstimateBlockSize) {
  const std::filesystem::path source = test_dir / "big.bin";
  write_file(source, random_bytes(100000));

  EXPECT_EQ(run({"obs", "--filename", source.string()}), 0);
  EXPECT_THAT(out.str(), HasSubstr("is 100000 bytes"));
  EXPECT_THAT(out.str(), HasSubstr("Minimum block size to reach AES-256 is 2000"));

  out.str("");
  EXPECT_EQ(run({"obs", "--filename", (test_dir / "missing.bin").string()}), 1);
  EXPECT_THAT(out.str(), HasSubstr("Error estimating block size"));
}
