#include "pipeline/encode_pipeline.hpp"
#include <vector>
#include <boost/log/trivial.hpp>
#include "slicer/block_slicer.hpp"

namespace jigsaw {
namespace pipeline {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

EncodePipeline::EncodePipeline(const config::SessionConfig& config)
  : config_(config) {
  config_.validate();
}


//==============================================
// ENCODING
//==============================================

std::filesystem::path EncodePipeline::encode(const std::filesystem::path& source,
                                             const std::filesystem::path& output_dir) const {
  BOOST_LOG_TRIVIAL(info) << "Encoder: Encoding file: " << source.string();

  EncodeRun run;
  resolve_paths(run, source, output_dir);

  BOOST_LOG_TRIVIAL(info) << "Encoder: ... in input directory: " << run.source.parent_path().string();
  BOOST_LOG_TRIVIAL(info) << "Encoder: ... onto output directory: " << run.output_dir.string();
  BOOST_LOG_TRIVIAL(info) << "Encoder: ... using Jigsaw version: " << config_.version_tag();
  BOOST_LOG_TRIVIAL(info) << "Encoder: ... using slicer: " << config::to_string(config_.slicer);
  BOOST_LOG_TRIVIAL(info) << "Encoder: ... using block size: " << config_.block_size;

  // Names already on disk must not be reused
  run.names = store::FragmentStore::existing_names(run.output_dir);

  build_header(run);

  keyfile::KeyFileWriter writer(run.key_file, run.header);
  write_fragments(run, writer);
  writer.close();

  BOOST_LOG_TRIVIAL(info) << "Encoder: " << run.fragment_count << " blocks processed ("
                          << run.total_bytes << " bytes)";
  BOOST_LOG_TRIVIAL(info) << "Encoder: Encoding file, " << run.source.string() << ", completed";
  return run.key_file;
}


//==============================================
// ENCODING STEPS
//==============================================

void EncodePipeline::resolve_paths(EncodeRun& run, const std::filesystem::path& source,
                                   const std::filesystem::path& output_dir) const {
  try {
    run.source = std::filesystem::absolute(source).lexically_normal();

    if (!std::filesystem::is_regular_file(run.source)) {
      BOOST_LOG_TRIVIAL(error) << "Encoder: Source is not a readable file: " << run.source.string();
      throw IOError("Source file not found: " + run.source.string());
    }

    if (output_dir.empty()) {
      BOOST_LOG_TRIVIAL(debug) << "Encoder: Output directory not given, using source directory";
      run.output_dir = run.source.parent_path();
    } else {
      run.output_dir = std::filesystem::absolute(output_dir).lexically_normal();
    }

    if (!std::filesystem::exists(run.output_dir)) {
      BOOST_LOG_TRIVIAL(debug) << "Encoder: Creating output directory: " << run.output_dir.string();
      std::filesystem::create_directories(run.output_dir);
    } else if (!std::filesystem::is_directory(run.output_dir)) {
      throw IOError("Output path is not a directory: " + run.output_dir.string());
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Encoder: Failed to resolve paths: " << e.what();
    throw IOError(std::string("Failed to resolve paths: ") + e.what());
  }

  run.key_file = run.output_dir /
    (run.source.filename().string() + keyfile::KeyFileCodec::KEY_FILE_EXTENSION);
}

void EncodePipeline::build_header(EncodeRun& run) const {
  run.header.version = config_.version_tag();
  run.header.input_dir = run.source.parent_path().string();
  run.header.input_file = run.source.string();
  run.header.digest_length = config_.digest_length;
  run.header.digests = digests_.whole_file_digests(run.source);
}

void EncodePipeline::write_fragments(EncodeRun& run, keyfile::KeyFileWriter& writer) const {
  store::FragmentStore fragment_store(run.output_dir, config_.name_length, config_.digest_length);
  slicer::BlockSlicer block_slicer = slicer::BlockSlicer::from_config(run.source, config_);

  BOOST_LOG_TRIVIAL(info) << "Encoder: Processing using " << config::to_string(config_.slicer) << " slicer";

  std::vector<std::uint8_t> block;
  while (block_slicer.next(block)) {
    const store::Fragment fragment = fragment_store.write(run.fragment_count, block, run.names);
    const std::string line = writer.append(fragment);
    report_progress(run, line);
    ++run.fragment_count;
    run.total_bytes += block.size();
  }
}

void EncodePipeline::report_progress(const EncodeRun& run, const std::string& line) const {
  if (config_.verbosity == 1) {
    BOOST_LOG_TRIVIAL(info) << "Encoder: Code: " << line;
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Encoder: Code: " << line;
  }
  if (config_.verbosity > 1 && run.fragment_count % 1000 == 0) {
    BOOST_LOG_TRIVIAL(info) << "Encoder: " << run.fragment_count << " blocks processed";
  }
}


//==============================================
// CONVENIENCE
//==============================================

std::filesystem::path encode(const std::filesystem::path& source,
                             const std::filesystem::path& output_dir,
                             const config::SessionConfig& config) {
  return EncodePipeline(config).encode(source, output_dir);
}

} // namespace pipeline
} // namespace jigsaw
