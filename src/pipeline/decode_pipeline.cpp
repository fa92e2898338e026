#include "pipeline/decode_pipeline.hpp"
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>
#include "store/fragment_store.hpp"

namespace jigsaw {
namespace pipeline {

const char* to_string(DecodeStage stage) {
  switch (stage) {
    case DecodeStage::Start:               return "Start";
    case DecodeStage::HeaderParsed:        return "HeaderParsed";
    case DecodeStage::DirectoriesResolved: return "DirectoriesResolved";
    case DecodeStage::Reconstructing:      return "Reconstructing";
    case DecodeStage::DigestVerified:      return "DigestVerified";
    case DecodeStage::Done:                return "Done";
    case DecodeStage::Failed:              return "Failed";
    default:                               return "Unknown";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DecodePipeline::DecodePipeline(const config::DecodeOptions& options)
  : options_(options) {}


//==============================================
// DECODING
//==============================================

FidelityReport DecodePipeline::decode(const std::filesystem::path& key_file,
                                      const std::filesystem::path& output_path,
                                      const std::filesystem::path& fragment_dir) {
  BOOST_LOG_TRIVIAL(info) << "Decoder: Decoding file using key file: " << key_file.string();
  stage_ = DecodeStage::Start;
  fragments_reconstructed_ = 0;

  try {
    DecodeRun run;
    run.key_file = key_file;
    run.key = codec_.read(key_file);

    const std::string supported = config::version_tag(config::SessionConfig::SUPPORTED_VERSION);
    if (run.key.header.version != supported) {
      BOOST_LOG_TRIVIAL(error) << "Decoder: Unsupported key file version: " << run.key.header.version;
      throw FormatError("Unsupported key file version: " + run.key.header.version);
    }
    // Gaps are rejected before any output is written
    ordered_fragments(run);
    advance(DecodeStage::HeaderParsed);

    resolve_directories(run, output_path, fragment_dir);
    advance(DecodeStage::DirectoriesResolved);
    BOOST_LOG_TRIVIAL(info) << "Decoder: ... directory of fragments (input): " << run.fragment_dir.string();
    BOOST_LOG_TRIVIAL(info) << "Decoder: ... decoded file name (output): " << run.output_path.string();

    run.report.output_file = run.output_path;
    run.report.audit_file = run.output_path;
    run.report.audit_file += AUDIT_EXTENSION;

    std::ofstream audit(run.report.audit_file, std::ios::out | std::ios::trunc);
    if (!audit) {
      BOOST_LOG_TRIVIAL(error) << "Decoder: Failed to create audit file: " << run.report.audit_file.string();
      throw IOError("Failed to create audit file: " + run.report.audit_file.string());
    }

    advance(DecodeStage::Reconstructing);
    reconstruct(run, audit);

    verify_digests(run);
    advance(DecodeStage::DigestVerified);
    report_summary(run.report, audit);

    audit.close();
    if (!audit) {
      throw IOError("Failed to write audit file: " + run.report.audit_file.string());
    }

    if (options_.strict && !run.report.digests_match()) {
      BOOST_LOG_TRIVIAL(error) << "Decoder: Whole file digests do not match the key file";
      throw FidelityError("Whole file digests of " + run.output_path.string() +
                          " do not match the key file");
    }

    advance(DecodeStage::Done);
    BOOST_LOG_TRIVIAL(info) << "Decoder: Decryption completed";
    return std::move(run.report);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Decoder: Decode failed in stage " << to_string(stage_) << ": " << e.what();
    stage_ = DecodeStage::Failed;
    throw;
  }
}


//==============================================
// DECODING STEPS
//==============================================

void DecodePipeline::advance(DecodeStage stage) {
  BOOST_LOG_TRIVIAL(debug) << "Decoder: " << to_string(stage_) << " -> " << to_string(stage);
  stage_ = stage;
}

void DecodePipeline::resolve_directories(DecodeRun& run, const std::filesystem::path& output_path,
                                         const std::filesystem::path& fragment_dir) const {
  try {
    // Fragment directory
    if (!fragment_dir.empty()) {
      run.fragment_dir = fragment_dir;
    } else if (run.key_file.has_parent_path()) {
      BOOST_LOG_TRIVIAL(debug) << "Decoder: Fragment directory not given, using key file directory";
      run.fragment_dir = run.key_file.parent_path();
    } else if (output_path.has_parent_path()) {
      BOOST_LOG_TRIVIAL(debug) << "Decoder: Fragment directory not given, using output file directory";
      run.fragment_dir = output_path.parent_path();
    } else {
      BOOST_LOG_TRIVIAL(debug) << "Decoder: Fragment directory not given, using working directory";
      run.fragment_dir = std::filesystem::current_path();
    }
    run.fragment_dir = std::filesystem::absolute(run.fragment_dir).lexically_normal();

    // Output file
    if (output_path.empty()) {
      BOOST_LOG_TRIVIAL(debug) << "Decoder: Output file not given, using original file name";
      run.output_path = run.fragment_dir /
        std::filesystem::path(run.key.header.input_file).filename();
    } else if (!output_path.has_parent_path()) {
      run.output_path = run.fragment_dir / output_path;
    } else {
      run.output_path = std::filesystem::absolute(output_path).lexically_normal();
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Decoder: Failed to resolve directories: " << e.what();
    throw IOError(std::string("Failed to resolve directories: ") + e.what());
  }

  if (!std::filesystem::is_directory(run.fragment_dir)) {
    BOOST_LOG_TRIVIAL(error) << "Decoder: Fragment directory not found: " << run.fragment_dir.string();
    throw IOError("Fragment directory not found: " + run.fragment_dir.string());
  }
}

const keyfile::SchemeManifest& DecodePipeline::ordered_fragments(const DecodeRun& run) const {
  static const keyfile::SchemeManifest empty;

  auto it = run.key.manifest.find(keyfile::KeyFileCodec::BASE_SCHEME);
  if (it == run.key.manifest.end()) {
    return empty;
  }

  // std::map keeps the entries in ascending sequence order
  std::uint64_t expected = 0;
  for (const auto& [sequence, fragment] : it->second) {
    if (sequence != expected) {
      BOOST_LOG_TRIVIAL(error) << "Decoder: Manifest is missing sequence number " << expected;
      throw FormatError("Manifest is missing sequence number " + std::to_string(expected));
    }
    ++expected;
  }
  return it->second;
}

void DecodePipeline::reconstruct(DecodeRun& run, std::ofstream& audit) {
  BOOST_LOG_TRIVIAL(info) << "Decoder: Decrypting file ......";

  std::ofstream output(run.output_path, std::ios::binary | std::ios::trunc);
  if (!output) {
    BOOST_LOG_TRIVIAL(error) << "Decoder: Failed to create output file: " << run.output_path.string();
    throw IOError("Failed to create output file: " + run.output_path.string());
  }

  const store::FragmentStore fragment_store(run.fragment_dir);
  const std::size_t digest_length = run.key.header.digest_length;

  for (const auto& [sequence, fragment] : ordered_fragments(run)) {
    const std::vector<std::uint8_t> block = fragment_store.read(fragment.filename);

    if (!block.empty()) {
      output.write(reinterpret_cast<const char*>(block.data()), static_cast<std::streamsize>(block.size()));
    }
    if (!output) {
      BOOST_LOG_TRIVIAL(error) << "Decoder: Failed to write output file: " << run.output_path.string();
      throw IOError("Failed to write output file: " + run.output_path.string());
    }

    FragmentCheck check;
    check.sequence = sequence;
    check.path = run.fragment_dir / fragment.filename;
    check.expected_size = fragment.byte_length;
    check.actual_size = block.size();
    check.recorded_digest = fragment.digest;
    check.recomputed_digest = digests_.truncated_digest(block, digest_length);

    run.report.expected_bytes += check.expected_size;
    run.report.actual_bytes += check.actual_size;
    run.report.fragments.push_back(check);
    ++fragments_reconstructed_;

    report_fragment(check, audit);

    if (!check.intact()) {
      BOOST_LOG_TRIVIAL(warning) << "Decoder: Fragment " << sequence << " (" << fragment.filename
                                 << ") failed fidelity check: size " << check.actual_size
                                 << " vs " << check.expected_size << ", digest "
                                 << check.recomputed_digest << " vs " << check.recorded_digest;
      if (options_.strict) {
        throw FidelityError("Fragment " + std::to_string(sequence) + " (" + fragment.filename +
                            ") does not match the key file");
      }
    }
  }

  output.close();
  if (!output) {
    BOOST_LOG_TRIVIAL(error) << "Decoder: Failed to finish output file: " << run.output_path.string();
    throw IOError("Failed to finish output file: " + run.output_path.string());
  }
}

void DecodePipeline::verify_digests(DecodeRun& run) const {
  const digest::FileDigests actual = digests_.whole_file_digests(run.output_path);
  for (std::size_t i = 0; i < digest::WHOLE_FILE_DIGEST_COUNT; ++i) {
    DigestComparison& comparison = run.report.digests[i];
    comparison.algorithm = digest::WHOLE_FILE_ALGORITHMS[i];
    comparison.expected = run.key.header.digests[i];
    comparison.actual = actual[i];
    if (!comparison.matches()) {
      BOOST_LOG_TRIVIAL(warning) << "Decoder: " << digest::to_string(comparison.algorithm)
                                 << " mismatch: " << comparison.actual << " vs " << comparison.expected;
    }
  }
}


//==============================================
// AUDIT OUTPUT
//==============================================

void DecodePipeline::report_fragment(const FragmentCheck& check, std::ofstream& audit) const {
  const std::string line = FidelityReport::fragment_line(check);
  audit << line << '\n';

  if (options_.verbosity == 1) {
    BOOST_LOG_TRIVIAL(info) << "Decoder: Code: " << line;
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Decoder: Code: " << line;
  }
  if (options_.verbosity > 1 && check.sequence % 1000 == 0) {
    BOOST_LOG_TRIVIAL(info) << "Decoder: " << check.sequence << " blocks processed";
  }
}

void DecodePipeline::report_summary(const FidelityReport& report, std::ofstream& audit) const {
  std::ostringstream summary;
  report.write_summary(summary);
  audit << summary.str();

  std::istringstream lines(summary.str());
  std::string line;
  while (std::getline(lines, line)) {
    BOOST_LOG_TRIVIAL(info) << "Decoder: " << line;
  }
}


//==============================================
// CONVENIENCE
//==============================================

FidelityReport decode(const std::filesystem::path& key_file,
                      const std::filesystem::path& output_path,
                      const std::filesystem::path& fragment_dir) {
  DecodePipeline pipeline;
  return pipeline.decode(key_file, output_path, fragment_dir);
}

} // namespace pipeline
} // namespace jigsaw
