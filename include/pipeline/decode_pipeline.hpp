#ifndef JIGSAW_PIPELINE_DECODE_PIPELINE_HPP
#define JIGSAW_PIPELINE_DECODE_PIPELINE_HPP

#include <filesystem>
#include <fstream>
#include "config/session_config.hpp"
#include "digest/digest_service.hpp"
#include "errors/jigsaw_error.hpp"
#include "keyfile/key_file_codec.hpp"
#include "pipeline/fidelity_report.hpp"

namespace jigsaw {
namespace pipeline {

// Progress of one decode run; any failure ends in Failed
enum class DecodeStage {
  Start,
  HeaderParsed,
  DirectoriesResolved,
  Reconstructing,
  DigestVerified,
  Done,
  Failed
};

const char* to_string(DecodeStage stage);

class DecodePipeline {
public:
  static constexpr const char* AUDIT_EXTENSION = ".jkd";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DecodePipeline(const config::DecodeOptions& options = config::DecodeOptions{});


  // ---- DECODING ----
  // Reassembles the file described by key_file. fragment_dir defaults to the
  // key file's directory; output_path defaults to the original file name
  // inside fragment_dir. Fidelity mismatches are reported, not thrown,
  // unless the strict option is set. A failed run leaves the partially
  // written output on disk.
  FidelityReport decode(const std::filesystem::path& key_file,
                        const std::filesystem::path& output_path = {},
                        const std::filesystem::path& fragment_dir = {});


  // ---- GETTERS ----
  DecodeStage stage() const { return stage_; }
  // Fragments appended to the output in the current or last run
  std::size_t fragments_reconstructed() const { return fragments_reconstructed_; }
  const config::DecodeOptions& options() const { return options_; }

private:
  // ---- PARAMETERS ----
  const config::DecodeOptions options_;
  DecodeStage stage_ = DecodeStage::Start;
  std::size_t fragments_reconstructed_ = 0;
  keyfile::KeyFileCodec codec_;
  digest::DigestService digests_;

  struct DecodeRun {
    std::filesystem::path key_file;
    keyfile::KeyFile key;
    std::filesystem::path fragment_dir;
    std::filesystem::path output_path;
    FidelityReport report;
  };

  // ---- DECODING STEPS ----
  void advance(DecodeStage stage);
  void resolve_directories(DecodeRun& run, const std::filesystem::path& output_path,
                           const std::filesystem::path& fragment_dir) const;
  // Base scheme fragments in sequence order, checked for gaps
  const keyfile::SchemeManifest& ordered_fragments(const DecodeRun& run) const;
  void reconstruct(DecodeRun& run, std::ofstream& audit);
  void verify_digests(DecodeRun& run) const;
  void report_fragment(const FragmentCheck& check, std::ofstream& audit) const;
  void report_summary(const FidelityReport& report, std::ofstream& audit) const;
};

// Decodes with a one-off lenient pipeline
FidelityReport decode(const std::filesystem::path& key_file,
                      const std::filesystem::path& output_path = {},
                      const std::filesystem::path& fragment_dir = {});

} // namespace pipeline
} // namespace jigsaw

#endif // JIGSAW_PIPELINE_DECODE_PIPELINE_HPP
