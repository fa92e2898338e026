#ifndef JIGSAW_PIPELINE_ENCODE_PIPELINE_HPP
#define JIGSAW_PIPELINE_ENCODE_PIPELINE_HPP

#include <filesystem>
#include "config/session_config.hpp"
#include "digest/digest_service.hpp"
#include "errors/jigsaw_error.hpp"
#include "keyfile/key_file_codec.hpp"
#include "store/fragment_store.hpp"

namespace jigsaw {
namespace pipeline {

class EncodePipeline {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws ConfigError for settings that cannot drive an encode
  explicit EncodePipeline(const config::SessionConfig& config);


  // ---- ENCODING ----
  // Splits source into fragments inside output_dir and writes
  // <output_dir>/<source filename>.jgk. An empty output_dir means the
  // directory of the source file. Returns the key file path.
  std::filesystem::path encode(const std::filesystem::path& source,
                               const std::filesystem::path& output_dir = {}) const;


  // ---- GETTERS ----
  const config::SessionConfig& session_config() const { return config_; }

private:
  // ---- PARAMETERS ----
  const config::SessionConfig config_;
  digest::DigestService digests_;

  // Per-run values, never shared between runs
  struct EncodeRun {
    std::filesystem::path source;
    std::filesystem::path output_dir;
    std::filesystem::path key_file;
    store::NameRegistry names;
    keyfile::KeyFileHeader header;
    std::size_t fragment_count = 0;
    std::uintmax_t total_bytes = 0;
  };

  // ---- ENCODING STEPS ----
  void resolve_paths(EncodeRun& run, const std::filesystem::path& source,
                     const std::filesystem::path& output_dir) const;
  void build_header(EncodeRun& run) const;
  void write_fragments(EncodeRun& run, keyfile::KeyFileWriter& writer) const;
  void report_progress(const EncodeRun& run, const std::string& line) const;
};

// Encodes with a one-off pipeline
std::filesystem::path encode(const std::filesystem::path& source,
                             const std::filesystem::path& output_dir,
                             const config::SessionConfig& config);

} // namespace pipeline
} // namespace jigsaw

#endif // JIGSAW_PIPELINE_ENCODE_PIPELINE_HPP
