#ifndef JIGSAW_PIPELINE_FIDELITY_REPORT_HPP
#define JIGSAW_PIPELINE_FIDELITY_REPORT_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include "digest/digest_service.hpp"

namespace jigsaw {
namespace pipeline {

struct FragmentCheck {
  std::uint64_t sequence = 0;
  std::filesystem::path path;
  std::uint64_t expected_size = 0;
  std::uint64_t actual_size = 0;
  std::string recorded_digest;
  std::string recomputed_digest;

  bool size_matches() const { return expected_size == actual_size; }
  bool digest_matches() const { return recorded_digest == recomputed_digest; }
  bool intact() const { return size_matches() && digest_matches(); }
};

struct DigestComparison {
  digest::Algorithm algorithm = digest::Algorithm::MD5;
  std::string expected;
  std::string actual;

  bool matches() const { return expected == actual; }
};

// Outcome of one decode. Mismatches are recorded here rather than raised.
struct FidelityReport {
  std::filesystem::path output_file;
  std::filesystem::path audit_file;
  std::vector<FragmentCheck> fragments;
  std::array<DigestComparison, digest::WHOLE_FILE_DIGEST_COUNT> digests;
  std::uint64_t expected_bytes = 0;
  std::uint64_t actual_bytes = 0;

  std::size_t fragment_count() const { return fragments.size(); }
  std::size_t mismatched_fragments() const;
  bool fragments_intact() const { return mismatched_fragments() == 0; }
  bool byte_counts_match() const { return expected_bytes == actual_bytes; }
  bool digests_match() const;
  bool ok() const { return fragments_intact() && byte_counts_match() && digests_match(); }

  // ---- AUDIT OUTPUT ----
  // One line per fragment
  static std::string fragment_line(const FragmentCheck& check);
  // Fragment count, byte accounting and digest comparison
  void write_summary(std::ostream& output) const;
};

} // namespace pipeline
} // namespace jigsaw

#endif // JIGSAW_PIPELINE_FIDELITY_REPORT_HPP
