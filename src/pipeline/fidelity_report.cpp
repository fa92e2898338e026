#include "pipeline/fidelity_report.hpp"
#include <algorithm>
#include <sstream>
#include "keyfile/key_file_codec.hpp"

namespace jigsaw {
namespace pipeline {

std::size_t FidelityReport::mismatched_fragments() const {
  return static_cast<std::size_t>(std::count_if(fragments.begin(), fragments.end(),
    [](const FragmentCheck& check) { return !check.intact(); }));
}

bool FidelityReport::digests_match() const {
  return std::all_of(digests.begin(), digests.end(),
    [](const DigestComparison& comparison) { return comparison.matches(); });
}

std::string FidelityReport::fragment_line(const FragmentCheck& check) {
  const char* delimiter = keyfile::KeyFileCodec::DELIMITER;
  std::ostringstream line;
  line << check.sequence << delimiter
       << check.path.string() << delimiter
       << check.expected_size << delimiter
       << check.actual_size << delimiter
       << check.recorded_digest << delimiter
       << check.recomputed_digest;
  return line.str();
}

void FidelityReport::write_summary(std::ostream& output) const {
  output << fragment_count() << " Jigsaw files processed\n";
  output << "Expected number of bytes: " << expected_bytes << "\n";
  output << "Actual number of bytes  : " << actual_bytes << "\n";
  if (mismatched_fragments() > 0) {
    output << "Fragments failing fidelity check: " << mismatched_fragments() << "\n";
  }

  output << "File Hashes (Decrypted File vs Original Unencrypted File)\n";
  for (const auto& comparison : digests) {
    const std::string name = digest::to_string(comparison.algorithm);
    output << name << ": " << comparison.actual << "\n";
    // Align the expected digest under the actual one
    output << "  vs" << std::string(name.size() - 2, ' ') << comparison.expected
           << (comparison.matches() ? "" : "  (MISMATCH)") << "\n";
  }
}

} // namespace pipeline
} // namespace jigsaw
