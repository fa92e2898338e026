#include "digest/digest_service.hpp"
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace jigsaw {
namespace digest {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  explicit DigestContext(Algorithm algorithm) {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw JigsawError("Digest: Failed to create hash context");
    }
    if (!EVP_DigestInit_ex(ctx, evp_for(algorithm), nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw JigsawError(std::string("Digest: Failed to initialize ") + to_string(algorithm));
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  void update(const void* data, std::size_t size) {
    if (!EVP_DigestUpdate(ctx, data, size)) {
      throw JigsawError("Digest: Failed to update hash");
    }
  }

  // Finalize and convert the raw hash bytes to a hexadecimal string
  std::string hex() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
      throw JigsawError("Digest: Failed to finalize hash");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
      ss << std::hex << std::setw(2) << std::setfill('0')
         << static_cast<int>(hash[i]);
    }
    return ss.str();
  }

  static const EVP_MD* evp_for(Algorithm algorithm) {
    switch (algorithm) {
      case Algorithm::MD5:    return EVP_md5();
      case Algorithm::SHA1:   return EVP_sha1();
      case Algorithm::SHA224: return EVP_sha224();
      case Algorithm::SHA256: return EVP_sha256();
      case Algorithm::SHA384: return EVP_sha384();
      case Algorithm::SHA512: return EVP_sha512();
    }
    throw JigsawError("Digest: Unknown algorithm");
  }
};

} // namespace

const char* to_string(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::MD5:    return "md5";
    case Algorithm::SHA1:   return "sha1";
    case Algorithm::SHA224: return "sha224";
    case Algorithm::SHA256: return "sha256";
    case Algorithm::SHA384: return "sha384";
    case Algorithm::SHA512: return "sha512";
    default:                return "unknown";
  }
}


//==============================================
// WHOLE FILE DIGESTS
//==============================================

FileDigests DigestService::whole_file_digests(const std::filesystem::path& path) const {
  BOOST_LOG_TRIVIAL(info) << "Digest: Hashing file: " << path.string();

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to open file: " << path.string();
    throw IOError("Failed to open file for hashing: " + path.string());
  }

  std::vector<std::unique_ptr<DigestContext>> contexts;
  for (Algorithm algorithm : WHOLE_FILE_ALGORITHMS) {
    contexts.push_back(std::make_unique<DigestContext>(algorithm));
  }

  char buffer[CHUNK_SIZE];
  std::uintmax_t total_bytes = 0;

  // Read file in chunks and feed every context
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    const auto bytes_read = static_cast<std::size_t>(file.gcount());
    for (auto& context : contexts) {
      context->update(buffer, bytes_read);
    }
    total_bytes += bytes_read;
  }

  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Read failure while hashing: " << path.string();
    throw IOError("Failed to read file for hashing: " + path.string());
  }

  FileDigests digests;
  for (std::size_t i = 0; i < contexts.size(); ++i) {
    digests[i] = contexts[i]->hex();
    BOOST_LOG_TRIVIAL(debug) << "Digest: " << to_string(WHOLE_FILE_ALGORITHMS[i]) << ": " << digests[i];
  }

  BOOST_LOG_TRIVIAL(debug) << "Digest: Hashed " << total_bytes << " bytes of " << path.string();
  return digests;
}


//==============================================
// BLOCK DIGESTS
//==============================================

std::string DigestService::truncated_digest(const std::uint8_t* data, std::size_t size,
                                            std::size_t length) const {
  std::string digest = hex_digest(Algorithm::SHA256, data, size);
  if (length < digest.size()) {
    digest.resize(length);
  }
  return digest;
}

std::string DigestService::hex_digest(Algorithm algorithm, const std::uint8_t* data,
                                      std::size_t size) const {
  DigestContext context(algorithm);
  if (size > 0) {
    context.update(data, size);
  }
  return context.hex();
}

} // namespace digest
} // namespace jigsaw
