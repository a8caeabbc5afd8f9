#include "docqa_core/utils/hashing.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace docqa_core {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext new_sha256_context() {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw HashingError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw HashingError("Failed to initialize SHA256 digest");
  }
  return ctx;
}

std::string finalize_hex(EVP_MD_CTX* ctx) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
    throw HashingError("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace

std::string sha256_hex(std::string_view content) {
  DigestContext ctx = new_sha256_context();
  if (EVP_DigestUpdate(ctx.get(), content.data(), content.size()) != 1) {
    throw HashingError("Failed to update SHA256 digest");
  }
  return finalize_hex(ctx.get());
}

std::string sha256_file(const std::filesystem::path& file_path) {
  std::ifstream stream(file_path, std::ios::binary);
  if (!stream.is_open()) {
    throw HashingError("Could not open file for hashing: " + file_path.string());
  }

  DigestContext ctx = new_sha256_context();
  char block[4096];
  while (stream.read(block, sizeof(block)) || stream.gcount() > 0) {
    if (EVP_DigestUpdate(ctx.get(), block, static_cast<size_t>(stream.gcount())) != 1) {
      throw HashingError("Failed to update SHA256 digest");
    }
  }
  return finalize_hex(ctx.get());
}

}  // namespace docqa_core
