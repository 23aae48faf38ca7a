#include "hoard/hash.hpp"

#include "hoard/consts.hpp"
#include "hoard/error.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace hoard {

namespace {

// Raw 32-byte SHA-256 digest
using digest = std::array<std::uint8_t, consts::kHashRawLen>;

struct MdCtxFree {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;

MdCtx new_sha256_ctx() {
  MdCtx ctx{EVP_MD_CTX_new()};
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha256) failed");
  }
  return ctx;
}

digest finish(EVP_MD_CTX *ctx) {
  digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-256 produced unexpected length");
  }
  return out;
}

bool is_lower_hex(char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }

std::string to_hex(const digest &d) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(consts::kHashHexLen);
  for (std::size_t i = 0; i < consts::kHashRawLen; ++i) {
    unsigned b = d[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

} // namespace

std::optional<ContentHash> ContentHash::try_parse(std::string_view hex) {
  if (hex.size() != consts::kHashHexLen || !std::ranges::all_of(hex, is_lower_hex)) {
    return std::nullopt;
  }
  return ContentHash{std::string(hex)};
}

ContentHash ContentHash::parse(std::string_view hex) {
  if (auto h = try_parse(hex)) {
    return *h;
  }
  throw Error{ErrorKind::InvalidFormat,
              "not a valid SHA-256 hash: '" + std::string(hex) + "'"};
}

ContentHash ContentHash::compute(const std::filesystem::path &file) {
  std::ifstream ifs(file, std::ios::binary);
  if (!ifs) {
    throw Error{ErrorKind::Hash, "open for hashing failed", file};
  }
  auto ctx = new_sha256_ctx();
  std::vector<char> buf(consts::kReadChunk);
  while (ifs) {
    ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto n = ifs.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(n)) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  if (ifs.bad()) {
    throw Error{ErrorKind::Hash, "read for hashing failed", file};
  }
  return ContentHash{to_hex(finish(ctx.get()))};
}

ContentHash ContentHash::from_path_or_content(const std::filesystem::path &path) {
  const auto object = path.filename().string();
  const auto prefix = path.parent_path().filename().string();
  if (auto h = try_parse(prefix + object)) {
    return *h;
  }
  return compute(path);
}

std::filesystem::path ContentHash::storage_path() const {
  return std::filesystem::path(hex_.substr(0, consts::kFanoutDirHexLen)) /
         hex_.substr(consts::kFanoutDirHexLen);
}

} // namespace hoard
