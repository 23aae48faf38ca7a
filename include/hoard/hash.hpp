#pragma once

#include "hoard/consts.hpp"

#include <compare>
#include <functional>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace hoard {

/**
 * Fingerprint of a file's bytes: 64 lowercase hex chars of its SHA-256.
 *
 * Only the static factories construct one, so a ContentHash is always valid.
 * The store keeps each object at storage_path() under its root:
 *   ab/cdef0123...   (2 chars of fan-out, then the remaining 62)
 */
class ContentHash {
public:
  // Validate 64 lowercase hex chars; throws Error{InvalidFormat} otherwise.
  static ContentHash parse(std::string_view hex);
  static std::optional<ContentHash> try_parse(std::string_view hex);

  // Stream the file through SHA-256; throws Error{Hash} if it cannot be read.
  static ContentHash compute(const std::filesystem::path &file);

  // Files inside the store are named after their hash: if the last two path
  // segments form a hash, trust it instead of reading the file.
  static ContentHash from_path_or_content(const std::filesystem::path &path);

  [[nodiscard]] const std::string &str() const noexcept { return hex_; }
  [[nodiscard]] std::filesystem::path storage_path() const;

  auto operator<=>(const ContentHash &) const = default;
  bool operator==(const ContentHash &) const = default;

private:
  explicit ContentHash(std::string hex) : hex_(std::move(hex)) {}

  std::string hex_;
};

} // namespace hoard

template <> struct std::hash<hoard::ContentHash> {
  std::size_t operator()(const hoard::ContentHash &h) const noexcept {
    return std::hash<std::string>{}(h.str());
  }
};
