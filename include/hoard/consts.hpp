#pragma once
#include <cstddef>
#include <string_view>

namespace hoard::consts {

// Directory and file names
inline constexpr std::string_view kHoardDir    = ".hoard";
inline constexpr std::string_view kObjectsDir  = "objects";
inline constexpr std::string_view kByHashDir   = "by-hash";
inline constexpr std::string_view kByNameDir   = "by-name";
inline constexpr std::string_view kManifestFile = "manifest.json";

// ——— Content hash sizes ———
inline constexpr std::size_t kHashRawLen = 32;  // 32 bytes (SHA-256)
inline constexpr std::size_t kHashHexLen = 64;  // 64 hex chars (SHA-256)

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in by-hash

// ——— Name collisions ———
inline constexpr char kNameSuffixSep = '~';     // "photo.jpg" -> "photo.jpg~2"

// Streaming read chunk for hashing
inline constexpr std::size_t kReadChunk = 64 * 1024;

} // namespace hoard::consts
