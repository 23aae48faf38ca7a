#pragma once
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace hoard {

enum class ErrorKind : std::uint8_t {
  Io,                    // open/read/write/link/unlink/mkdir failed
  Hash,                  // content could not be read to fingerprint it
  InvalidFormat,         // string is not a hash, bad manifest, bad name
  BrokenReference,       // by-name entry points at nothing
  AmbiguousManifest,     // two names claim one path
  PathOutsideRepository, // path not under the repository root
  RepositoryNotFound,    // no .hoard found walking upward
};

std::string_view to_string(ErrorKind kind);

// Every failure raised by the hoard core. Carries a kind callers can match on and,
// when the failure concerns a file, the path; what() renders "<path>: <message>".
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message, std::filesystem::path path = {});

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }
  [[nodiscard]] const std::string &message() const noexcept { return message_; }

private:
  ErrorKind kind_;
  std::filesystem::path path_;
  std::string message_;
};

// Wrap a std::error_code from a filesystem call as an Io error on `path`.
[[nodiscard]] Error io_error(const std::filesystem::path &path, std::string_view what,
                             const std::error_code &ec);

} // namespace hoard
