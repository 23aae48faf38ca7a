#include "hoard/error.hpp"

namespace hoard {

namespace {

std::string render(const std::string &message, const std::filesystem::path &path) {
  if (path.empty()) {
    return message;
  }
  return path.string() + ": " + message;
}

} // namespace

std::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Io:
    return "io error";
  case ErrorKind::Hash:
    return "hash error";
  case ErrorKind::InvalidFormat:
    return "invalid format";
  case ErrorKind::BrokenReference:
    return "broken reference";
  case ErrorKind::AmbiguousManifest:
    return "ambiguous manifest";
  case ErrorKind::PathOutsideRepository:
    return "path outside repository";
  case ErrorKind::RepositoryNotFound:
    return "repository not found";
  }
  return "unknown error";
}

Error::Error(ErrorKind kind, const std::string &message, std::filesystem::path path)
    : std::runtime_error(render(message, path)), kind_(kind), path_(std::move(path)),
      message_(message) {}

Error io_error(const std::filesystem::path &path, std::string_view what,
               const std::error_code &ec) {
  return Error{ErrorKind::Io, std::string(what) + ": " + ec.message(), path};
}

} // namespace hoard
