#include "hoard/manifest.hpp"

#include "hoard/error.hpp"
#include "hoard/fs.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hoard {

Manifest parse_manifest(const std::string &text) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error &e) {
    throw Error{ErrorKind::InvalidFormat, std::string("manifest is not valid JSON: ") + e.what()};
  }
  if (!doc.is_object()) {
    throw Error{ErrorKind::InvalidFormat, "manifest must be a JSON object of name -> [paths]"};
  }

  Manifest manifest;
  for (const auto &[name, paths] : doc.items()) {
    if (!paths.is_array()) {
      throw Error{ErrorKind::InvalidFormat, "manifest entry '" + name + "' is not an array"};
    }
    auto &out = manifest[name];
    for (const auto &p : paths) {
      if (!p.is_string()) {
        throw Error{ErrorKind::InvalidFormat,
                    "manifest entry '" + name + "' contains a non-string path"};
      }
      out.push_back(p.get<std::string>());
    }
  }
  return manifest;
}

Manifest load_manifest(const std::filesystem::path &file) {
  try {
    return parse_manifest(fs::read_text(file));
  } catch (const Error &e) {
    if (e.kind() == ErrorKind::InvalidFormat && e.path().empty())
      throw Error{e.kind(), e.message(), file};
    throw;
  }
}

std::string dump_manifest(const Manifest &manifest) {
  json doc = json::object();
  for (const auto &[name, paths] : manifest) {
    doc[name] = paths;
  }
  return doc.dump(2) + "\n";
}

void save_manifest(const std::filesystem::path &file, const Manifest &manifest) {
  fs::write_file_atomic(file, dump_manifest(manifest));
}

} // namespace hoard
