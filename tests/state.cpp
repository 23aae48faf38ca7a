#include "hoard/error.hpp"
#include "hoard/hash.hpp"
#include "hoard/fs.hpp"
#include "hoard/manifest.hpp"
#include "hoard/state.hpp"

#include <filesystem>
#include <functional>
#include <set>
#include <stdexcept>
#include <unordered_set>
#include <vector>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static hoard::ErrorKind kind_of(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const hoard::Error &e) {
    return e.kind();
  }
  throw std::runtime_error("expected an error");
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("hoard_state_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    const std::unordered_set<std::string> known{"item-name-1", "item-name-2"};

    // 1) Well-formed manifest
    write_file(root / "ok.json", R"({
      "item-name-1": ["path1/item-name-1", "path2/item-name-1"],
      "item-name-2": ["path1/item-name-2", "path3/item-name-2"],
      "item-name-9": ["path9/item-name-9"]
    })");
    const auto st = hoard::State::from_manifest(root / "ok.json", known);
    if (st.paths.size() != 2 || st.paths.at("item-name-1").size() != 2 ||
        !st.paths.at("item-name-2").contains("path3/item-name-2")) {
      std::cerr << "manifest paths not loaded\n";
      return 1;
    }
    if (st.unknown != std::vector<std::string>{"item-name-9"}) {
      std::cerr << "unknown name not reported\n";
      return 1;
    }

    // 2) Two names claiming one path
    write_file(root / "dupe.json", R"({
      "item-name-1": ["path1/item-name-1"],
      "item-name-2": ["path1/item-name-1", "path2/item-name-2"]
    })");
    try {
      (void)hoard::State::from_manifest(root / "dupe.json", known);
      std::cerr << "ambiguous manifest accepted\n";
      return 1;
    } catch (const hoard::Error &e) {
      const std::string msg = e.what();
      if (e.kind() != hoard::ErrorKind::AmbiguousManifest ||
          msg.find("path1/item-name-1") == std::string::npos ||
          msg.find("item-name-1") == std::string::npos ||
          msg.find("item-name-2") == std::string::npos) {
        std::cerr << "bad ambiguity report: " << msg << "\n";
        return 1;
      }
    }

    // Same path spelled differently still collides
    if (kind_of([&] {
          (void)hoard::State::from_manifest(
              hoard::Manifest{{"item-name-1", {"a/./x"}}, {"item-name-2", {"a/x"}}}, known);
        }) != hoard::ErrorKind::AmbiguousManifest) {
      std::cerr << "normalized duplicate not detected\n";
      return 1;
    }

    // A dropped name cannot cause ambiguity
    (void)hoard::State::from_manifest(
        hoard::Manifest{{"item-name-1", {"a/x"}}, {"stranger", {"a/x"}}}, known);

    // 3) Malformed input
    write_file(root / "bad.json", "[1, 2");
    if (kind_of([&] { (void)hoard::State::from_manifest(root / "bad.json", known); }) !=
        hoard::ErrorKind::InvalidFormat) {
      std::cerr << "malformed json accepted\n";
      return 1;
    }
    if (kind_of([&] { (void)hoard::parse_manifest(R"({"a": "not-a-list"})"); }) !=
        hoard::ErrorKind::InvalidFormat) {
      std::cerr << "non-array entry accepted\n";
      return 1;
    }
    if (kind_of([&] {
          (void)hoard::State::from_manifest(hoard::Manifest{{"item-name-1", {"../escape"}}}, known);
        }) != hoard::ErrorKind::PathOutsideRepository) {
      std::cerr << "escaping path accepted\n";
      return 1;
    }
    if (kind_of([&] {
          (void)hoard::State::from_manifest(hoard::Manifest{{"item-name-1", {"/etc/passwd"}}},
                                            known);
        }) != hoard::ErrorKind::PathOutsideRepository) {
      std::cerr << "absolute path accepted\n";
      return 1;
    }

    // 4) From the filesystem
    const fs::path tree = root / "tree";
    write_file(tree / "path1/movie", "frames");
    fs::create_directories(tree / "path2");
    fs::create_hard_link(tree / "path1/movie", tree / "path2/movie");
    write_file(tree / "loose.txt", "untracked");
    write_file(tree / ".hoard/objects/by-hash/aa/bb", "hidden");

    const hoard::NameIndex index{{hoard::NamedObject{
        .name = "movie",
        .path = tree / "path1/movie",
        .hash = hoard::ContentHash::compute(tree / "path1/movie"),
        .ino = hoard::fs::inode_of(tree / "path1/movie")}}};
    const auto actual = hoard::State::from_filesystem(tree, index);
    if (actual.paths.size() != 1 ||
        actual.paths.at("movie") != std::set<std::string>{"path1/movie", "path2/movie"}) {
      std::cerr << "tracked paths wrong\n";
      return 1;
    }
    if (actual.extra != std::set<std::string>{"loose.txt"}) {
      std::cerr << "extra paths wrong (is .hoard excluded?)\n";
      return 1;
    }

    // Empty index: everything is extra
    const auto bare = hoard::State::from_filesystem(tree, hoard::NameIndex{});
    if (!bare.paths.empty() || bare.extra.size() != 3) {
      std::cerr << "expected 3 extra paths, got " << bare.extra.size() << "\n";
      return 1;
    }

    // Round trip through a manifest
    const auto m = actual.to_manifest();
    if (m.at("movie") != std::vector<std::string>{"path1/movie", "path2/movie"}) {
      std::cerr << "to_manifest wrong\n";
      return 1;
    }

    std::cout << "state OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
