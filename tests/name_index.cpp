#include "hoard/error.hpp"
#include "hoard/fs.hpp"
#include "hoard/name_index.hpp"
#include "hoard/object_store.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("hoard_names_" + std::to_string(std::random_device{}()));
  const fs::path by_hash = root / "objects/by-hash";
  const fs::path by_name = root / "objects/by-name";
  fs::create_directories(by_name);

  try {
    write_file(root / "movie.mkv", "frames");
    write_file(root / "book.epub", "pages");
    hoard::ObjectStore store{by_hash};
    const auto movie = store.ingest(root / "movie.mkv");
    const auto book = store.ingest(root / "book.epub");

    hoard::NameIndex::link_name(by_name, "movie", store.path_for(movie));
    hoard::NameIndex::link_name(by_name, "book", store.path_for(book));
    write_file(by_name / "README", "not a reference"); // skipped

    if (fs::read_symlink(by_name / "movie").is_absolute()) {
      std::cerr << "reference should be relative\n";
      return 1;
    }

    const auto index = hoard::NameIndex::load(by_name);
    if (index.objects().size() != 2) {
      std::cerr << "expected 2 objects, got " << index.objects().size() << "\n";
      return 1;
    }
    const auto names = index.by_name();
    const auto hashes = index.by_hash();
    const auto inos = index.by_ino();
    if (!names.contains("movie") || names.at("movie")->hash != movie) {
      std::cerr << "by_name lookup failed\n";
      return 1;
    }
    if (!hashes.contains(book) || hashes.at(book)->name != "book") {
      std::cerr << "by_hash lookup failed\n";
      return 1;
    }
    const auto ino = hoard::fs::inode_of(root / "movie.mkv");
    if (!inos.contains(ino) || inos.at(ino)->name != "movie") {
      std::cerr << "by_ino lookup failed\n";
      return 1;
    }
    if (names.at("book")->path != fs::canonical(store.path_for(book))) {
      std::cerr << "reference not resolved to stored object\n";
      return 1;
    }

    // Invalid names
    for (const char *bad : {"", ".", "..", "a/b"}) {
      bool threw = false;
      try {
        hoard::NameIndex::validate_name(bad);
      } catch (const hoard::Error &e) {
        threw = e.kind() == hoard::ErrorKind::InvalidFormat;
      }
      if (!threw) {
        std::cerr << "accepted bad name '" << bad << "'\n";
        return 1;
      }
    }

    // Broken reference
    fs::create_symlink("../by-hash/00/nothing-here", by_name / "ghost");
    bool threw = false;
    try {
      (void)hoard::NameIndex::load(by_name);
    } catch (const hoard::Error &e) {
      threw = e.kind() == hoard::ErrorKind::BrokenReference && e.path() == by_name / "ghost";
    }
    if (!threw) {
      std::cerr << "broken reference not reported\n";
      return 1;
    }

    // Missing directory -> empty index
    if (!hoard::NameIndex::load(root / "nope").objects().empty()) {
      std::cerr << "missing directory should give an empty index\n";
      return 1;
    }

    std::cout << "name index OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
