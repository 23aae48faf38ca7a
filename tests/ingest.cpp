#include "hoard/error.hpp"
#include "hoard/fs.hpp"
#include "hoard/manifest.hpp"
#include "hoard/repo.hpp"

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

static std::size_t count_files(const fs::path &root) {
  std::size_t n = 0;
  for (const auto &e : fs::recursive_directory_iterator(root))
    if (e.is_regular_file())
      ++n;
  return n;
}

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("hoard_ingest_" + std::to_string(std::random_device{}()));
  const fs::path root = base / "r";
  fs::create_directories(root);

  try {
    const auto repo = hoard::Repository::init(root);

    // 1) Fresh repository, one 10-byte file
    write_file(root / "inbox/ten.bin", "0123456789");
    const auto reports = repo.ingest_paths({root / "inbox/ten.bin"});
    if (reports.size() != 1 || !reports[0].new_object || reports[0].relinked ||
        reports[0].name != "ten.bin") {
      std::cerr << "unexpected report for first ingest\n";
      return 1;
    }
    const auto &hex = reports[0].hash.str();
    const fs::path stored = repo.by_hash_dir() / hex.substr(0, 2) / hex.substr(2);
    if (hex.size() != 64 || !fs::exists(stored) || count_files(repo.by_hash_dir()) != 1) {
      std::cerr << "object not stored at " << stored << "\n";
      return 1;
    }
    if (hoard::fs::inode_of(stored) != hoard::fs::inode_of(root / "inbox/ten.bin")) {
      std::cerr << "original does not share the stored inode\n";
      return 1;
    }
    const auto m = repo.manifest();
    if (m.at("ten.bin") != std::vector<std::string>{"inbox/ten.bin"}) {
      std::cerr << "manifest not updated\n";
      return 1;
    }
    const auto named = repo.lookup("ten.bin");
    if (!named || named->hash != reports[0].hash) {
      std::cerr << "ingested object not queryable by name\n";
      return 1;
    }

    // 2) Idempotence
    const auto again = repo.ingest_paths({root / "inbox/ten.bin"});
    if (again.size() != 1 || again[0].new_object || again[0].relinked ||
        again[0].hash != reports[0].hash || count_files(repo.by_hash_dir()) != 1 ||
        repo.objects().size() != 1) {
      std::cerr << "second ingest was not a no-op\n";
      return 1;
    }

    // 3) Directory with a byte-identical copy and a name clash
    write_file(root / "shelf/copy.bin", "0123456789");
    write_file(root / "shelf/other/ten.bin", "different content");
    const auto dir_reports = repo.ingest_paths({root / "shelf"});
    if (dir_reports.size() != 2) {
      std::cerr << "expected 2 files from directory, got " << dir_reports.size() << "\n";
      return 1;
    }
    const auto &copy = dir_reports[0];
    if (copy.new_object || !copy.relinked || copy.name != "ten.bin" ||
        hoard::fs::inode_of(root / "shelf/copy.bin") != hoard::fs::inode_of(stored)) {
      std::cerr << "identical copy was not deduplicated\n";
      return 1;
    }
    if (dir_reports[1].name != "ten.bin~2" || !dir_reports[1].new_object) {
      std::cerr << "name clash not disambiguated: " << dir_reports[1].name << "\n";
      return 1;
    }
    if (count_files(repo.by_hash_dir()) != 2 || repo.objects().size() != 2) {
      std::cerr << "expected two stored objects\n";
      return 1;
    }
    if (repo.manifest().at("ten.bin") !=
        std::vector<std::string>{"inbox/ten.bin", "shelf/copy.bin"}) {
      std::cerr << "copy not recorded under its object\n";
      return 1;
    }

    // 4) Paths outside the repository are rejected before anything changes
    write_file(base / "outside.txt", "nope");
    write_file(root / "late.txt", "late");
    bool threw = false;
    try {
      (void)repo.ingest_paths({root / "late.txt", base / "outside.txt"});
    } catch (const hoard::Error &e) {
      threw = e.kind() == hoard::ErrorKind::PathOutsideRepository;
    }
    if (!threw || repo.lookup("late.txt")) {
      std::cerr << "outside path accepted or partial ingest happened\n";
      return 1;
    }

    threw = false;
    try {
      (void)repo.ingest_paths({repo.manifest_file()});
    } catch (const hoard::Error &e) {
      threw = e.kind() == hoard::ErrorKind::PathOutsideRepository;
    }
    if (!threw) {
      std::cerr << "hoard's own files accepted\n";
      return 1;
    }

    std::cout << "ingest OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(base);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
