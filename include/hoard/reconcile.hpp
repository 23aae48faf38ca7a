#pragma once
#include "hoard/name_index.hpp"
#include "hoard/state.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hoard {

enum class ChangeKind : std::uint8_t { Ignore, Create, Delete, Modify };

std::string_view to_string(ChangeKind kind);

struct Change {
  std::string path;                  // repo-relative
  ChangeKind kind;
  std::optional<NamedObject> from;   // Delete, Modify: what the path holds now
  std::optional<NamedObject> to;     // Create, Modify: what it should hold

  bool operator==(const Change &) const = default;
};

// Diff desired against actual. Only names present in both states (and known to
// the index) are compared; paths holding unknown content become Ignore and win
// over anything else at that path. A Create and a Delete of the same object at
// one path cancel out; of different objects they become Modify(from, to).
// Result is sorted by path.
std::vector<Change> reconcile(const State &desired, const State &actual, const NameIndex &index);

class ChangeExecutor {
public:
  explicit ChangeExecutor(std::filesystem::path root) : root_(std::move(root)) {}

  void execute(const Change &change) const;

  // In order; the first failure propagates and earlier changes stay applied.
  void execute_all(const std::vector<Change> &changes) const;

private:
  std::filesystem::path root_;
};

} // namespace hoard
