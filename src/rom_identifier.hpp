#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "checksum.hpp"
#include "result_status.hpp"

class CatalogStore;
class Logger;

struct IdentificationResult {
  std::filesystem::path file_path;
  std::string file_name;
  Fingerprint fingerprint;
  bool identified = false;
  std::optional<CatalogMatch> match;
  std::optional<std::string> correct_name;
  // Byte-exact comparison of the current basename with correct_name.
  std::optional<bool> name_matches;

  ResultStatus status = ResultStatus::Success;
  ErrorKind error = ErrorKind::None;
  std::string message;

  const CatalogEntry* matched_entry() const { return match ? match->entry.get() : nullptr; }
};

// Lists candidate ROM files under dir, sorted by path. Unreadable
// directories are logged and skipped.
std::vector<std::filesystem::path> collect_rom_files(const std::filesystem::path& dir,
                                                     bool recursive,
                                                     Logger* logger = nullptr);

class RomIdentifier {
public:
  explicit RomIdentifier(const CatalogStore& store, Logger* logger = nullptr);

  // Resolution uses content hashes only; names never take part.
  IdentificationResult identify(const std::filesystem::path& path) const;

  std::vector<IdentificationResult> identify_directory(const std::filesystem::path& dir,
                                                       bool recursive) const;

  // Number of workers used by identify_directory (at least one).
  void set_jobs(std::size_t jobs) { jobs_ = jobs == 0 ? 1 : jobs; }
  std::size_t jobs() const { return jobs_; }

private:
  const CatalogStore& store_;
  Logger* logger_;
  std::size_t jobs_ = 1;
};
