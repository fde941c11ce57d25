#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rom_identifier.hpp"

class Logger;

struct RenameResult {
  std::filesystem::path file_path;
  std::optional<std::filesystem::path> new_path;
  std::optional<std::string> new_name;
  // In dry-run mode this reports whether the file would be renamed;
  // otherwise whether it actually was.
  bool renamed = false;
  IdentificationResult identification;
  bool dry_run = false;
  std::optional<bool> name_matches;

  ResultStatus status = ResultStatus::Success;
  ErrorKind error = ErrorKind::None;
  std::string message;
};

class RomRenamer {
public:
  explicit RomRenamer(const RomIdentifier& identifier, Logger* logger = nullptr);

  // Catalog name when present, otherwise description plus the original
  // file's extension; nullopt when neither exists or the result is not a
  // bare file name in the ROM's own directory.
  static std::optional<std::string> derive_name(const CatalogEntry& entry,
                                                const std::filesystem::path& original);

  RenameResult rename(const std::filesystem::path& path, bool dry_run);
  RenameResult rename_identified(const IdentificationResult& identification, bool dry_run);

  std::vector<RenameResult> rename_directory(const std::filesystem::path& dir,
                                             bool recursive,
                                             bool dry_run);

  // Copies every ROM file under dir into a mirrored tree below backup_dir
  // (default "<dir>_backup"). Files already copied stay in place on failure.
  bool backup(const std::filesystem::path& dir,
              const std::filesystem::path& backup_dir = {});

  static std::filesystem::path default_backup_dir(const std::filesystem::path& dir);

private:
  RenameResult fail(RenameResult result, ErrorKind kind, std::string message) const;

  const RomIdentifier& identifier_;
  Logger* logger_;
  // Serializes the destination check and the move.
  std::mutex rename_mutex_;
};
