#include "rom_renamer.hpp"

#include "log.hpp"
#include "utils.hpp"

namespace {

bool is_within(const std::filesystem::path& candidate, const std::filesystem::path& root) {
  if(root.empty()) return false;
  auto rel = candidate.lexically_relative(root);
  return !rel.empty() && *rel.begin() != "..";
}

// A bare file name: no directory part, not absolute, not a dot entry.
bool is_plain_file_name(const std::string& name) {
  const std::filesystem::path path(name);
  if(name.empty() || path.is_absolute() || path.has_parent_path()) return false;
  return name != "." && name != "..";
}

} // namespace

RomRenamer::RomRenamer(const RomIdentifier& identifier, Logger* logger)
  : identifier_(identifier), logger_(logger) {}

std::optional<std::string> RomRenamer::derive_name(const CatalogEntry& entry,
                                                   const std::filesystem::path& original) {
  std::string name;
  if(!entry.name.empty()) {
    name = entry.name;
  } else if(!entry.description.empty()) {
    name = entry.description + original.extension().string();
  }
  if(!is_plain_file_name(name)) return std::nullopt;
  return name;
}

RenameResult RomRenamer::fail(RenameResult result, ErrorKind kind, std::string message) const {
  result.status = ResultStatus::Error;
  result.error = kind;
  result.renamed = false;
  result.message = std::move(message);
  log_debug(logger_, "{}", result.message);
  return result;
}

RenameResult RomRenamer::rename(const std::filesystem::path& path, bool dry_run) {
  return rename_identified(identifier_.identify(path), dry_run);
}

RenameResult RomRenamer::rename_identified(const IdentificationResult& identification, bool dry_run) {
  namespace fs = std::filesystem;
  RenameResult result;
  result.file_path = identification.file_path;
  result.identification = identification;
  result.dry_run = dry_run;

  if(!identification.identified || !identification.matched_entry()) {
    auto kind = identification.status == ResultStatus::Error ? identification.error : ErrorKind::NotFound;
    return fail(std::move(result), kind, "Could not identify ROM: " + identification.file_path.string());
  }

  auto new_name = derive_name(*identification.matched_entry(), identification.file_path);
  if(!new_name) {
    return fail(std::move(result), ErrorKind::Validation,
                "Could not generate new name for ROM: " + identification.file_path.string());
  }
  result.new_name = *new_name;

  const auto current_name = identification.file_path.filename().string();
  if(current_name == *new_name) {
    result.name_matches = true;
    result.message = "ROM already has correct name: " + identification.file_path.string();
    return result;
  }

  const fs::path new_path = identification.file_path.parent_path() / *new_name;
  result.new_path = new_path;

  if(dry_run) {
    result.renamed = true;
    result.message = "Would rename " + identification.file_path.string() + " to " + new_path.string();
    log_info(logger_, "{}", result.message);
    return result;
  }

  std::lock_guard<std::mutex> lock(rename_mutex_);
  std::error_code ec;
  if(fs::exists(new_path, ec)) {
    // A case-only rename on a case-insensitive filesystem sees its own source.
    // Any other existing destination, hard links to the source included, collides.
    std::error_code eq_ec;
    const bool case_only = to_lower_copy(current_name) == to_lower_copy(*new_name);
    if(!case_only || !fs::equivalent(identification.file_path, new_path, eq_ec)) {
      return fail(std::move(result), ErrorKind::Collision,
                  "Destination file already exists: " + new_path.string());
    }
  }

  fs::rename(identification.file_path, new_path, ec);
  if(ec) {
    log_error(logger_, "Error renaming {} to {}: {}", identification.file_path.string(), new_path.string(), ec.message());
    return fail(std::move(result), ErrorKind::IO,
                "Failed to rename " + identification.file_path.string() + ": " + ec.message());
  }

  result.renamed = true;
  result.message = "Renamed " + identification.file_path.string() + " to " + new_path.string();
  log_info(logger_, "{}", result.message);
  return result;
}

std::vector<RenameResult> RomRenamer::rename_directory(const std::filesystem::path& dir,
                                                       bool recursive,
                                                       bool dry_run) {
  auto identifications = identifier_.identify_directory(dir, recursive);
  std::vector<RenameResult> results;
  results.reserve(identifications.size());
  for(const auto& identification : identifications) {
    results.push_back(rename_identified(identification, dry_run));
  }
  return results;
}

std::filesystem::path RomRenamer::default_backup_dir(const std::filesystem::path& dir) {
  auto normalized = dir.lexically_normal();
  if(!normalized.has_filename() && normalized.has_parent_path()) {
    normalized = normalized.parent_path();
  }
  return std::filesystem::path(normalized.string() + "_backup");
}

bool RomRenamer::backup(const std::filesystem::path& dir, const std::filesystem::path& backup_dir) {
  namespace fs = std::filesystem;
  const fs::path root = backup_dir.empty() ? default_backup_dir(dir) : backup_dir;

  std::error_code ec;
  if(!fs::is_directory(dir, ec)) {
    log_error(logger_, "Error backing up ROMs: directory not found: {}", dir.string());
    return false;
  }
  fs::create_directories(root, ec);
  if(ec) {
    log_error(logger_, "Error backing up ROMs: cannot create {}: {}", root.string(), ec.message());
    return false;
  }

  // Listed up front so a backup root nested inside dir is never walked.
  const auto sources = collect_rom_files(dir, true, logger_);
  const auto canonical_root = fs::weakly_canonical(root, ec);
  for(const auto& source : sources) {
    if(is_within(fs::weakly_canonical(source, ec), canonical_root)) continue;

    const auto relative = source.lexically_relative(dir);
    const auto destination = root / relative;
    fs::create_directories(destination.parent_path(), ec);
    if(ec) {
      log_error(logger_, "Error backing up ROMs: cannot create {}: {}", destination.parent_path().string(), ec.message());
      return false;
    }
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if(ec) {
      log_error(logger_, "Error backing up ROMs: copy {} failed: {}", source.string(), ec.message());
      return false;
    }
    auto source_status = fs::status(source, ec);
    if(!ec) fs::permissions(destination, source_status.permissions(), ec);
    if(!ec) {
      auto modified = fs::last_write_time(source, ec);
      if(!ec) fs::last_write_time(destination, modified, ec);
    }
    if(ec) {
      log_warn(logger_, "Copied {} without its metadata: {}", source.string(), ec.message());
    }
  }

  log_info(logger_, "Backed up {} ROMs from {} to {}", sources.size(), dir.string(), root.string());
  return true;
}
