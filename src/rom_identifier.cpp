#include "rom_identifier.hpp"

#include <algorithm>
#include <future>

#include "catalog_store.hpp"
#include "log.hpp"
#include "utils.hpp"

std::vector<std::filesystem::path> collect_rom_files(const std::filesystem::path& dir,
                                                     bool recursive,
                                                     Logger* logger) {
  namespace fs = std::filesystem;
  std::vector<fs::path> files;
  std::error_code ec;
  if(!fs::is_directory(dir, ec)) {
    log_error(logger, "Directory not found: {}", dir.string());
    return files;
  }

  auto consider = [&](const fs::directory_entry& entry){
    std::error_code type_ec;
    if(entry.is_regular_file(type_ec) && is_rom_file(entry.path())) {
      files.push_back(entry.path());
    }
  };

  if(recursive) {
    for(auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
        !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      consider(*it);
    }
  } else {
    for(auto it = fs::directory_iterator(dir, ec);
        !ec && it != fs::directory_iterator(); it.increment(ec)) {
      consider(*it);
    }
  }
  if(ec) {
    log_error(logger, "Error while traversing {}: {}", dir.string(), ec.message());
  }

  std::sort(files.begin(), files.end());
  return files;
}

RomIdentifier::RomIdentifier(const CatalogStore& store, Logger* logger)
  : store_(store), logger_(logger) {}

IdentificationResult RomIdentifier::identify(const std::filesystem::path& path) const {
  IdentificationResult result;
  result.file_path = path;
  result.file_name = path.filename().string();

  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec)) {
    result.status = ResultStatus::Error;
    result.error = ErrorKind::Validation;
    result.message = "File not found: " + path.string();
    return result;
  }
  if(!is_rom_file(path)) {
    result.status = ResultStatus::Error;
    result.error = ErrorKind::Validation;
    result.message = "Not a ROM file: " + path.string();
    return result;
  }

  std::string error;
  auto fingerprint = compute_fingerprint(path, error);
  if(!fingerprint) {
    log_error(logger_, "Error calculating checksums for {}: {}", path.string(), error);
    result.status = ResultStatus::Error;
    result.error = ErrorKind::IO;
    result.message = "Unable to read " + path.string() + ": " + error;
    return result;
  }
  result.fingerprint = std::move(*fingerprint);

  auto match = store_.find_by_fingerprint(result.fingerprint);
  if(!match) {
    result.error = ErrorKind::NotFound;
    result.message = "No catalog match for " + result.file_name;
    log_debug(logger_, "{}: no match (md5 {})", path.string(), result.fingerprint.md5);
    return result;
  }

  result.identified = true;
  result.correct_name = match->entry->name;
  result.name_matches = (result.file_name == match->entry->name);
  result.message = "Identified as " + match->entry->name + " (" + to_string(match->type) + ")";
  log_debug(logger_, "{}: {} match in '{}' -> {}",
            path.string(), to_string(match->type), match->catalog, match->entry->name);
  result.match = std::move(match);
  return result;
}

std::vector<IdentificationResult> RomIdentifier::identify_directory(const std::filesystem::path& dir,
                                                                    bool recursive) const {
  auto files = collect_rom_files(dir, recursive, logger_);
  std::vector<IdentificationResult> results(files.size());
  if(files.empty()) return results;

  const std::size_t workers = std::min(jobs_, files.size());
  if(workers <= 1) {
    for(std::size_t i = 0; i < files.size(); ++i) {
      results[i] = identify(files[i]);
    }
    return results;
  }

  // Each worker owns a strided slice of the output, so no slot is shared.
  std::vector<std::future<void>> pending;
  pending.reserve(workers);
  for(std::size_t w = 0; w < workers; ++w) {
    pending.push_back(std::async(std::launch::async, [this, w, workers, &files, &results](){
      for(std::size_t i = w; i < files.size(); i += workers) {
        results[i] = identify(files[i]);
      }
    }));
  }
  for(auto& task : pending) task.get();
  log_debug(logger_, "Identified {} files with {} workers", files.size(), workers);
  return results;
}
