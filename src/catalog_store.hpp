#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "catalog.hpp"
#include "checksum.hpp"

class Logger;

struct CatalogStats {
  struct PerCatalog {
    std::string name;
    std::size_t entries = 0;
    std::size_t unique_md5 = 0;
    std::size_t unique_crc32 = 0;
    std::size_t unique_sha1 = 0;
  };

  std::size_t catalog_count = 0;
  std::size_t total_entries = 0;
  std::size_t total_md5 = 0; // sum of unique_md5
  std::vector<PerCatalog> per_catalog; // load order
};

// Owns every loaded reference catalog. Loads take the lock exclusively and
// lookups share it, so lookups may run from several workers at once.
//
// Catalogs are scanned in load order; on a cross-catalog tie the earliest
// loaded catalog wins.
class CatalogStore {
public:
  explicit CatalogStore(Logger* logger = nullptr);

  // Parses the whole source before touching the store; a failing source
  // leaves existing catalogs unchanged and is not marked as loaded.
  // Loading an already loaded source is a successful no-op.
  bool load_source(const std::filesystem::path& path);
  bool load_source(const std::filesystem::path& path, std::string& error);

  // Loads every .dat/.xml directly inside dir in filename order; returns
  // the number of sources that loaded.
  std::size_t load_all_from_directory(const std::filesystem::path& dir);

  std::optional<CatalogMatch> find_by_fingerprint(const Fingerprint& fingerprint) const;
  std::vector<CatalogMatch> find_by_name(const std::string& query) const;

  CatalogStats export_stats() const;
  std::vector<std::string> catalog_names() const;
  std::size_t catalog_count() const;
  bool is_loaded(const std::filesystem::path& path) const;

private:
  static std::string source_key(const std::filesystem::path& path);
  std::optional<CatalogMatch> find_in_catalogs(MatchType type, const std::string& key) const;

  Logger* logger_;
  mutable std::shared_mutex m_;
  std::vector<std::unique_ptr<Catalog>> catalogs_;
  std::unordered_map<std::string, std::size_t> catalog_slots_;
  std::unordered_set<std::string> loaded_sources_;
};
