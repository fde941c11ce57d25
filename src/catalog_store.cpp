#include "catalog_store.hpp"

#include <algorithm>
#include <mutex>

#include "dat_parser.hpp"
#include "log.hpp"
#include "utils.hpp"

CatalogStore::CatalogStore(Logger* logger) : logger_(logger) {}

std::string CatalogStore::source_key(const std::filesystem::path& path) {
  std::error_code ec;
  auto normalized = std::filesystem::weakly_canonical(path, ec);
  if(ec) return path.lexically_normal().string();
  return normalized.string();
}

bool CatalogStore::is_loaded(const std::filesystem::path& path) const {
  std::shared_lock lock(m_);
  return loaded_sources_.count(source_key(path)) > 0;
}

bool CatalogStore::load_source(const std::filesystem::path& path) {
  std::string error;
  return load_source(path, error);
}

bool CatalogStore::load_source(const std::filesystem::path& path, std::string& error) {
  error.clear();
  const auto key = source_key(path);
  if(is_loaded(path)) {
    log_info(logger_, "DAT file {} already loaded", path.string());
    return true;
  }

  log_info(logger_, "Loading DAT file: {}", path.string());
  auto document = parse_dat_file(path, error);
  if(!document) {
    log_error(logger_, "Error loading DAT file {}: {}", path.string(), error);
    return false;
  }

  std::string catalog_name = document->header_name.empty()
    ? path.filename().string()
    : document->header_name;

  Catalog parsed(catalog_name);
  for(const auto& game : document->games) {
    for(const auto& rom : game.roms) {
      CatalogEntry entry;
      entry.name = rom.name;
      entry.description = game.description;
      entry.size = rom.size;
      entry.md5 = rom.md5;
      entry.crc32 = rom.crc;
      entry.sha1 = rom.sha1;
      parsed.add(std::move(entry));
    }
  }

  std::size_t hashed = 0;
  {
    std::unique_lock lock(m_);
    if(loaded_sources_.count(key)) {
      return true;
    }
    auto slot = catalog_slots_.find(catalog_name);
    Catalog* target = nullptr;
    if(slot == catalog_slots_.end()) {
      catalog_slots_.emplace(catalog_name, catalogs_.size());
      catalogs_.push_back(std::make_unique<Catalog>(std::move(parsed)));
      target = catalogs_.back().get();
    } else {
      target = catalogs_[slot->second].get();
      target->merge_from(parsed);
    }
    loaded_sources_.insert(key);
    hashed = target->unique_md5();
  }
  log_info(logger_, "Loaded {} ROMs from {} into '{}'", hashed, path.string(), catalog_name);
  return true;
}

std::size_t CatalogStore::load_all_from_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  if(!std::filesystem::is_directory(dir, ec)) {
    log_warn(logger_, "DAT directory not found: {}", dir.string());
    return 0;
  }

  std::vector<std::filesystem::path> sources;
  for(auto it = std::filesystem::directory_iterator(dir, ec);
      !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if(it->is_regular_file(ec) && is_dat_file(it->path())) {
      sources.push_back(it->path());
    }
  }
  if(ec) {
    log_error(logger_, "Error while listing {}: {}", dir.string(), ec.message());
  }
  std::sort(sources.begin(), sources.end());

  std::size_t count = 0;
  for(const auto& source : sources) {
    if(load_source(source)) ++count;
  }
  return count;
}

std::optional<CatalogMatch> CatalogStore::find_in_catalogs(MatchType type, const std::string& key) const {
  if(key.empty()) return std::nullopt;
  for(const auto& catalog : catalogs_) {
    if(auto entry = catalog->find(type, key)) {
      CatalogMatch match;
      match.entry = std::move(entry);
      match.catalog = catalog->name();
      match.type = type;
      match.confidence = confidence_for(type);
      return match;
    }
  }
  return std::nullopt;
}

std::optional<CatalogMatch> CatalogStore::find_by_fingerprint(const Fingerprint& fingerprint) const {
  std::shared_lock lock(m_);
  if(auto match = find_in_catalogs(MatchType::Md5, fingerprint.md5)) return match;
  if(auto match = find_in_catalogs(MatchType::Sha1, fingerprint.sha1)) return match;
  if(auto match = find_in_catalogs(MatchType::Crc32, fingerprint.crc32)) return match;
  return std::nullopt;
}

std::vector<CatalogMatch> CatalogStore::find_by_name(const std::string& query) const {
  std::vector<CatalogMatch> results;
  const auto needle = to_lower_copy(query);
  if(needle.empty()) return results;

  std::shared_lock lock(m_);
  for(const auto& catalog : catalogs_) {
    for(const auto& item : catalog->names()) {
      const auto candidate = to_lower_copy(item.first);
      if(candidate.find(needle) == std::string::npos) continue;
      CatalogMatch match;
      match.entry = item.second;
      match.catalog = catalog->name();
      match.type = MatchType::Name;
      double similarity = static_cast<double>(needle.size()) /
                          static_cast<double>(std::max(needle.size(), candidate.size()));
      match.confidence = std::min(kNameConfidenceCap, similarity);
      results.push_back(std::move(match));
    }
  }
  std::stable_sort(results.begin(), results.end(),
                   [](const CatalogMatch& a, const CatalogMatch& b){ return a.confidence > b.confidence; });
  return results;
}

CatalogStats CatalogStore::export_stats() const {
  std::shared_lock lock(m_);
  CatalogStats stats;
  stats.catalog_count = catalogs_.size();
  for(const auto& catalog : catalogs_) {
    CatalogStats::PerCatalog per;
    per.name = catalog->name();
    per.entries = catalog->entry_count();
    per.unique_md5 = catalog->unique_md5();
    per.unique_crc32 = catalog->unique_crc32();
    per.unique_sha1 = catalog->unique_sha1();
    stats.total_entries += per.entries;
    stats.total_md5 += per.unique_md5;
    stats.per_catalog.push_back(std::move(per));
  }
  return stats;
}

std::vector<std::string> CatalogStore::catalog_names() const {
  std::shared_lock lock(m_);
  std::vector<std::string> out;
  out.reserve(catalogs_.size());
  for(const auto& catalog : catalogs_) out.push_back(catalog->name());
  return out;
}

std::size_t CatalogStore::catalog_count() const {
  std::shared_lock lock(m_);
  return catalogs_.size();
}
