#include "catalog.hpp"

#include "utils.hpp"

const char* to_string(MatchType type) {
  switch(type) {
    case MatchType::Md5: return "md5";
    case MatchType::Sha1: return "sha1";
    case MatchType::Crc32: return "crc32";
    case MatchType::Name: return "name";
  }
  return "md5";
}

std::optional<MatchType> match_type_from_string(const std::string& value) {
  auto lowered = to_lower_copy(value);
  if(lowered == "md5") return MatchType::Md5;
  if(lowered == "sha1") return MatchType::Sha1;
  if(lowered == "crc32" || lowered == "crc") return MatchType::Crc32;
  if(lowered == "name") return MatchType::Name;
  return std::nullopt;
}

double confidence_for(MatchType type) {
  switch(type) {
    case MatchType::Md5: return kMd5Confidence;
    case MatchType::Sha1: return kSha1Confidence;
    case MatchType::Crc32: return kCrc32Confidence;
    case MatchType::Name: return kNameConfidenceCap;
  }
  return 0.0;
}

Catalog::Catalog(std::string name) : name_(std::move(name)) {}

void Catalog::add(CatalogEntry entry) {
  entry.md5 = to_lower_copy(std::move(entry.md5));
  entry.sha1 = to_lower_copy(std::move(entry.sha1));
  entry.crc32 = to_lower_copy(std::move(entry.crc32));
  insert(std::make_shared<const CatalogEntry>(std::move(entry)));
}

void Catalog::merge_from(const Catalog& other) {
  for(const auto& item : other.names_) {
    insert(item.second);
  }
}

void Catalog::insert(const CatalogEntryPtr& entry) {
  // Later records replace earlier ones under the same key.
  if(!entry->md5.empty()) by_md5_[entry->md5] = entry;
  if(!entry->crc32.empty()) by_crc32_[entry->crc32] = entry;
  if(!entry->sha1.empty()) by_sha1_[entry->sha1] = entry;

  auto slot = name_slots_.find(entry->name);
  if(slot != name_slots_.end()) {
    names_[slot->second].second = entry;
  } else {
    name_slots_.emplace(entry->name, names_.size());
    names_.emplace_back(entry->name, entry);
  }
}

const std::unordered_map<std::string, CatalogEntryPtr>* Catalog::index_for(MatchType type) const {
  switch(type) {
    case MatchType::Md5: return &by_md5_;
    case MatchType::Sha1: return &by_sha1_;
    case MatchType::Crc32: return &by_crc32_;
    case MatchType::Name: return nullptr;
  }
  return nullptr;
}

CatalogEntryPtr Catalog::find(MatchType type, const std::string& key) const {
  if(key.empty()) return nullptr;
  if(type == MatchType::Name) {
    auto slot = name_slots_.find(key);
    return slot == name_slots_.end() ? nullptr : names_[slot->second].second;
  }
  const auto* index = index_for(type);
  auto it = index->find(to_lower_copy(key));
  return it == index->end() ? nullptr : it->second;
}
