#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

enum class MatchType { Md5, Sha1, Crc32, Name };

const char* to_string(MatchType type);
std::optional<MatchType> match_type_from_string(const std::string& value);

// Fixed confidence per hash type; name matches are capped below all of them.
inline constexpr double kMd5Confidence = 1.0;
inline constexpr double kSha1Confidence = 0.99;
inline constexpr double kCrc32Confidence = 0.95;
inline constexpr double kNameConfidenceCap = 0.8;

double confidence_for(MatchType type);

// One rom record of a reference source. Hashes are lower-case hex and may be
// empty when the source omitted them; size is kept as declared.
struct CatalogEntry {
  std::string name;
  std::string description;
  std::string size = "0";
  std::string md5;
  std::string crc32;
  std::string sha1;
};

using CatalogEntryPtr = std::shared_ptr<const CatalogEntry>;

struct CatalogMatch {
  CatalogEntryPtr entry;
  std::string catalog;
  MatchType type = MatchType::Md5;
  double confidence = 0.0;
};

// A single loaded reference database with hash and name indexes over the
// same entries. Every entry is reachable through the name index.
class Catalog {
public:
  explicit Catalog(std::string name);

  const std::string& name() const { return name_; }

  void add(CatalogEntry entry);
  void merge_from(const Catalog& other);

  CatalogEntryPtr find(MatchType type, const std::string& key) const;

  // Entries in name-index insertion order.
  const std::vector<std::pair<std::string, CatalogEntryPtr>>& names() const { return names_; }

  std::size_t entry_count() const { return names_.size(); }
  std::size_t unique_md5() const { return by_md5_.size(); }
  std::size_t unique_sha1() const { return by_sha1_.size(); }
  std::size_t unique_crc32() const { return by_crc32_.size(); }

private:
  void insert(const CatalogEntryPtr& entry);
  const std::unordered_map<std::string, CatalogEntryPtr>* index_for(MatchType type) const;

  std::string name_;
  std::unordered_map<std::string, CatalogEntryPtr> by_md5_;
  std::unordered_map<std::string, CatalogEntryPtr> by_sha1_;
  std::unordered_map<std::string, CatalogEntryPtr> by_crc32_;
  std::unordered_map<std::string, std::size_t> name_slots_;
  std::vector<std::pair<std::string, CatalogEntryPtr>> names_;
};
