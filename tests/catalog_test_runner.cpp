#include "catalog_store.hpp"
#include "checksum.hpp"
#include "dat_parser.hpp"
#include "reports.hpp"
#include "utils.hpp"
#include "test_runner_utils.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace {

using romid::test::DatBuilder;
using romid::test::TempWorkspace;
using romid::test::TestCase;
using romid::test::TestContext;
using romid::test::write_file;

std::shared_ptr<Logger> captured_logger(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("catalog-test");
  ctx.logs.attach(logger);
  return logger;
}

bool test_known_digests(TestContext& ctx) {
  TempWorkspace ws("digests");
  write_file(ws / "hello.bin", "hello world");
  write_file(ws / "empty.bin", "");
  write_file(ws / "abc.bin", "abc");

  auto hello = romid::test::fingerprint_of(ws / "hello.bin");
  ctx.check(hello.md5 == "5eb63bbbe01eeed093cb22bb8f5acdc3", "hello md5 " + hello.md5);
  ctx.check(hello.sha1 == "2aae6c35c94fcfb415dbe95f408b9ce91ee846ed", "hello sha1 " + hello.sha1);
  ctx.check(hello.crc32 == "0d4a1185", "hello crc32 " + hello.crc32);
  ctx.check(hello.size == 11, "hello size");

  auto empty = romid::test::fingerprint_of(ws / "empty.bin");
  ctx.check(empty.md5 == "d41d8cd98f00b204e9800998ecf8427e", "empty md5 " + empty.md5);
  ctx.check(empty.sha1 == "da39a3ee5e6b4b0d3255bfef95601890afd80709", "empty sha1 " + empty.sha1);
  ctx.check(empty.crc32 == "00000000", "empty crc32 " + empty.crc32);
  ctx.check(empty.size == 0, "empty size");
  ctx.check(!empty.empty(), "a zero-byte file still has digests");

  auto abc = romid::test::fingerprint_of(ws / "abc.bin");
  ctx.check(abc.md5 == "900150983cd24fb0d6963f7d28e17f72", "abc md5 " + abc.md5);
  ctx.check(abc.sha1 == "a9993e364706816aba3e25717850c26c9cd0d89d", "abc sha1 " + abc.sha1);
  ctx.check(abc.crc32 == "352441c2", "abc crc32 " + abc.crc32);
  return true;
}

bool test_fingerprint_streams_large_files(TestContext& ctx) {
  TempWorkspace ws("large");
  // Spans several read blocks and ends mid-block.
  std::string content;
  content.reserve(200000);
  for(std::size_t i = 0; i < 200000; ++i) {
    content.push_back(static_cast<char>(i * 31 % 251));
  }
  write_file(ws / "a.bin", content);
  write_file(ws / "b.bin", content);

  auto logger = captured_logger(ctx);
  auto first = fingerprint_file(ws / "a.bin", logger.get());
  auto second = fingerprint_file(ws / "b.bin", logger.get());
  auto again = fingerprint_file(ws / "a.bin", logger.get());
  ctx.check(first.size == content.size(), "size counts every byte");
  ctx.check(first == second, "same bytes give the same fingerprint");
  ctx.check(first == again, "fingerprinting is deterministic");
  ctx.check(first.md5.size() == 32 && first.sha1.size() == 40 && first.crc32.size() == 8,
            "digest widths");
  return true;
}

bool test_unreadable_file_yields_empty_fingerprint(TestContext& ctx) {
  TempWorkspace ws("unreadable");
  auto logger = captured_logger(ctx);

  std::string error;
  ctx.check(!compute_fingerprint(ws / "missing.nes", error), "missing file has no fingerprint");
  ctx.check(!error.empty(), "missing file reports an error");

  auto fp = fingerprint_file(ws / "missing.nes", logger.get());
  ctx.check(fp.empty(), "fingerprint_file returns the empty fingerprint");
  ctx.check(fp.size == 0, "empty fingerprint has no size");
  ctx.check(!ctx.logs.snapshot().empty(), "the failure is logged");
  return true;
}

bool test_parse_dat_document(TestContext& ctx) {
  const std::string xml = R"xml(<?xml version="1.0"?>
<datafile>
  <header>
    <name>  Nintendo - NES  </name>
    <description>ignored</description>
  </header>
  <game name="Alpha (USA)">
    <description>Alpha Adventure</description>
    <rom name="Alpha (USA).nes" size="40976" crc="ABCDEF01" md5="AAAA" sha1="BBBB"/>
    <rom name="Alpha (USA) [b].nes" crc="12345678"/>
  </game>
  <group>
    <game name="Nested">
      <rom name="Nested.nes" size="16" md5="cccc"/>
    </game>
  </group>
  <game name="NoDescription">
    <description></description>
    <rom name="NoDescription.nes" size="8" md5="dddd"/>
  </game>
</datafile>
)xml";

  std::string error;
  auto doc = parse_dat_memory(xml, error);
  if(!ctx.check(doc.has_value(), "document parses: " + error)) return false;
  ctx.check(doc->header_name == "Nintendo - NES", "header name is trimmed: '" + doc->header_name + "'");
  ctx.check(doc->games.size() == 3, "three games including the nested one");
  ctx.check(doc->rom_count() == 4, "four roms");

  const auto& alpha = doc->games.at(0);
  ctx.check(alpha.description == "Alpha Adventure", "description read");
  ctx.check(alpha.roms.at(0).size == "40976", "size attribute kept verbatim");
  ctx.check(alpha.roms.at(0).crc == "ABCDEF01", "parser leaves case alone");
  ctx.check(alpha.roms.at(1).size == "0", "missing size defaults to 0");
  ctx.check(alpha.roms.at(1).md5.empty(), "missing md5 stays empty");

  ctx.check(doc->games.at(1).name == "Nested", "nested game found");
  ctx.check(doc->games.at(1).description == "Nested", "absent description falls back to game name");
  ctx.check(doc->games.at(2).description == "NoDescription", "empty description falls back to game name");
  return true;
}

bool test_parse_rejects_malformed_xml(TestContext& ctx) {
  std::string error;
  auto doc = parse_dat_memory("<datafile><game name=\"x\"><rom name=\"x.nes\"></datafile>", error);
  ctx.check(!doc.has_value(), "malformed XML is rejected");
  ctx.check(!error.empty(), "parse error has a message");

  TempWorkspace ws("parse_missing");
  auto missing = parse_dat_file(ws / "nope.dat", error);
  ctx.check(!missing.has_value(), "missing file is rejected");
  ctx.check(!error.empty(), "missing file has a message");
  return true;
}

bool test_hashes_are_indexed_lowercase(TestContext& ctx) {
  TempWorkspace ws("lowercase");
  DatBuilder()
    .header("Mixed")
    .game("Game", "Game Description")
    .rom({"Game.nes", "11", "0D4A1185", "5EB63BBBE01EEED093CB22BB8F5ACDC3", "2AAE6C35C94FCFB415DBE95F408B9CE91EE846ED"})
    .write(ws / "mixed.dat");

  auto logger = captured_logger(ctx);
  CatalogStore store(logger.get());
  if(!ctx.check(store.load_source(ws / "mixed.dat"), "source loads")) return false;

  Fingerprint fp;
  fp.md5 = "5eb63bbbe01eeed093cb22bb8f5acdc3";
  auto match = store.find_by_fingerprint(fp);
  if(!ctx.check(match.has_value(), "upper-case md5 in source matches lower-case query")) return false;
  ctx.check(match->entry->md5 == fp.md5, "stored md5 is lower-case");
  ctx.check(match->entry->crc32 == "0d4a1185", "stored crc32 is lower-case");
  ctx.check(match->entry->description == "Game Description", "description carried into the entry");
  ctx.check(match->catalog == "Mixed", "catalog named after header");
  ctx.check(ctx.logs.contains("Loaded 1 ROMs from"), "load is logged");
  return true;
}

bool test_fingerprint_priority(TestContext& ctx) {
  TempWorkspace ws("priority");
  DatBuilder()
    .header("Priority")
    .game("ByMd5").rom({"by_md5.nes", "4", "", "11111111111111111111111111111111", ""})
    .game("ByCrc").rom({"by_crc.nes", "4", "cafebabe", "", ""})
    .game("BySha1").rom({"by_sha1.nes", "4", "", "", "2222222222222222222222222222222222222222"})
    .write(ws / "priority.dat");

  CatalogStore store;
  if(!ctx.check(store.load_source(ws / "priority.dat"), "source loads")) return false;

  Fingerprint fp;
  fp.md5 = "11111111111111111111111111111111";
  fp.crc32 = "cafebabe";
  fp.sha1 = "2222222222222222222222222222222222222222";
  auto match = store.find_by_fingerprint(fp);
  if(!ctx.check(match.has_value(), "md5 match")) return false;
  ctx.check(match->entry->name == "by_md5.nes", "md5 wins over sha1 and crc32");
  ctx.check(match->type == MatchType::Md5, "type md5");
  ctx.check(match->confidence == 1.0, "md5 confidence is exactly 1.0");

  fp.md5 = "ffffffffffffffffffffffffffffffff";
  match = store.find_by_fingerprint(fp);
  if(!ctx.check(match.has_value(), "sha1 match")) return false;
  ctx.check(match->entry->name == "by_sha1.nes", "sha1 wins over crc32");
  ctx.check(match->type == MatchType::Sha1, "type sha1");
  ctx.near(match->confidence, 0.99, "sha1 confidence");

  fp.sha1.clear();
  match = store.find_by_fingerprint(fp);
  if(!ctx.check(match.has_value(), "crc32 match")) return false;
  ctx.check(match->entry->name == "by_crc.nes", "crc32 fallback");
  ctx.check(match->type == MatchType::Crc32, "type crc32");
  ctx.near(match->confidence, 0.95, "crc32 confidence");

  fp.crc32 = "00000000";
  ctx.check(!store.find_by_fingerprint(fp), "unknown digests do not match");
  ctx.check(!store.find_by_fingerprint(Fingerprint{}), "empty fingerprint never matches");
  return true;
}

bool test_cross_catalog_tie_uses_load_order(TestContext& ctx) {
  TempWorkspace ws("tiebreak");
  const std::string md5 = "0123456789abcdef0123456789abcdef";
  DatBuilder().header("Alpha").game("A").rom({"alpha.nes", "1", "", md5, ""}).write(ws / "alpha.dat");
  DatBuilder().header("Zeta").game("Z").rom({"zeta.nes", "1", "", md5, ""}).write(ws / "zeta.dat");

  CatalogStore store;
  ctx.check(store.load_source(ws / "zeta.dat"), "zeta loads");
  ctx.check(store.load_source(ws / "alpha.dat"), "alpha loads");

  Fingerprint fp;
  fp.md5 = md5;
  auto match = store.find_by_fingerprint(fp);
  if(!ctx.check(match.has_value(), "match found")) return false;
  ctx.check(match->catalog == "Zeta", "earliest loaded catalog wins, got " + match->catalog);
  ctx.check(match->entry->name == "zeta.nes", "entry from the earliest catalog");

  auto names = store.catalog_names();
  ctx.check(names == std::vector<std::string>({"Zeta", "Alpha"}), "catalog names in load order");
  return true;
}

bool test_find_by_name(TestContext& ctx) {
  TempWorkspace ws("by_name");
  DatBuilder()
    .header("Names")
    .game("Game 1").rom({"game1.nes", "1", "00000001", "", ""})
    .game("Game 2").rom({"game2.nes", "1", "00000002", "", ""})
    .game("Other").rom({"other.nes", "1", "00000003", "", ""})
    .write(ws / "names.dat");

  CatalogStore store;
  if(!ctx.check(store.load_source(ws / "names.dat"), "source loads")) return false;

  auto results = store.find_by_name("game");
  ctx.check(results.size() == 2, "two substring matches");
  for(const auto& result : results) {
    ctx.check(result.type == MatchType::Name, "name match type");
    ctx.check(result.confidence < 0.8, "partial match stays under the cap");
    ctx.near(result.confidence, 4.0 / 9.0, "similarity is query over candidate length");
  }

  auto exact = store.find_by_name("GAME1.NES");
  if(ctx.check(exact.size() == 1, "case-insensitive exact match")) {
    ctx.check(exact.front().entry->name == "game1.nes", "matched game1.nes");
    ctx.near(exact.front().confidence, 0.8, "exact name capped at 0.8");
  }

  auto mixed = store.find_by_name("nes");
  ctx.check(mixed.size() == 3, "every name contains .nes");
  ctx.check(store.find_by_name("").empty(), "empty query returns nothing");
  ctx.check(store.find_by_name("zelda").empty(), "no match returns nothing");
  return true;
}

bool test_find_by_name_orders_by_confidence(TestContext& ctx) {
  TempWorkspace ws("by_name_order");
  DatBuilder()
    .header("Order")
    .game("Long").rom({"mario bros deluxe edition.nes", "1", "00000011", "", ""})
    .game("Short").rom({"mario.nes", "1", "00000012", "", ""})
    .write(ws / "order.dat");

  CatalogStore store;
  if(!ctx.check(store.load_source(ws / "order.dat"), "source loads")) return false;
  auto results = store.find_by_name("mario");
  if(!ctx.check(results.size() == 2, "two matches")) return false;
  ctx.check(results[0].entry->name == "mario.nes", "closest name first");
  ctx.check(results[0].confidence > results[1].confidence, "descending confidence");
  return true;
}

bool test_load_is_idempotent(TestContext& ctx) {
  TempWorkspace ws("idempotent");
  DatBuilder()
    .header("Once")
    .game("A").rom({"a.nes", "1", "aaaaaaaa", "a0a0a0a0a0a0a0a0a0a0a0a0a0a0a0a0", ""})
    .game("B").rom({"b.nes", "1", "bbbbbbbb", "b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0", ""})
    .write(ws / "once.dat");

  auto logger = captured_logger(ctx);
  CatalogStore store(logger.get());
  ctx.check(store.load_source(ws / "once.dat"), "first load");
  auto before = store.export_stats();
  ctx.check(store.load_source(ws / "once.dat"), "second load succeeds");
  std::filesystem::create_directories(ws / "sub");
  ctx.check(store.load_source(ws.root() / "sub" / ".." / "once.dat"), "same source by another spelling");
  auto after = store.export_stats();

  ctx.check(before.catalog_count == 1 && after.catalog_count == 1, "one catalog");
  ctx.check(before.total_entries == 2 && after.total_entries == 2, "entries unchanged");
  ctx.check(after.per_catalog.at(0).unique_md5 == 2, "md5 index unchanged");
  ctx.check(store.is_loaded(ws / "once.dat"), "source recorded as loaded");
  ctx.check(ctx.logs.contains("already loaded"), "repeat load is logged");
  return true;
}

bool test_failed_load_leaves_store_untouched(TestContext& ctx) {
  TempWorkspace ws("failed_load");
  DatBuilder().header("Good").game("A").rom({"a.nes", "1", "aaaaaaaa", "", ""}).write(ws / "good.dat");
  write_file(ws / "broken.dat", "<datafile><header><name>Good</name></header><game name=\"x\">");

  auto logger = captured_logger(ctx);
  CatalogStore store(logger.get());
  ctx.check(store.load_source(ws / "good.dat"), "good source loads");
  auto before = store.export_stats();

  std::string error;
  ctx.check(!store.load_source(ws / "broken.dat", error), "broken source fails");
  ctx.check(!error.empty(), "failure carries a message");
  ctx.check(!store.is_loaded(ws / "broken.dat"), "failed source is not marked loaded");
  ctx.check(!store.load_source(ws / "missing.dat"), "missing source fails");

  auto after = store.export_stats();
  ctx.check(after.catalog_count == before.catalog_count, "catalog count unchanged");
  ctx.check(after.total_entries == before.total_entries, "entry count unchanged");
  ctx.check(ctx.logs.contains("Error loading DAT file"), "failure is logged");

  // A fixed source can be loaded afterwards.
  DatBuilder().header("Good").game("X").rom({"x.nes", "1", "cccccccc", "", ""}).write(ws / "broken.dat");
  ctx.check(store.load_source(ws / "broken.dat"), "repaired source loads");
  ctx.check(store.export_stats().total_entries == 2, "repaired source merged into its catalog");
  return true;
}

bool test_header_fallback_and_merge(TestContext& ctx) {
  TempWorkspace ws("header");
  DatBuilder().game("Lone").rom({"lone.nes", "1", "11111111", "", ""}).write(ws / "headerless.dat");
  DatBuilder().header("Shared").game("One").rom({"one.nes", "1", "22222222", "", ""}).write(ws / "part1.dat");
  DatBuilder()
    .header("Shared")
    .game("One Revised").rom({"one.nes", "2", "33333333", "", ""})
    .game("Two").rom({"two.nes", "1", "44444444", "", ""})
    .write(ws / "part2.dat");

  CatalogStore store;
  ctx.check(store.load_source(ws / "headerless.dat"), "headerless loads");
  ctx.check(store.load_source(ws / "part1.dat"), "part1 loads");
  ctx.check(store.load_source(ws / "part2.dat"), "part2 loads");

  auto stats = store.export_stats();
  ctx.check(stats.catalog_count == 2, "same header merges into one catalog");
  if(!ctx.check(stats.per_catalog.size() == 2, "two catalog rows")) return false;
  ctx.check(stats.per_catalog[0].name == "headerless.dat", "missing header falls back to the file name");
  ctx.check(stats.per_catalog[1].name == "Shared", "shared catalog");
  ctx.check(stats.per_catalog[1].entries == 2, "name collision keeps one entry");
  ctx.check(stats.total_entries == 3, "total entries");

  auto renamed = store.find_by_name("one.nes");
  if(ctx.check(renamed.size() == 1, "one.nes listed once")) {
    ctx.check(renamed.front().entry->description == "One Revised", "later record wins the name");
  }
  Fingerprint fp;
  fp.crc32 = "22222222";
  ctx.check(store.find_by_fingerprint(fp).has_value(), "earlier hash stays indexed");
  return true;
}

bool test_stats_count_unhashed_entries(TestContext& ctx) {
  TempWorkspace ws("unhashed");
  DatBuilder()
    .header("Partial")
    .game("Hashed").rom({"hashed.nes", "1", "12121212", "34343434343434343434343434343434", "5656565656565656565656565656565656565656"})
    .game("Bare").rom({"bare.nes", "1", "", "", ""})
    .write(ws / "partial.dat");

  CatalogStore store;
  ctx.check(store.load_source(ws / "partial.dat"), "source loads");
  auto stats = store.export_stats();
  if(!ctx.check(stats.per_catalog.size() == 1, "one catalog")) return false;
  const auto& row = stats.per_catalog.front();
  ctx.check(row.entries == 2, "every rom counts as an entry");
  ctx.check(row.unique_md5 == 1, "only hashed roms reach the md5 index");
  ctx.check(row.unique_sha1 == 1, "sha1 index");
  ctx.check(row.unique_crc32 == 1, "crc32 index");
  ctx.check(stats.total_entries == 2 && stats.total_md5 == 1, "md5-keyed total excludes bare roms");
  nlohmann::json doc = stats;
  ctx.check(doc["total_roms"] == 1 && doc["total_entries"] == 2, "json totals");
  ctx.check(doc["catalogs"]["Partial"]["roms"] == 1, "json per-catalog md5 count");
  ctx.check(store.find_by_name("bare").size() == 1, "unhashed rom is still findable by name");
  return true;
}

bool test_load_all_from_directory(TestContext& ctx) {
  TempWorkspace ws("load_all");
  DatBuilder().header("B").game("b").rom({"b.nes", "1", "bbbbbbbb", "", ""}).write(ws / "dats" / "b.dat");
  DatBuilder().header("A").game("a").rom({"a.nes", "1", "aaaaaaaa", "", ""}).write(ws / "dats" / "a.xml");
  write_file(ws / "dats" / "c.dat", "not xml at all");
  write_file(ws / "dats" / "readme.txt", "<datafile/>");
  DatBuilder().header("Deep").game("d").rom({"d.nes", "1", "dddddddd", "", ""}).write(ws / "dats" / "sub" / "d.dat");

  auto logger = captured_logger(ctx);
  CatalogStore store(logger.get());
  ctx.check(store.load_all_from_directory(ws / "dats") == 2, "two sources load");
  ctx.check(store.catalog_names() == std::vector<std::string>({"A", "B"}), "loaded in filename order");
  ctx.check(ctx.logs.contains("Error loading DAT file"), "bad source logged and skipped");

  ctx.check(store.load_all_from_directory(ws / "dats") == 2, "reloading counts already loaded sources");
  ctx.check(store.catalog_count() == 2, "reloading adds nothing");
  ctx.check(store.load_all_from_directory(ws / "absent") == 0, "missing directory loads nothing");
  return true;
}

bool test_match_type_names(TestContext& ctx) {
  TempWorkspace ws("stats_json");
  DatBuilder().header("Json").game("j").rom({"j.nes", "1", "abababab", "", ""}).write(ws / "j.dat");
  CatalogStore store;
  ctx.check(store.load_source(ws / "j.dat"), "source loads");

  auto stats = store.export_stats();
  ctx.check(stats.catalog_count == 1 && stats.total_entries == 1, "counts");
  ctx.check(match_type_from_string("CRC") == MatchType::Crc32, "crc alias");
  ctx.check(!match_type_from_string("sha256").has_value(), "unknown match type");
  ctx.check(std::string(to_string(MatchType::Sha1)) == "sha1", "match type name");
  return true;
}

bool test_parse_rom_name(TestContext& ctx) {
  auto region = parse_rom_name("Super Mario Bros. (USA).nes");
  ctx.check(region.title == "Super Mario Bros.", "title without region: " + region.title);
  ctx.check(region.region == "USA", "region");
  ctx.check(region.version.empty() && region.attributes.empty(), "no version or attributes");

  auto version = parse_rom_name("Super Mario Bros. (v1.1).nes");
  ctx.check(version.title == "Super Mario Bros.", "title without version: " + version.title);
  ctx.check(version.region.empty(), "version group is not a region");
  ctx.check(version.version == "1.1", "version");

  auto flagged = parse_rom_name("Super Mario Bros. [!].nes");
  ctx.check(flagged.title == "Super Mario Bros.", "title without attributes: " + flagged.title);
  ctx.check(flagged.region.empty() && flagged.version.empty(), "no region or version");
  ctx.check(flagged.attributes == std::vector<std::string>{"!"}, "attribute");

  auto full = parse_rom_name("Super Mario Bros. (USA) (v1.1) [!] [b1].nes");
  ctx.check(full.title == "Super Mario Bros.", "title with every component: " + full.title);
  ctx.check(full.region == "USA" && full.version == "1.1", "region and version");
  ctx.check(full.attributes == std::vector<std::string>({"!", "b1"}), "attributes in order");
  return true;
}

bool test_create_standardized_name(TestContext& ctx) {
  RomNameParts parts;
  parts.title = "Super Mario Bros.";
  parts.region = "USA";
  parts.version = "1.1";
  parts.attributes = {"!"};
  ctx.check(create_standardized_name(parts, ".nes") == "Super Mario Bros. (USA) (v1.1) [!].nes", "every component");

  RomNameParts bare;
  bare.title = "Super Mario Bros.";
  ctx.check(create_standardized_name(bare, ".nes") == "Super Mario Bros..nes", "title only");

  auto rebuilt = create_standardized_name(parse_rom_name("Zelda  (Europe)[T+Eng].sfc"), ".sfc");
  ctx.check(rebuilt == "Zelda (Europe) [T+Eng].sfc", "spacing normalised: " + rebuilt);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"known_digests", test_known_digests},
    {"fingerprint_streams_large_files", test_fingerprint_streams_large_files},
    {"unreadable_file_yields_empty_fingerprint", test_unreadable_file_yields_empty_fingerprint},
    {"parse_dat_document", test_parse_dat_document},
    {"parse_rejects_malformed_xml", test_parse_rejects_malformed_xml},
    {"hashes_are_indexed_lowercase", test_hashes_are_indexed_lowercase},
    {"fingerprint_priority", test_fingerprint_priority},
    {"cross_catalog_tie_uses_load_order", test_cross_catalog_tie_uses_load_order},
    {"find_by_name", test_find_by_name},
    {"find_by_name_orders_by_confidence", test_find_by_name_orders_by_confidence},
    {"load_is_idempotent", test_load_is_idempotent},
    {"failed_load_leaves_store_untouched", test_failed_load_leaves_store_untouched},
    {"header_fallback_and_merge", test_header_fallback_and_merge},
    {"stats_count_unhashed_entries", test_stats_count_unhashed_entries},
    {"load_all_from_directory", test_load_all_from_directory},
    {"match_type_names", test_match_type_names},
    {"parse_rom_name", test_parse_rom_name},
    {"create_standardized_name", test_create_standardized_name}
  };
  return romid::test::run_tests("catalog", argc, argv, tests);
}
