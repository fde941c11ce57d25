#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct DatRom {
  std::string name;
  std::string size = "0";
  std::string crc;
  std::string md5;
  std::string sha1;
};

struct DatGame {
  std::string name;
  std::string description; // falls back to name when the source has none
  std::vector<DatRom> roms;
};

// A reference checksum document: <header><name/></header> followed by any
// number of <game name=".."><description/><rom .../></game> records.
struct DatDocument {
  std::string header_name; // empty when the source declares none
  std::vector<DatGame> games;

  std::size_t rom_count() const;
};

std::optional<DatDocument> parse_dat_memory(const std::string& content, std::string& error);
std::optional<DatDocument> parse_dat_file(const std::filesystem::path& path, std::string& error);
