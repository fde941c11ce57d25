#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const unsigned char* data, std::size_t size);
std::string hex_from_u32(uint32_t value);

std::string to_lower_copy(std::string value);
std::string trim_copy(std::string value);
std::string lower_extension(const std::filesystem::path& path);

// Extensions (lower-case, with the dot) of files treated as ROM images.
const std::vector<std::string>& rom_extensions();
bool is_rom_file(const std::filesystem::path& path);

// Components of a catalog-style ROM name such as "Title (USA) (v1.1) [!].nes".
// region is the first parenthesised group that is not a "(v...)" version.
struct RomNameParts {
    std::string title;
    std::string region;
    std::string version;
    std::vector<std::string> attributes;
};

RomNameParts parse_rom_name(const std::string& filename);
std::string create_standardized_name(const RomNameParts& parts, const std::string& extension);

// Extensions of reference checksum sources picked up from a database directory.
bool is_dat_file(const std::filesystem::path& path);
