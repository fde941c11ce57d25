#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

class Logger;

// Content identity of a whole file. All hex digests are lower-case;
// crc32 is zero-padded to eight digits.
struct Fingerprint {
    std::string md5;
    std::string sha1;
    std::string crc32;
    uint64_t size = 0;

    // The all-empty fingerprint stands for "file could not be read".
    bool empty() const { return md5.empty() && sha1.empty() && crc32.empty(); }

    bool operator==(const Fingerprint& other) const {
        return md5 == other.md5 && sha1 == other.sha1 && crc32 == other.crc32 && size == other.size;
    }
    bool operator!=(const Fingerprint& other) const { return !(*this == other); }
};

std::optional<Fingerprint> compute_fingerprint(const std::filesystem::path& file, std::string& error);

// Never fails: an unreadable file yields the empty fingerprint and an error log line.
Fingerprint fingerprint_file(const std::filesystem::path& file, Logger* logger = nullptr);
