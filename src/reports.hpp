#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "catalog_store.hpp"
#include "rom_identifier.hpp"
#include "rom_renamer.hpp"

class Logger;

struct IdentificationReport {
  std::size_t total = 0;
  std::size_t identified = 0;
  std::size_t correct = 0;
  double identification_rate = 0.0; // identified / total, 0 when empty
  double correct_name_rate = 0.0;   // correct / identified, 0 when nothing identified
  std::vector<IdentificationResult> results;
};

struct RenameReport {
  std::size_t total = 0;
  std::size_t identified = 0;
  std::size_t renamed = 0;
  std::size_t already_correct = 0;
  double identification_rate = 0.0;
  std::vector<RenameResult> results;
};

IdentificationReport summarize_identification(std::vector<IdentificationResult> results);
RenameReport summarize_renames(std::vector<RenameResult> results);

void to_json(nlohmann::json& j, const Fingerprint& fp);
void to_json(nlohmann::json& j, const CatalogEntry& entry);
void to_json(nlohmann::json& j, const IdentificationResult& result);
void to_json(nlohmann::json& j, const RenameResult& result);
void to_json(nlohmann::json& j, const IdentificationReport& report);
void to_json(nlohmann::json& j, const RenameReport& report);
void to_json(nlohmann::json& j, const CatalogStats& stats);

enum class ReportFormat { Json, Html, Csv };

bool parse_report_format(const std::string& value, ReportFormat& out);

std::string render_html(const IdentificationReport& report);
std::string render_csv(const IdentificationReport& report);
std::string render(const IdentificationReport& report, ReportFormat format);

// Writes text to path, creating the parent directory; logs the outcome.
bool save_text(const std::filesystem::path& path, const std::string& text, Logger* logger = nullptr);
bool save_report(const std::filesystem::path& path, const nlohmann::json& report, Logger* logger = nullptr);
