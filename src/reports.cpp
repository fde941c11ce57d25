#include "reports.hpp"

#include <spdlog/fmt/fmt.h>

#include <fstream>

#include "log.hpp"
#include "utils.hpp"

namespace {

double ratio(std::size_t numerator, std::size_t denominator) {
  if(denominator == 0) return 0.0;
  return static_cast<double>(numerator) / static_cast<double>(denominator);
}

std::string percent(double value) {
  return fmt::format("{:.1f}%", value * 100.0);
}

std::string html_escape(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for(char c : value) {
    switch(c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default: out += c; break;
    }
  }
  return out;
}

std::string csv_quote(const std::string& value) {
  std::string out = "\"";
  for(char c : value) {
    if(c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

const char* bool_text(bool value) { return value ? "true" : "false"; }

struct RowView {
  std::string file_name;
  bool identified = false;
  std::string match_type = "N/A";
  std::string confidence = "N/A";
  std::string correct_name = "N/A";
  bool name_matches = false;
};

RowView row_for(const IdentificationResult& result) {
  RowView row;
  row.file_name = result.file_name;
  row.identified = result.identified;
  if(result.match) {
    row.match_type = to_string(result.match->type);
    row.confidence = percent(result.match->confidence);
  }
  if(result.correct_name) row.correct_name = *result.correct_name;
  row.name_matches = result.name_matches.value_or(false);
  return row;
}

} // namespace

IdentificationReport summarize_identification(std::vector<IdentificationResult> results) {
  IdentificationReport report;
  report.total = results.size();
  for(const auto& result : results) {
    if(result.identified) ++report.identified;
    if(result.name_matches.value_or(false)) ++report.correct;
  }
  report.identification_rate = ratio(report.identified, report.total);
  report.correct_name_rate = ratio(report.correct, report.identified);
  report.results = std::move(results);
  return report;
}

RenameReport summarize_renames(std::vector<RenameResult> results) {
  RenameReport report;
  report.total = results.size();
  for(const auto& result : results) {
    if(result.identification.identified) ++report.identified;
    if(result.renamed) ++report.renamed;
    if(result.name_matches.value_or(false)) ++report.already_correct;
  }
  report.identification_rate = ratio(report.identified, report.total);
  report.results = std::move(results);
  return report;
}

void to_json(nlohmann::json& j, const Fingerprint& fp) {
  j = nlohmann::json{{"md5", fp.md5}, {"sha1", fp.sha1}, {"crc32", fp.crc32}, {"size", fp.size}};
}

void to_json(nlohmann::json& j, const CatalogEntry& entry) {
  j = nlohmann::json{
    {"name", entry.name},
    {"description", entry.description},
    {"size", entry.size},
    {"md5", entry.md5},
    {"crc32", entry.crc32},
    {"sha1", entry.sha1}
  };
}

void to_json(nlohmann::json& j, const IdentificationResult& result) {
  j = nlohmann::json::object();
  j["status"] = to_string(result.status);
  if(!result.message.empty()) j["message"] = result.message;
  j["file_path"] = result.file_path.string();
  j["file_name"] = result.file_name;
  j["identified"] = result.identified;
  if(result.status == ResultStatus::Error) {
    j["error"] = to_string(result.error);
    return;
  }
  j["checksums"] = result.fingerprint;
  if(result.match) {
    nlohmann::json info = *result.match->entry;
    info["database"] = result.match->catalog;
    j["rom_info"] = std::move(info);
    j["match_type"] = to_string(result.match->type);
    j["match_confidence"] = result.match->confidence;
  }
  if(result.correct_name) j["correct_name"] = *result.correct_name;
  if(result.name_matches) j["name_matches"] = *result.name_matches;
}

void to_json(nlohmann::json& j, const RenameResult& result) {
  j = nlohmann::json::object();
  j["status"] = to_string(result.status);
  j["message"] = result.message;
  if(result.status == ResultStatus::Error) j["error"] = to_string(result.error);
  j["file_path"] = result.file_path.string();
  j["renamed"] = result.renamed;
  j["dry_run"] = result.dry_run;
  if(result.new_name) j["new_name"] = *result.new_name;
  if(result.new_path) j["new_path"] = result.new_path->string();
  if(result.name_matches) j["name_matches"] = *result.name_matches;
  j["identification"] = result.identification;
}

void to_json(nlohmann::json& j, const IdentificationReport& report) {
  j = nlohmann::json{
    {"total", report.total},
    {"identified", report.identified},
    {"identification_rate", report.identification_rate},
    {"correct", report.correct},
    {"correct_name_rate", report.correct_name_rate},
    {"results", report.results}
  };
}

void to_json(nlohmann::json& j, const RenameReport& report) {
  j = nlohmann::json{
    {"total", report.total},
    {"identified", report.identified},
    {"identification_rate", report.identification_rate},
    {"renamed", report.renamed},
    {"already_correct", report.already_correct},
    {"correct", report.already_correct},
    {"results", report.results}
  };
}

void to_json(nlohmann::json& j, const CatalogStats& stats) {
  nlohmann::json per = nlohmann::json::object();
  for(const auto& catalog : stats.per_catalog) {
    per[catalog.name] = {
      {"entries", catalog.entries},
      {"roms", catalog.unique_md5},
      {"unique_md5", catalog.unique_md5},
      {"unique_crc32", catalog.unique_crc32},
      {"unique_sha1", catalog.unique_sha1}
    };
  }
  j = nlohmann::json{
    {"catalog_count", stats.catalog_count},
    {"total_entries", stats.total_entries},
    {"total_roms", stats.total_md5},
    {"catalogs", std::move(per)}
  };
}

bool parse_report_format(const std::string& value, ReportFormat& out) {
  auto lowered = to_lower_copy(trim_copy(value));
  if(lowered == "json") { out = ReportFormat::Json; return true; }
  if(lowered == "html") { out = ReportFormat::Html; return true; }
  if(lowered == "csv") { out = ReportFormat::Csv; return true; }
  return false;
}

std::string render_html(const IdentificationReport& report) {
  std::string html = fmt::format(R"(<!DOCTYPE html>
<html>
<head>
    <title>ROM Identification Report</title>
    <style>
        body {{ font-family: Arial, sans-serif; margin: 20px; }}
        h1, h2 {{ color: #333; }}
        table {{ border-collapse: collapse; width: 100%; }}
        th, td {{ border: 1px solid #ddd; padding: 8px; text-align: left; }}
        th {{ background-color: #f2f2f2; }}
        tr:nth-child(even) {{ background-color: #f9f9f9; }}
        .success {{ color: green; }}
        .error {{ color: red; }}
        .warning {{ color: orange; }}
        .summary {{ margin: 20px 0; padding: 10px; background-color: #f2f2f2; }}
    </style>
</head>
<body>
    <h1>ROM Identification Report</h1>

    <div class="summary">
        <h2>Summary</h2>
        <p>Total ROMs: {}</p>
        <p>Identified ROMs: {} ({})</p>
        <p>Correct Names: {} ({} of identified)</p>
    </div>

    <h2>Details</h2>
    <table>
        <tr>
            <th>File Name</th>
            <th>Identified</th>
            <th>Match Type</th>
            <th>Confidence</th>
            <th>Correct Name</th>
            <th>Name Matches</th>
        </tr>
)",
    report.total,
    report.identified, percent(report.identification_rate),
    report.correct, percent(report.correct_name_rate));

  for(const auto& result : report.results) {
    auto row = row_for(result);
    const char* status_class = row.identified ? "success" : "error";
    const char* name_class = row.name_matches ? "success" : (row.identified ? "warning" : "error");
    html += fmt::format(R"(        <tr>
            <td>{}</td>
            <td class="{}">{}</td>
            <td>{}</td>
            <td>{}</td>
            <td>{}</td>
            <td class="{}">{}</td>
        </tr>
)",
      html_escape(row.file_name),
      status_class, bool_text(row.identified),
      row.match_type,
      row.confidence,
      html_escape(row.correct_name),
      name_class, bool_text(row.name_matches));
  }

  html += "    </table>\n</body>\n</html>\n";
  return html;
}

std::string render_csv(const IdentificationReport& report) {
  std::string csv = "File Name,Identified,Match Type,Confidence,Correct Name,Name Matches\n";
  for(const auto& result : report.results) {
    auto row = row_for(result);
    csv += fmt::format("{},{},{},{},{},{}\n",
                       csv_quote(row.file_name),
                       bool_text(row.identified),
                       row.match_type,
                       row.confidence,
                       csv_quote(row.correct_name),
                       bool_text(row.name_matches));
  }
  return csv;
}

std::string render(const IdentificationReport& report, ReportFormat format) {
  switch(format) {
    case ReportFormat::Html: return render_html(report);
    case ReportFormat::Csv: return render_csv(report);
    case ReportFormat::Json: break;
  }
  return nlohmann::json(report).dump(4);
}

bool save_text(const std::filesystem::path& path, const std::string& text, Logger* logger) {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    log_error(logger, "Error saving report to {}: cannot open for writing", path.string());
    return false;
  }
  out << text;
  out.flush();
  if(!out) {
    log_error(logger, "Error saving report to {}: write failed", path.string());
    return false;
  }
  log_info(logger, "Report saved to {}", path.string());
  return true;
}

bool save_report(const std::filesystem::path& path, const nlohmann::json& report, Logger* logger) {
  return save_text(path, report.dump(4), logger);
}
