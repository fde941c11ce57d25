#include "rom_engine.hpp"

#include <algorithm>

#include "catalog_store.hpp"
#include "command_line_parser.hpp"
#include "reports.hpp"
#include "rom_identifier.hpp"
#include "rom_renamer.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::string percent(double rate) {
  return fmt::format("{:.1f}%", rate * 100.0);
}

} // namespace

RomEngine::RomEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("romid")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
  store_ = std::make_unique<CatalogStore>(logger_.get());
  identifier_ = std::make_unique<RomIdentifier>(*store_, logger_.get());
  renamer_ = std::make_unique<RomRenamer>(*identifier_, logger_.get());
}

RomEngine::~RomEngine() = default;

std::filesystem::path RomEngine::resolve_path(const std::string& raw) const {
  std::filesystem::path p(raw);
  if(p.empty() || p.is_absolute()) return p;
  return options_.workspace_root / p;
}

void RomEngine::apply_jobs() {
  identifier_->set_jobs(static_cast<std::size_t>(std::max(1, settings_->get<int>("jobs"))));
}

void RomEngine::start() {
  if(started_) return;
  started_ = true;

  std::filesystem::path log_file;
  auto raw_log = settings_->get<std::string>("log_file");
  if(!raw_log.empty()) log_file = resolve_path(raw_log);
  init(settings_->get<bool>("verbose"), log_file);
  apply_jobs();

  if(!options_.load_database_dir) return;

  auto database_dir = resolve_path(settings_->get<std::string>("database_dir"));
  std::error_code ec;
  std::filesystem::create_directories(database_dir, ec);
  if(ec) {
    logger_->warn("Unable to create database directory {}: {}", database_dir.string(), ec.message());
  }
  sources_loaded_ = store_->load_all_from_directory(database_dir);
  logger_->info("Loaded {} DAT files", sources_loaded_);
}

LogListenerHandle RomEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void RomEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

RomEngine::Stats RomEngine::stats() const {
  Stats s;
  s.sources_loaded = sources_loaded_;
  auto catalog_stats = store_->export_stats();
  s.catalogs = catalog_stats.catalog_count;
  s.entries = catalog_stats.total_entries;
  return s;
}

int RomEngine::execute() {
  return execute_command(settings_->get<std::string>("command"));
}

int RomEngine::execute_command(const std::string& command) {
  if(!started_) start();
  apply_jobs();

  const auto name = to_lower_copy(trim_copy(command));
  if(name == "scan") return run_scan();
  if(name == "rename") return run_rename();
  if(name == "report") return run_report();
  if(name == "db") return run_db();
  if(name == "settings") return run_settings();

  if(!name.empty()) {
    logger_->print_err("Unknown command '{}'", command);
  }
  CommandLineParser().usage(logger_.get());
  return 1;
}

bool RomEngine::require_path(std::filesystem::path& out) {
  auto raw = settings_->get<std::string>("path");
  if(raw.empty()) {
    logger_->print_err("A ROM directory is required (romid <command> <path>)");
    return false;
  }
  out = resolve_path(raw);
  return true;
}

int RomEngine::run_scan() {
  std::filesystem::path dir;
  if(!require_path(dir)) return 1;

  auto report = summarize_identification(
    identifier_->identify_directory(dir, settings_->get<bool>("recursive")));

  auto output = settings_->get<std::string>("output");
  if(!output.empty()) {
    save_report(resolve_path(output), nlohmann::json(report), logger_.get());
  }

  logger_->print("Scanned {} ROMs", report.total);
  logger_->print("Identified {} ROMs ({})", report.identified, percent(report.identification_rate));
  logger_->print("Correct names: {} ({})", report.correct, percent(report.correct_name_rate));
  return 0;
}

int RomEngine::run_rename() {
  std::filesystem::path dir;
  if(!require_path(dir)) return 1;
  const bool dry_run = settings_->get<bool>("dry_run");

  if(settings_->get<bool>("backup")) {
    auto raw_backup = settings_->get<std::string>("backup_dir");
    auto backup_dir = raw_backup.empty() ? RomRenamer::default_backup_dir(dir) : resolve_path(raw_backup);
    logger_->print("Backing up ROMs to {}...", backup_dir.string());
    if(!renamer_->backup(dir, backup_dir)) {
      logger_->print_err("Backup incomplete; continuing with rename");
    }
  }

  auto report = summarize_renames(
    renamer_->rename_directory(dir, settings_->get<bool>("recursive"), dry_run));

  auto output = settings_->get<std::string>("output");
  if(!output.empty()) {
    save_report(resolve_path(output), nlohmann::json(report), logger_.get());
  }

  logger_->print("Scanned {} ROMs", report.total);
  logger_->print("Identified {} ROMs ({})", report.identified, percent(report.identification_rate));
  logger_->print("{} {} ROMs", dry_run ? "Would rename" : "Renamed", report.renamed);
  logger_->print("Already correct: {} ROMs", report.already_correct);
  return 0;
}

int RomEngine::run_report() {
  std::filesystem::path dir;
  if(!require_path(dir)) return 1;

  auto output = settings_->get<std::string>("output");
  if(output.empty()) {
    logger_->print_err("The report command requires --output");
    return 1;
  }
  ReportFormat format = ReportFormat::Json;
  if(!parse_report_format(settings_->get<std::string>("format"), format)) {
    logger_->print_err("Unsupported report format '{}'", settings_->get<std::string>("format"));
    return 1;
  }

  auto report = summarize_identification(
    identifier_->identify_directory(dir, settings_->get<bool>("recursive")));
  auto target = resolve_path(output);
  if(!save_text(target, render(report, format), logger_.get())) {
    logger_->print_err("Failed to write report to {}", target.string());
    return 1;
  }

  const char* label = format == ReportFormat::Html ? "HTML report"
                    : format == ReportFormat::Csv ? "CSV report" : "Report";
  logger_->print("{} saved to {}", label, target.string());
  return 0;
}

int RomEngine::run_db() {
  auto add = settings_->get<std::string>("add");
  if(!add.empty()) {
    auto source = resolve_path(add);
    if(store_->load_source(source)) {
      logger_->print("Added DAT file: {}", source.string());
      return 0;
    }
    logger_->print("Failed to add DAT file: {}", source.string());
    return 1;
  }

  if(settings_->get<bool>("list")) {
    logger_->print("Loaded databases:");
    for(const auto& name : store_->catalog_names()) {
      logger_->print("- {}", name);
    }
    return 0;
  }

  if(settings_->get<bool>("stats")) {
    auto stats = store_->export_stats();
    logger_->print("Total databases: {}", stats.catalog_count);
    logger_->print("Total ROMs: {}", stats.total_entries);
    logger_->print("ROMs with MD5: {}", stats.total_md5);
    logger_->print("");
    logger_->print("Database details:");
    for(const auto& catalog : stats.per_catalog) {
      logger_->print("- {}: {} ROMs ({} md5, {} sha1, {} crc32)",
                     catalog.name, catalog.entries,
                     catalog.unique_md5, catalog.unique_sha1, catalog.unique_crc32);
    }
    return 0;
  }

  auto query = settings_->get<std::string>("find");
  if(!query.empty()) {
    auto matches = store_->find_by_name(query);
    logger_->print("{} match(es) for '{}'", matches.size(), query);
    for(const auto& match : matches) {
      logger_->print("- {} [{}] {} ({})",
                     match.entry->name, match.catalog, match.entry->description, percent(match.confidence));
      auto parts = parse_rom_name(match.entry->name);
      logger_->print("  title: {}, region: {}, version: {}", parts.title,
                     parts.region.empty() ? std::string("-") : parts.region,
                     parts.version.empty() ? std::string("-") : parts.version);
    }
    return 0;
  }

  logger_->print_err("db requires one of --add, --list, --stats or --find");
  return 1;
}

int RomEngine::run_settings() {
  auto keys = settings_->keys();
  std::sort(keys.begin(), keys.end());
  for(const auto& key : keys) {
    logger_->print("{} = {}", key, settings_->value_as_string(key));
  }
  logger_->print("(settings file: {})", settings_->settings_path().string());
  return 0;
}
