#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "log.hpp"

class CatalogStore;
class RomIdentifier;
class RomRenamer;
class SettingsManager;

class RomEngine {
public:
  struct Options {
    // Relative paths in settings resolve against this directory.
    std::filesystem::path workspace_root = std::filesystem::current_path();
    bool load_database_dir = true;
  };

  RomEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~RomEngine();

  // Configures logging and loads every DAT in database_dir.
  void start();

  // Runs the subcommand held in the "command" setting; returns an exit code.
  int execute();
  int execute_command(const std::string& command);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

  CatalogStore& store() { return *store_; }
  RomIdentifier& identifier() { return *identifier_; }
  RomRenamer& renamer() { return *renamer_; }

  struct Stats {
    std::size_t sources_loaded = 0;
    std::size_t catalogs = 0;
    std::size_t entries = 0;
  };

  Stats stats() const;

  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }
  std::filesystem::path resolve_path(const std::string& raw) const;

private:
  int run_scan();
  int run_rename();
  int run_report();
  int run_db();
  int run_settings();

  bool require_path(std::filesystem::path& out);
  void apply_jobs();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<CatalogStore> store_;
  std::unique_ptr<RomIdentifier> identifier_;
  std::unique_ptr<RomRenamer> renamer_;
  bool started_ = false;
  std::size_t sources_loaded_ = 0;
};
