#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

class Logger;

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "romid",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","command"}},
                      {{"index",1},{"key","path"}}
                    }));

  // Applies argv onto settings. Returns false with a message on an unknown
  // option, a missing or invalid value, or a surplus positional.
  bool parse(int argc, const char* const argv[], SettingsManager& settings, std::string& error) const;
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
  void usage(Logger* logger = nullptr) const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
