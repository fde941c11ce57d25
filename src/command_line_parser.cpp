#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    argv_spec_(std::move(argv_spec)),
    positional_specs_(build_positional_specs(argv_spec_)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager known(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!known.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?')) {
    return true;
  }
  return false;
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower_copy(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

bool CommandLineParser::parse(int argc, const char* const argv[], SettingsManager& settings, std::string& error) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args, settings, error);
}

bool CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const {
  error.clear();
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    // Returns 1 when consumed, 0 to fall through to positionals, -1 on error.
    auto handle_option = [&](std::string key_token, bool long_form) -> int {
      std::string inline_value;
      bool has_inline = false;
      if(long_form) {
        auto eq = key_token.find('=');
        if(eq != std::string::npos) {
          inline_value = key_token.substr(eq + 1);
          key_token = key_token.substr(0, eq);
          has_inline = true;
        }
      }
      // Accept --dry-run as well as --dry_run.
      std::replace(key_token.begin(), key_token.end(), '-', '_');
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) {
          error = "Unknown option --" + key_token;
          return -1;
        }
        return 0;
      }
      std::string value;
      if(has_inline) {
        value = inline_value;
      } else if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          error = "Missing value for option '" + key_token + "'";
          return -1;
        }
        value = args[++i];
      }
      std::string set_error;
      if(!settings.set_from_string(*resolved, value, set_error)) {
        error = "Invalid value for option '" + key_token + "': " + set_error;
        return -1;
      }
      return 1;
    };

    if(token.rfind("--", 0) == 0 && token.size() > 2) {
      if(handle_option(token.substr(2), true) < 0) return false;
      continue;
    }

    if(token.size() > 1 && token[0] == '-' && token[1] != '-') {
      int handled = handle_option(token.substr(1), false);
      if(handled < 0) return false;
      if(handled > 0) continue;
    }

    if(positional_index >= positional_specs_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string set_error;
    if(!settings.set_from_string(spec.key, token, set_error)) {
      error = "Invalid value for " + spec.key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage(Logger* logger) const {
  print_out(logger, "{} - identify ROM files against DAT checksum catalogs", process_name_);
  print_out(logger, "Usage:");

  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  print_out(logger, "  {} [options]", cmd);
  print_out(logger, "");
  print_out(logger, "Commands:");
  print_out(logger, "  scan <path>      identify ROMs and summarize (--output writes a JSON report)");
  print_out(logger, "  rename <path>    rename identified ROMs to their catalog names");
  print_out(logger, "  report <path>    write an identification report (--output required)");
  print_out(logger, "  db               --add <dat> | --list | --stats | --find <query>");
  print_out(logger, "  settings         show the effective settings");
  print_out(logger, "");
  print_out(logger, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    auto description = entry.value("description", "");
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    print_out(logger, "  --{:<13} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              description,
              aliases.str(),
              default_str);
  }
  print_out(logger, "");
}
