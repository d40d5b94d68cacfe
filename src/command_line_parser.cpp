#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>

CommandLineParser::CommandLineParser(std::string process_name, std::vector<std::string> positional)
  : process_name_(std::move(process_name)),
    positional_(std::move(positional)) {
  SettingsManager defaults;
  for(const auto& key : positional_) {
    if(!defaults.resolve_key(key)) {
      throw std::runtime_error("Positional argument mapped to unknown setting '" + key + "'");
    }
  }
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?');
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(is_option_token(token)) {
      const bool long_form = token.rfind("--", 0) == 0;
      std::string name = token.substr(long_form ? 2 : 1);
      std::string value;
      bool has_inline_value = false;
      if(auto eq = name.find('='); long_form && eq != std::string::npos) {
        value = name.substr(eq + 1);
        name = name.substr(0, eq);
        has_inline_value = true;
      }

      auto key = settings.resolve_key(name);
      if(!key) {
        throw CommandLineError("Unknown option " + token);
      }
      if(!has_inline_value) {
        if(settings.is_bool_setting(*key)) {
          if(i + 1 < args.size() && is_bool_literal(args[i + 1])) {
            value = args[++i];
          } else {
            value = "true";
          }
        } else {
          if(i + 1 >= args.size()) {
            throw CommandLineError("Missing value for option " + token);
          }
          value = args[++i];
        }
      }
      std::string error;
      if(!settings.set_from_string(*key, value, error)) {
        throw CommandLineError("Invalid value for " + token + ": " + error);
      }
      continue;
    }

    if(positional_index >= positional_.size()) {
      throw CommandLineError("Unexpected argument '" + token + "'");
    }
    const auto& key = positional_[positional_index++];
    std::string error;
    if(!settings.set_from_string(key, token, error)) {
      throw CommandLineError("Invalid value for " + key + " '" + token + "': " + error);
    }
  }
}

std::string CommandLineParser::usage(const SettingsManager& settings) const {
  std::ostringstream out;
  out << process_name_ << " - peer-to-peer folder replication\n";
  out << "Usage:\n  " << process_name_;
  for(const auto& key : positional_) out << " [" << key << "]";
  out << " [options]\n\nOptions:\n";
  out << settings.describe();
  return out.str();
}
