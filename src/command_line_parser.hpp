#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Bad command line; the message is meant for the user.
class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// --key value, -alias value, and positional arguments mapped to settings in
// order. Boolean options take an optional true/false literal.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "replisync",
                             std::vector<std::string> positional = {"folder_path", "listen_port", "peers"});

  // Throws CommandLineError.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  std::string usage(const SettingsManager& settings) const;

private:
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  std::vector<std::string> positional_;
};
