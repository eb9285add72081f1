// utils.hpp - Utility functions
#pragma once

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace stablemount {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);

private:
  Logger() = default;
  bool verbose_ = false;
  std::unique_ptr<std::ofstream> log_file_;
};

#define LOG_INFO(msg) Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) Logger::getInstance().log("DEBUG", msg)

// Local time as 2026-10-16T09:15:02+02:00
std::string iso8601_now();

// File system utilities
bool ensure_dir_exists(const fs::path &path);
bool remove_empty_dir(const fs::path &path);
bool is_dir_at(const fs::path &path);

// String utilities
std::string trim(const std::string &s);
std::string url_encode(const std::string &s);
std::string url_decode(const std::string &s);
std::string shell_quote(const std::string &s);

// Replaces {name} placeholders with shell-quoted values. Unknown
// placeholders are left untouched.
std::string expand_template(const std::string &tmpl,
                            const std::map<std::string, std::string> &vars);

// Process utilities
void sleep_ms(int ms);
int run_command(const std::string &cmd);
bool run_command_capture(const std::string &cmd, std::string &output);

} // namespace stablemount
