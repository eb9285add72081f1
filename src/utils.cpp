// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include <cctype>
#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <thread>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace stablemount {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  verbose_ = verbose;
  log_file_.reset();

  if (!log_path.empty()) {
    if (log_path.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(log_path.parent_path(), ec);
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  std::string log_line = iso8601_now() + " [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  // Routine lines go to stdout, diagnostics to stderr
  if (level == "WARN" || level == "ERROR") {
    std::cerr << log_line;
  } else {
    std::cout << log_line << std::flush;
  }
}

std::string iso8601_now() {
  auto now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);

  char time_buf[32];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm);

  // strftime's %z has no colon in the offset
  char zone_buf[8];
  std::strftime(zone_buf, sizeof(zone_buf), "%z", &tm);
  std::string zone(zone_buf);
  if (zone.size() == 5) {
    zone.insert(3, ":");
  }

  return std::string(time_buf) + zone;
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

bool remove_empty_dir(const fs::path &path) {
  if (rmdir(path.c_str()) == 0) {
    return true;
  }
  LOG_DEBUG("rmdir " + path.string() + ": " + strerror(errno));
  return false;
}

bool is_dir_at(const fs::path &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

// String utilities
std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string url_encode(const std::string &s) {
  static const char *hex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0x0F];
    }
  }
  return out;
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string url_decode(const std::string &s) {
  std::string out;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size()) {
      int hi = hex_value(s[i + 1]);
      int lo = hex_value(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
        continue;
      }
    }
    out += s[i];
  }
  return out;
}

std::string shell_quote(const std::string &s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += "'";
  return out;
}

std::string expand_template(const std::string &tmpl,
                            const std::map<std::string, std::string> &vars) {
  std::string out;
  size_t pos = 0;
  while (pos < tmpl.size()) {
    auto open = tmpl.find('{', pos);
    if (open == std::string::npos) {
      out += tmpl.substr(pos);
      break;
    }
    auto close = tmpl.find('}', open);
    if (close == std::string::npos) {
      out += tmpl.substr(pos);
      break;
    }

    out += tmpl.substr(pos, open - pos);
    std::string name = tmpl.substr(open + 1, close - open - 1);
    auto it = vars.find(name);
    if (it != vars.end()) {
      out += shell_quote(it->second);
    } else {
      out += tmpl.substr(open, close - open + 1);
    }
    pos = close + 1;
  }
  return out;
}

// Process utilities
void sleep_ms(int ms) {
  if (ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
}

int run_command(const std::string &cmd) {
  LOG_DEBUG("exec: " + cmd);
  int ret = system(cmd.c_str());
  if (ret == -1) {
    LOG_ERROR("Failed to execute: " + cmd);
    return -1;
  }
  if (WIFEXITED(ret)) {
    return WEXITSTATUS(ret);
  }
  return -1;
}

bool run_command_capture(const std::string &cmd, std::string &output) {
  LOG_DEBUG("exec: " + cmd);
  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    LOG_ERROR("Failed to execute: " + cmd);
    return false;
  }

  output.clear();
  char buffer[256];
  while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    output += buffer;
  }

  int ret = pclose(pipe);
  return ret != -1 && WIFEXITED(ret) && WEXITSTATUS(ret) == 0;
}

} // namespace stablemount
