#include "upgate/security/content_scanner.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

#include <spdlog/spdlog.h>

#include "upgate/util/filesystem.hpp"

namespace upgate::security {

namespace {

std::string toLower(std::string_view value) {
  std::string result(value);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

}  // namespace

const std::vector<std::string>& ContentScanner::defaultPatterns() {
  static const std::vector<std::string> patterns = {
    // Code execution
    "eval(", "exec(", "system(", "shell_exec(", "passthru(", "popen(", "proc_open(",
    "file_get_contents(", "file_put_contents(", "fopen(", "fwrite(",
    "include(", "require(", "require_once(", "include_once(",
    // Interpreters and command execution
    "#!/bin/bash", "#!/bin/sh", "#!/usr/bin/env", "cmd.exe", "powershell",
    "/bin/sh", "/bin/bash", "wget ", "curl ", "netcat", "telnet",
    // Web script injection
    "<script", "<iframe", "<object", "<embed", "<applet", "javascript:", "vbscript:",
    "onload=", "onerror=", "onclick=", "onmouseover=",
    "document.cookie", "document.write", "window.location", "xmlhttprequest",
    "$.ajax", "$.post", "$.get",
    // SQL manipulation
    "union select", "drop table", "delete from", "insert into", "alter table",
    "create table", "execute(", "sp_executesql", "xp_cmdshell",
    // Path traversal and sensitive locations
    "../", "..\\", "/etc/passwd", "/etc/shadow", "c:\\windows\\system32",
    "/proc/self",
    // Encoding and obfuscation
    "base64_decode", "base64_encode", "str_rot13", "gzinflate", "gzuncompress",
    "gzdecode", "gzencode", "gzcompress", "gzdeflate", "gzfile", "readgzfile",
    "gzopen", "gzread", "gzwrite", "gzpassthru", "fromcharcode", "unescape(",
    "atob(", "create_function(", "assert(", "preg_replace(",
  };
  return patterns;
}

ContentScanner::ContentScanner() : ContentScanner(defaultPatterns()) {
}

ContentScanner::ContentScanner(std::vector<std::string> patterns) {
  patterns_.reserve(patterns.size());
  for (auto& pattern : patterns) {
    if (!pattern.empty()) {
      patterns_.push_back(toLower(pattern));
    }
  }
}

ContentScanner::ScanResult ContentScanner::scan(std::string_view content) const {
  auto lowered = toLower(content);

  for (const auto& pattern : patterns_) {
    if (lowered.find(pattern) != std::string::npos) {
      return {false, "Suspicious content detected: " + pattern, core::ViolationKind::kContentPattern};
    }
  }

  if (entropy(content) > kEntropyThreshold) {
    return {false, "High entropy content detected (potential obfuscation)",
            core::ViolationKind::kEntropy};
  }

  if (content.size() < kMinimumSize) {
    return {false, "File too small (potential payload)", core::ViolationKind::kSmallPayload};
  }

  return {};
}

ContentScanner::ScanResult ContentScanner::scanFile(const std::filesystem::path& path) const {
  auto content = util::FileSystem::readFile(path);
  if (!content.has_value()) {
    spdlog::warn("Content scan skipped for {}: {}", path.string(), content.error().message());
    return {};
  }
  return scan(*content);
}

double ContentScanner::entropy(std::string_view content) {
  if (content.empty()) {
    return 0.0;
  }

  std::array<std::size_t, 256> counts{};
  for (char c : content) {
    ++counts[static_cast<unsigned char>(c)];
  }

  double result = 0.0;
  const auto total = static_cast<double>(content.size());
  for (auto count : counts) {
    if (count > 0) {
      double p = static_cast<double>(count) / total;
      result -= p * std::log2(p);
    }
  }

  return result;
}

}  // namespace upgate::security
