#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace autotile {

// RAII helper that duplicates std::cout/std::cerr into a log file.
//
// Tools print results to stdout and diagnostics to stderr; with a LogTee active both
// also land in the file, each file line prefixed with a UTC timestamp and [OUT]/[ERR].
// Console output is unchanged.
struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep (<log>.1 .. <log>.N). 0 truncates the existing file.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start logging. An already active tee is stopped first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original stream buffers and close the file.
  void stop();

  bool active() const { return m_impl != nullptr; }

  // base -> base.1 -> base.2 ... up to keepFiles.
  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace autotile
