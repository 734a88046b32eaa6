#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace reconplan {

// RAII helper that copies std::cout/std::cerr output into a log file.
//
// The core library never logs; the tools report progress on stdout and
// diagnostics on stderr. `--log <path>` installs a LogTee so a planning run
// leaves a timestamped record next to its exported plan.
//
// Log file lines are prefixed with a UTC timestamp and [OUT]/[ERR]; the console
// output is left untouched. Existing logs are rotated <log> -> <log>.1 -> ...
struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep. 0 truncates the existing file.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  bool prefixLines = true;
};

class LogTee {
public:
  LogTee() = default;
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start teeing. An active tee is stopped first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original stream buffers and close the file.
  void stop();

  bool active() const { return m_impl != nullptr; }

  // Shift <base>.(i-1) to <base>.i for i = keepFiles..1.
  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  struct ImplDeleter {
    void operator()(Impl* p) const noexcept;
  };
  std::unique_ptr<Impl, ImplDeleter> m_impl;
};

} // namespace reconplan
