#include "reconplan/LogTee.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <system_error>

namespace reconplan {

namespace fs = std::filesystem;

namespace {

fs::path RotatedPath(const fs::path& base, int idx)
{
  if (idx <= 0) return base;
  fs::path p = base;
  p += "." + std::to_string(idx);
  return p;
}

std::string UtcTimestamp()
{
  using clock = std::chrono::system_clock;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now().time_since_epoch());
  const auto sec = std::chrono::duration_cast<std::chrono::seconds>(ms);
  const std::time_t tt = static_cast<std::time_t>(sec.count());

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>((ms - sec).count()));
  return std::string(buf);
}

// The log file shared by the stdout and stderr tees.
struct FileSink {
  std::ofstream file;
  std::mutex mutex;
  bool atLineStart = true;
  bool prefixLines = true;

  // Write `n` bytes, prefixing each new line. Returns bytes of `s` consumed.
  std::streamsize write(const char* s, std::streamsize n, const char* tag)
  {
    std::streambuf* out = file.rdbuf();
    if (!prefixLines) return out->sputn(s, n);

    std::streamsize done = 0;
    while (done < n) {
      if (atLineStart) {
        const std::string prefix = UtcTimestamp() + " [" + tag + "] ";
        const auto plen = static_cast<std::streamsize>(prefix.size());
        if (out->sputn(prefix.data(), plen) != plen) return done;
        atLineStart = false;
      }

      const char* p = s + done;
      const char* nl = static_cast<const char*>(std::memchr(p, '\n', static_cast<std::size_t>(n - done)));
      const std::streamsize chunk = nl ? static_cast<std::streamsize>(nl - p + 1) : (n - done);
      const std::streamsize wr = out->sputn(p, chunk);
      if (wr > 0) done += wr;
      if (wr != chunk) return done;

      if (nl) {
        atLineStart = true;
        (void)out->pubsync();
      }
    }
    return done;
  }
};

class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, FileSink* sink, const char* tag) : m_console(console), m_sink(sink), m_tag(tag) {}

protected:
  int overflow(int ch) override
  {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    const char c = static_cast<char>(ch);
    return (xsputn(&c, 1) == 1) ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (n <= 0) return 0;
    std::lock_guard<std::mutex> lock(m_sink->mutex);
    const std::streamsize a = m_console->sputn(s, n);
    const std::streamsize b = m_sink->write(s, n, m_tag);
    return (a < b) ? a : b;
  }

  int sync() override
  {
    std::lock_guard<std::mutex> lock(m_sink->mutex);
    const int a = m_console->pubsync();
    const int b = m_sink->file.rdbuf()->pubsync();
    return (a == 0 && b == 0) ? 0 : -1;
  }

private:
  std::streambuf* m_console;
  FileSink* m_sink;
  const char* m_tag;
};

} // namespace

struct LogTee::Impl {
  FileSink sink;
  std::streambuf* origCout = nullptr;
  std::streambuf* origCerr = nullptr;
  std::unique_ptr<TeeBuf> coutBuf;
  std::unique_ptr<TeeBuf> cerrBuf;
};

void LogTee::ImplDeleter::operator()(Impl* p) const noexcept
{
  delete p;
}

LogTee::~LogTee()
{
  stop();
}

bool LogTee::Rotate(const fs::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const fs::path src = RotatedPath(basePath, i - 1);
    if (!fs::exists(src, ec)) continue;

    const fs::path dst = RotatedPath(basePath, i);
    fs::remove(dst, ec);
    fs::rename(src, dst, ec);
    if (ec) {
      outError = "failed to rotate log '" + src.string() + "' -> '" + dst.string() + "': " + ec.message();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  outError.clear();
  stop();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  const fs::path parent = opt.path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      outError = "failed to create log directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  std::unique_ptr<Impl, ImplDeleter> impl(new Impl());
  impl->sink.prefixLines = opt.prefixLines;
  impl->sink.file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->sink.file) {
    outError = "unable to open log file for writing: " + opt.path.string();
    return false;
  }

  if (opt.teeStdout) {
    impl->origCout = std::cout.rdbuf();
    impl->coutBuf = std::make_unique<TeeBuf>(impl->origCout, &impl->sink, "OUT");
    std::cout.rdbuf(impl->coutBuf.get());
  }
  if (opt.teeStderr) {
    impl->origCerr = std::cerr.rdbuf();
    impl->cerrBuf = std::make_unique<TeeBuf>(impl->origCerr, &impl->sink, "ERR");
    std::cerr.rdbuf(impl->cerrBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  if (m_impl->coutBuf && std::cout.rdbuf() == m_impl->coutBuf.get()) std::cout.rdbuf(m_impl->origCout);
  if (m_impl->cerrBuf && std::cerr.rdbuf() == m_impl->cerrBuf.get()) std::cerr.rdbuf(m_impl->origCerr);

  m_impl->sink.file.flush();
  m_impl.reset();
}

} // namespace reconplan
