#include "autotile/LogTee.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <system_error>
#include <utility>

namespace autotile {

namespace {

std::filesystem::path RotatedPath(const std::filesystem::path& base, int idx)
{
  if (idx <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(idx);
  return p;
}

std::string TimestampUtcNow()
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

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>((ms - sec).count()));
  return std::string(buf);
}

// Forwards every write to the console buffer and to the shared log file buffer.
class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, std::streambuf* file, std::mutex* m, bool* fileAtLineStart, const char* tag,
         bool prefixLines)
      : m_console(console)
      , m_file(file)
      , m_mutex(m)
      , m_fileAtLineStart(fileAtLineStart)
      , m_tag(tag)
      , m_prefixLines(prefixLines)
  {
  }

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
    std::lock_guard<std::mutex> lock(*m_mutex);
    const std::streamsize written = m_console->sputn(s, n);
    writeFileLocked(s, n);
    return written;
  }

  int sync() override
  {
    std::lock_guard<std::mutex> lock(*m_mutex);
    const int a = m_console->pubsync();
    const int b = m_file->pubsync();
    return (a == 0 && b == 0) ? 0 : -1;
  }

private:
  void writeFileLocked(const char* s, std::streamsize n)
  {
    if (!m_prefixLines) {
      m_file->sputn(s, n);
      return;
    }

    const char* p = s;
    const char* end = s + n;
    while (p < end) {
      if (*m_fileAtLineStart) {
        const std::string prefix = TimestampUtcNow() + " [" + m_tag + "] ";
        m_file->sputn(prefix.data(), static_cast<std::streamsize>(prefix.size()));
        *m_fileAtLineStart = false;
      }

      const char* nl = static_cast<const char*>(std::memchr(p, '\n', static_cast<std::size_t>(end - p)));
      const char* stop = nl ? nl + 1 : end;
      m_file->sputn(p, static_cast<std::streamsize>(stop - p));
      if (nl) {
        *m_fileAtLineStart = true;
        // Flush per line.
        m_file->pubsync();
      }
      p = stop;
    }
  }

  std::streambuf* m_console = nullptr;
  std::streambuf* m_file = nullptr;
  std::mutex* m_mutex = nullptr;
  bool* m_fileAtLineStart = nullptr;
  std::string m_tag;
  bool m_prefixLines = true;
};

} // namespace

struct LogTee::Impl {
  std::ofstream file;
  std::mutex mutex;
  bool fileAtLineStart = true;

  std::streambuf* origCout = nullptr;
  std::streambuf* origCerr = nullptr;
  std::unique_ptr<TeeBuf> coutBuf;
  std::unique_ptr<TeeBuf> cerrBuf;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path dst = RotatedPath(basePath, i);
    const std::filesystem::path src = RotatedPath(basePath, i - 1);
    if (!std::filesystem::exists(src, ec)) continue;

    std::filesystem::remove(dst, ec);
    std::filesystem::rename(src, dst, ec);
    if (ec) {
      outError = "Failed to rotate log '" + src.string() + "' -> '" + dst.string() + "': " + ec.message();
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
    outError = "Log path is empty";
    return false;
  }

  const std::filesystem::path parent = opt.path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "Failed to create log directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto impl = std::make_unique<Impl>();
  impl->file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->file) {
    outError = "Unable to open log file for writing: " + opt.path.string();
    return false;
  }
  std::streambuf* fileBuf = impl->file.rdbuf();

  if (opt.teeStdout) {
    impl->origCout = std::cout.rdbuf();
    impl->coutBuf = std::make_unique<TeeBuf>(impl->origCout, fileBuf, &impl->mutex, &impl->fileAtLineStart, "OUT",
                                             opt.prefixLines);
    std::cout.rdbuf(impl->coutBuf.get());
  }
  if (opt.teeStderr) {
    impl->origCerr = std::cerr.rdbuf();
    impl->cerrBuf = std::make_unique<TeeBuf>(impl->origCerr, fileBuf, &impl->mutex, &impl->fileAtLineStart, "ERR",
                                             opt.prefixLines);
    std::cerr.rdbuf(impl->cerrBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  // Restore first so output during teardown never reaches a closed file.
  if (m_impl->origCout && std::cout.rdbuf() == m_impl->coutBuf.get()) std::cout.rdbuf(m_impl->origCout);
  if (m_impl->origCerr && std::cerr.rdbuf() == m_impl->cerrBuf.get()) std::cerr.rdbuf(m_impl->origCerr);

  m_impl->file.flush();
  m_impl.reset();
}

} // namespace autotile
