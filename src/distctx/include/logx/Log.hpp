#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @file Log.hpp
 * @brief Process-wide printf-style log stream with rank/elapsed-time prefixed sinks.
 *
 * @details
 * Records are produced by named :cpp:class:`Logger` objects (or the ``LOG*`` macros, which log
 * under the name ``root``) and handed to every :cpp:class:`Sink` attached to a
 * :cpp:class:`LogStream`. A sink renders one line per record:
 *
 * @rst
 * .. code-block:: text
 *
 *    [ 000000.43 ]   0: 06-28 14:49  measurestats    INFO     Nproc = [2, 1, 1]
 *
 * The leading block is seconds since the sink was first configured and the process rank; the
 * rest is ``asctime name(15) level(8) message``. Sinks are attached by
 * :cpp:class:`LogConfigurator`, which guarantees a single sink however often it is reconfigured.
 *
 * .. code-block:: cpp
 *
 *    distctx::Context::process().logging().configure("info");
 *    distctx::logx::Logger log("measurestats");
 *    log.info("Nproc = [%d, %d, %d]", 2, 1, 1);
 *    LOGW("falling back to %s", "MPI_COMM_WORLD");
 * @endrst
 */

namespace distctx::logx
{

enum class Level : int
{
    Quiet = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

/// Thrown for a level name outside {info, debug, warning}.
class UnrecognizedLevel : public std::invalid_argument
{
  public:
    explicit UnrecognizedLevel(std::string_view name)
        : std::invalid_argument("Unrecognized log level: '" + std::string(name) +
                                "' (expected info | debug | warning)")
    {
    }
};

// Case-sensitive; throws UnrecognizedLevel.
Level parse_level(std::string_view name);

// Value of DISTCTX_LOG, or `fallback` when unset/empty.
std::string level_name_from_env(std::string_view fallback = "info");

const char* level_name(Level L) noexcept;

/// Line template of a sink.
struct Format
{
    std::string prefix = "[ %09.2f ] % 3d: "; // elapsed seconds, rank
    std::string datefmt = "%m-%d %H:%M ";     // strftime pattern for asctime
    int name_width = 15;
    int level_width = 8;
};

/// Single output destination: template + threshold + rank.
class Sink
{
  public:
    using clock = std::chrono::steady_clock;

    Sink();

    bool accepts(Level L) const noexcept { return L != Level::Quiet && L <= level; }

    // Renders without the trailing newline.
    std::string render(std::string_view name, Level L, std::string_view msg) const;
    void emit(std::string_view name, Level L, std::string_view msg) const;

    Format fmt{};
    Level level = Level::Warn;
    int rank = 0;
    std::FILE* out = stderr;
    clock::time_point t0;
};

/// The process-wide record router. Owns its sinks.
class LogStream
{
  public:
    Sink& attach(std::unique_ptr<Sink> s);

    bool enabled(Level L) const noexcept;
    void write(std::string_view name, Level L, std::string_view msg) const;

    // Introspection for tests
    std::size_t sink_count() const noexcept { return sinks_.size(); }

  private:
    std::vector<std::unique_ptr<Sink>> sinks_;
};

// Stream owned by distctx::Context::process().
LogStream& process_stream();

void vprint(LogStream& s, std::string_view name, Level L, const char* fmt, va_list ap);
void print(LogStream& s, std::string_view name, Level L, const char* fmt, ...);
void print(std::string_view name, Level L, const char* fmt, ...);

/// Named handle onto a stream; cheap to copy.
class Logger
{
  public:
    explicit Logger(std::string name) : Logger(std::move(name), process_stream()) {}
    Logger(std::string name, LogStream& s) : name_(std::move(name)), stream_(&s) {}

    const std::string& name() const noexcept { return name_; }

    void debug(const char* fmt, ...) const;
    void info(const char* fmt, ...) const;
    void warning(const char* fmt, ...) const;
    void error(const char* fmt, ...) const;

  private:
    std::string name_;
    LogStream* stream_;
};

// Convenience
#define LOGD(...) ::distctx::logx::print("root", ::distctx::logx::Level::Debug, __VA_ARGS__)
#define LOGI(...) ::distctx::logx::print("root", ::distctx::logx::Level::Info, __VA_ARGS__)
#define LOGW(...) ::distctx::logx::print("root", ::distctx::logx::Level::Warn, __VA_ARGS__)
#define LOGE(...) ::distctx::logx::print("root", ::distctx::logx::Level::Error, __VA_ARGS__)

} // namespace distctx::logx
