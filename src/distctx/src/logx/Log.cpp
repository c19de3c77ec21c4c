#include "logx/Log.hpp"
#include <array>
#include <cstdlib>
#include <ctime>

namespace distctx::logx
{

Level parse_level(std::string_view name)
{
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "warning")
        return Level::Warn;
    throw UnrecognizedLevel(name);
}

std::string level_name_from_env(std::string_view fallback)
{
    const char* v = std::getenv("DISTCTX_LOG");
    if (!v || !*v)
        return std::string(fallback);
    return v;
}

const char* level_name(Level L) noexcept
{
    switch (L)
    {
    case Level::Error:
        return "ERROR";
    case Level::Warn:
        return "WARNING";
    case Level::Info:
        return "INFO";
    case Level::Debug:
        return "DEBUG";
    default:
        return "";
    }
}

Sink::Sink() : t0(clock::now()) {}

std::string Sink::render(std::string_view name, Level L, std::string_view msg) const
{
    const double elapsed = std::chrono::duration<double>(clock::now() - t0).count();

    std::array<char, 64> head{};
    std::snprintf(head.data(), head.size(), fmt.prefix.c_str(), elapsed, rank);

    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    std::array<char, 64> asctime{};
    std::strftime(asctime.data(), asctime.size(), fmt.datefmt.c_str(), &tm);

    const std::string nm(name);
    const int n = std::snprintf(nullptr, 0, "%s%s %-*s %-*s ", head.data(), asctime.data(),
                                fmt.name_width, nm.c_str(), fmt.level_width, level_name(L));
    std::string line(static_cast<std::size_t>(n), '\0');
    std::snprintf(line.data(), line.size() + 1, "%s%s %-*s %-*s ", head.data(), asctime.data(),
                  fmt.name_width, nm.c_str(), fmt.level_width, level_name(L));
    line.append(msg);
    return line;
}

void Sink::emit(std::string_view name, Level L, std::string_view msg) const
{
    if (!out || !accepts(L))
        return;
    const double elapsed = std::chrono::duration<double>(clock::now() - t0).count();

    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    std::array<char, 64> asctime{};
    std::strftime(asctime.data(), asctime.size(), fmt.datefmt.c_str(), &tm);

    // Straight to the FILE, same layout as render()
    std::fprintf(out, fmt.prefix.c_str(), elapsed, rank);
    std::fprintf(out, "%s %-*.*s %-*s ", asctime.data(), fmt.name_width,
                 static_cast<int>(name.size()), name.data(), fmt.level_width, level_name(L));
    std::fwrite(msg.data(), 1, msg.size(), out);
    std::fputc('\n', out);
    std::fflush(out);
}

Sink& LogStream::attach(std::unique_ptr<Sink> s)
{
    sinks_.push_back(std::move(s));
    return *sinks_.back();
}

bool LogStream::enabled(Level L) const noexcept
{
    for (const auto& s : sinks_)
        if (s->accepts(L))
            return true;
    return false;
}

void LogStream::write(std::string_view name, Level L, std::string_view msg) const
{
    for (const auto& s : sinks_)
        s->emit(name, L, msg);
}

void vprint(LogStream& s, std::string_view name, Level L, const char* fmt, va_list ap)
{
    if (!s.enabled(L))
        return;

    // Short records are formatted on the stack; only longer ones allocate
    std::array<char, 512> buf{};
    va_list aq;
    va_copy(aq, ap);
    const int n = std::vsnprintf(buf.data(), buf.size(), fmt, aq);
    va_end(aq);
    if (n < 0)
        return;

    std::string heap;
    std::string_view msg;
    if (static_cast<std::size_t>(n) < buf.size())
    {
        msg = std::string_view(buf.data(), static_cast<std::size_t>(n));
    }
    else
    {
        heap.assign(static_cast<std::size_t>(n), '\0');
        std::vsnprintf(heap.data(), heap.size() + 1, fmt, ap);
        msg = heap;
    }
    // Sinks terminate lines themselves
    while (!msg.empty() && msg.back() == '\n')
        msg.remove_suffix(1);
    s.write(name, L, msg);
}

void print(LogStream& s, std::string_view name, Level L, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    vprint(s, name, L, fmt, ap);
    va_end(ap);
}

void print(std::string_view name, Level L, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    vprint(process_stream(), name, L, fmt, ap);
    va_end(ap);
}

void Logger::debug(const char* fmt, ...) const
{
    va_list ap;
    va_start(ap, fmt);
    vprint(*stream_, name_, Level::Debug, fmt, ap);
    va_end(ap);
}

void Logger::info(const char* fmt, ...) const
{
    va_list ap;
    va_start(ap, fmt);
    vprint(*stream_, name_, Level::Info, fmt, ap);
    va_end(ap);
}

void Logger::warning(const char* fmt, ...) const
{
    va_list ap;
    va_start(ap, fmt);
    vprint(*stream_, name_, Level::Warn, fmt, ap);
    va_end(ap);
}

void Logger::error(const char* fmt, ...) const
{
    va_list ap;
    va_start(ap, fmt);
    vprint(*stream_, name_, Level::Error, fmt, ap);
    va_end(ap);
}

} // namespace distctx::logx
