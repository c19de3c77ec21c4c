#pragma once
#include "comm/CommRegistry.hpp"
#include "logx/Log.hpp"
#include <cstdio>
#include <string_view>

/**
 * @file LogConfigurator.hpp
 * @brief Attaches exactly one rank-prefixed sink to a log stream and reconfigures it in place.
 *
 * @details
 * The first successful :cpp:func:`LogConfigurator::configure` creates the sink and attaches it;
 * every later call only rewrites that sink's template, rank and threshold, so repeated
 * configuration never duplicates output. The elapsed-seconds origin is fixed by the first call.
 * The rank is that of the registry's current communicator, or the world rank when the current
 * handle is ``MPI_COMM_NULL``.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto& lc = distctx::Context::process().logging();
 *   lc.configure("info");
 *   lc.configure("debug"); // same sink, now at debug
 *   lc.configure("loud");  // throws UnrecognizedLevel; sink untouched
 * @endrst
 */

namespace distctx::logx
{

class LogConfigurator
{
  public:
    LogConfigurator(LogStream& stream, comm::CommRegistry& comm) : stream_(stream), comm_(comm)
    {
    }

    LogConfigurator(const LogConfigurator&) = delete;
    LogConfigurator& operator=(const LogConfigurator&) = delete;

    // level ∈ {info, debug, warning}; output goes to the sink's current FILE* (stderr at first).
    void configure(std::string_view level);
    void configure(std::string_view level, std::FILE* out);
    // DISTCTX_LOG if set, else `fallback`.
    void configure_from_env(std::string_view fallback = "info");

    bool attached() const noexcept { return sink_ != nullptr; }
    // nullptr until the first successful configure
    const Sink* sink() const noexcept { return sink_; }

  private:
    Sink& ensure_sink();

    LogStream& stream_;
    comm::CommRegistry& comm_;
    Sink* sink_ = nullptr; // owned by stream_
};

} // namespace distctx::logx
