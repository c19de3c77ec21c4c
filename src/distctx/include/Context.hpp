#pragma once
#include "comm/CommRegistry.hpp"
#include "config/ConfigYAML.hpp"
#include "logx/Log.hpp"
#include "logx/LogConfigurator.hpp"
#include "options/Options.hpp"

/**
 * @file Context.hpp
 * @brief Coordination state shared by every operation of one process.
 *
 * @details
 * `Context` owns the current-communicator registry, the options table, the log stream and the
 * configurator that attaches its sink. Components take the piece they need by reference, so
 * tests can build an isolated `Context` while ordinary code uses :cpp:func:`Context::process`.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   distctx::comm::MpiSession mpi(argc, argv);
 *   auto& ctx = distctx::Context::process();
 *   ctx.apply(distctx::config::load_config_from_yaml("run.yaml"));
 *
 *   distctx::cache::ResultCache cache(ctx.options());
 *   ctx.comm().set(sub_comm);
 * @endrst
 *
 * @note Each MPI process has its own instance; nothing here communicates across processes.
 * Not thread-safe.
 */

namespace distctx
{

class Context
{
  public:
    Context() : logging_(log_, comm_) {}

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    // Constructed on first use
    static Context& process();

    comm::CommRegistry& comm() noexcept { return comm_; }
    options::Options& options() noexcept { return options_; }
    logx::LogStream& log() noexcept { return log_; }
    logx::LogConfigurator& logging() noexcept { return logging_; }

    // Configures logging when the config names a level. The options overlay is left to the
    // caller's ScopedOptions.
    void apply(const config::RuntimeConfig& cfg);

  private:
    comm::CommRegistry comm_;
    options::Options options_;
    logx::LogStream log_;
    logx::LogConfigurator logging_;
};

} // namespace distctx
