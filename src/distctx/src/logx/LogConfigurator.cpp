#include "logx/LogConfigurator.hpp"
#include <memory>
#include <string>

namespace distctx::logx
{

namespace
{

// Ranks left out of a split hold MPI_COMM_NULL; their prefix shows the world rank instead.
int prefix_rank(comm::CommRegistry& reg)
{
    if (!comm::mpi_active() || reg.get() != MPI_COMM_NULL)
        return reg.rank();
    int r = 0;
    comm::check_mpi(MPI_Comm_rank(MPI_COMM_WORLD, &r), "MPI_Comm_rank");
    return r;
}

} // namespace

Sink& LogConfigurator::ensure_sink()
{
    if (!sink_)
        sink_ = &stream_.attach(std::make_unique<Sink>());
    return *sink_;
}

void LogConfigurator::configure(std::string_view level)
{
    const Level L = parse_level(level); // throws before anything is touched
    const int rank = prefix_rank(comm_);

    Sink& s = ensure_sink();
    s.fmt = Format{};
    s.rank = rank;
    s.level = L;
}

void LogConfigurator::configure(std::string_view level, std::FILE* out)
{
    configure(level);
    sink_->out = out;
}

void LogConfigurator::configure_from_env(std::string_view fallback)
{
    const std::string name = level_name_from_env(fallback);
    configure(name);
}

} // namespace distctx::logx
