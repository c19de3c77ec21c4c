#include "comm/CommRegistry.hpp"

namespace distctx::comm
{

static std::string error_text(int code)
{
    char buf[MPI_MAX_ERROR_STRING];
    int len = 0;
    if (MPI_Error_string(code, buf, &len) != MPI_SUCCESS)
        return "MPI error " + std::to_string(code);
    return std::string(buf, static_cast<std::size_t>(len));
}

MpiError::MpiError(const std::string& where, int code)
    : std::runtime_error(where + ": " + error_text(code)), code_(code)
{
}

void check_mpi(int code, const char* where)
{
    if (code != MPI_SUCCESS)
        throw MpiError(where, code);
}

bool mpi_active() noexcept
{
    int inited = 0, finalized = 0;
    MPI_Initialized(&inited);
    MPI_Finalized(&finalized);
    return inited && !finalized;
}

MPI_Comm CommRegistry::get()
{
    if (!current_)
        current_ = MPI_COMM_WORLD;
    return *current_;
}

int CommRegistry::rank()
{
    if (!mpi_active())
        return 0;
    int r = 0;
    check_mpi(MPI_Comm_rank(get(), &r), "MPI_Comm_rank");
    return r;
}

int CommRegistry::size()
{
    if (!mpi_active())
        return 1;
    int n = 1;
    check_mpi(MPI_Comm_size(get(), &n), "MPI_Comm_size");
    return n;
}

} // namespace distctx::comm
