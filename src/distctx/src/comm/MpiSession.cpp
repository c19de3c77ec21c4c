#include "comm/MpiSession.hpp"
#include "comm/CommRegistry.hpp"

namespace distctx::comm
{

MpiSession::MpiSession(int& argc, char**& argv)
{
    int inited = 0;
    MPI_Initialized(&inited);
    if (inited)
        return;
    int provided = MPI_THREAD_SINGLE;
    check_mpi(MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided), "MPI_Init_thread");
    owner_ = true;
}

MpiSession::~MpiSession()
{
    if (!owner_)
        return;
    int finalized = 0;
    MPI_Finalized(&finalized);
    if (!finalized)
        MPI_Finalize();
}

} // namespace distctx::comm
