#pragma once
#include <mpi.h>

namespace distctx::comm
{

// Once-only MPI lifetime. Initializes (FUNNELED) only when nobody has yet; finalizes only if this
// object was the owner. Safe under mpirun or standalone.
class MpiSession
{
  public:
    MpiSession(int& argc, char**& argv);
    ~MpiSession();

    MpiSession(const MpiSession&) = delete;
    MpiSession& operator=(const MpiSession&) = delete;

  private:
    bool owner_{false};
};

} // namespace distctx::comm
