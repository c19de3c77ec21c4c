#pragma once
#include <mpi.h>
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @file CommRegistry.hpp
 * @brief Holder of the communicator the process currently uses for collectives.
 *
 * @details
 * The registry starts empty. The first :cpp:func:`CommRegistry::get` resolves to
 * ``MPI_COMM_WORLD`` and caches it; :cpp:func:`CommRegistry::set` overwrites the slot with any
 * handle. Handles are neither validated, duplicated nor freed here; a bad handle surfaces as
 * whatever error MPI raises in the operation that uses it.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto& reg = distctx::Context::process().comm();
 *   MPI_Comm sub = MPI_COMM_NULL;
 *   MPI_Comm_split(reg.get(), color, key, &sub);
 *   reg.set(sub);        // every later default-resolved call uses `sub`
 *   ...
 *   reg.reset();         // back to the lazy MPI_COMM_WORLD default
 *   MPI_Comm_free(&sub); // caller owns what it created
 * @endrst
 *
 * @note Not thread-safe. Use from the thread that drives MPI.
 */

namespace distctx::comm
{

/// MPI call returned something other than MPI_SUCCESS.
class MpiError : public std::runtime_error
{
  public:
    MpiError(const std::string& where, int code);
    int code() const noexcept { return code_; }

  private:
    int code_;
};

// Throws MpiError on a non-success return code.
void check_mpi(int code, const char* where);

// MPI_Init has run and MPI_Finalize has not.
bool mpi_active() noexcept;

class CommRegistry
{
  public:
    MPI_Comm get();
    void set(MPI_Comm handle) noexcept { current_ = handle; }
    void reset() noexcept { current_.reset(); }

    bool has_value() const noexcept { return current_.has_value(); }

    // Of the current communicator; 0 and 1 when MPI is not running.
    int rank();
    int size();

  private:
    std::optional<MPI_Comm> current_;
};

// Registry owned by distctx::Context::process().
CommRegistry& process_comm();

} // namespace distctx::comm
