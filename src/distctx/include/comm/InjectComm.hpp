#pragma once
#include "comm/CommRegistry.hpp"
#include <functional>
#include <type_traits>
#include <utility>

/**
 * @file InjectComm.hpp
 * @brief Call wrapper that fills in the current communicator when the caller omits it.
 *
 * @details
 * Library operations take the communicator explicitly as their **first** parameter so they stay
 * testable and composable. Wrapping one with :cpp:func:`inject_comm` gives ordinary call sites a
 * form without that argument:
 *
 * - the arguments already form a valid call of the operation → forwarded untouched
 *   (an explicit communicator always wins);
 * - otherwise the registry is asked for its current handle *at call time* and it is prepended.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   double global_sum(MPI_Comm comm, double local);
 *
 *   const auto sum = distctx::comm::inject_comm(&global_sum);
 *   sum(1.0);                // uses Context::process().comm().get()
 *   sum(MPI_COMM_SELF, 1.0); // uses MPI_COMM_SELF
 * @endrst
 *
 * The decision is made with ``std::is_invocable``, so a wrapped operation must not itself accept
 * the argument list without the communicator (no defaulted or generic leading parameter).
 */

namespace distctx::comm
{

template <class F> class InjectComm
{
  public:
    InjectComm(F fn, CommRegistry& reg) : fn_(std::move(fn)), reg_(&reg) {}

    template <class... Args> decltype(auto) operator()(Args&&... args) const
    {
        if constexpr (std::is_invocable_v<const F&, Args&&...>)
            return std::invoke(fn_, std::forward<Args>(args)...);
        else
            return std::invoke(fn_, reg_->get(), std::forward<Args>(args)...);
    }

  private:
    F fn_;
    CommRegistry* reg_;
};

template <class F> auto inject_comm(F&& fn, CommRegistry& reg)
{
    return InjectComm<std::decay_t<F>>(std::forward<F>(fn), reg);
}

template <class F> auto inject_comm(F&& fn)
{
    return inject_comm(std::forward<F>(fn), process_comm());
}

} // namespace distctx::comm
