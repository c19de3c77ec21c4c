#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file Options.hpp
 * @brief Global tunables with scoped override-and-restore.
 *
 * @details
 * @rst
 * :cpp:class:`Options` holds the current table of named tunables and a stack of snapshots. The
 * table starts from :cpp:func:`Options::defaults` and changes only through
 * :cpp:class:`ScopedOptions`:
 *
 * - construction pushes a snapshot of the whole table, then overlays the given keys (all other
 *   keys keep their values);
 * - destruction (normal return, early return or exception) restores that snapshot.
 *
 * **Recognized keys**
 *
 * ===========================  ==========  ===================================================
 * key                          default     meaning
 * ===========================  ==========  ===================================================
 * ``cache_capacity_bytes``     1e9         ceiling on bytes retained by the result cache
 * ``default_chunk_elements``   5000000     default partition size for array-like inputs
 * ===========================  ==========  ===================================================
 *
 * Unknown keys are stored as given and ignored by consumers that do not look for them.
 *
 * .. code-block:: cpp
 *
 *   auto& opts = distctx::Context::process().options();
 *   {
 *       distctx::options::ScopedOptions shrink(opts, {{"cache_capacity_bytes", 100.0}});
 *       cache.sync_capacity();        // sees 100
 *   }                                 // back to 1e9
 * @endrst
 *
 * Scopes are meant to nest strictly. Each one restores its own snapshot and discards any deeper
 * ones, so an outer scope leaving first returns the table to the outer entry state and makes the
 * inner scope's later exit a no-op. Scope ids are never reused, so a late exit cannot reach a
 * snapshot pushed after its own was discarded. Not thread-safe.
 */

namespace distctx::options
{

using Value = std::variant<bool, std::int64_t, double, std::string>;
using Table = std::map<std::string, Value, std::less<>>;

inline constexpr const char* kCacheCapacityBytes = "cache_capacity_bytes";
inline constexpr const char* kDefaultChunkElements = "default_chunk_elements";

class Options
{
  public:
    Options() : Options(defaults()) {}
    explicit Options(Table initial) : current_(std::move(initial)) {}

    static Table defaults();

    const Table& table() const noexcept { return current_; }
    bool contains(std::string_view key) const noexcept;
    const Value& value(std::string_view key) const;

    // Numeric reads convert between integer and floating point; throws on missing key, on a
    // string/bool read as a number, or on a double outside the integer type's range.
    template <class T> T get(std::string_view key) const;

    double cache_capacity_bytes() const { return get<double>(kCacheCapacityBytes); }
    std::int64_t default_chunk_elements() const
    {
        return get<std::int64_t>(kDefaultChunkElements);
    }

    // Number of active scopes
    std::size_t depth() const noexcept { return saved_.size(); }

    // Scoped-override protocol (used by ScopedOptions). push returns the id to restore with;
    // restore returns false when that id is no longer on the stack.
    std::uint64_t push(const Table& overlay);
    bool restore(std::uint64_t id) noexcept;

  private:
    struct Frame
    {
        std::uint64_t id;
        Table saved;
    };

    Table current_;
    std::vector<Frame> saved_;
    std::uint64_t next_id_ = 0;
};

class ScopedOptions
{
  public:
    ScopedOptions(Options& opts, const Table& overlay);
    // On distctx::Context::process().options()
    explicit ScopedOptions(const Table& overlay);
    ~ScopedOptions();

    ScopedOptions(const ScopedOptions&) = delete;
    ScopedOptions& operator=(const ScopedOptions&) = delete;
    ScopedOptions(ScopedOptions&& o) noexcept;
    ScopedOptions& operator=(ScopedOptions&&) = delete;

  private:
    Options* opts_;
    std::uint64_t id_;
};

// Options owned by distctx::Context::process().
Options& process_options();

std::string to_string(const Value& v);

// ---- template implementation ----

template <class T> T Options::get(std::string_view key) const
{
    const Value& v = value(key);
    if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
    {
        if (const auto* i = std::get_if<std::int64_t>(&v))
            return static_cast<T>(*i);
        if (const auto* d = std::get_if<double>(&v))
        {
            if constexpr (std::is_integral_v<T>)
            {
                // 2^digits is exact in double; NaN fails both comparisons
                constexpr double hi =
                    2.0 * static_cast<double>(std::numeric_limits<T>::max() / 2 + 1);
                constexpr double lo = static_cast<double>(std::numeric_limits<T>::min());
                if (!(*d >= lo && *d < hi))
                    throw std::runtime_error("Option '" + std::string(key) +
                                             "' is out of range: " + to_string(v));
            }
            return static_cast<T>(*d);
        }
    }
    else
    {
        if (const auto* x = std::get_if<T>(&v))
            return *x;
    }
    throw std::runtime_error("Option '" + std::string(key) +
                             "' holds an incompatible value: " + to_string(v));
}

} // namespace distctx::options
