#pragma once
#include "options/Options.hpp"
#include <cstddef>
#include <list>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

/**
 * @file ResultCache.hpp
 * @brief Byte-budgeted store of computed results, sized by the ``cache_capacity_bytes`` option.
 *
 * @details
 * Results are copied into 64-byte aligned blocks owned by the cache and evicted
 * least-recently-used first. The budget is strict: after any insert or resize the retained
 * total is **below** the capacity, never equal to it.
 *
 * The capacity follows the options table the cache was built with: every :cpp:func:`put`
 * re-reads it, and :cpp:func:`sync_capacity` applies it on demand (e.g. right after entering a
 * :cpp:class:`distctx::options::ScopedOptions` that shrinks it).
 *
 * @rst
 * .. code-block:: cpp
 *
 *   distctx::cache::ResultCache cache(ctx.options());
 *   cache.put<double>("pos**5", values);
 *   {
 *       distctx::options::ScopedOptions small(ctx.options(), {{"cache_capacity_bytes", 100.0}});
 *       cache.sync_capacity(); // total_bytes() < 100 from here on
 *   }
 * @endrst
 *
 * @warning Pointers returned by :cpp:func:`get` are invalid once the entry is evicted.
 */

namespace distctx::cache
{

class ResultCache
{
  public:
    explicit ResultCache(const options::Options& opts);

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    // false when the item alone does not fit under the capacity (nothing retained)
    template <class T> bool put(std::string key, std::span<const T> data);
    template <class T> const T* get(std::string_view key);

    bool contains(std::string_view key) const;
    void erase(std::string_view key);
    void clear() noexcept;

    // Evicts LRU entries until total_bytes() < capacity_bytes.
    void resize(double capacity_bytes);
    void sync_capacity();

    double capacity() const noexcept { return capacity_; }
    std::size_t total_bytes() const noexcept { return total_; }
    std::size_t size() const noexcept { return entries_.size(); }

  private:
    struct Block
    {
        struct Deleter
        {
            void operator()(void* p) const noexcept;
        };

        std::unique_ptr<void, Deleter> ptr{nullptr};
        std::size_t bytes = 0;
    };

    struct Entry
    {
        Block blk;
        std::list<std::string>::iterator pos; // into lru_
    };

    bool insert(std::string key, const void* src, std::size_t bytes);
    const void* lookup(std::string_view key);
    void evict_to_capacity();

    const options::Options& opts_;
    double capacity_;
    std::size_t total_ = 0;
    std::list<std::string> lru_; // front = most recent
    std::unordered_map<std::string, Entry> entries_;
};

// ---- template implementation ----

template <class T> bool ResultCache::put(std::string key, std::span<const T> data)
{
    return insert(std::move(key), data.data(), data.size_bytes());
}

template <class T> const T* ResultCache::get(std::string_view key)
{
    return static_cast<const T*>(lookup(key));
}

} // namespace distctx::cache
