#include "cache/ResultCache.hpp"
#include "logx/Log.hpp"
#include <cstdlib>
#include <cstring>
#include <new>

namespace distctx::cache
{

namespace
{

constexpr std::size_t kBlockAlign = 64;

// Whole alignment units, at least one; std::aligned_alloc rejects other sizes.
void* allocate_block(std::size_t bytes)
{
    const std::size_t units = bytes / kBlockAlign + (bytes % kBlockAlign != 0);
    void* p = std::aligned_alloc(kBlockAlign, (units ? units : 1) * kBlockAlign);
    if (!p)
        throw std::bad_alloc{};
    return p;
}

} // namespace

ResultCache::ResultCache(const options::Options& opts)
    : opts_(opts), capacity_(opts.cache_capacity_bytes())
{
}

bool ResultCache::insert(std::string key, const void* src, std::size_t bytes)
{
    capacity_ = opts_.cache_capacity_bytes();
    erase(key);

    if (static_cast<double>(bytes) >= capacity_)
    {
        LOGD("cache: '%s' (%zu B) does not fit under capacity %.0f B", key.c_str(), bytes,
             capacity_);
        evict_to_capacity();
        return false;
    }

    Block blk;
    blk.ptr.reset(allocate_block(bytes));
    blk.bytes = bytes;
    if (bytes)
        std::memcpy(blk.ptr.get(), src, bytes);

    lru_.push_front(key);
    entries_.emplace(std::move(key), Entry{std::move(blk), lru_.begin()});
    total_ += bytes;
    evict_to_capacity();
    return true;
}

const void* ResultCache::lookup(std::string_view key)
{
    auto it = entries_.find(std::string(key));
    if (it == entries_.end())
        return nullptr;
    lru_.splice(lru_.begin(), lru_, it->second.pos);
    return it->second.blk.ptr.get();
}

bool ResultCache::contains(std::string_view key) const
{
    return entries_.find(std::string(key)) != entries_.end();
}

void ResultCache::erase(std::string_view key)
{
    auto it = entries_.find(std::string(key));
    if (it == entries_.end())
        return;
    total_ -= it->second.blk.bytes;
    lru_.erase(it->second.pos);
    entries_.erase(it);
}

void ResultCache::clear() noexcept
{
    entries_.clear();
    lru_.clear();
    total_ = 0;
}

void ResultCache::resize(double capacity_bytes)
{
    capacity_ = capacity_bytes;
    evict_to_capacity();
}

void ResultCache::sync_capacity()
{
    resize(opts_.cache_capacity_bytes());
}

void ResultCache::evict_to_capacity()
{
    // strict: retained total must end up below the capacity
    while (!lru_.empty() && static_cast<double>(total_) >= capacity_)
    {
        auto it = entries_.find(lru_.back());
        LOGD("cache: evict '%s' (%zu B)", lru_.back().c_str(), it->second.blk.bytes);
        total_ -= it->second.blk.bytes;
        entries_.erase(it);
        lru_.pop_back();
    }
}

/// \cond DOXYGEN_EXCLUDE
void ResultCache::Block::Deleter::operator()(void* p) const noexcept
{
    std::free(p);
}
/// \endcond

} // namespace distctx::cache
