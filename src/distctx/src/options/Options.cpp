#include "options/Options.hpp"
#include "logx/Log.hpp"
#include <algorithm>
#include <sstream>

namespace distctx::options
{

Table Options::defaults()
{
    Table t;
    t.emplace(kCacheCapacityBytes, 1e9);
    t.emplace(kDefaultChunkElements, std::int64_t{5000000});
    return t;
}

bool Options::contains(std::string_view key) const noexcept
{
    return current_.find(key) != current_.end();
}

const Value& Options::value(std::string_view key) const
{
    auto it = current_.find(key);
    if (it == current_.end())
        throw std::runtime_error("Unknown option: " + std::string(key));
    return it->second;
}

std::uint64_t Options::push(const Table& overlay)
{
    const std::uint64_t id = next_id_++;
    saved_.push_back(Frame{id, current_});
    for (const auto& [k, v] : overlay)
        current_.insert_or_assign(k, v);
    return id;
}

bool Options::restore(std::uint64_t id) noexcept
{
    auto it = std::find_if(saved_.begin(), saved_.end(),
                           [id](const Frame& f) { return f.id == id; });
    if (it == saved_.end())
        return false;
    current_ = std::move(it->saved);
    saved_.erase(it, saved_.end());
    return true;
}

ScopedOptions::ScopedOptions(Options& opts, const Table& overlay)
    : opts_(&opts), id_(opts.push(overlay))
{
}

ScopedOptions::ScopedOptions(const Table& overlay) : ScopedOptions(process_options(), overlay) {}

ScopedOptions::ScopedOptions(ScopedOptions&& o) noexcept : opts_(o.opts_), id_(o.id_)
{
    o.opts_ = nullptr;
}

ScopedOptions::~ScopedOptions()
{
    // An enclosing scope already restored past this one
    if (opts_ && !opts_->restore(id_))
        LOGW("options: scope %llu exited after an enclosing scope; nothing to restore",
             static_cast<unsigned long long>(id_));
}

std::string to_string(const Value& v)
{
    std::ostringstream os;
    std::visit(
        [&](const auto& x)
        {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, bool>)
                os << (x ? "true" : "false");
            else if constexpr (std::is_same_v<T, std::string>)
                os << '"' << x << '"';
            else
                os << x;
        },
        v);
    return os.str();
}

} // namespace distctx::options
