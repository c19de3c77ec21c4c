#include "Context.hpp"

namespace distctx
{

Context& Context::process()
{
    static Context ctx;
    return ctx;
}

void Context::apply(const config::RuntimeConfig& cfg)
{
    if (cfg.log_level)
        logging_.configure(*cfg.log_level);
}

namespace comm
{
CommRegistry& process_comm()
{
    return Context::process().comm();
}
} // namespace comm

namespace options
{
Options& process_options()
{
    return Context::process().options();
}
} // namespace options

namespace logx
{
LogStream& process_stream()
{
    return Context::process().log();
}
} // namespace logx

} // namespace distctx
