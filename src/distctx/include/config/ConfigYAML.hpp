#pragma once
#include "options/Options.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

/**
 * @file   ConfigYAML.hpp
 * @brief  YAML → RuntimeConfig loader for logging and options overlays.
 *
 * @details
 * @rst
 * **Schema (v0)**
 *
 * .. code-block:: yaml
 *
 *    logging:
 *      level: info                    # info | debug | warning
 *
 *    options:                         # overlay applied through ScopedOptions
 *      cache_capacity_bytes: 1.0e9    # bytes kept by the result cache
 *      default_chunk_elements: 5000000
 *
 * **Semantics**
 *
 * - Both sections are optional; an absent ``logging.level`` leaves logging untouched.
 * - ``options`` is free-form: each scalar becomes an integer, floating point, boolean
 *   (``true``/``false``) or string value, tried in that order. Quoted scalars are always strings.
 *   Unknown keys are kept.
 * - The overlay is not applied on load. Open a ``ScopedOptions`` with ``cfg.options`` for as
 *   long as it should be in effect; ``Context::apply`` only configures logging.
 * @endrst
 */

namespace distctx::config
{

struct RuntimeConfig
{
    std::optional<std::string> log_level; // validated when applied
    options::Table options{};
};

inline options::Value scalar_to_value(const YAML::Node& n)
{
    // Quoted scalars carry the non-specific tag "!" and stay strings
    if (n.Tag() == "!")
        return n.Scalar();
    std::int64_t i = 0;
    if (YAML::convert<std::int64_t>::decode(n, i))
        return i;
    double d = 0.0;
    if (YAML::convert<double>::decode(n, d))
        return d;
    const std::string s = n.Scalar();
    if (s == "true")
        return true;
    if (s == "false")
        return false;
    return s;
}

inline RuntimeConfig parse_runtime_config(const YAML::Node& root)
{
    RuntimeConfig cfg;

    if (auto lg = root["logging"])
    {
        if (auto n = lg["level"])
            cfg.log_level = n.as<std::string>();
    }

    if (auto opts = root["options"])
    {
        if (!opts.IsMap())
            throw std::runtime_error("config: 'options' must be a mapping");
        for (auto it = opts.begin(); it != opts.end(); ++it)
        {
            const auto key = it->first.as<std::string>();
            if (!it->second.IsScalar())
                throw std::runtime_error("config: option '" + key + "' must be a scalar");
            cfg.options.insert_or_assign(key, scalar_to_value(it->second));
        }
    }

    return cfg;
}

inline RuntimeConfig load_config_from_yaml(const std::string& path)
{
    return parse_runtime_config(YAML::LoadFile(path));
}

} // namespace distctx::config
