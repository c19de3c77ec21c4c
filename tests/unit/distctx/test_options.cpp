#include "Context.hpp"
#include "options/Options.hpp"
#include <catch2/catch.hpp>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

using namespace distctx::options;

TEST_CASE("Options start from the recognized defaults", "[options]")
{
    Options opts;
    CHECK(opts.cache_capacity_bytes() == 1e9);
    CHECK(opts.default_chunk_elements() == 5000000);
    CHECK(opts.table() == Options::defaults());
    CHECK(opts.depth() == 0);
    CHECK_FALSE(opts.contains("dask_cache_size"));
}

TEST_CASE("ScopedOptions overlays only the given keys and restores all of them", "[options]")
{
    Options opts;
    const Table before = opts.table();
    {
        ScopedOptions s(opts, {{kCacheCapacityBytes, 100.0}, {"extra_key", std::string("x")}});
        CHECK(opts.cache_capacity_bytes() == 100.0);
        CHECK(opts.default_chunk_elements() == 5000000); // untouched
        CHECK(opts.get<std::string>("extra_key") == "x");  // unknown keys are just stored
        CHECK(opts.depth() == 1);
    }
    CHECK(opts.table() == before);
    CHECK_FALSE(opts.contains("extra_key"));
    CHECK(opts.depth() == 0);
}

TEST_CASE("ScopedOptions restores when the scope is left by an exception", "[options]")
{
    Options opts;
    const Table before = opts.table();

    auto body = [&]
    {
        ScopedOptions s(opts, {{kDefaultChunkElements, 1}});
        REQUIRE(opts.default_chunk_elements() == 1);
        throw std::runtime_error("operation failed");
    };
    REQUIRE_THROWS_AS(body(), std::runtime_error);
    CHECK(opts.table() == before);
}

TEST_CASE("Nested overlays unwind one level at a time", "[options][nested]")
{
    Options opts;
    const auto chunk0 = opts.default_chunk_elements();
    const auto cap0 = opts.cache_capacity_bytes();
    {
        ScopedOptions outer(opts, {{kDefaultChunkElements, 10}});
        {
            ScopedOptions inner(opts, {{kCacheCapacityBytes, 5}});
            CHECK(opts.default_chunk_elements() == 10);
            CHECK(opts.cache_capacity_bytes() == 5.0);
            CHECK(opts.depth() == 2);
        }
        CHECK(opts.default_chunk_elements() == 10);
        CHECK(opts.cache_capacity_bytes() == cap0);
    }
    CHECK(opts.default_chunk_elements() == chunk0);
    CHECK(opts.cache_capacity_bytes() == cap0);
}

TEST_CASE("Overlay can shadow the same key at several depths", "[options][nested]")
{
    Options opts;
    ScopedOptions a(opts, {{kDefaultChunkElements, 100}});
    {
        ScopedOptions b(opts, {{kDefaultChunkElements, 200}});
        {
            ScopedOptions c(opts, {{kDefaultChunkElements, 300}});
            CHECK(opts.default_chunk_elements() == 300);
        }
        CHECK(opts.default_chunk_elements() == 200);
    }
    CHECK(opts.default_chunk_elements() == 100);
}

TEST_CASE("Outer scope leaving first restores its entry state; inner exit is a no-op",
          "[options][nested]")
{
    Options opts;
    auto outer = std::make_unique<ScopedOptions>(opts, Table{{kDefaultChunkElements, 10}});
    auto inner = std::make_unique<ScopedOptions>(opts, Table{{kCacheCapacityBytes, 5.0}});

    outer.reset();
    CHECK(opts.table() == Options::defaults());
    CHECK(opts.depth() == 0);

    inner.reset();
    CHECK(opts.table() == Options::defaults());
}

TEST_CASE("Late inner exit leaves scopes opened after the outer exit alone", "[options][nested]")
{
    Options opts;
    auto a = std::make_unique<ScopedOptions>(opts, Table{{kDefaultChunkElements, 10}});
    auto b = std::make_unique<ScopedOptions>(opts, Table{{kCacheCapacityBytes, 5.0}});
    a.reset();
    REQUIRE(opts.depth() == 0);

    // new scopes reach the depths a and b used to occupy
    ScopedOptions c(opts, {{kDefaultChunkElements, 111}});
    {
        ScopedOptions d(opts, {{kCacheCapacityBytes, 222.0}});
        REQUIRE(opts.depth() == 2);

        b.reset();
        CHECK(opts.default_chunk_elements() == 111);
        CHECK(opts.cache_capacity_bytes() == 222.0);
        CHECK(opts.depth() == 2);
    }
    CHECK(opts.default_chunk_elements() == 111);
    CHECK(opts.cache_capacity_bytes() == 1e9);
    CHECK(opts.depth() == 1);
}

TEST_CASE("Late inner exit is reported as a warning", "[options][nested][log]")
{
    auto& ctx = distctx::Context::process();
    std::FILE* f = std::tmpfile();
    REQUIRE(f);
    ctx.logging().configure("warning", f);

    Options opts;
    auto outer = std::make_unique<ScopedOptions>(opts, Table{{kDefaultChunkElements, 10}});
    auto inner = std::make_unique<ScopedOptions>(opts, Table{{kCacheCapacityBytes, 5.0}});
    outer.reset();
    inner.reset();

    std::fflush(f);
    std::rewind(f);
    char buf[512] = {};
    const bool got = std::fgets(buf, sizeof(buf), f) != nullptr;
    ctx.logging().configure("warning", stderr);
    std::fclose(f);

    REQUIRE(got);
    const std::string line(buf);
    CAPTURE(line);
    CHECK(line.find("root            WARNING") != std::string::npos);
    CHECK(line.find("exited after an enclosing scope") != std::string::npos);
}

TEST_CASE("Moved ScopedOptions restores exactly once", "[options]")
{
    Options opts;
    {
        ScopedOptions a(opts, {{kDefaultChunkElements, 42}});
        ScopedOptions b(std::move(a));
        CHECK(opts.default_chunk_elements() == 42);
        CHECK(opts.depth() == 1);
    }
    CHECK(opts.default_chunk_elements() == 5000000);
    CHECK(opts.depth() == 0);
}

TEST_CASE("Typed reads convert numbers and reject mismatches", "[options]")
{
    Options opts;
    ScopedOptions s(opts, {{kCacheCapacityBytes, std::int64_t{2048}},
                           {kDefaultChunkElements, 1.5e3},
                           {"flag", true},
                           {"name", std::string("uniform")}});

    CHECK(opts.cache_capacity_bytes() == 2048.0);
    CHECK(opts.default_chunk_elements() == 1500);
    CHECK(opts.get<bool>("flag"));
    CHECK(to_string(opts.value("name")) == "\"uniform\"");

    REQUIRE_THROWS_AS(opts.get<double>("name"), std::runtime_error);
    REQUIRE_THROWS_AS(opts.get<std::string>("flag"), std::runtime_error);
    REQUIRE_THROWS_AS(opts.value("missing"), std::runtime_error);
}

TEST_CASE("Integer reads reject doubles outside the integer range", "[options]")
{
    Options opts;
    {
        ScopedOptions s(opts, {{kDefaultChunkElements, 1e300}});
        REQUIRE_THROWS_AS(opts.default_chunk_elements(), std::runtime_error);
        CHECK(opts.get<double>(kDefaultChunkElements) == 1e300);
    }
    {
        ScopedOptions s(opts, {{kDefaultChunkElements, 9.3e18}});
        REQUIRE_THROWS_AS(opts.default_chunk_elements(), std::runtime_error);
    }
    {
        ScopedOptions s(opts, {{kDefaultChunkElements, -1.0}, {"small", 3.0e9}});
        CHECK(opts.default_chunk_elements() == -1);
        REQUIRE_THROWS_AS(opts.get<std::int32_t>("small"), std::runtime_error);
        REQUIRE_THROWS_AS(opts.get<std::uint32_t>(kDefaultChunkElements), std::runtime_error);
    }
}

TEST_CASE("Process-wide options honour the same protocol", "[options][context]")
{
    auto& opts = distctx::Context::process().options();
    REQUIRE(&opts == &process_options());
    const Table before = opts.table();
    {
        ScopedOptions s(Table{{kCacheCapacityBytes, 1.0}});
        CHECK(process_options().cache_capacity_bytes() == 1.0);
    }
    CHECK(opts.table() == before);
}
