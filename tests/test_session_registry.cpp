#include <catch2/catch_test_macros.hpp>
#include "navis/session_registry.hpp"
#include <algorithm>
#include <cctype>
#include <set>

using namespace navis;
using namespace std::chrono_literals;

namespace
{
    struct FakeClock
    {
        SessionRegistry::Clock::time_point now{SessionRegistry::Clock::time_point{} + 1000h};

        SessionRegistry::NowFn fn()
        {
            return [this] { return now; };
        }
    };
}

TEST_CASE("Session ids are 128-bit hex strings", "[session]")
{
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i)
    {
        auto id = generate_session_id();
        REQUIRE(id.size() == 32);
        REQUIRE(std::all_of(id.begin(), id.end(), [](char c)
                            { return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f'); }));
        ids.insert(id);
    }
    REQUIRE(ids.size() == 100);
}

TEST_CASE("Sessions can be created, updated and ended", "[session]")
{
    FakeClock clock;
    SessionRegistry registry(60s, clock.fn());

    auto session = registry.create();
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.get(session.id).has_value());
    REQUIRE(registry.get(session.id)->phase == "idle");

    REQUIRE(registry.set_phase(session.id, "scoring").has_value());
    REQUIRE(registry.get(session.id)->phase == "scoring");

    REQUIRE(registry.end(session.id));
    REQUIRE_FALSE(registry.end(session.id));
    REQUIRE_FALSE(registry.get(session.id).has_value());

    auto missing = registry.set_phase(session.id, "idle");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE("Expired sessions disappear", "[session]")
{
    FakeClock clock;
    SessionRegistry registry(60s, clock.fn());

    auto short_lived = registry.create();
    auto long_lived = registry.create(3600s);
    REQUIRE(registry.size() == 2);

    clock.now += 61s;
    REQUIRE_FALSE(registry.get(short_lived.id).has_value());
    REQUIRE(registry.get(long_lived.id).has_value());
    REQUIRE(registry.size() == 1);
    REQUIRE_FALSE(registry.set_phase(short_lived.id, "deciding").has_value());

    REQUIRE(registry.purge_expired() == 1);
    REQUIRE(registry.purge_expired() == 0);
    REQUIRE_FALSE(registry.end(short_lived.id));

    clock.now += 3600s;
    REQUIRE(registry.size() == 0);
    REQUIRE(registry.purge_expired() == 1);
}

TEST_CASE("The default registry keeps sessions for a day", "[session]")
{
    SessionRegistry registry;
    REQUIRE(registry.default_ttl() == std::chrono::seconds(24 * 60 * 60));

    auto session = registry.create();
    auto j = registry.to_json(session);
    REQUIRE(j["session_id"] == session.id);
    REQUIRE(j["phase"] == "idle");
    REQUIRE(j["expires_in_seconds"].get<std::int64_t>() > 0);
}

TEST_CASE("Creating a session reclaims expired ones", "[session]")
{
    FakeClock clock;
    SessionRegistry registry(60s, clock.fn());

    for (int i = 0; i < 5; ++i)
        registry.create();

    clock.now += 61s;
    auto fresh = registry.create();
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.purge_expired() == 0);
    REQUIRE(registry.get(fresh.id).has_value());
}

TEST_CASE("Session expiry is reported on the registry clock", "[session]")
{
    FakeClock clock;
    SessionRegistry registry(60s, clock.fn());
    auto session = registry.create();

    REQUIRE(registry.to_json(session)["expires_in_seconds"] == 60);

    clock.now += 45s;
    REQUIRE(registry.to_json(session)["expires_in_seconds"] == 15);

    clock.now += 30s;
    REQUIRE(registry.to_json(session)["expires_in_seconds"] == 0);
}
