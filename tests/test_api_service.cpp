#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "fixtures.hpp"
#include "navis/api_service.hpp"
#include "navis/runtime.hpp"

using Catch::Approx;
using namespace navis;
using navis::test::login_intent;
using navis::test::make_candidate;
using navis::test::make_element;
using Json = nlohmann::json;

namespace
{
    NavisConfig test_config()
    {
        NavisConfig cfg;
        cfg.audit.enabled = false;
        cfg.learning.seed = 7;
        cfg.learning.exploration_rate = 0.0;
        cfg.learning.min_exploration_rate = 0.0;
        cfg.learning.batch_size = 2;
        return cfg;
    }

    struct ApiFixture
    {
        ApiFixture() : runtime(Runtime::create(test_config()).value()), api(*runtime) {}

        Json call(const std::string &op, const Json &body = Json::object())
        {
            auto result = api.handle(op, body);
            REQUIRE(result.has_value());
            return *result;
        }

        std::unique_ptr<Runtime> runtime;
        ApiService api;
    };

    Json login_elements()
    {
        return Json::array({
            make_element("#terms", "Terms", "a", "link", {100.0, 900.0, 60.0, 20.0}).to_json(),
            make_element("#login", "Login", "button", "button", {100.0, 50.0, 120.0, 40.0}).to_json(),
        });
    }
}

TEST_CASE("analyze-elements ranks the page", "[api]")
{
    ApiFixture f;

    auto out = f.call("analyze-elements", {{"intent", login_intent().to_json()}, {"elements", login_elements()}});
    REQUIRE(out["status"] == "ok");
    REQUIRE(out["count"] == 2);
    REQUIRE(out["candidates"][0]["selector"] == "#login");
    REQUIRE(out["candidates"][0]["rank"] == 1);
    REQUIRE(out["candidates"][0].contains("scores"));

    SECTION("a page with nothing visible")
    {
        auto hidden = make_element("#login", "Login", "button", "button", {0.0, 0.0, 0.0, 0.0}).to_json();
        auto empty = f.call("analyze-elements",
                            {{"intent", login_intent().to_json()}, {"elements", Json::array({hidden})}});
        REQUIRE(empty["status"] == "nothing_found");
        REQUIRE(empty["count"] == 0);
    }

    SECTION("missing elements is invalid input")
    {
        auto result = f.api.handle("analyze-elements", {{"intent", login_intent().to_json()}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidInput);
    }
}

TEST_CASE("select-action gates on confidence", "[api]")
{
    ApiFixture f;

    SECTION("confident candidates auto-execute")
    {
        Json candidates = Json::array({make_candidate("#login", 0.9, 0.85).to_json(),
                                       make_candidate("#terms", 0.2, 0.1, 1).to_json()});
        auto out = f.call("select-action", {{"intent", login_intent().to_json()}, {"candidates", candidates}});
        REQUIRE(out["decision"] == "auto_execute");
        REQUIRE(out["action"]["candidate"]["selector"] == "#login");
        REQUIRE(out["session_id"].get<std::string>().size() == 32);
        REQUIRE(f.runtime->sessions().size() == 1);
    }

    SECTION("uncertain candidates go to the user")
    {
        Json candidates = Json::array({make_candidate("#a", 0.5, 0.3).to_json(),
                                       make_candidate("#b", 0.49, 0.25, 1).to_json()});
        auto out = f.call("select-action", {{"intent", login_intent().to_json()},
                                            {"candidates", candidates},
                                            {"session_id", "existing"}});
        REQUIRE(out["decision"] == "request_user_selection");
        REQUIRE(out["candidates"].size() == 2);
        REQUIRE(out["session_id"] == "existing");
        REQUIRE_FALSE(out["explanation"].get<std::string>().empty());
    }

    SECTION("an empty candidate list is rejected")
    {
        auto result = f.api.handle("select-action", {{"intent", login_intent().to_json()},
                                                     {"candidates", Json::array()}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::NoCandidatesAvailable);
    }
}

TEST_CASE("record-experience stores a reward and feedback", "[api]")
{
    ApiFixture f;
    auto action = make_candidate("#login", 0.8, 0.6);
    Json state{{"intent", login_intent().to_json()}, {"candidates", Json::array({action.to_json()})}};

    auto out = f.call("record-experience", {{"session_id", "s1"},
                                            {"state", state},
                                            {"action", action.to_json()},
                                            {"reward", 0.8},
                                            {"feedback", {{"type", "correct_action"}}}});
    REQUIRE(out["status"] == "recorded");
    REQUIRE(out["session_id"] == "s1");

    auto exp = f.runtime->ledger().get(out["experience_id"].get<std::uint64_t>());
    REQUIRE(exp.has_value());
    REQUIRE(exp->reward == Approx(1.0));
    REQUIRE(exp->origin == ExperienceOrigin::Direct);

    SECTION("reward must be numeric")
    {
        auto result = f.api.handle("record-experience", {{"state", state},
                                                         {"action", action.to_json()},
                                                         {"reward", "lots"}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidInput);
    }

    SECTION("unknown feedback kinds are rejected")
    {
        auto result = f.api.handle("record-experience", {{"state", state},
                                                         {"action", action.to_json()},
                                                         {"reward", 1.0},
                                                         {"feedback", "meh"}});
        REQUIRE_FALSE(result.has_value());
    }
}

TEST_CASE("Recorded outcomes drive learning", "[api]")
{
    ApiFixture f;
    auto chosen = make_candidate("#login", 0.8, 0.6);
    auto other = make_candidate("#terms", 0.3, 0.2, 1);

    auto picked = f.call("record-user-selection", {{"session_id", "s1"},
                                                   {"intent", login_intent().to_json()},
                                                   {"candidates", Json::array({chosen.to_json(), other.to_json()})},
                                                   {"selected", chosen.to_json()}});
    REQUIRE(picked["status"] == "recorded");
    REQUIRE(f.runtime->model().update_count() == 0);

    auto result = f.call("record-action-result", {{"session_id", "s1"},
                                                  {"intent", login_intent().to_json()},
                                                  {"action", chosen.to_json()},
                                                  {"success", true}});
    REQUIRE(result["status"] == "recorded");
    REQUIRE(f.runtime->model().update_count() == 1);

    auto stats = f.call("statistics");
    REQUIRE(stats["experience_count"] == 2);
    REQUIRE(stats["model_updates"] == 1);
    REQUIRE(stats["recent_accuracy"].get<double>() == Approx(1.0));
    REQUIRE(stats.contains("active_sessions"));

    SECTION("feedback after training is reported as ignored")
    {
        auto fb = f.call("record-feedback", {{"session_id", "s1"}, {"feedback", "wrong_action"}});
        REQUIRE(fb["status"] == "ignored");
        REQUIRE(fb["experience_id"] == result["experience_id"]);
    }

    SECTION("success must be a boolean")
    {
        auto bad = f.api.handle("record-action-result", {{"intent", login_intent().to_json()},
                                                         {"action", chosen.to_json()},
                                                         {"success", "yes"}});
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code == ErrorCode::InvalidInput);
    }
}

TEST_CASE("record-feedback adjusts the latest experience", "[api]")
{
    ApiFixture f;
    auto chosen = make_candidate("#login", 0.8, 0.6);

    auto recorded = f.call("record-action-result", {{"session_id", "s2"},
                                                    {"intent", login_intent().to_json()},
                                                    {"action", chosen.to_json()},
                                                    {"success", false},
                                                    {"used_vision_fallback", true}});

    auto fb = f.call("record-feedback", {{"session_id", "s2"},
                                         {"feedback", "better_alternative"},
                                         {"alternative", make_candidate("#signin", 0.7, 0.5, 2).to_json()}});
    REQUIRE(fb["status"] == "applied");
    REQUIRE(fb["experience_id"] == recorded["experience_id"]);
    REQUIRE(fb["feedback"] == "better_alternative");
    REQUIRE(fb["reward"].get<double>() == Approx(-1.0));
    REQUIRE(f.runtime->ledger().size() == 2);

    SECTION("feedback is required")
    {
        auto result = f.api.handle("record-feedback", {{"session_id", "s2"}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidInput);
    }

    SECTION("unknown sessions are not found")
    {
        auto result = f.api.handle("record-feedback", {{"session_id", "ghost"}, {"feedback", "correct_action"}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::NotFound);
    }
}

TEST_CASE("health and unknown operations", "[api]")
{
    ApiFixture f;

    auto health = f.call("health");
    REQUIRE(health["status"] == "healthy");
    REQUIRE(health["version"] == "0.1.0");
    REQUIRE(ApiService::operations().size() == 8);

    auto unknown = f.api.handle("launch-rockets", Json::object());
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().code == ErrorCode::NotFound);

    auto not_object = f.api.handle("health", Json::array());
    REQUIRE_FALSE(not_object.has_value());
    REQUIRE(not_object.error().code == ErrorCode::InvalidInput);
}
