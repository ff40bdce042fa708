#include <catch2/catch_test_macros.hpp>
#include "fixtures.hpp"
#include "navis/resolution_cycle.hpp"
#include <algorithm>

using namespace navis;
using navis::test::login_intent;
using navis::test::make_candidate;
using navis::test::make_element;
using navis::test::ScriptedRandom;

namespace
{
    class ScriptedExecutor : public ActionExecutor
    {
    public:
        explicit ScriptedExecutor(std::vector<ExecutionStatus> statuses) : statuses_(std::move(statuses)) {}

        ExecutionStatus execute(const Candidate &candidate, const Intent &, std::stop_token) override
        {
            executed.push_back(candidate.element.selector);
            auto status = statuses_[std::min(next_, statuses_.size() - 1)];
            ++next_;
            return status;
        }

        std::vector<std::string> executed;

    private:
        std::vector<ExecutionStatus> statuses_;
        std::size_t next_{0};
    };

    class FixedLocator : public VisionLocator
    {
    public:
        explicit FixedLocator(std::optional<Candidate> result = std::nullopt) : result_(std::move(result)) {}

        std::optional<Candidate> locate(const Candidate &, const Intent &, const PageContext &,
                                        std::stop_token) override
        {
            ++calls;
            return result_;
        }

        int calls{0};

    private:
        std::optional<Candidate> result_;
    };

    std::vector<Element> login_page()
    {
        return {
            make_element("#terms", "Terms", "a", "link", {100.0, 900.0, 60.0, 20.0}),
            make_element("#login", "Login", "button", "button", {100.0, 50.0, 120.0, 40.0}),
        };
    }

    struct CycleFixture
    {
        CycleFixture(double threshold, std::vector<ExecutionStatus> statuses,
                     std::optional<Candidate> located = std::nullopt)
            : random({0.99}),
              agent(model, random),
              selector(agent, ledger, selector_config(threshold)),
              executor(std::move(statuses)),
              locator(std::move(located)),
              session(sessions.create()),
              cycle(scoring, selector, executor, locator, session.id, &sessions)
        {
        }

        static ActionSelector::Config selector_config(double threshold)
        {
            ActionSelector::Config cfg;
            cfg.confidence_threshold = threshold;
            return cfg;
        }

        bool visited(CyclePhase phase) const
        {
            auto h = cycle.history();
            return std::any_of(h.begin(), h.end(), [phase](const PhaseTransition &t) { return t.to == phase; });
        }

        ScoringEngine scoring;
        PreferenceModel model;
        ScriptedRandom random;
        DecisionAgent agent;
        ExperienceLedger ledger;
        ActionSelector selector;
        ScriptedExecutor executor;
        FixedLocator locator;
        SessionRegistry sessions;
        Session session;
        ResolutionCycle cycle;
    };
}

TEST_CASE("A confident cycle executes and records success", "[cycle]")
{
    CycleFixture f(0.0, {ExecutionStatus::Succeeded});

    auto report = f.cycle.run(login_intent(), login_page(), PageContext{});
    REQUIRE(report.has_value());
    REQUIRE(report->outcome == CycleOutcome::Succeeded);
    REQUIRE(report->executed.has_value());
    REQUIRE(report->executed->element.selector == "#login");
    REQUIRE_FALSE(report->used_vision_fallback);
    REQUIRE(report->experience_id.has_value());

    auto exp = f.ledger.get(*report->experience_id);
    REQUIRE(exp.has_value());
    REQUIRE(exp->reward == 1.0);
    REQUIRE_FALSE(exp->used_vision_fallback);

    REQUIRE(f.cycle.phase() == CyclePhase::Idle);
    REQUIRE(f.visited(CyclePhase::Scoring));
    REQUIRE(f.visited(CyclePhase::Deciding));
    REQUIRE(f.visited(CyclePhase::AutoExecuting));
    REQUIRE(f.visited(CyclePhase::Success));
    REQUIRE(f.visited(CyclePhase::RewardRecorded));
    REQUIRE_FALSE(f.visited(CyclePhase::VisionFallback));
    REQUIRE(f.locator.calls == 0);

    SECTION("a successful cycle ends its session")
    {
        REQUIRE_FALSE(f.sessions.get(f.session.id).has_value());
    }

    SECTION("the report serialises its outcome")
    {
        auto j = report->to_json();
        REQUIRE(j["outcome"] == "succeeded");
        REQUIRE(j["decision"]["decision"] == "auto_execute");
    }
}

TEST_CASE("A failed action falls back to vision once", "[cycle]")
{
    SECTION("the vision candidate succeeds")
    {
        CycleFixture f(0.0, {ExecutionStatus::Failed, ExecutionStatus::Succeeded},
                       make_candidate("#login-by-vision", 0.6, 0.5));

        auto report = f.cycle.run(login_intent(), login_page(), PageContext{});
        REQUIRE(report.has_value());
        REQUIRE(report->outcome == CycleOutcome::Succeeded);
        REQUIRE(report->used_vision_fallback);
        REQUIRE(report->executed->element.selector == "#login-by-vision");
        REQUIRE(f.executor.executed == std::vector<std::string>{"#login", "#login-by-vision"});
        REQUIRE(f.locator.calls == 1);

        auto exp = f.ledger.get(*report->experience_id);
        REQUIRE(exp->reward == 1.0);
        REQUIRE(exp->used_vision_fallback);
        REQUIRE(f.visited(CyclePhase::VisionFallback));
    }

    SECTION("the vision candidate fails too")
    {
        CycleFixture f(0.0, {ExecutionStatus::Failed, ExecutionStatus::Failed},
                       make_candidate("#login-by-vision", 0.6, 0.5));

        auto report = f.cycle.run(login_intent(), login_page(), PageContext{});
        REQUIRE(report.has_value());
        REQUIRE(report->outcome == CycleOutcome::RequestHelp);
        REQUIRE(report->used_vision_fallback);
        REQUIRE(f.executor.executed.size() == 2);
        REQUIRE(f.locator.calls == 1);

        auto exp = f.ledger.get(*report->experience_id);
        REQUIRE(exp->reward == -1.0);
        REQUIRE(exp->used_vision_fallback);
        REQUIRE(exp->action.element.selector == "#login");
        REQUIRE(f.visited(CyclePhase::Failure));
        REQUIRE(f.cycle.phase() == CyclePhase::Idle);
        REQUIRE(f.sessions.get(f.session.id).has_value());
    }

    SECTION("vision finds nothing")
    {
        CycleFixture f(0.0, {ExecutionStatus::Failed});

        auto report = f.cycle.run(login_intent(), login_page(), PageContext{});
        REQUIRE(report.has_value());
        REQUIRE(report->outcome == CycleOutcome::RequestHelp);
        REQUIRE(f.executor.executed.size() == 1);
        REQUIRE(report->message == "Vision fallback found no alternative");
        REQUIRE(f.ledger.size() == 1);
    }
}

TEST_CASE("An interrupted cycle is abandoned without an experience", "[cycle]")
{
    SECTION("the executor reports cancellation")
    {
        CycleFixture f(0.0, {ExecutionStatus::Cancelled});

        auto report = f.cycle.run(login_intent(), login_page(), PageContext{});
        REQUIRE(report.has_value());
        REQUIRE(report->outcome == CycleOutcome::Abandoned);
        REQUIRE_FALSE(report->experience_id.has_value());
        REQUIRE(f.ledger.size() == 0);
        REQUIRE(f.cycle.phase() == CyclePhase::Abandoned);
    }

    SECTION("interrupt while waiting for the user")
    {
        CycleFixture f(1.0, {ExecutionStatus::Succeeded});

        auto parked = f.cycle.run(login_intent(), login_page(), PageContext{});
        REQUIRE(parked.has_value());
        REQUIRE(parked->outcome == CycleOutcome::AwaitingUser);

        f.cycle.interrupt();
        auto report = f.cycle.resume_with_selection(make_candidate("#login", 0.6, 0.3, 1));
        REQUIRE(report.has_value());
        REQUIRE(report->outcome == CycleOutcome::Abandoned);
        REQUIRE(f.ledger.size() == 0);
        REQUIRE(f.executor.executed.empty());

        SECTION("an abandoned cycle can run again")
        {
            auto again = f.cycle.run(login_intent(), login_page(), PageContext{});
            REQUIRE(again.has_value());
            REQUIRE(again->outcome == CycleOutcome::AwaitingUser);
        }
    }

    SECTION("the user's pick is cancelled during execution")
    {
        CycleFixture f(1.0, {ExecutionStatus::Cancelled});

        auto parked = f.cycle.run(login_intent(), login_page(), PageContext{});
        REQUIRE(parked.has_value());
        REQUIRE(parked->outcome == CycleOutcome::AwaitingUser);

        const auto &options = std::get<RequestUserSelection>(*parked->decision).options;
        auto report = f.cycle.resume_with_selection(options.front());
        REQUIRE(report.has_value());
        REQUIRE(report->outcome == CycleOutcome::Abandoned);
        REQUIRE(f.executor.executed.size() == 1);
        REQUIRE(f.ledger.size() == 0);
        REQUIRE(f.cycle.phase() == CyclePhase::Abandoned);
    }
}

TEST_CASE("A low-confidence cycle waits for the user", "[cycle]")
{
    CycleFixture f(1.0, {ExecutionStatus::Succeeded});

    auto parked = f.cycle.run(login_intent(), login_page(), PageContext{});
    REQUIRE(parked.has_value());
    REQUIRE(parked->outcome == CycleOutcome::AwaitingUser);
    REQUIRE(f.cycle.phase() == CyclePhase::AwaitingUserSelection);
    REQUIRE(std::holds_alternative<RequestUserSelection>(*parked->decision));
    REQUIRE_FALSE(parked->message.empty());
    REQUIRE(f.sessions.get(f.session.id)->phase == "awaiting_user_selection");

    const auto &options = std::get<RequestUserSelection>(*parked->decision).options;
    auto report = f.cycle.resume_with_selection(options.back());
    REQUIRE(report.has_value());
    REQUIRE(report->outcome == CycleOutcome::Succeeded);
    REQUIRE(f.executor.executed == std::vector<std::string>{"#terms"});
    REQUIRE(f.visited(CyclePhase::Executing));

    auto snapshot = f.ledger.snapshot();
    REQUIRE(snapshot.size() == 2);
    REQUIRE(snapshot[0].origin == ExperienceOrigin::UserSelection);
    REQUIRE(snapshot[0].state.candidates.size() == 2);
    REQUIRE(snapshot[1].origin == ExperienceOrigin::Execution);

    SECTION("resuming twice is rejected")
    {
        auto again = f.cycle.resume_with_selection(options.back());
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().code == ErrorCode::InvalidInput);
    }

    SECTION("feedback lands on the latest experience")
    {
        auto outcome = f.cycle.feedback(FeedbackKind::WrongAction);
        REQUIRE(outcome.has_value());
        REQUIRE(outcome->id == snapshot[1].id);
        REQUIRE(f.ledger.get(snapshot[1].id)->reward == 0.5);
    }
}

TEST_CASE("A page without visible elements finds nothing", "[cycle]")
{
    CycleFixture f(0.0, {ExecutionStatus::Succeeded});
    auto hidden = make_element("#login", "Login", "button", "button", {0.0, 0.0, 100.0, 40.0});
    hidden.visible = false;

    auto report = f.cycle.run(login_intent(), {hidden}, PageContext{});
    REQUIRE(report.has_value());
    REQUIRE(report->outcome == CycleOutcome::NothingFound);
    REQUIRE_FALSE(report->decision.has_value());
    REQUIRE(f.cycle.phase() == CyclePhase::Idle);
    REQUIRE(f.executor.executed.empty());
    REQUIRE(f.ledger.size() == 0);
}

TEST_CASE("Resuming without a pending selection is rejected", "[cycle]")
{
    CycleFixture f(0.0, {ExecutionStatus::Succeeded});
    auto report = f.cycle.resume_with_selection(make_candidate("#login", 0.6, 0.3));
    REQUIRE_FALSE(report.has_value());
    REQUIRE(report.error().code == ErrorCode::InvalidInput);
}

TEST_CASE("Phase history is bounded", "[cycle]")
{
    CycleFixture f(0.0, {ExecutionStatus::Succeeded});
    for (int i = 0; i < 30; ++i)
        REQUIRE(f.cycle.run(login_intent(), login_page(), PageContext{}).has_value());

    REQUIRE(f.cycle.history().size() == ResolutionCycle::kMaxHistory);
    REQUIRE(cycle_phase_to_string(CyclePhase::VisionFallback) == "vision_fallback");
}
