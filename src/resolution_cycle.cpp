#include "navis/resolution_cycle.hpp"
#include "navis/preference_model.hpp"
#include <spdlog/spdlog.h>

namespace navis
{

    std::string cycle_phase_to_string(CyclePhase phase)
    {
        switch (phase)
        {
        case CyclePhase::Idle:
            return "idle";
        case CyclePhase::Scoring:
            return "scoring";
        case CyclePhase::Deciding:
            return "deciding";
        case CyclePhase::AutoExecuting:
            return "auto_executing";
        case CyclePhase::AwaitingUserSelection:
            return "awaiting_user_selection";
        case CyclePhase::Executing:
            return "executing";
        case CyclePhase::VisionFallback:
            return "vision_fallback";
        case CyclePhase::Success:
            return "success";
        case CyclePhase::Failure:
            return "failure";
        case CyclePhase::RewardRecorded:
            return "reward_recorded";
        case CyclePhase::ModelUpdated:
            return "model_updated";
        case CyclePhase::Abandoned:
            return "abandoned";
        }
        return "unknown";
    }

    std::string cycle_outcome_to_string(CycleOutcome outcome)
    {
        switch (outcome)
        {
        case CycleOutcome::Succeeded:
            return "succeeded";
        case CycleOutcome::NothingFound:
            return "nothing_found";
        case CycleOutcome::AwaitingUser:
            return "awaiting_user";
        case CycleOutcome::RequestHelp:
            return "request_help";
        case CycleOutcome::Abandoned:
            return "abandoned";
        }
        return "unknown";
    }

    nlohmann::json CycleReport::to_json() const
    {
        nlohmann::json j{
            {"outcome", cycle_outcome_to_string(outcome)},
            {"used_vision_fallback", used_vision_fallback},
            {"model_updated", model_updated},
            {"message", message}};
        if (decision)
            j["decision"] = decision_to_json(*decision);
        if (executed)
            j["executed"] = executed->to_json();
        if (experience_id)
            j["experience_id"] = *experience_id;
        return j;
    }

    ResolutionCycle::ResolutionCycle(const ScoringEngine &scoring,
                                     ActionSelector &selector,
                                     ActionExecutor &executor,
                                     VisionLocator &vision,
                                     std::string session_id,
                                     SessionRegistry *sessions)
        : scoring_(scoring),
          selector_(selector),
          executor_(executor),
          vision_(vision),
          session_id_(std::move(session_id)),
          sessions_(sessions)
    {
    }

    void ResolutionCycle::transition(CyclePhase to)
    {
        {
            std::lock_guard lock(mutex_);
            history_.push_back(PhaseTransition{phase_, to, now_iso8601()});
            if (history_.size() > kMaxHistory)
                history_.pop_front();
            phase_ = to;
        }
        spdlog::debug("Session {} -> {}", session_id_, cycle_phase_to_string(to));

        if (sessions_)
        {
            if (auto res = sessions_->set_phase(session_id_, cycle_phase_to_string(to)); !res)
                spdlog::debug("Session phase not tracked: {}", res.error().what());
        }
    }

    std::stop_token ResolutionCycle::current_token() const
    {
        std::lock_guard lock(mutex_);
        return stop_.get_token();
    }

    void ResolutionCycle::interrupt()
    {
        std::lock_guard lock(mutex_);
        stop_.request_stop();
        spdlog::info("Session {} interrupted in phase {}", session_id_, cycle_phase_to_string(phase_));
    }

    CyclePhase ResolutionCycle::phase() const
    {
        std::lock_guard lock(mutex_);
        return phase_;
    }

    std::vector<PhaseTransition> ResolutionCycle::history() const
    {
        std::lock_guard lock(mutex_);
        return std::vector<PhaseTransition>(history_.begin(), history_.end());
    }

    Result<CycleReport> ResolutionCycle::run(const Intent &intent,
                                             const std::vector<Element> &elements,
                                             const PageContext &page)
    {
        {
            std::lock_guard lock(mutex_);
            if (phase_ != CyclePhase::Idle && phase_ != CyclePhase::Abandoned &&
                phase_ != CyclePhase::AwaitingUserSelection)
            {
                return std::unexpected(NavisError::invalid_input(
                    "Cycle is busy in phase " + cycle_phase_to_string(phase_)));
            }
            stop_ = std::stop_source{};
        }

        intent_ = intent;
        page_ = page;
        candidates_.clear();
        user_pick_.reset();

        transition(CyclePhase::Scoring);
        const auto &model = selector_.model();
        spdlog::info("Resolving '{}' over {} elements (exploration {:.3f})",
                     intent.goal, elements.size(), model.exploration_rate());

        auto scored = scoring_.score(intent, elements, page, &model);
        if (!scored)
        {
            transition(CyclePhase::Idle);
            if (scored.error().code == ErrorCode::EmptyCandidateSet)
            {
                CycleReport report;
                report.outcome = CycleOutcome::NothingFound;
                report.message = scored.error().what();
                return report;
            }
            return std::unexpected(scored.error());
        }
        candidates_ = std::move(*scored);

        transition(CyclePhase::Deciding);
        auto decision = selector_.decide(candidates_, intent_, page_);
        if (!decision)
        {
            transition(CyclePhase::Idle);
            return std::unexpected(decision.error());
        }

        CycleReport report;
        report.decision = *decision;

        if (auto *auto_exec = std::get_if<AutoExecute>(&*decision))
        {
            return execute(auto_exec->selection.candidate, CyclePhase::AutoExecuting, std::move(report));
        }

        transition(CyclePhase::AwaitingUserSelection);
        report.outcome = CycleOutcome::AwaitingUser;
        report.message = std::get<RequestUserSelection>(*decision).explanation;
        return report;
    }

    Result<CycleReport> ResolutionCycle::resume_with_selection(const Candidate &selected)
    {
        if (phase() != CyclePhase::AwaitingUserSelection)
        {
            return std::unexpected(NavisError::invalid_input("No user selection is pending for this cycle"));
        }
        if (current_token().stop_requested())
            return abandon(CycleReport{});

        user_pick_ = selected;
        return execute(selected, CyclePhase::Executing, CycleReport{});
    }

    Result<FeedbackOutcome> ResolutionCycle::feedback(FeedbackKind kind, const std::optional<Candidate> &alternative)
    {
        return selector_.record_feedback(session_id_, kind, alternative);
    }

    CycleReport ResolutionCycle::abandon(CycleReport report)
    {
        user_pick_.reset();
        transition(CyclePhase::Abandoned);
        report.outcome = CycleOutcome::Abandoned;
        report.message = "Interrupted by user";
        return report;
    }

    CycleReport ResolutionCycle::execute(const Candidate &chosen, CyclePhase executing_phase, CycleReport report)
    {
        auto stop = current_token();
        transition(executing_phase);
        if (stop.stop_requested())
            return abandon(std::move(report));

        auto status = executor_.execute(chosen, intent_, stop);
        if (status == ExecutionStatus::Cancelled || stop.stop_requested())
            return abandon(std::move(report));

        if (status == ExecutionStatus::Succeeded)
        {
            transition(CyclePhase::Success);
            finish(report, chosen, true, false);
            return report;
        }

        spdlog::warn("Execution failed for {}, trying vision fallback", chosen.element.selector);
        transition(CyclePhase::VisionFallback);
        report.used_vision_fallback = true;

        auto located = vision_.locate(chosen, intent_, page_, stop);
        if (stop.stop_requested())
            return abandon(std::move(report));

        if (located)
        {
            auto retry = executor_.execute(*located, intent_, stop);
            if (retry == ExecutionStatus::Cancelled || stop.stop_requested())
                return abandon(std::move(report));
            if (retry == ExecutionStatus::Succeeded)
            {
                transition(CyclePhase::Success);
                finish(report, *located, true, true);
                return report;
            }
        }

        auto error = NavisError::vision_fallback(located ? "Vision fallback action failed"
                                                         : "Vision fallback found no alternative");
        spdlog::warn("Session {}: {}", session_id_, error.what());
        transition(CyclePhase::Failure);
        finish(report, chosen, false, true);
        report.message = error.what();
        return report;
    }

    void ResolutionCycle::finish(CycleReport &report, const Candidate &action, bool success, bool used_vision_fallback)
    {
        auto updates_before = selector_.statistics().model_updates;
        if (user_pick_)
        {
            selector_.record_user_selection(session_id_, candidates_, *user_pick_, intent_, page_);
            user_pick_.reset();
        }
        report.executed = action;
        report.experience_id = selector_.record_action_result(session_id_, action, intent_, page_, success,
                                                              used_vision_fallback);
        transition(CyclePhase::RewardRecorded);

        if (selector_.statistics().model_updates > updates_before)
        {
            report.model_updated = true;
            transition(CyclePhase::ModelUpdated);
        }

        report.outcome = success ? CycleOutcome::Succeeded : CycleOutcome::RequestHelp;
        if (success)
            report.message = "Action completed";
        transition(CyclePhase::Idle);

        if (success && sessions_)
            sessions_->end(session_id_);
    }

} // namespace navis
