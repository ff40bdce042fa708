#pragma once

#include "action_selector.hpp"
#include "candidate.hpp"
#include "element.hpp"
#include "intent.hpp"
#include "scoring_engine.hpp"
#include "session_registry.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace navis
{

    enum class CyclePhase
    {
        Idle,
        Scoring,
        Deciding,
        AutoExecuting,
        AwaitingUserSelection,
        Executing,
        VisionFallback,
        Success,
        Failure,
        RewardRecorded,
        ModelUpdated,
        Abandoned
    };

    std::string cycle_phase_to_string(CyclePhase phase);

    enum class ExecutionStatus
    {
        Succeeded,
        Failed,
        Cancelled
    };

    /** Performs a DOM action on the page. May block; should honour the stop token. */
    class ActionExecutor
    {
    public:
        virtual ~ActionExecutor() = default;

        virtual ExecutionStatus execute(
            const Candidate &candidate,
            const Intent &intent,
            std::stop_token stop) = 0;
    };

    /** Coordinate-based localisation used only after a DOM action has failed */
    class VisionLocator
    {
    public:
        virtual ~VisionLocator() = default;

        virtual std::optional<Candidate> locate(
            const Candidate &failed,
            const Intent &intent,
            const PageContext &page,
            std::stop_token stop) = 0;
    };

    enum class CycleOutcome
    {
        Succeeded,
        NothingFound,
        AwaitingUser,
        RequestHelp,
        Abandoned
    };

    std::string cycle_outcome_to_string(CycleOutcome outcome);

    struct PhaseTransition
    {
        CyclePhase from;
        CyclePhase to;
        std::string timestamp;
    };

    struct CycleReport
    {
        CycleOutcome outcome{CycleOutcome::Abandoned};
        std::optional<Decision> decision;
        std::optional<Candidate> executed;
        bool used_vision_fallback{false};
        std::optional<std::uint64_t> experience_id;
        bool model_updated{false};
        std::string message;

        nlohmann::json to_json() const;
    };

    /**
     * Drives one goal-resolution cycle:
     *
     *   Scoring -> Deciding -> AutoExecuting | AwaitingUserSelection -> Executing
     *   -> Success | Failure -> VisionFallback -> Success | Failure
     *   -> RewardRecorded -> [ModelUpdated] -> Idle
     *
     * Vision fallback runs at most once. interrupt() abandons an in-flight
     * execution; abandoned cycles record no experience.
     */
    class ResolutionCycle
    {
    public:
        static constexpr std::size_t kMaxHistory = 100;

        ResolutionCycle(const ScoringEngine &scoring,
                        ActionSelector &selector,
                        ActionExecutor &executor,
                        VisionLocator &vision,
                        std::string session_id,
                        SessionRegistry *sessions = nullptr);

        /** Score, decide and, when confident enough, execute */
        Result<CycleReport> run(const Intent &intent,
                                const std::vector<Element> &elements,
                                const PageContext &page);

        /** Continue a cycle parked in AwaitingUserSelection with the user's pick */
        Result<CycleReport> resume_with_selection(const Candidate &selected);

        /** Post-hoc human feedback on this session's latest experience */
        Result<FeedbackOutcome> feedback(FeedbackKind kind, const std::optional<Candidate> &alternative = std::nullopt);

        /** Request cancellation of the in-flight execution */
        void interrupt();

        CyclePhase phase() const;
        std::vector<PhaseTransition> history() const;
        const std::string &session_id() const { return session_id_; }

    private:
        void transition(CyclePhase to);
        std::stop_token current_token() const;
        CycleReport abandon(CycleReport report);
        CycleReport execute(const Candidate &chosen, CyclePhase executing_phase, CycleReport report);
        void finish(CycleReport &report, const Candidate &action, bool success, bool used_vision_fallback);

        const ScoringEngine &scoring_;
        ActionSelector &selector_;
        ActionExecutor &executor_;
        VisionLocator &vision_;
        std::string session_id_;
        SessionRegistry *sessions_;

        Intent intent_;
        PageContext page_;
        std::vector<Candidate> candidates_;
        // Recorded together with the action result, never for abandoned cycles
        std::optional<Candidate> user_pick_;

        mutable std::mutex mutex_;
        CyclePhase phase_{CyclePhase::Idle};
        std::deque<PhaseTransition> history_;
        std::stop_source stop_;
    };

} // namespace navis
