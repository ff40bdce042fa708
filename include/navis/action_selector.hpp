#pragma once

#include "audit.hpp"
#include "candidate.hpp"
#include "decision_agent.hpp"
#include "experience.hpp"
#include "experience_ledger.hpp"
#include "intent.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace navis
{

    struct AutoExecute
    {
        Selection selection;
    };

    struct RequestUserSelection
    {
        std::vector<Candidate> options; // top candidates by total_score, at most three
        Selection recommended;
        std::string explanation;
    };

    using Decision = std::variant<AutoExecute, RequestUserSelection>;

    nlohmann::json decision_to_json(const Decision &decision);

    /** Short user-facing description of a confidence level */
    std::string confidence_explanation(double confidence);

    struct LearningStatistics
    {
        double exploration_rate{0.0};
        std::size_t experience_count{0};
        double recent_accuracy{0.0};
        std::size_t model_updates{0};
        double confidence_threshold{0.0};

        bool operator==(const LearningStatistics &) const = default;

        nlohmann::json to_json() const;
    };

    /**
     * Confidence gate in front of the decision agent, plus the feedback loop
     * that turns outcomes into experiences and experiences into model updates.
     *
     * Every record_* call appends to the ledger and then drains complete
     * batches into the preference model. Each applied batch decays the
     * exploration rate once.
     */
    class ActionSelector
    {
    public:
        struct Config
        {
            double confidence_threshold{0.7};
            std::size_t batch_size{10};
            std::size_t max_options{3};
            double vision_fallback_discount{0.8};
            std::string model_path; // empty: weights are kept in memory only
            ScoringWeights scoring_weights{};
        };

        /** Throws NavisError (ConfigError) when the threshold lies outside [0,1] */
        ActionSelector(DecisionAgent &agent, ExperienceLedger &ledger);
        ActionSelector(DecisionAgent &agent, ExperienceLedger &ledger, const Config &cfg, AuditLogger *audit = nullptr);

        Result<Decision> decide(
            const std::vector<Candidate> &candidates,
            const Intent &intent,
            const PageContext &page) const;

        /** User picked one of the offered candidates: reward +1 */
        std::uint64_t record_user_selection(
            const std::string &session_id,
            const std::vector<Candidate> &candidates,
            const Candidate &selected,
            const Intent &intent,
            const PageContext &page);

        /** Execution outcome: +1 on success, -1 on failure */
        std::uint64_t record_action_result(
            const std::string &session_id,
            const Candidate &action,
            const Intent &intent,
            const PageContext &page,
            bool success,
            bool used_vision_fallback = false,
            FeedbackKind feedback = FeedbackKind::None);

        std::uint64_t record_experience(const ExperienceDraft &draft);

        /**
         * Post-hoc feedback on the session's most recent experience. A
         * better_alternative carrying the alternative also records a
         * user_correction experience for it.
         */
        Result<FeedbackOutcome> record_feedback(
            const std::string &session_id,
            FeedbackKind kind,
            const std::optional<Candidate> &alternative = std::nullopt);

        /** Drain complete batches into the model; returns the number applied */
        std::size_t learn_pending();

        LearningStatistics statistics() const;

        const Config &config() const { return cfg_; }
        const PreferenceModel &model() const { return agent_.model(); }

    private:
        std::uint64_t append_and_learn(const ExperienceDraft &draft);
        std::vector<TrainingSample> training_samples(const std::vector<Experience> &batch) const;
        void audit(const std::string &session_id, const std::string &action,
                   const std::string &result, nlohmann::json details) const;

        DecisionAgent &agent_;
        ExperienceLedger &ledger_;
        Config cfg_;
        AuditLogger *audit_;
    };

} // namespace navis
