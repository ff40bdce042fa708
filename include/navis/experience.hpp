#pragma once

#include "candidate.hpp"
#include "intent.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace navis
{

    enum class FeedbackKind
    {
        None,
        CorrectAction,
        WrongAction,
        BetterAlternative
    };

    std::string feedback_kind_to_string(FeedbackKind kind);
    Result<FeedbackKind> feedback_kind_from_string(std::string_view s);

    /** Reward adjustment applied for a feedback kind */
    double feedback_delta(FeedbackKind kind);

    /** How an experience entered the ledger */
    enum class ExperienceOrigin
    {
        Execution,
        UserSelection,
        UserCorrection,
        Direct
    };

    std::string experience_origin_to_string(ExperienceOrigin origin);
    Result<ExperienceOrigin> experience_origin_from_string(std::string_view s);

    /** What the agent saw when it acted */
    struct StateSnapshot
    {
        Intent intent;
        std::vector<Candidate> candidates;
        PageContext page;

        nlohmann::json to_json() const;
        static Result<StateSnapshot> from_json(const nlohmann::json &j);
    };

    /** Input to ExperienceLedger::append; id, timestamp and consumption are assigned there */
    struct ExperienceDraft
    {
        std::string session_id;
        StateSnapshot state;
        Candidate action;
        double reward{0.0};
        FeedbackKind feedback{FeedbackKind::None};
        ExperienceOrigin origin{ExperienceOrigin::Direct};
        bool used_vision_fallback{false};
    };

    /**
     * One (state, action, reward, feedback) record.
     *
     * base_reward is the clamped reward at append time. reward is the value
     * after every feedback adjustment, always in [-1,1].
     */
    struct Experience
    {
        std::uint64_t id{0};
        std::string session_id;
        StateSnapshot state;
        Candidate action;
        double base_reward{0.0};
        double reward{0.0};
        FeedbackKind feedback{FeedbackKind::None};
        ExperienceOrigin origin{ExperienceOrigin::Direct};
        bool used_vision_fallback{false};
        std::string timestamp;
        bool consumed{false};

        /** Storage key: "<session_id>:<zero-padded id>" */
        std::string storage_key() const;

        nlohmann::json to_json() const;
        static Result<Experience> from_json(const nlohmann::json &j);
    };

} // namespace navis
