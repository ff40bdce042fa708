#include "navis/experience.hpp"
#include <cstdio>

namespace navis
{

    using Json = nlohmann::json;

    std::string feedback_kind_to_string(FeedbackKind kind)
    {
        switch (kind)
        {
        case FeedbackKind::None:
            return "none";
        case FeedbackKind::CorrectAction:
            return "correct_action";
        case FeedbackKind::WrongAction:
            return "wrong_action";
        case FeedbackKind::BetterAlternative:
            return "better_alternative";
        }
        return "none";
    }

    Result<FeedbackKind> feedback_kind_from_string(std::string_view s)
    {
        if (s.empty() || s == "none")
            return FeedbackKind::None;
        if (s == "correct_action")
            return FeedbackKind::CorrectAction;
        if (s == "wrong_action")
            return FeedbackKind::WrongAction;
        if (s == "better_alternative")
            return FeedbackKind::BetterAlternative;
        return std::unexpected(NavisError::invalid_input("Invalid feedback kind: " + std::string(s)));
    }

    double feedback_delta(FeedbackKind kind)
    {
        switch (kind)
        {
        case FeedbackKind::CorrectAction:
            return 0.5;
        case FeedbackKind::WrongAction:
            return -0.5;
        case FeedbackKind::BetterAlternative:
            return -0.2;
        case FeedbackKind::None:
            return 0.0;
        }
        return 0.0;
    }

    std::string experience_origin_to_string(ExperienceOrigin origin)
    {
        switch (origin)
        {
        case ExperienceOrigin::Execution:
            return "execution";
        case ExperienceOrigin::UserSelection:
            return "user_selection";
        case ExperienceOrigin::UserCorrection:
            return "user_correction";
        case ExperienceOrigin::Direct:
            return "direct";
        }
        return "direct";
    }

    Result<ExperienceOrigin> experience_origin_from_string(std::string_view s)
    {
        if (s == "execution")
            return ExperienceOrigin::Execution;
        if (s == "user_selection")
            return ExperienceOrigin::UserSelection;
        if (s == "user_correction")
            return ExperienceOrigin::UserCorrection;
        if (s == "direct")
            return ExperienceOrigin::Direct;
        return std::unexpected(NavisError::invalid_input("Invalid experience origin: " + std::string(s)));
    }

    Json StateSnapshot::to_json() const
    {
        return Json{
            {"intent", intent.to_json()},
            {"candidates", candidates_to_json(candidates)},
            {"page_context", page.to_json()}};
    }

    Result<StateSnapshot> StateSnapshot::from_json(const Json &j)
    {
        if (!j.is_object())
            return std::unexpected(NavisError::parsing("state must be a JSON object"));

        StateSnapshot state;
        auto intent = Intent::from_json(j.value("intent", Json::object()));
        if (!intent)
            return std::unexpected(intent.error());
        state.intent = std::move(*intent);

        auto candidates = candidates_from_json(j.value("candidates", Json::array()));
        if (!candidates)
            return std::unexpected(candidates.error());
        state.candidates = std::move(*candidates);

        auto page = PageContext::from_json(j.value("page_context", Json()));
        if (!page)
            return std::unexpected(page.error());
        state.page = std::move(*page);
        return state;
    }

    std::string Experience::storage_key() const
    {
        char padded[21];
        std::snprintf(padded, sizeof(padded), "%020llu", static_cast<unsigned long long>(id));
        return session_id + ":" + padded;
    }

    Json Experience::to_json() const
    {
        return Json{
            {"id", id},
            {"session_id", session_id},
            {"state", state.to_json()},
            {"action", action.to_json()},
            {"base_reward", base_reward},
            {"reward", reward},
            {"feedback", feedback_kind_to_string(feedback)},
            {"origin", experience_origin_to_string(origin)},
            {"used_vision_fallback", used_vision_fallback},
            {"timestamp", timestamp},
            {"consumed", consumed}};
    }

    Result<Experience> Experience::from_json(const Json &j)
    {
        if (!j.is_object())
            return std::unexpected(NavisError::parsing("Experience must be a JSON object"));

        try
        {
            Experience exp;
            exp.id = j.value("id", std::uint64_t{0});
            exp.session_id = j.value("session_id", std::string{});

            auto state = StateSnapshot::from_json(j.at("state"));
            if (!state)
                return std::unexpected(state.error());
            exp.state = std::move(*state);

            auto action = Candidate::from_json(j.at("action"));
            if (!action)
                return std::unexpected(action.error());
            exp.action = std::move(*action);

            exp.base_reward = clamp_reward(j.value("base_reward", 0.0));
            exp.reward = clamp_reward(j.value("reward", exp.base_reward));

            auto feedback = feedback_kind_from_string(j.value("feedback", std::string("none")));
            if (!feedback)
                return std::unexpected(feedback.error());
            exp.feedback = *feedback;

            auto origin = experience_origin_from_string(j.value("origin", std::string("direct")));
            if (!origin)
                return std::unexpected(origin.error());
            exp.origin = *origin;

            exp.used_vision_fallback = j.value("used_vision_fallback", false);
            exp.timestamp = j.value("timestamp", std::string{});
            exp.consumed = j.value("consumed", false);
            return exp;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(NavisError::parsing(std::string("Invalid experience: ") + e.what()));
        }
    }

} // namespace navis
