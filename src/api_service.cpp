#include "navis/api_service.hpp"
#include <spdlog/spdlog.h>

namespace navis
{

    using Json = nlohmann::json;

    namespace
    {
        constexpr const char *kVersion = "0.1.0";

        Result<const Json *> require(const Json &body, const char *key)
        {
            auto it = body.find(key);
            if (it == body.end() || it->is_null())
                return std::unexpected(NavisError::invalid_input(std::string("Missing field: ") + key));
            return &*it;
        }

        Result<std::vector<Element>> elements_from_json(const Json &j)
        {
            if (!j.is_array())
                return std::unexpected(NavisError::parsing("elements must be a JSON array"));

            std::vector<Element> out;
            out.reserve(j.size());
            for (const auto &item : j)
            {
                auto el = Element::from_json(item);
                if (!el)
                    return std::unexpected(el.error());
                out.push_back(std::move(*el));
            }
            return out;
        }

        Result<Intent> intent_of(const Json &body)
        {
            auto j = require(body, "intent");
            if (!j)
                return std::unexpected(j.error());
            return Intent::from_json(**j);
        }

        Result<PageContext> page_of(const Json &body)
        {
            return PageContext::from_json(body.value("page_context", Json()));
        }

        Result<Candidate> candidate_of(const Json &body, const char *key)
        {
            auto j = require(body, key);
            if (!j)
                return std::unexpected(j.error());
            return Candidate::from_json(**j);
        }

        Result<FeedbackKind> feedback_of(const Json &body)
        {
            auto it = body.find("feedback");
            if (it == body.end() || it->is_null())
                return FeedbackKind::None;
            if (it->is_string())
                return feedback_kind_from_string(it->get<std::string>());
            if (it->is_object())
                return feedback_kind_from_string(it->value("type", std::string("none")));
            return std::unexpected(NavisError::invalid_input("feedback must be a string or an object with a type"));
        }
    } // namespace

    ApiService::ApiService(Runtime &runtime) : rt_(runtime) {}

    const std::vector<std::string> &ApiService::operations()
    {
        static const std::vector<std::string> ops = {
            "analyze-elements",
            "select-action",
            "record-experience",
            "record-user-selection",
            "record-action-result",
            "record-feedback",
            "statistics",
            "health"};
        return ops;
    }

    Result<Json> ApiService::handle(const std::string &operation, const Json &body)
    {
        if (!body.is_null() && !body.is_object())
            return std::unexpected(NavisError::invalid_input("Request body must be a JSON object"));

        const Json &request = body.is_null() ? Json::object() : body;
        spdlog::debug("API {} request", operation);

        try
        {
            if (operation == "analyze-elements")
                return analyze_elements(request);
            if (operation == "select-action")
                return select_action(request);
            if (operation == "record-experience")
                return record_experience(request);
            if (operation == "record-user-selection")
                return record_user_selection(request);
            if (operation == "record-action-result")
                return record_action_result(request);
            if (operation == "record-feedback")
                return record_feedback(request);
            if (operation == "statistics")
                return statistics();
            if (operation == "health")
                return health();
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(NavisError::invalid_input(std::string("Malformed request: ") + e.what()));
        }

        return std::unexpected(NavisError::not_found("Unknown operation: " + operation));
    }

    std::string ApiService::session_for(const Json &body)
    {
        auto id = body.value("session_id", std::string{});
        if (!id.empty())
        {
            if (!rt_.sessions().get(id))
                spdlog::debug("Session {} unknown or expired; experiences still keyed by it", id);
            return id;
        }
        return rt_.sessions().create().id;
    }

    Result<Json> ApiService::analyze_elements(const Json &body)
    {
        auto intent = intent_of(body);
        if (!intent)
            return std::unexpected(intent.error());
        auto elements_json = require(body, "elements");
        if (!elements_json)
            return std::unexpected(elements_json.error());
        auto elements = elements_from_json(**elements_json);
        if (!elements)
            return std::unexpected(elements.error());
        auto page = page_of(body);
        if (!page)
            return std::unexpected(page.error());

        auto scored = rt_.scoring().score(*intent, *elements, *page, &rt_.model());
        if (!scored)
        {
            if (scored.error().code == ErrorCode::EmptyCandidateSet)
                return Json{{"status", "nothing_found"}, {"candidates", Json::array()}, {"count", 0}};
            return std::unexpected(scored.error());
        }

        return Json{
            {"status", "ok"},
            {"candidates", candidates_to_json(*scored)},
            {"count", scored->size()}};
    }

    Result<Json> ApiService::select_action(const Json &body)
    {
        auto intent = intent_of(body);
        if (!intent)
            return std::unexpected(intent.error());
        auto candidates = candidates_from_json(body.value("candidates", Json::array()));
        if (!candidates)
            return std::unexpected(candidates.error());
        auto page = page_of(body);
        if (!page)
            return std::unexpected(page.error());

        auto decision = rt_.selector().decide(*candidates, *intent, *page);
        if (!decision)
            return std::unexpected(decision.error());

        auto session_id = session_for(body);
        bool automatic = std::holds_alternative<AutoExecute>(*decision);
        if (auto res = rt_.sessions().set_phase(session_id, automatic ? "auto_executing" : "awaiting_user_selection"); !res)
            spdlog::debug("Session phase not tracked: {}", res.error().what());

        auto out = decision_to_json(*decision);
        out["session_id"] = session_id;
        return out;
    }

    Result<Json> ApiService::record_experience(const Json &body)
    {
        auto state_json = require(body, "state");
        if (!state_json)
            return std::unexpected(state_json.error());
        auto state = StateSnapshot::from_json(**state_json);
        if (!state)
            return std::unexpected(state.error());
        auto action = candidate_of(body, "action");
        if (!action)
            return std::unexpected(action.error());
        auto reward = require(body, "reward");
        if (!reward)
            return std::unexpected(reward.error());
        if (!(*reward)->is_number())
            return std::unexpected(NavisError::invalid_input("reward must be a number"));
        auto feedback = feedback_of(body);
        if (!feedback)
            return std::unexpected(feedback.error());

        ExperienceDraft draft;
        draft.session_id = session_for(body);
        draft.state = std::move(*state);
        draft.action = std::move(*action);
        draft.reward = (*reward)->get<double>();
        draft.feedback = *feedback;
        draft.origin = ExperienceOrigin::Direct;
        draft.used_vision_fallback = body.value("used_vision_fallback", false);

        auto id = rt_.selector().record_experience(draft);
        return Json{{"status", "recorded"}, {"experience_id", id}, {"session_id", draft.session_id}};
    }

    Result<Json> ApiService::record_user_selection(const Json &body)
    {
        auto intent = intent_of(body);
        if (!intent)
            return std::unexpected(intent.error());
        auto candidates = candidates_from_json(body.value("candidates", Json::array()));
        if (!candidates)
            return std::unexpected(candidates.error());
        auto selected = candidate_of(body, "selected");
        if (!selected)
            return std::unexpected(selected.error());
        auto page = page_of(body);
        if (!page)
            return std::unexpected(page.error());

        auto session_id = session_for(body);
        auto id = rt_.selector().record_user_selection(session_id, *candidates, *selected, *intent, *page);
        return Json{{"status", "recorded"}, {"experience_id", id}, {"session_id", session_id}};
    }

    Result<Json> ApiService::record_action_result(const Json &body)
    {
        auto intent = intent_of(body);
        if (!intent)
            return std::unexpected(intent.error());
        auto action = candidate_of(body, "action");
        if (!action)
            return std::unexpected(action.error());
        auto page = page_of(body);
        if (!page)
            return std::unexpected(page.error());
        auto success = require(body, "success");
        if (!success)
            return std::unexpected(success.error());
        if (!(*success)->is_boolean())
            return std::unexpected(NavisError::invalid_input("success must be a boolean"));
        auto feedback = feedback_of(body);
        if (!feedback)
            return std::unexpected(feedback.error());

        auto session_id = session_for(body);
        bool ok = (*success)->get<bool>();
        auto id = rt_.selector().record_action_result(session_id, *action, *intent, *page, ok,
                                                      body.value("used_vision_fallback", false), *feedback);
        if (ok)
            rt_.sessions().end(session_id);

        return Json{{"status", "recorded"}, {"experience_id", id}, {"session_id", session_id}};
    }

    Result<Json> ApiService::record_feedback(const Json &body)
    {
        auto session_id = body.value("session_id", std::string{});
        if (session_id.empty())
            return std::unexpected(NavisError::invalid_input("Missing field: session_id"));
        auto kind = feedback_of(body);
        if (!kind)
            return std::unexpected(kind.error());
        if (*kind == FeedbackKind::None)
            return std::unexpected(NavisError::invalid_input("Missing field: feedback"));

        std::optional<Candidate> alternative;
        if (auto it = body.find("alternative"); it != body.end() && !it->is_null())
        {
            auto alt = Candidate::from_json(*it);
            if (!alt)
                return std::unexpected(alt.error());
            alternative = std::move(*alt);
        }

        auto outcome = rt_.selector().record_feedback(session_id, *kind, alternative);
        if (!outcome)
            return std::unexpected(outcome.error());

        return Json{
            {"status", outcome->applied ? "applied" : "ignored"},
            {"experience_id", outcome->id},
            {"feedback", feedback_kind_to_string(outcome->kind)},
            {"reward", outcome->reward}};
    }

    Json ApiService::statistics() const
    {
        auto stats = rt_.selector().statistics().to_json();
        stats["active_sessions"] = rt_.sessions().size();
        return stats;
    }

    Json ApiService::health() const
    {
        return Json{
            {"status", "healthy"},
            {"version", kVersion},
            {"model_updates", rt_.model().update_count()},
            {"storage", rt_.config().storage.enabled}};
    }

} // namespace navis
