#include "navis/intent.hpp"
#include <algorithm>
#include <cctype>

namespace navis
{

    using Json = nlohmann::json;

    namespace
    {
        std::string lower(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::vector<std::string> string_list(const Json &j, const char *key)
        {
            std::vector<std::string> out;
            auto it = j.find(key);
            if (it == j.end() || !it->is_array())
                return out;
            for (const auto &v : *it)
            {
                if (v.is_string())
                    out.push_back(v.get<std::string>());
            }
            return out;
        }
    } // namespace

    std::string action_type_to_string(ActionType type)
    {
        switch (type)
        {
        case ActionType::Navigate:
            return "navigate";
        case ActionType::Search:
            return "search";
        case ActionType::FillForm:
            return "fill_form";
        case ActionType::Purchase:
            return "purchase";
        case ActionType::Contact:
            return "contact";
        case ActionType::Click:
            return "click";
        case ActionType::Select:
            return "select";
        }
        return "click";
    }

    Result<ActionType> action_type_from_string(std::string_view s)
    {
        auto v = lower(s);
        if (v == "navigate")
            return ActionType::Navigate;
        if (v == "search")
            return ActionType::Search;
        if (v == "fill_form")
            return ActionType::FillForm;
        if (v == "purchase")
            return ActionType::Purchase;
        if (v == "contact")
            return ActionType::Contact;
        if (v == "click")
            return ActionType::Click;
        if (v == "select")
            return ActionType::Select;
        return std::unexpected(NavisError::invalid_input("Invalid action_type: " + std::string(s)));
    }

    std::string urgency_to_string(Urgency urgency)
    {
        switch (urgency)
        {
        case Urgency::Low:
            return "low";
        case Urgency::Medium:
            return "medium";
        case Urgency::High:
            return "high";
        }
        return "medium";
    }

    Result<Urgency> urgency_from_string(std::string_view s)
    {
        auto v = lower(s);
        if (v == "low")
            return Urgency::Low;
        if (v == "medium")
            return Urgency::Medium;
        if (v == "high")
            return Urgency::High;
        return std::unexpected(NavisError::invalid_input("Invalid urgency: " + std::string(s)));
    }

    bool Intent::expects(std::string_view tag, std::string_view role) const
    {
        auto t = lower(tag);
        auto r = lower(role);
        for (const auto &expected : expected_element_types)
        {
            auto e = lower(expected);
            if ((!t.empty() && e == t) || (!r.empty() && e == r))
                return true;
        }
        return false;
    }

    Json Intent::to_json() const
    {
        return Json{
            {"goal", goal},
            {"action_type", action_type_to_string(action_type)},
            {"keywords", keywords},
            {"expected_element_types", expected_element_types},
            {"context_clues", context_clues},
            {"urgency", urgency_to_string(urgency)},
            {"confidence", confidence}};
    }

    Result<Intent> Intent::from_json(const Json &j)
    {
        if (!j.is_object())
            return std::unexpected(NavisError::parsing("Intent must be a JSON object"));

        try
        {
            Intent intent;
            intent.goal = j.value("goal", std::string{});

            auto action = action_type_from_string(j.value("action_type", std::string("click")));
            if (!action)
                return std::unexpected(action.error());
            intent.action_type = *action;

            auto urgency = urgency_from_string(j.value("urgency", std::string("medium")));
            if (!urgency)
                return std::unexpected(urgency.error());
            intent.urgency = *urgency;

            intent.keywords = string_list(j, "keywords");
            intent.expected_element_types = string_list(j, "expected_element_types");
            intent.context_clues = string_list(j, "context_clues");

            // The intent parser nests target hints under target_semantics
            if (auto ts = j.find("target_semantics"); ts != j.end() && ts->is_object())
            {
                if (intent.keywords.empty())
                    intent.keywords = string_list(*ts, "keywords");
                if (intent.expected_element_types.empty())
                    intent.expected_element_types = string_list(*ts, "element_types");
                if (intent.context_clues.empty())
                    intent.context_clues = string_list(*ts, "context_clues");
            }

            intent.confidence = clamp_unit(j.value("confidence", 0.0));
            return intent;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(NavisError::parsing(std::string("Invalid intent: ") + e.what()));
        }
    }

    Json PageContext::to_json() const
    {
        return Json{
            {"url", url},
            {"title", title},
            {"viewport_width", viewport_width},
            {"viewport_height", viewport_height}};
    }

    Result<PageContext> PageContext::from_json(const Json &j)
    {
        PageContext ctx;
        if (j.is_null())
            return ctx;
        if (!j.is_object())
            return std::unexpected(NavisError::parsing("page_context must be a JSON object"));

        try
        {
            ctx.url = j.value("url", std::string{});
            ctx.title = j.value("title", std::string{});
            double w = j.value("viewport_width", kDefaultViewportWidth);
            double h = j.value("viewport_height", kDefaultViewportHeight);
            ctx.viewport_width = w > 0.0 ? w : kDefaultViewportWidth;
            ctx.viewport_height = h > 0.0 ? h : kDefaultViewportHeight;
            return ctx;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(NavisError::parsing(std::string("Invalid page_context: ") + e.what()));
        }
    }

} // namespace navis
