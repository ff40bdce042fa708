#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace navis
{

    enum class ActionType
    {
        Navigate,
        Search,
        FillForm,
        Purchase,
        Contact,
        Click,
        Select
    };

    std::string action_type_to_string(ActionType type);
    Result<ActionType> action_type_from_string(std::string_view s);

    enum class Urgency
    {
        Low,
        Medium,
        High
    };

    std::string urgency_to_string(Urgency urgency);
    Result<Urgency> urgency_from_string(std::string_view s);

    /**
     * Structured user goal produced by the intent parser. Immutable once parsed;
     * the caller owns it for one goal-resolution cycle.
     */
    struct Intent
    {
        std::string goal;
        ActionType action_type{ActionType::Click};
        std::vector<std::string> keywords;
        std::vector<std::string> expected_element_types;
        std::vector<std::string> context_clues;
        Urgency urgency{Urgency::Medium};
        double confidence{0.0};

        /** True when tag or role (case-insensitive) is one of the expected element types */
        bool expects(std::string_view tag, std::string_view role) const;

        nlohmann::json to_json() const;
        static Result<Intent> from_json(const nlohmann::json &j);
    };

    /**
     * Page-level context for one request. Viewport falls back to 1920x1080.
     */
    struct PageContext
    {
        static constexpr double kDefaultViewportWidth = 1920.0;
        static constexpr double kDefaultViewportHeight = 1080.0;

        std::string url;
        std::string title;
        double viewport_width{kDefaultViewportWidth};
        double viewport_height{kDefaultViewportHeight};

        nlohmann::json to_json() const;
        static Result<PageContext> from_json(const nlohmann::json &j);
    };

} // namespace navis
