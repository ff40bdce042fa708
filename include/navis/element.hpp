#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace navis
{

    struct BoundingBox
    {
        double x{0.0};
        double y{0.0};
        double width{0.0};
        double height{0.0};

        double area() const { return width * height; }
        double center_x() const { return x + width / 2.0; }
        double center_y() const { return y + height / 2.0; }
    };

    /**
     * Raw descriptor of one interactive element, as produced by the page analyzer.
     * A snapshot: it goes stale once the page mutates, so nothing in the core
     * holds on to elements between calls.
     */
    struct Element
    {
        std::string selector;    // stable selector / identifier
        std::string text;        // visible text
        std::string label;       // aria-label, title, placeholder
        std::string tag;         // lower-case tag name
        std::string role;        // ARIA role
        BoundingBox bounds;
        bool visible{true};
        bool enabled{true};
        double contrast{0.5};    // [0,1], 0.5 when unknown
        std::string landmark;    // header, nav, main, form, aside, footer or empty
        std::string nearby_text; // text surrounding the element

        /** Visible with a non-zero area; anything else is never a candidate. */
        bool is_actionable() const
        {
            return visible && bounds.width > 0.0 && bounds.height > 0.0;
        }

        nlohmann::json to_json() const;
        static Result<Element> from_json(const nlohmann::json &j);
    };

} // namespace navis
