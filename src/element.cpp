#include "navis/element.hpp"
#include <algorithm>
#include <cctype>

namespace navis
{

    using Json = nlohmann::json;

    Json Element::to_json() const
    {
        return Json{
            {"selector", selector},
            {"text", text},
            {"label", label},
            {"tag", tag},
            {"role", role},
            {"bounds", {{"x", bounds.x}, {"y", bounds.y}, {"width", bounds.width}, {"height", bounds.height}}},
            {"visible", visible},
            {"enabled", enabled},
            {"contrast", contrast},
            {"landmark", landmark},
            {"nearby_text", nearby_text}};
    }

    Result<Element> Element::from_json(const Json &j)
    {
        if (!j.is_object())
            return std::unexpected(NavisError::parsing("Element must be a JSON object"));

        try
        {
            Element e;
            e.selector = j.value("selector", std::string{});
            e.text = j.value("text", std::string{});
            e.label = j.value("label", std::string{});
            e.tag = j.value("tag", std::string{});
            e.role = j.value("role", std::string{});
            std::transform(e.tag.begin(), e.tag.end(), e.tag.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            if (auto b = j.find("bounds"); b != j.end() && b->is_object())
            {
                e.bounds.x = b->value("x", 0.0);
                e.bounds.y = b->value("y", 0.0);
                e.bounds.width = b->value("width", 0.0);
                e.bounds.height = b->value("height", 0.0);
            }

            e.visible = j.value("visible", true);
            e.enabled = j.value("enabled", true);
            e.contrast = clamp_unit(j.value("contrast", 0.5));
            e.landmark = j.value("landmark", std::string{});
            e.nearby_text = j.value("nearby_text", std::string{});
            return e;
        }
        catch (const Json::exception &ex)
        {
            return std::unexpected(NavisError::parsing(std::string("Invalid element: ") + ex.what()));
        }
    }

} // namespace navis
