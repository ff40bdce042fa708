#pragma once

#include "navis/candidate.hpp"
#include "navis/decision_agent.hpp"
#include "navis/element.hpp"
#include "navis/intent.hpp"
#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace navis::test
{

    inline Element make_element(const std::string &selector,
                                const std::string &text,
                                const std::string &tag,
                                const std::string &role,
                                BoundingBox bounds)
    {
        Element e;
        e.selector = selector;
        e.text = text;
        e.tag = tag;
        e.role = role;
        e.bounds = bounds;
        return e;
    }

    inline Candidate make_candidate(const std::string &selector, double total, double confidence, std::size_t dom_index = 0)
    {
        Candidate c;
        c.element = make_element(selector, selector, "button", "button", {100.0, 100.0, 120.0, 40.0});
        c.total_score = total;
        c.confidence = confidence;
        c.dom_index = dom_index;
        c.rank = dom_index + 1;
        return c;
    }

    inline Intent login_intent()
    {
        Intent intent;
        intent.goal = "log in to my account";
        intent.action_type = ActionType::Click;
        intent.keywords = {"login", "sign in"};
        intent.expected_element_types = {"button"};
        intent.confidence = 0.9;
        return intent;
    }

    /** Replays fixed draws; the last value repeats once the script runs out */
    class ScriptedRandom : public RandomSource
    {
    public:
        ScriptedRandom(std::vector<double> uniforms, std::vector<std::size_t> indices = {0})
            : uniforms_(std::move(uniforms)), indices_(std::move(indices))
        {
        }

        double uniform() override
        {
            double v = uniforms_[std::min(next_uniform_, uniforms_.size() - 1)];
            ++next_uniform_;
            return v;
        }

        std::size_t index(std::size_t n) override
        {
            std::size_t v = indices_[std::min(next_index_, indices_.size() - 1)];
            ++next_index_;
            return n == 0 ? 0 : v % n;
        }

    private:
        std::vector<double> uniforms_;
        std::vector<std::size_t> indices_;
        std::size_t next_uniform_{0};
        std::size_t next_index_{0};
    };

} // namespace navis::test
