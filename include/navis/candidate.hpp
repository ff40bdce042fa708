#pragma once

#include "element.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace navis
{

    /**
     * Named sub-scores for one element, each in [0,1].
     */
    struct ScoreBreakdown
    {
        double text_match{0.0};
        double semantic_relevance{0.0};
        double contextual_position{0.0};
        double visual_prominence{0.0};
        double learned_preference{0.5};

        nlohmann::json to_json() const;
        static ScoreBreakdown from_json(const nlohmann::json &j);
    };

    /**
     * Factor weights for the total score. Must be non-negative and sum to 1.0.
     */
    struct ScoringWeights
    {
        double text_match{0.30};
        double semantic_relevance{0.25};
        double contextual_position{0.20};
        double visual_prominence{0.15};
        double learned_preference{0.10};

        static ScoringWeights defaults() { return ScoringWeights{}; }

        Result<void> validate() const;

        /** Weighted sum of all five factors */
        double combine(const ScoreBreakdown &scores) const;

        /** Weighted sum without the learned term, renormalised to [0,1] */
        double combine_without_learned(const ScoreBreakdown &scores) const;

        nlohmann::json to_json() const;
    };

    /**
     * A scored element. Produced fresh per request and ordered by total_score.
     */
    struct Candidate
    {
        Element element;
        ScoreBreakdown scores;
        double total_score{0.0};
        double confidence{0.0};
        std::size_t dom_index{0}; // position in the analyzer's element list
        std::size_t rank{0};      // 1-based, after sorting

        nlohmann::json to_json() const;
        static Result<Candidate> from_json(const nlohmann::json &j);
    };

    nlohmann::json candidates_to_json(const std::vector<Candidate> &candidates);
    Result<std::vector<Candidate>> candidates_from_json(const nlohmann::json &j);

} // namespace navis
