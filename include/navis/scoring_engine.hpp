#pragma once

#include "candidate.hpp"
#include "element.hpp"
#include "intent.hpp"
#include "types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace navis
{

    class PreferenceModel;

    /**
     * Multi-factor semantic scorer. Stateless between calls: the same
     * (intent, elements, page, model snapshot) always yields the same ranking.
     */
    class ScoringEngine
    {
    public:
        struct Config
        {
            ScoringWeights weights{};
        };

        /** Throws NavisError (ConfigError) when the weights do not sum to 1.0 */
        ScoringEngine();
        explicit ScoringEngine(const Config &cfg);

        /**
         * Score and rank elements against an intent. Invisible and zero-area
         * elements are dropped first; if nothing remains the result is
         * EmptyCandidateSet. Output is stable-sorted by total_score descending,
         * ties keep DOM order.
         *
         * @param model optional preference model; 0.5 is used when null
         */
        Result<std::vector<Candidate>> score(
            const Intent &intent,
            const std::vector<Element> &elements,
            const PageContext &page = PageContext{},
            const PreferenceModel *model = nullptr) const;

        /** First n candidates with total_score >= min_score */
        static std::vector<Candidate> top_candidates(
            const std::vector<Candidate> &ranked,
            std::size_t n = 3,
            double min_score = 0.0);

        /** Human-readable per-factor breakdown of a candidate */
        std::string explain(const Candidate &candidate) const;

        const ScoringWeights &weights() const { return cfg_.weights; }

        static double text_match(const Element &element, const Intent &intent);
        static double semantic_relevance(const Element &element, const Intent &intent);
        static double position_relevance(const Element &element, ActionType action, const PageContext &page);
        static double visual_prominence(const Element &element, const PageContext &page);

        /** 0.5 * gap + 0.5 * magnitude, gap = max(0, total - best_other) */
        static double confidence(double total_score, double best_other);

    private:
        Config cfg_;
    };

} // namespace navis
