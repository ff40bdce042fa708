#pragma once

#include "candidate.hpp"
#include "intent.hpp"
#include "preference_model.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace navis
{

    /**
     * Source of randomness for exploration. Injected so that selection is
     * reproducible under a fixed seed.
     */
    class RandomSource
    {
    public:
        virtual ~RandomSource() = default;

        /** Uniform value in [0,1) */
        virtual double uniform() = 0;

        /** Uniform index in [0,n); n must be > 0 */
        virtual std::size_t index(std::size_t n) = 0;
    };

    class SeededRandom : public RandomSource
    {
    public:
        explicit SeededRandom(std::uint64_t seed);

        double uniform() override;
        std::size_t index(std::size_t n) override;

    private:
        std::mt19937_64 engine_;
    };

    enum class SelectionMethod
    {
        Exploration,
        Exploitation
    };

    std::string selection_method_to_string(SelectionMethod method);

    struct Selection
    {
        Candidate candidate;
        std::size_t index{0}; // position in the input list
        double rl_score{0.5};
        double combined_score{0.0};
        SelectionMethod method{SelectionMethod::Exploitation};
        double exploration_rate{0.0};

        nlohmann::json to_json() const;
    };

    /**
     * Epsilon-greedy choice over a ranked candidate list.
     *
     * Exploration picks uniformly among the top three by total_score.
     * Exploitation picks argmax of
     *   semantic_weight * total_score + preference_weight * rl_score
     * with ties going to the better-ranked candidate.
     */
    class DecisionAgent
    {
    public:
        struct Config
        {
            double semantic_weight{0.7};
            double preference_weight{0.3};
            std::size_t exploration_pool{3};
            ScoringWeights scoring_weights{};
        };

        /** Throws NavisError (ConfigError) when the two weights do not sum to 1.0 */
        DecisionAgent(PreferenceModel &model, RandomSource &random);
        DecisionAgent(PreferenceModel &model, RandomSource &random, const Config &cfg);

        Result<Selection> select(
            const std::vector<Candidate> &candidates,
            const Intent &intent,
            const PageContext &page) const;

        PreferenceModel &model() { return model_; }
        const PreferenceModel &model() const { return model_; }
        const Config &config() const { return cfg_; }

    private:
        double rl_score(const Candidate &candidate, const Intent &intent, const PageContext &page) const;

        PreferenceModel &model_;
        RandomSource &random_;
        Config cfg_;
    };

} // namespace navis
