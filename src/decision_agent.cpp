#include "navis/decision_agent.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace navis
{

    SeededRandom::SeededRandom(std::uint64_t seed) : engine_(seed) {}

    double SeededRandom::uniform()
    {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(engine_);
    }

    std::size_t SeededRandom::index(std::size_t n)
    {
        if (n == 0)
            return 0;
        std::uniform_int_distribution<std::size_t> dist(0, n - 1);
        return dist(engine_);
    }

    std::string selection_method_to_string(SelectionMethod method)
    {
        switch (method)
        {
        case SelectionMethod::Exploration:
            return "exploration";
        case SelectionMethod::Exploitation:
            return "exploitation";
        }
        return "unknown";
    }

    nlohmann::json Selection::to_json() const
    {
        return nlohmann::json{
            {"candidate", candidate.to_json()},
            {"index", index},
            {"rl_score", rl_score},
            {"combined_score", combined_score},
            {"selection_method", selection_method_to_string(method)},
            {"exploration_rate", exploration_rate}};
    }

    DecisionAgent::DecisionAgent(PreferenceModel &model, RandomSource &random)
        : DecisionAgent(model, random, Config{})
    {
    }

    DecisionAgent::DecisionAgent(PreferenceModel &model, RandomSource &random, const Config &cfg)
        : model_(model), random_(random), cfg_(cfg)
    {
        if (cfg_.semantic_weight < 0.0 || cfg_.preference_weight < 0.0 ||
            std::abs(cfg_.semantic_weight + cfg_.preference_weight - 1.0) > 1e-6)
        {
            throw NavisError::config("Decision weights must be non-negative and sum to 1.0");
        }
        if (cfg_.exploration_pool == 0)
        {
            throw NavisError::config("Exploration pool must hold at least one candidate");
        }
    }

    double DecisionAgent::rl_score(const Candidate &candidate, const Intent &intent, const PageContext &page) const
    {
        auto features = PreferenceFeatures::from_candidate(candidate, intent, page, cfg_.scoring_weights);
        return model_.predict(features);
    }

    Result<Selection> DecisionAgent::select(
        const std::vector<Candidate> &candidates,
        const Intent &intent,
        const PageContext &page) const
    {
        if (candidates.empty())
        {
            return std::unexpected(NavisError::no_candidates("No candidates to choose from"));
        }

        // Input order may not be ranked; order by total_score, then original rank
        std::vector<std::size_t> by_score(candidates.size());
        std::iota(by_score.begin(), by_score.end(), std::size_t{0});
        std::stable_sort(by_score.begin(), by_score.end(), [&](std::size_t a, std::size_t b)
                         {
                             if (candidates[a].total_score != candidates[b].total_score)
                                 return candidates[a].total_score > candidates[b].total_score;
                             return candidates[a].rank < candidates[b].rank;
                         });

        const double epsilon = model_.exploration_rate();
        Selection out;
        out.exploration_rate = epsilon;

        if (random_.uniform() < epsilon)
        {
            std::size_t pool = std::min(cfg_.exploration_pool, by_score.size());
            out.index = by_score[random_.index(pool)];
            out.method = SelectionMethod::Exploration;
            out.candidate = candidates[out.index];
            out.rl_score = rl_score(out.candidate, intent, page);
            out.combined_score = cfg_.semantic_weight * out.candidate.total_score +
                                 cfg_.preference_weight * out.rl_score;
            spdlog::debug("Exploring: picked candidate {} of top {}", out.index, pool);
            return out;
        }

        double best_combined = -1.0;
        double best_rl = 0.5;
        std::size_t best = 0;
        for (std::size_t i = 0; i < candidates.size(); ++i)
        {
            double rl = rl_score(candidates[i], intent, page);
            double combined = cfg_.semantic_weight * candidates[i].total_score + cfg_.preference_weight * rl;
            if (combined > best_combined ||
                (combined == best_combined && candidates[i].rank < candidates[best].rank))
            {
                best_combined = combined;
                best_rl = rl;
                best = i;
            }
        }

        out.index = best;
        out.method = SelectionMethod::Exploitation;
        out.candidate = candidates[best];
        out.rl_score = best_rl;
        out.combined_score = best_combined;
        spdlog::debug("Exploiting: picked candidate {} (combined {:.3f})", best, best_combined);
        return out;
    }

} // namespace navis
