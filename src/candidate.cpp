#include "navis/candidate.hpp"
#include <cmath>

namespace navis
{

    using Json = nlohmann::json;

    namespace
    {
        constexpr double kWeightTolerance = 1e-6;
    }

    Json ScoreBreakdown::to_json() const
    {
        return Json{
            {"text_match", text_match},
            {"semantic_relevance", semantic_relevance},
            {"contextual_position", contextual_position},
            {"visual_prominence", visual_prominence},
            {"learned_preference", learned_preference}};
    }

    ScoreBreakdown ScoreBreakdown::from_json(const Json &j)
    {
        ScoreBreakdown s;
        if (!j.is_object())
            return s;
        s.text_match = clamp_unit(j.value("text_match", 0.0));
        s.semantic_relevance = clamp_unit(j.value("semantic_relevance", 0.0));
        s.contextual_position = clamp_unit(j.value("contextual_position", 0.0));
        s.visual_prominence = clamp_unit(j.value("visual_prominence", 0.0));
        s.learned_preference = clamp_unit(j.value("learned_preference", 0.5));
        return s;
    }

    Result<void> ScoringWeights::validate() const
    {
        const double values[] = {text_match, semantic_relevance, contextual_position,
                                 visual_prominence, learned_preference};
        double sum = 0.0;
        for (double v : values)
        {
            if (!std::isfinite(v) || v < 0.0)
                return std::unexpected(NavisError::config("Scoring weights must be finite and non-negative"));
            sum += v;
        }
        if (std::abs(sum - 1.0) > kWeightTolerance)
        {
            return std::unexpected(NavisError::config("Scoring weights must sum to 1.0 (got " + std::to_string(sum) + ")"));
        }
        if (learned_preference >= 1.0)
            return std::unexpected(NavisError::config("learned_preference weight must be below 1.0"));
        return {};
    }

    double ScoringWeights::combine(const ScoreBreakdown &s) const
    {
        return clamp_unit(text_match * s.text_match +
                          semantic_relevance * s.semantic_relevance +
                          contextual_position * s.contextual_position +
                          visual_prominence * s.visual_prominence +
                          learned_preference * s.learned_preference);
    }

    double ScoringWeights::combine_without_learned(const ScoreBreakdown &s) const
    {
        double partial = text_match * s.text_match +
                         semantic_relevance * s.semantic_relevance +
                         contextual_position * s.contextual_position +
                         visual_prominence * s.visual_prominence;
        return clamp_unit(partial / (1.0 - learned_preference));
    }

    Json ScoringWeights::to_json() const
    {
        return Json{
            {"text_match", text_match},
            {"semantic_relevance", semantic_relevance},
            {"contextual_position", contextual_position},
            {"visual_prominence", visual_prominence},
            {"learned_preference", learned_preference}};
    }

    Json Candidate::to_json() const
    {
        Json j = element.to_json();
        j["scores"] = scores.to_json();
        j["total_score"] = total_score;
        j["confidence"] = confidence;
        j["dom_index"] = dom_index;
        j["rank"] = rank;
        return j;
    }

    Result<Candidate> Candidate::from_json(const Json &j)
    {
        auto element = Element::from_json(j);
        if (!element)
            return std::unexpected(element.error());

        try
        {
            Candidate c;
            c.element = std::move(*element);
            if (auto s = j.find("scores"); s != j.end())
                c.scores = ScoreBreakdown::from_json(*s);
            c.total_score = clamp_unit(j.value("total_score", 0.0));
            c.confidence = clamp_unit(j.value("confidence", 0.0));
            c.dom_index = j.value("dom_index", std::size_t{0});
            c.rank = j.value("rank", std::size_t{0});
            return c;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(NavisError::parsing(std::string("Invalid candidate: ") + e.what()));
        }
    }

    Json candidates_to_json(const std::vector<Candidate> &candidates)
    {
        Json arr = Json::array();
        for (const auto &c : candidates)
            arr.push_back(c.to_json());
        return arr;
    }

    Result<std::vector<Candidate>> candidates_from_json(const Json &j)
    {
        if (!j.is_array())
            return std::unexpected(NavisError::parsing("candidates must be a JSON array"));

        std::vector<Candidate> out;
        out.reserve(j.size());
        for (const auto &item : j)
        {
            auto c = Candidate::from_json(item);
            if (!c)
                return std::unexpected(c.error());
            out.push_back(std::move(*c));
        }
        return out;
    }

} // namespace navis
