#include "navis/scoring_engine.hpp"
#include "navis/preference_model.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string_view>
#include <tuple>

namespace navis
{

    namespace
    {
        // Landmark order used by the position tables below
        constexpr std::array<std::string_view, 6> kLandmarks = {
            "header", "nav", "main", "form", "aside", "footer"};

        using LandmarkTable = std::array<double, kLandmarks.size()>;

        LandmarkTable landmark_table(ActionType action)
        {
            switch (action)
            {
            case ActionType::Navigate:
                return {0.9, 1.0, 0.5, 0.3, 0.4, 0.6};
            case ActionType::Search:
                return {1.0, 0.7, 0.6, 0.9, 0.4, 0.3};
            case ActionType::FillForm:
                return {0.4, 0.3, 0.8, 1.0, 0.5, 0.3};
            case ActionType::Purchase:
                return {0.5, 0.4, 1.0, 0.9, 0.6, 0.3};
            case ActionType::Contact:
                return {0.7, 0.8, 0.6, 0.6, 0.4, 1.0};
            case ActionType::Click:
                return {0.7, 0.7, 0.8, 0.8, 0.5, 0.5};
            case ActionType::Select:
                return {0.5, 0.5, 0.8, 1.0, 0.6, 0.4};
            }
            return {0.5, 0.5, 0.5, 0.5, 0.5, 0.5};
        }

        constexpr double kAnchorRatio = 0.8;
        constexpr double kReferenceArea = 20000.0; // a large button, in px^2

        std::string lower(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        double viewport_w(const PageContext &page)
        {
            return page.viewport_width > 0.0 ? page.viewport_width : PageContext::kDefaultViewportWidth;
        }

        double viewport_h(const PageContext &page)
        {
            return page.viewport_height > 0.0 ? page.viewport_height : PageContext::kDefaultViewportHeight;
        }
    } // namespace

    ScoringEngine::ScoringEngine() : ScoringEngine(Config{}) {}

    ScoringEngine::ScoringEngine(const Config &cfg) : cfg_(cfg)
    {
        if (auto valid = cfg_.weights.validate(); !valid)
        {
            throw valid.error();
        }
    }

    double ScoringEngine::text_match(const Element &element, const Intent &intent)
    {
        if (intent.keywords.empty())
            return 0.0;

        std::string combined = lower(element.text + " " + element.label);
        std::size_t matches = 0;
        for (const auto &keyword : intent.keywords)
        {
            auto kw = lower(keyword);
            if (!kw.empty() && combined.find(kw) != std::string::npos)
                ++matches;
        }
        return clamp_unit(static_cast<double>(matches) / static_cast<double>(intent.keywords.size()));
    }

    double ScoringEngine::semantic_relevance(const Element &element, const Intent &intent)
    {
        double score = intent.expects(element.tag, element.role) ? 0.5 : 0.0;

        if (!intent.context_clues.empty())
        {
            std::string nearby = lower(element.nearby_text + " " + element.text);
            std::size_t hits = 0;
            for (const auto &clue : intent.context_clues)
            {
                auto c = lower(clue);
                if (!c.empty() && nearby.find(c) != std::string::npos)
                    ++hits;
            }
            score += 0.5 * static_cast<double>(hits) / static_cast<double>(intent.context_clues.size());
        }
        return clamp_unit(score);
    }

    double ScoringEngine::position_relevance(const Element &element, ActionType action, const PageContext &page)
    {
        auto landmark = lower(element.landmark);
        auto table = landmark_table(action);
        for (std::size_t i = 0; i < kLandmarks.size(); ++i)
        {
            if (landmark == kLandmarks[i])
                return table[i];
        }

        // No landmark: fall back to vertical position
        double rel_y = element.bounds.center_y() / viewport_h(page);
        switch (action)
        {
        case ActionType::Navigate:
        case ActionType::Search:
        case ActionType::Click:
            if (element.bounds.y < 200.0)
                return 0.8;
            if (element.bounds.y < 500.0)
                return 0.6;
            return 0.5;
        case ActionType::Contact:
            return rel_y >= 0.75 ? 0.8 : 0.5;
        default:
            return 0.5;
        }
    }

    double ScoringEngine::visual_prominence(const Element &element, const PageContext &page)
    {
        if (!element.is_actionable())
            return 0.0;

        double size_score = std::min(1.0, element.bounds.area() / kReferenceArea);
        double cx = element.bounds.center_x();
        double cy = element.bounds.center_y();
        bool in_viewport = cx >= 0.0 && cy >= 0.0 && cx <= viewport_w(page) && cy <= viewport_h(page);
        double viewport_term = in_viewport ? 1.0 : 0.5;
        return clamp_unit(0.5 * size_score + 0.3 * clamp_unit(element.contrast) + 0.2 * viewport_term);
    }

    double ScoringEngine::confidence(double total_score, double best_other)
    {
        double magnitude = clamp_unit(total_score);
        double gap = clamp_unit(total_score - best_other);
        return clamp_unit(0.5 * gap + 0.5 * magnitude);
    }

    Result<std::vector<Candidate>> ScoringEngine::score(
        const Intent &intent,
        const std::vector<Element> &elements,
        const PageContext &page,
        const PreferenceModel *model) const
    {
        std::vector<Candidate> candidates;
        candidates.reserve(elements.size());
        for (std::size_t i = 0; i < elements.size(); ++i)
        {
            if (!elements[i].is_actionable())
                continue;
            Candidate c;
            c.element = elements[i];
            c.dom_index = i;
            candidates.push_back(std::move(c));
        }

        if (candidates.empty())
        {
            spdlog::info("No visible elements to score for intent: {}", intent.goal);
            return std::unexpected(NavisError::empty_candidate_set("No visible elements on page"));
        }

        spdlog::debug("Scoring {} of {} elements for intent: {}", candidates.size(), elements.size(), intent.goal);

        // First pass: the text-driven factors, which also pick the proximity anchors
        std::vector<double> preliminary(candidates.size(), 0.0);
        double max_preliminary = 0.0;
        for (std::size_t i = 0; i < candidates.size(); ++i)
        {
            auto &s = candidates[i].scores;
            s.text_match = text_match(candidates[i].element, intent);
            s.semantic_relevance = semantic_relevance(candidates[i].element, intent);
            preliminary[i] = 0.5 * s.text_match + 0.5 * s.semantic_relevance;
            max_preliminary = std::max(max_preliminary, preliminary[i]);
        }

        std::vector<std::size_t> anchors;
        if (max_preliminary > 0.0)
        {
            for (std::size_t i = 0; i < candidates.size(); ++i)
            {
                if (preliminary[i] > 0.0 && preliminary[i] >= kAnchorRatio * max_preliminary)
                    anchors.push_back(i);
            }
        }

        const double diagonal = std::hypot(viewport_w(page), viewport_h(page));

        for (std::size_t i = 0; i < candidates.size(); ++i)
        {
            auto &c = candidates[i];
            const auto &el = c.element;

            double nearest = std::numeric_limits<double>::infinity();
            for (auto a : anchors)
            {
                if (a == i)
                    continue;
                const auto &other = candidates[a].element.bounds;
                double d = std::hypot(el.bounds.center_x() - other.center_x(),
                                      el.bounds.center_y() - other.center_y());
                nearest = std::min(nearest, d);
            }
            double proximity = std::isfinite(nearest) ? clamp_unit(1.0 - nearest / diagonal) : 0.5;

            c.scores.contextual_position = clamp_unit(
                0.5 * position_relevance(el, intent.action_type, page) + 0.5 * proximity);
            c.scores.visual_prominence = visual_prominence(el, page);

            c.scores.learned_preference = 0.5;
            if (model)
            {
                auto features = PreferenceFeatures::from_candidate(c, intent, page, cfg_.weights);
                c.scores.learned_preference = model->predict(features);
            }

            c.total_score = cfg_.weights.combine(c.scores);
        }

        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const Candidate &a, const Candidate &b) { return a.total_score > b.total_score; });

        for (std::size_t i = 0; i < candidates.size(); ++i)
        {
            double best_other = 0.0;
            if (candidates.size() > 1)
                best_other = (i == 0) ? candidates[1].total_score : candidates[0].total_score;
            candidates[i].confidence = confidence(candidates[i].total_score, best_other);
            candidates[i].rank = i + 1;
        }

        spdlog::info("Scored {} elements, top score: {:.3f}, confidence: {:.3f}",
                     candidates.size(), candidates.front().total_score, candidates.front().confidence);
        return candidates;
    }

    std::vector<Candidate> ScoringEngine::top_candidates(
        const std::vector<Candidate> &ranked,
        std::size_t n,
        double min_score)
    {
        std::vector<Candidate> out;
        for (const auto &c : ranked)
        {
            if (out.size() >= n)
                break;
            if (c.total_score >= min_score)
                out.push_back(c);
        }
        return out;
    }

    std::string ScoringEngine::explain(const Candidate &candidate) const
    {
        const auto &w = cfg_.weights;
        const auto &s = candidate.scores;
        const std::array<std::tuple<const char *, double, double>, 5> rows = {{
            {"text_match", s.text_match, w.text_match},
            {"semantic_relevance", s.semantic_relevance, w.semantic_relevance},
            {"contextual_position", s.contextual_position, w.contextual_position},
            {"visual_prominence", s.visual_prominence, w.visual_prominence},
            {"learned_preference", s.learned_preference, w.learned_preference},
        }};

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        oss << "Score: " << candidate.total_score << " (Confidence: " << candidate.confidence << ")\n";
        oss << "Breakdown:\n";
        for (const auto &[name, value, weight] : rows)
        {
            oss << "  - " << name << ": " << value
                << " (weight: " << weight << ", contribution: " << value * weight << ")\n";
        }
        return oss.str();
    }

} // namespace navis
