#include "navis/action_selector.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace navis
{

    using Json = nlohmann::json;

    nlohmann::json decision_to_json(const Decision &decision)
    {
        if (const auto *auto_exec = std::get_if<AutoExecute>(&decision))
        {
            return Json{
                {"decision", "auto_execute"},
                {"action", auto_exec->selection.to_json()},
                {"confidence", auto_exec->selection.candidate.confidence}};
        }

        const auto &request = std::get<RequestUserSelection>(decision);
        return Json{
            {"decision", "request_user_selection"},
            {"candidates", candidates_to_json(request.options)},
            {"recommended", request.recommended.to_json()},
            {"confidence", request.recommended.candidate.confidence},
            {"explanation", request.explanation}};
    }

    std::string confidence_explanation(double confidence)
    {
        if (confidence < 0.3)
            return "Very uncertain - multiple similar options found";
        if (confidence < 0.5)
            return "Uncertain - please verify this is the correct element";
        if (confidence < 0.7)
            return "Moderately confident - please confirm";
        return "Confident in this selection";
    }

    nlohmann::json LearningStatistics::to_json() const
    {
        return Json{
            {"exploration_rate", exploration_rate},
            {"experience_count", experience_count},
            {"recent_accuracy", recent_accuracy},
            {"model_updates", model_updates},
            {"confidence_threshold", confidence_threshold}};
    }

    ActionSelector::ActionSelector(DecisionAgent &agent, ExperienceLedger &ledger)
        : ActionSelector(agent, ledger, Config{})
    {
    }

    ActionSelector::ActionSelector(DecisionAgent &agent, ExperienceLedger &ledger, const Config &cfg, AuditLogger *audit)
        : agent_(agent), ledger_(ledger), cfg_(cfg), audit_(audit)
    {
        if (!(cfg_.confidence_threshold >= 0.0 && cfg_.confidence_threshold <= 1.0))
        {
            throw NavisError::config("Confidence threshold must be within [0,1]");
        }
        if (cfg_.batch_size == 0)
        {
            throw NavisError::config("Learning batch size must be at least 1");
        }
    }

    Result<Decision> ActionSelector::decide(
        const std::vector<Candidate> &candidates,
        const Intent &intent,
        const PageContext &page) const
    {
        auto selection = agent_.select(candidates, intent, page);
        if (!selection)
            return std::unexpected(selection.error());

        const double confidence = selection->candidate.confidence;
        spdlog::info("Decision for '{}': {} via {}, confidence {:.3f} (threshold {:.2f})",
                     intent.goal, selection->candidate.element.selector,
                     selection_method_to_string(selection->method), confidence, cfg_.confidence_threshold);

        if (confidence >= cfg_.confidence_threshold)
        {
            audit("", "decide", "auto_execute", selection->to_json());
            return Decision{AutoExecute{std::move(*selection)}};
        }

        std::vector<Candidate> options(candidates);
        std::stable_sort(options.begin(), options.end(),
                         [](const Candidate &a, const Candidate &b) { return a.total_score > b.total_score; });
        if (options.size() > cfg_.max_options)
            options.resize(cfg_.max_options);

        RequestUserSelection request{std::move(options), std::move(*selection), confidence_explanation(confidence)};
        audit("", "decide", "request_user_selection", request.recommended.to_json());
        return Decision{std::move(request)};
    }

    std::uint64_t ActionSelector::record_user_selection(
        const std::string &session_id,
        const std::vector<Candidate> &candidates,
        const Candidate &selected,
        const Intent &intent,
        const PageContext &page)
    {
        spdlog::info("Recording user selection: {}", selected.element.text.substr(0, 30));

        ExperienceDraft draft;
        draft.session_id = session_id;
        draft.state = StateSnapshot{intent, candidates, page};
        draft.action = selected;
        draft.reward = 1.0;
        draft.origin = ExperienceOrigin::UserSelection;
        return append_and_learn(draft);
    }

    std::uint64_t ActionSelector::record_action_result(
        const std::string &session_id,
        const Candidate &action,
        const Intent &intent,
        const PageContext &page,
        bool success,
        bool used_vision_fallback,
        FeedbackKind feedback)
    {
        spdlog::info("Recording action result: success={}, vision_fallback={}, feedback={}",
                     success, used_vision_fallback, feedback_kind_to_string(feedback));

        ExperienceDraft draft;
        draft.session_id = session_id;
        draft.state = StateSnapshot{intent, {action}, page};
        draft.action = action;
        draft.reward = success ? 1.0 : -1.0;
        draft.feedback = feedback;
        draft.origin = ExperienceOrigin::Execution;
        draft.used_vision_fallback = used_vision_fallback;
        return append_and_learn(draft);
    }

    std::uint64_t ActionSelector::record_experience(const ExperienceDraft &draft)
    {
        return append_and_learn(draft);
    }

    Result<FeedbackOutcome> ActionSelector::record_feedback(
        const std::string &session_id,
        FeedbackKind kind,
        const std::optional<Candidate> &alternative)
    {
        auto latest = ledger_.latest_for_session(session_id);
        if (!latest)
        {
            return std::unexpected(NavisError::not_found("No experience recorded for session " + session_id));
        }

        auto outcome = ledger_.apply_feedback(latest->id, kind);
        if (!outcome)
            return outcome;

        audit(session_id, "feedback", outcome->applied ? "applied" : "ignored",
              Json{{"experience_id", outcome->id},
                   {"kind", feedback_kind_to_string(kind)},
                   {"reward", outcome->reward}});

        if (kind == FeedbackKind::BetterAlternative && alternative)
        {
            ExperienceDraft correction;
            correction.session_id = session_id;
            correction.state = latest->state;
            correction.action = *alternative;
            correction.reward = 1.0;
            correction.origin = ExperienceOrigin::UserCorrection;
            append_and_learn(correction);
        }
        return outcome;
    }

    std::uint64_t ActionSelector::append_and_learn(const ExperienceDraft &draft)
    {
        auto id = ledger_.append(draft);
        if (auto exp = ledger_.get(id))
        {
            audit(draft.session_id, "experience", experience_origin_to_string(draft.origin),
                  Json{{"experience_id", id},
                       {"reward", exp->reward},
                       {"used_vision_fallback", exp->used_vision_fallback}});
        }
        learn_pending();
        return id;
    }

    std::vector<TrainingSample> ActionSelector::training_samples(const std::vector<Experience> &batch) const
    {
        std::vector<TrainingSample> samples;
        samples.reserve(batch.size());
        for (const auto &exp : batch)
        {
            TrainingSample sample;
            sample.features = PreferenceFeatures::from_candidate(exp.action, exp.state.intent, exp.state.page,
                                                                 cfg_.scoring_weights);
            sample.target = (exp.reward + 1.0) / 2.0;
            if (exp.used_vision_fallback)
                sample.target *= cfg_.vision_fallback_discount;
            samples.push_back(sample);
        }
        return samples;
    }

    std::size_t ActionSelector::learn_pending()
    {
        auto &model = agent_.model();
        std::size_t applied = 0;

        for (auto batch = ledger_.take_batch(cfg_.batch_size); !batch.empty();
             batch = ledger_.take_batch(cfg_.batch_size))
        {
            auto result = model.update(training_samples(batch));
            if (!result)
            {
                spdlog::warn("Skipping training batch of {} experiences: {}", batch.size(), result.error().what());
                audit("", "model_update", "rejected", Json{{"error", result.error().what()}});
                continue;
            }

            double rate = model.exploration_rate();
            double decayed = model.decay_exploration();
            ++applied;
            spdlog::info("Preference model updated from {} experiences, exploration {:.4f} -> {:.4f}",
                         batch.size(), rate, decayed);
            audit("", "model_update", "applied",
                  Json{{"batch_size", batch.size()}, {"exploration_rate", decayed}, {"updates", model.update_count()}});

            if (!cfg_.model_path.empty())
            {
                if (auto saved = model.save(cfg_.model_path); !saved)
                    spdlog::error("Failed to save preference model: {}", saved.error().what());
            }
        }
        return applied;
    }

    LearningStatistics ActionSelector::statistics() const
    {
        const auto &model = agent_.model();
        return LearningStatistics{
            model.exploration_rate(),
            ledger_.size(),
            ledger_.recent_accuracy(),
            model.update_count(),
            cfg_.confidence_threshold};
    }

    void ActionSelector::audit(const std::string &session_id, const std::string &action,
                               const std::string &result, nlohmann::json details) const
    {
        if (audit_)
            audit_->log(AuditEvent::now(session_id, action, result, std::move(details)));
    }

} // namespace navis
