#include "navis/experience_ledger.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace navis
{

    ExperienceLedger::ExperienceLedger() : ExperienceLedger(Config{}) {}

    ExperienceLedger::ExperienceLedger(const Config &cfg, std::shared_ptr<ExperienceStore> store)
        : cfg_(cfg), store_(std::move(store))
    {
    }

    std::uint64_t ExperienceLedger::append(const ExperienceDraft &draft)
    {
        Experience exp;
        exp.session_id = draft.session_id;
        exp.state = draft.state;
        exp.action = draft.action;
        exp.base_reward = clamp_reward(draft.reward);
        exp.reward = clamp_reward(exp.base_reward + feedback_delta(draft.feedback));
        exp.feedback = draft.feedback;
        exp.origin = draft.origin;
        exp.used_vision_fallback = draft.used_vision_fallback;
        exp.timestamp = now_iso8601();

        {
            std::lock_guard lock(mutex_);
            exp.id = next_id_++;
            entries_.push_back(exp);
            ++pending_;
            evict_locked();
            persist(exp);
        }

        spdlog::info("Experience {} recorded: session={}, origin={}, reward={:.2f}",
                     exp.id, exp.session_id, experience_origin_to_string(exp.origin), exp.reward);
        return exp.id;
    }

    Result<FeedbackOutcome> ExperienceLedger::apply_feedback(std::uint64_t id, FeedbackKind kind)
    {
        Experience updated;
        {
            std::lock_guard lock(mutex_);
            auto *exp = find_locked(id);
            if (!exp)
            {
                return std::unexpected(NavisError::not_found("No experience with id " + std::to_string(id)));
            }

            if (exp->consumed)
            {
                spdlog::warn("Feedback {} for experience {} arrived after it was trained on; ignored",
                             feedback_kind_to_string(kind), id);
                return FeedbackOutcome{id, kind, false, exp->reward};
            }

            exp->reward = clamp_reward(exp->reward + feedback_delta(kind));
            if (kind != FeedbackKind::None)
                exp->feedback = kind;
            updated = *exp;
            persist(updated);
        }

        spdlog::info("Feedback {} applied to experience {}: reward={:.2f}",
                     feedback_kind_to_string(kind), id, updated.reward);
        return FeedbackOutcome{id, kind, true, updated.reward};
    }

    std::optional<Experience> ExperienceLedger::get(std::uint64_t id) const
    {
        std::lock_guard lock(mutex_);
        auto it = std::lower_bound(entries_.begin(), entries_.end(), id,
                                   [](const Experience &e, std::uint64_t v) { return e.id < v; });
        if (it == entries_.end() || it->id != id)
            return std::nullopt;
        return *it;
    }

    std::optional<Experience> ExperienceLedger::latest_for_session(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
        {
            if (it->session_id == session_id)
                return *it;
        }
        return std::nullopt;
    }

    std::vector<Experience> ExperienceLedger::take_batch(std::size_t batch_size)
    {
        std::vector<Experience> batch;
        std::lock_guard lock(mutex_);
        if (batch_size == 0 || pending_ < batch_size)
            return batch;

        batch.reserve(batch_size);
        for (auto &exp : entries_)
        {
            if (batch.size() == batch_size)
                break;
            if (exp.consumed)
                continue;
            exp.consumed = true;
            batch.push_back(exp);
        }
        pending_ -= batch.size();
        evict_locked();
        return batch;
    }

    std::size_t ExperienceLedger::size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    std::size_t ExperienceLedger::pending() const
    {
        std::lock_guard lock(mutex_);
        return pending_;
    }

    std::size_t ExperienceLedger::total_appended() const
    {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(next_id_ - 1);
    }

    double ExperienceLedger::recent_accuracy() const
    {
        std::lock_guard lock(mutex_);
        if (entries_.empty() || cfg_.accuracy_window == 0)
            return 0.0;

        std::size_t window = std::min(cfg_.accuracy_window, entries_.size());
        std::size_t positive = std::count_if(entries_.end() - static_cast<std::ptrdiff_t>(window), entries_.end(),
                                             [](const Experience &e) { return e.reward > 0.0; });
        return static_cast<double>(positive) / static_cast<double>(window);
    }

    std::vector<Experience> ExperienceLedger::snapshot() const
    {
        std::lock_guard lock(mutex_);
        return std::vector<Experience>(entries_.begin(), entries_.end());
    }

    Experience *ExperienceLedger::find_locked(std::uint64_t id)
    {
        auto it = std::lower_bound(entries_.begin(), entries_.end(), id,
                                   [](const Experience &e, std::uint64_t v) { return e.id < v; });
        if (it == entries_.end() || it->id != id)
            return nullptr;
        return &*it;
    }

    void ExperienceLedger::evict_locked()
    {
        while (entries_.size() > cfg_.max_entries)
        {
            auto oldest_consumed = std::find_if(entries_.begin(), entries_.end(),
                                                [](const Experience &e) { return e.consumed; });
            if (oldest_consumed == entries_.end())
                return; // everything retained is still pending
            entries_.erase(oldest_consumed);
        }
    }

    void ExperienceLedger::persist(const Experience &experience) const
    {
        if (!store_)
            return;
        if (auto res = store_->put(experience); !res)
        {
            spdlog::error("Failed to persist experience {}: {}", experience.id, res.error().what());
        }
    }

} // namespace navis
