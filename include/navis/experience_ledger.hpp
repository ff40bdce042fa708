#pragma once

#include "experience.hpp"
#include "experience_store.hpp"
#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace navis
{

    struct FeedbackOutcome
    {
        std::uint64_t id{0};
        FeedbackKind kind{FeedbackKind::None};
        bool applied{false}; // false when the experience was already trained on
        double reward{0.0};
    };

    /**
     * Append-only record of experiences. Sole owner of every Experience.
     *
     * All operations are atomic per entry. Only feedback adjustment touches an
     * existing entry, and only until the entry has been consumed by training.
     * Retention evicts the oldest consumed entries once max_entries is exceeded;
     * pending entries are never evicted.
     */
    class ExperienceLedger
    {
    public:
        struct Config
        {
            std::size_t max_entries{1000};
            std::size_t accuracy_window{50};
        };

        ExperienceLedger();
        explicit ExperienceLedger(const Config &cfg, std::shared_ptr<ExperienceStore> store = nullptr);

        /** Append a new experience; reward is clamped and any feedback delta applied. Returns its id. */
        std::uint64_t append(const ExperienceDraft &draft);

        /**
         * Adjust an experience's reward by the delta for kind, clamped to [-1,1].
         * Unknown id is NotFound. A consumed experience is left untouched and
         * reported with applied == false.
         */
        Result<FeedbackOutcome> apply_feedback(std::uint64_t id, FeedbackKind kind);

        std::optional<Experience> get(std::uint64_t id) const;
        std::optional<Experience> latest_for_session(const std::string &session_id) const;

        /** Oldest batch_size pending entries, marked consumed; empty when fewer are pending */
        std::vector<Experience> take_batch(std::size_t batch_size);

        std::size_t size() const;
        std::size_t pending() const;
        std::size_t total_appended() const;

        /** Fraction of the last accuracy_window entries with reward > 0; 0 when empty */
        double recent_accuracy() const;

        std::vector<Experience> snapshot() const;

    private:
        Experience *find_locked(std::uint64_t id);
        void evict_locked();
        // Called with mutex_ held so store writes land in ledger order
        void persist(const Experience &experience) const;

        Config cfg_;
        std::shared_ptr<ExperienceStore> store_;
        mutable std::mutex mutex_;
        std::deque<Experience> entries_;
        std::uint64_t next_id_{1};
        std::size_t pending_{0};
    };

} // namespace navis
