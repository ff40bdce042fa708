#pragma once

#include "candidate.hpp"
#include "intent.hpp"
#include "types.hpp"
#include <array>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace navis
{

    /**
     * Fixed-arity feature vector for the preference model. Changing the field
     * set changes kFeatureCount and invalidates saved weight files.
     *
     *   base_score    total score without the learned term, renormalised to [0,1]
     *   text_length   min(1, len(text) / 100)
     *   normalized_x  element centre x / viewport width, clamped
     *   normalized_y  element centre y / viewport height, clamped
     *   type_match    1 when tag or role is an expected element type
     */
    struct PreferenceFeatures
    {
        static constexpr std::size_t kFeatureCount = 5;

        double base_score{0.0};
        double text_length{0.0};
        double normalized_x{0.0};
        double normalized_y{0.0};
        double type_match{0.0};

        static PreferenceFeatures from_candidate(
            const Candidate &candidate,
            const Intent &intent,
            const PageContext &page,
            const ScoringWeights &weights);

        std::array<double, kFeatureCount> to_array() const;
        std::vector<double> to_vector() const;
    };

    struct PreferenceWeights
    {
        double bias{0.0};
        std::array<double, PreferenceFeatures::kFeatureCount> weights{};

        /** Cold model: all zeros, so every prediction is exactly 0.5 */
        static PreferenceWeights cold();
    };

    struct TrainingSample
    {
        PreferenceFeatures features;
        double target{0.5}; // in [0,1]
    };

    /**
     * Online logistic preference model plus the agent's exploration rate.
     *
     * predict() reads a consistent snapshot under a shared lock. update() is
     * serialised, trains on a private copy and swaps it in under an exclusive
     * lock, so a rejected batch never touches the live weights.
     */
    class PreferenceModel
    {
    public:
        struct Config
        {
            double learning_rate{0.05};
            double l2{0.0};
            double exploration_rate{0.1};
            double exploration_decay{0.995};
            double min_exploration_rate{0.01};
        };

        PreferenceModel();
        explicit PreferenceModel(const Config &cfg);
        PreferenceModel(const Config &cfg, const PreferenceWeights &weights);

        PreferenceModel(const PreferenceModel &) = delete;
        PreferenceModel &operator=(const PreferenceModel &) = delete;

        /** Learned preference in [0,1] */
        double predict(const PreferenceFeatures &features) const;

        /**
         * One SGD step per sample, in order. All-or-nothing: a malformed sample
         * rejects the whole batch with ModelUpdateFailure.
         */
        Result<void> update(const std::vector<TrainingSample> &batch);

        double exploration_rate() const;

        /** rate = max(floor, rate * decay); returns the new rate */
        double decay_exploration();

        /** The only way to raise the exploration rate */
        void reset_exploration(double rate);

        PreferenceWeights weights() const;
        std::size_t update_count() const;
        bool is_cold() const;
        const Config &config() const { return cfg_; }

        Result<void> save(const std::string &path) const;
        Result<void> load(const std::string &path);

    private:
        static double sigmoid(double x);
        static double raw_score(const PreferenceWeights &w, const PreferenceFeatures &f);

        Config cfg_;
        mutable std::shared_mutex mutex_;
        std::mutex update_mutex_;
        PreferenceWeights weights_;
        double exploration_rate_;
        std::size_t update_count_{0};
    };

} // namespace navis
