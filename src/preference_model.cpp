#include "navis/preference_model.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace navis
{

    namespace
    {
        constexpr int kWeightFileVersion = 1;

        bool valid_sample(const TrainingSample &sample)
        {
            if (!std::isfinite(sample.target) || sample.target < 0.0 || sample.target > 1.0)
                return false;
            for (double v : sample.features.to_array())
            {
                if (!std::isfinite(v))
                    return false;
            }
            return true;
        }
    } // namespace

    PreferenceFeatures PreferenceFeatures::from_candidate(
        const Candidate &candidate,
        const Intent &intent,
        const PageContext &page,
        const ScoringWeights &weights)
    {
        const auto &el = candidate.element;
        double vw = page.viewport_width > 0.0 ? page.viewport_width : PageContext::kDefaultViewportWidth;
        double vh = page.viewport_height > 0.0 ? page.viewport_height : PageContext::kDefaultViewportHeight;

        return PreferenceFeatures{
            weights.combine_without_learned(candidate.scores),
            std::min(1.0, static_cast<double>(el.text.size()) / 100.0),
            clamp_unit(el.bounds.center_x() / vw),
            clamp_unit(el.bounds.center_y() / vh),
            intent.expects(el.tag, el.role) ? 1.0 : 0.0};
    }

    std::array<double, PreferenceFeatures::kFeatureCount> PreferenceFeatures::to_array() const
    {
        return {base_score, text_length, normalized_x, normalized_y, type_match};
    }

    std::vector<double> PreferenceFeatures::to_vector() const
    {
        auto arr = to_array();
        return std::vector<double>(arr.begin(), arr.end());
    }

    PreferenceWeights PreferenceWeights::cold()
    {
        return PreferenceWeights{};
    }

    PreferenceModel::PreferenceModel() : PreferenceModel(Config{}) {}

    PreferenceModel::PreferenceModel(const Config &cfg) : PreferenceModel(cfg, PreferenceWeights::cold()) {}

    PreferenceModel::PreferenceModel(const Config &cfg, const PreferenceWeights &weights)
        : cfg_(cfg),
          weights_(weights),
          exploration_rate_(std::clamp(cfg.exploration_rate, cfg.min_exploration_rate, 1.0))
    {
    }

    double PreferenceModel::sigmoid(double x)
    {
        if (x >= 0.0)
        {
            const double z = std::exp(-x);
            return 1.0 / (1.0 + z);
        }
        const double z = std::exp(x);
        return z / (1.0 + z);
    }

    double PreferenceModel::raw_score(const PreferenceWeights &w, const PreferenceFeatures &f)
    {
        auto arr = f.to_array();
        double linear = w.bias;
        for (std::size_t i = 0; i < arr.size(); ++i)
        {
            linear += arr[i] * w.weights[i];
        }
        return linear;
    }

    double PreferenceModel::predict(const PreferenceFeatures &features) const
    {
        std::shared_lock lock(mutex_);
        double p = sigmoid(raw_score(weights_, features));
        if (!std::isfinite(p))
            return 0.5;
        return clamp_unit(p);
    }

    Result<void> PreferenceModel::update(const std::vector<TrainingSample> &batch)
    {
        if (batch.empty())
        {
            return std::unexpected(NavisError::model_update("Empty training batch"));
        }
        for (std::size_t i = 0; i < batch.size(); ++i)
        {
            if (!valid_sample(batch[i]))
            {
                return std::unexpected(NavisError::model_update(
                    "Malformed training sample at index " + std::to_string(i)));
            }
        }

        std::lock_guard serial(update_mutex_);

        PreferenceWeights candidate;
        {
            std::shared_lock lock(mutex_);
            candidate = weights_;
        }

        const double lr = cfg_.learning_rate;
        const double l2 = cfg_.l2;
        for (const auto &sample : batch)
        {
            auto x = sample.features.to_array();
            const double p = sigmoid(raw_score(candidate, sample.features));
            const double err = p - sample.target;
            for (std::size_t i = 0; i < x.size(); ++i)
            {
                const double grad = err * x[i] + l2 * candidate.weights[i];
                candidate.weights[i] -= lr * grad;
            }
            candidate.bias -= lr * err;
        }

        for (double w : candidate.weights)
        {
            if (!std::isfinite(w))
                return std::unexpected(NavisError::model_update("Update diverged; weights left unchanged"));
        }
        if (!std::isfinite(candidate.bias))
            return std::unexpected(NavisError::model_update("Update diverged; weights left unchanged"));

        {
            std::unique_lock lock(mutex_);
            weights_ = candidate;
            ++update_count_;
        }
        spdlog::debug("Preference model updated with {} samples", batch.size());
        return {};
    }

    double PreferenceModel::exploration_rate() const
    {
        std::shared_lock lock(mutex_);
        return exploration_rate_;
    }

    double PreferenceModel::decay_exploration()
    {
        std::unique_lock lock(mutex_);
        exploration_rate_ = std::max(cfg_.min_exploration_rate, exploration_rate_ * cfg_.exploration_decay);
        return exploration_rate_;
    }

    void PreferenceModel::reset_exploration(double rate)
    {
        std::unique_lock lock(mutex_);
        exploration_rate_ = std::clamp(rate, cfg_.min_exploration_rate, 1.0);
    }

    PreferenceWeights PreferenceModel::weights() const
    {
        std::shared_lock lock(mutex_);
        return weights_;
    }

    std::size_t PreferenceModel::update_count() const
    {
        std::shared_lock lock(mutex_);
        return update_count_;
    }

    bool PreferenceModel::is_cold() const
    {
        std::shared_lock lock(mutex_);
        if (weights_.bias != 0.0)
            return false;
        return std::all_of(weights_.weights.begin(), weights_.weights.end(),
                           [](double w) { return w == 0.0; });
    }

    Result<void> PreferenceModel::save(const std::string &path) const
    {
        nlohmann::json j;
        {
            std::shared_lock lock(mutex_);
            j["version"] = kWeightFileVersion;
            j["updated_at"] = now_iso8601();
            j["bias"] = weights_.bias;
            j["weights"] = weights_.weights;
            j["exploration_rate"] = exploration_rate_;
            j["updates"] = update_count_;
        }

        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent, ec);

        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open())
        {
            return std::unexpected(NavisError::io("Unable to write model file: " + path));
        }
        out << j.dump();
        return {};
    }

    Result<void> PreferenceModel::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(NavisError::io("Unable to open model file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        PreferenceWeights loaded;
        double rate = 0.0;
        std::size_t updates = 0;
        try
        {
            auto j = nlohmann::json::parse(buffer.str());
            auto arr = j.at("weights");
            if (!arr.is_array() || arr.size() != PreferenceFeatures::kFeatureCount)
            {
                return std::unexpected(NavisError::validation(
                    "Model file feature arity does not match (expected " +
                    std::to_string(PreferenceFeatures::kFeatureCount) + ")"));
            }
            for (std::size_t i = 0; i < arr.size(); ++i)
                loaded.weights[i] = arr[i].get<double>();
            loaded.bias = j.value("bias", 0.0);
            rate = j.value("exploration_rate", cfg_.exploration_rate);
            updates = j.value("updates", std::size_t{0});
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(NavisError::parsing(std::string("Invalid model file: ") + e.what()));
        }

        std::lock_guard serial(update_mutex_);
        std::unique_lock lock(mutex_);
        weights_ = loaded;
        exploration_rate_ = std::clamp(rate, cfg_.min_exploration_rate, 1.0);
        update_count_ = updates;
        spdlog::info("Loaded preference model from {} ({} prior updates)", path, updates);
        return {};
    }

} // namespace navis
