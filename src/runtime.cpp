#include "navis/runtime.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <random>

namespace navis
{

    Runtime::Runtime(const NavisConfig &cfg) : cfg_(cfg) {}

    Result<std::unique_ptr<Runtime>> Runtime::create(const NavisConfig &cfg)
    {
        if (auto valid = cfg.validate(); !valid)
            return std::unexpected(valid.error());

        std::unique_ptr<Runtime> rt(new Runtime(cfg));
        const auto &learning = cfg.learning;

        try
        {
            rt->audit_ = std::make_unique<AuditLogger>(cfg.audit);
            rt->scoring_ = std::make_unique<ScoringEngine>(ScoringEngine::Config{cfg.scoring.weights});

            PreferenceModel::Config model_cfg;
            model_cfg.learning_rate = learning.learning_rate;
            model_cfg.l2 = learning.l2;
            model_cfg.exploration_rate = learning.exploration_rate;
            model_cfg.exploration_decay = learning.exploration_decay;
            model_cfg.min_exploration_rate = learning.min_exploration_rate;
            rt->model_ = std::make_unique<PreferenceModel>(model_cfg);

            if (!learning.model_path.empty() && std::filesystem::exists(learning.model_path))
            {
                if (auto loaded = rt->model_->load(learning.model_path); !loaded)
                    return std::unexpected(loaded.error());
            }

            std::uint64_t seed = learning.seed ? *learning.seed : std::random_device{}();
            rt->random_ = std::make_unique<SeededRandom>(seed);

            DecisionAgent::Config agent_cfg;
            agent_cfg.semantic_weight = cfg.decision.semantic_weight;
            agent_cfg.preference_weight = cfg.decision.preference_weight;
            agent_cfg.scoring_weights = cfg.scoring.weights;
            rt->agent_ = std::make_unique<DecisionAgent>(*rt->model_, *rt->random_, agent_cfg);

            if (cfg.storage.enabled)
                rt->store_ = std::make_shared<RocksDbExperienceStore>(cfg.storage);

            rt->ledger_ = std::make_unique<ExperienceLedger>(
                ExperienceLedger::Config{cfg.ledger.max_entries, cfg.ledger.accuracy_window}, rt->store_);

            ActionSelector::Config selector_cfg;
            selector_cfg.confidence_threshold = cfg.decision.confidence_threshold;
            selector_cfg.batch_size = learning.batch_size;
            selector_cfg.vision_fallback_discount = learning.vision_fallback_discount;
            selector_cfg.model_path = learning.model_path;
            selector_cfg.scoring_weights = cfg.scoring.weights;
            rt->selector_ = std::make_unique<ActionSelector>(*rt->agent_, *rt->ledger_, selector_cfg, rt->audit_.get());

            rt->sessions_ = std::make_unique<SessionRegistry>(std::chrono::seconds(cfg.session.ttl_seconds));
        }
        catch (const NavisError &e)
        {
            return std::unexpected(e);
        }

        spdlog::info("Decision core ready (threshold {:.2f}, batch {}, exploration {:.3f}, storage {})",
                     cfg.decision.confidence_threshold, learning.batch_size,
                     rt->model_->exploration_rate(), cfg.storage.enabled ? cfg.storage.rocksdb_path : "off");
        return rt;
    }

} // namespace navis
