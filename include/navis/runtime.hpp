#pragma once

#include "action_selector.hpp"
#include "audit.hpp"
#include "config.hpp"
#include "decision_agent.hpp"
#include "experience_ledger.hpp"
#include "experience_store.hpp"
#include "preference_model.hpp"
#include "scoring_engine.hpp"
#include "session_registry.hpp"
#include "types.hpp"
#include <memory>

namespace navis
{

    /**
     * Owns one fully wired decision core built from a NavisConfig. Members are
     * declared in dependency order; everything else holds references into it.
     */
    class Runtime
    {
    public:
        /** Build components, open storage and load saved weights when present */
        static Result<std::unique_ptr<Runtime>> create(const NavisConfig &cfg);

        Runtime(const Runtime &) = delete;
        Runtime &operator=(const Runtime &) = delete;

        const NavisConfig &config() const { return cfg_; }
        const ScoringEngine &scoring() const { return *scoring_; }
        PreferenceModel &model() { return *model_; }
        ExperienceLedger &ledger() { return *ledger_; }
        ActionSelector &selector() { return *selector_; }
        SessionRegistry &sessions() { return *sessions_; }
        AuditLogger &audit() { return *audit_; }

    private:
        explicit Runtime(const NavisConfig &cfg);

        NavisConfig cfg_;
        std::unique_ptr<AuditLogger> audit_;
        std::unique_ptr<ScoringEngine> scoring_;
        std::unique_ptr<PreferenceModel> model_;
        std::unique_ptr<RandomSource> random_;
        std::unique_ptr<DecisionAgent> agent_;
        std::shared_ptr<ExperienceStore> store_;
        std::unique_ptr<ExperienceLedger> ledger_;
        std::unique_ptr<ActionSelector> selector_;
        std::unique_ptr<SessionRegistry> sessions_;
    };

} // namespace navis
