#pragma once

#include "candidate.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace navis
{

    struct ScoringConfig
    {
        ScoringWeights weights{};
    };

    struct DecisionConfig
    {
        double confidence_threshold{0.7};
        double semantic_weight{0.7};
        double preference_weight{0.3};
    };

    struct LearningConfig
    {
        double learning_rate{0.05};
        double l2{0.0};
        std::size_t batch_size{10};
        double exploration_rate{0.1};
        double exploration_decay{0.995};
        double min_exploration_rate{0.01};
        double vision_fallback_discount{0.8};
        std::string model_path;             // empty: weights are not persisted
        std::optional<std::uint64_t> seed;  // unset: seeded from std::random_device
    };

    struct LedgerConfig
    {
        std::size_t max_entries{1000};
        std::size_t accuracy_window{50};
    };

    struct SessionConfig
    {
        std::int64_t ttl_seconds{24 * 60 * 60};
    };

    struct StorageConfig
    {
        bool enabled{false};
        std::string rocksdb_path{"./data/experiences"};
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};
        std::size_t threads{2};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        std::string file; // empty: console only
    };

    struct AuditConfig
    {
        bool enabled{true};
        std::string log_path{"./logs/audit.log"};
    };

    struct NavisConfig
    {
        ScoringConfig scoring{};
        DecisionConfig decision{};
        LearningConfig learning{};
        LedgerConfig ledger{};
        SessionConfig session{};
        StorageConfig storage{};
        ServerConfig server{};
        LoggingConfig logging{};
        AuditConfig audit{};

        /** Range and consistency checks; failures are ConfigError */
        Result<void> validate() const;
    };

    /**
     * ConfigLoader loads TOML configs with NAVIS_* environment overrides.
     * Environment values take precedence over the file; the merged result is
     * validated before it is returned.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. */
        static Result<NavisConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<NavisConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides, no file. */
        static Result<NavisConfig> defaults();

        /** Serialize config to JSON for inspection. */
        static nlohmann::json to_json(const NavisConfig &cfg);

    private:
        static Result<void> apply_env_overrides(NavisConfig &cfg);
    };

} // namespace navis
