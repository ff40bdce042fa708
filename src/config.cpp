#include "navis/config.hpp"
#include <toml++/toml.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace navis
{
    namespace
    {
        void read_double(const toml::table &section, const char *key, double &out)
        {
            if (auto v = section[key].value<double>())
                out = *v;
        }

        void read_size(const toml::table &section, const char *key, std::size_t &out)
        {
            if (auto v = section[key].value<int64_t>())
            {
                if (*v < 0)
                    throw NavisError::config(std::string(key) + " must not be negative");
                out = static_cast<std::size_t>(*v);
            }
        }

        std::uint16_t checked_port(int64_t port)
        {
            if (port < 1 || port > std::numeric_limits<std::uint16_t>::max())
                throw std::out_of_range("port " + std::to_string(port) + " is outside 1-65535");
            return static_cast<std::uint16_t>(port);
        }

        // Non-negative integer, otherwise std::out_of_range
        std::size_t env_count(const char *v)
        {
            auto value = std::stoll(v);
            if (value < 0)
                throw std::out_of_range(std::string("negative count ") + v);
            return static_cast<std::size_t>(value);
        }

        NavisConfig parse_toml(const toml::table &tbl, NavisConfig cfg)
        {
            if (auto scoring = tbl["scoring"].as_table())
            {
                auto &w = cfg.scoring.weights;
                read_double(*scoring, "text_match", w.text_match);
                read_double(*scoring, "semantic_relevance", w.semantic_relevance);
                read_double(*scoring, "contextual_position", w.contextual_position);
                read_double(*scoring, "visual_prominence", w.visual_prominence);
                read_double(*scoring, "learned_preference", w.learned_preference);
            }

            if (auto decision = tbl["decision"].as_table())
            {
                read_double(*decision, "confidence_threshold", cfg.decision.confidence_threshold);
                read_double(*decision, "semantic_weight", cfg.decision.semantic_weight);
                read_double(*decision, "preference_weight", cfg.decision.preference_weight);
            }

            if (auto learning = tbl["learning"].as_table())
            {
                auto &l = cfg.learning;
                read_double(*learning, "learning_rate", l.learning_rate);
                read_double(*learning, "l2", l.l2);
                read_size(*learning, "batch_size", l.batch_size);
                read_double(*learning, "exploration_rate", l.exploration_rate);
                read_double(*learning, "exploration_decay", l.exploration_decay);
                read_double(*learning, "min_exploration_rate", l.min_exploration_rate);
                read_double(*learning, "vision_fallback_discount", l.vision_fallback_discount);
                if (auto path = (*learning)["model_path"].value<std::string>())
                    l.model_path = *path;
                if (auto seed = (*learning)["seed"].value<int64_t>())
                    l.seed = static_cast<std::uint64_t>(*seed);
            }

            if (auto ledger = tbl["ledger"].as_table())
            {
                read_size(*ledger, "max_entries", cfg.ledger.max_entries);
                read_size(*ledger, "accuracy_window", cfg.ledger.accuracy_window);
            }

            if (auto session = tbl["session"].as_table())
            {
                if (auto ttl = (*session)["ttl_seconds"].value<int64_t>())
                    cfg.session.ttl_seconds = *ttl;
            }

            if (auto storage = tbl["storage"].as_table())
            {
                if (auto enabled = (*storage)["enabled"].value<bool>())
                    cfg.storage.enabled = *enabled;
                if (auto path = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *path;
            }

            if (auto server = tbl["server"].as_table())
            {
                if (auto address = (*server)["address"].value<std::string>())
                    cfg.server.address = *address;
                if (auto port = (*server)["port"].value<int64_t>())
                {
                    try
                    {
                        cfg.server.port = checked_port(*port);
                    }
                    catch (const std::out_of_range &e)
                    {
                        throw NavisError::config(std::string("server.") + e.what());
                    }
                }
                read_size(*server, "threads", cfg.server.threads);
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto file = (*logging)["file"].value<std::string>())
                    cfg.logging.file = *file;
            }

            if (auto audit = tbl["audit"].as_table())
            {
                if (auto enabled = (*audit)["enabled"].value<bool>())
                    cfg.audit.enabled = *enabled;
                if (auto path = (*audit)["log_path"].value<std::string>())
                    cfg.audit.log_path = *path;
            }

            return cfg;
        }

        bool in_unit(double v)
        {
            return std::isfinite(v) && v >= 0.0 && v <= 1.0;
        }

        bool env_flag(const char *value)
        {
            std::string v(value);
            return v != "0" && v != "false" && v != "off";
        }

    } // namespace

    Result<void> NavisConfig::validate() const
    {
        if (auto weights = scoring.weights.validate(); !weights)
            return weights;

        if (!in_unit(decision.confidence_threshold))
            return std::unexpected(NavisError::config("decision.confidence_threshold must be within [0,1]"));
        if (!in_unit(decision.semantic_weight) || !in_unit(decision.preference_weight) ||
            std::abs(decision.semantic_weight + decision.preference_weight - 1.0) > 1e-6)
            return std::unexpected(NavisError::config("decision.semantic_weight and preference_weight must sum to 1.0"));

        if (!std::isfinite(learning.learning_rate) || learning.learning_rate <= 0.0)
            return std::unexpected(NavisError::config("learning.learning_rate must be positive"));
        if (!std::isfinite(learning.l2) || learning.l2 < 0.0)
            return std::unexpected(NavisError::config("learning.l2 must be non-negative"));
        if (learning.batch_size == 0)
            return std::unexpected(NavisError::config("learning.batch_size must be at least 1"));
        if (!in_unit(learning.exploration_rate) || !in_unit(learning.min_exploration_rate))
            return std::unexpected(NavisError::config("learning exploration rates must be within [0,1]"));
        if (learning.min_exploration_rate > learning.exploration_rate)
            return std::unexpected(NavisError::config("learning.min_exploration_rate exceeds exploration_rate"));
        if (!in_unit(learning.exploration_decay) || learning.exploration_decay == 0.0)
            return std::unexpected(NavisError::config("learning.exploration_decay must be within (0,1]"));
        if (!in_unit(learning.vision_fallback_discount))
            return std::unexpected(NavisError::config("learning.vision_fallback_discount must be within [0,1]"));

        if (ledger.max_entries < learning.batch_size)
            return std::unexpected(NavisError::config("ledger.max_entries must hold at least one batch"));
        if (ledger.accuracy_window == 0)
            return std::unexpected(NavisError::config("ledger.accuracy_window must be at least 1"));

        if (session.ttl_seconds <= 0)
            return std::unexpected(NavisError::config("session.ttl_seconds must be positive"));

        if (storage.enabled && storage.rocksdb_path.empty())
            return std::unexpected(NavisError::config("storage.rocksdb_path is required when storage is enabled"));

        if (server.threads == 0)
            return std::unexpected(NavisError::config("server.threads must be at least 1"));

        return {};
    }

    Result<NavisConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(NavisError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<NavisConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        NavisConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            cfg = parse_toml(tbl, cfg);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(NavisError::config(std::string("Failed to parse TOML: ") + e.what()));
        }
        catch (const NavisError &e)
        {
            return std::unexpected(e);
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = cfg.validate(); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<NavisConfig> ConfigLoader::defaults()
    {
        return from_string("");
    }

    Result<void> ConfigLoader::apply_env_overrides(NavisConfig &cfg)
    {
        try
        {
            if (const char *v = std::getenv("NAVIS_CONFIDENCE_THRESHOLD"))
                cfg.decision.confidence_threshold = std::stod(v);
            if (const char *v = std::getenv("NAVIS_LEARNING_RATE"))
                cfg.learning.learning_rate = std::stod(v);
            if (const char *v = std::getenv("NAVIS_BATCH_SIZE"))
                cfg.learning.batch_size = env_count(v);
            if (const char *v = std::getenv("NAVIS_EXPLORATION_RATE"))
                cfg.learning.exploration_rate = std::stod(v);
            if (const char *v = std::getenv("NAVIS_MODEL_PATH"))
                cfg.learning.model_path = v;
            if (const char *v = std::getenv("NAVIS_SEED"))
                cfg.learning.seed = static_cast<std::uint64_t>(std::stoull(v));
            if (const char *v = std::getenv("NAVIS_SESSION_TTL"))
                cfg.session.ttl_seconds = std::stoll(v);
            if (const char *v = std::getenv("NAVIS_STORAGE_ENABLED"))
                cfg.storage.enabled = env_flag(v);
            if (const char *v = std::getenv("NAVIS_ROCKSDB_PATH"))
                cfg.storage.rocksdb_path = v;
            if (const char *v = std::getenv("NAVIS_PORT"))
                cfg.server.port = checked_port(std::stoll(v));
            if (const char *v = std::getenv("NAVIS_THREADS"))
                cfg.server.threads = env_count(v);
            if (const char *v = std::getenv("NAVIS_LOG_LEVEL"))
                cfg.logging.level = v;
            if (const char *v = std::getenv("NAVIS_LOG_FILE"))
                cfg.logging.file = v;
            if (const char *v = std::getenv("NAVIS_AUDIT_ENABLED"))
                cfg.audit.enabled = env_flag(v);
            if (const char *v = std::getenv("NAVIS_AUDIT_LOG"))
                cfg.audit.log_path = v;
        }
        catch (const std::logic_error &e)
        {
            return std::unexpected(NavisError::config(std::string("Invalid NAVIS_* environment value: ") + e.what()));
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const NavisConfig &cfg)
    {
        nlohmann::json j;
        j["scoring"] = cfg.scoring.weights.to_json();
        j["decision"] = {
            {"confidence_threshold", cfg.decision.confidence_threshold},
            {"semantic_weight", cfg.decision.semantic_weight},
            {"preference_weight", cfg.decision.preference_weight}};
        j["learning"] = {
            {"learning_rate", cfg.learning.learning_rate},
            {"l2", cfg.learning.l2},
            {"batch_size", cfg.learning.batch_size},
            {"exploration_rate", cfg.learning.exploration_rate},
            {"exploration_decay", cfg.learning.exploration_decay},
            {"min_exploration_rate", cfg.learning.min_exploration_rate},
            {"vision_fallback_discount", cfg.learning.vision_fallback_discount},
            {"model_path", cfg.learning.model_path}};
        if (cfg.learning.seed)
            j["learning"]["seed"] = *cfg.learning.seed;
        j["ledger"] = {
            {"max_entries", cfg.ledger.max_entries},
            {"accuracy_window", cfg.ledger.accuracy_window}};
        j["session"] = {{"ttl_seconds", cfg.session.ttl_seconds}};
        j["storage"] = {
            {"enabled", cfg.storage.enabled},
            {"rocksdb_path", cfg.storage.rocksdb_path}};
        j["server"] = {
            {"address", cfg.server.address},
            {"port", cfg.server.port},
            {"threads", cfg.server.threads}};
        j["logging"] = {{"level", cfg.logging.level}, {"file", cfg.logging.file}};
        j["audit"] = {{"enabled", cfg.audit.enabled}, {"log_path", cfg.audit.log_path}};
        return j;
    }

} // namespace navis
