#pragma once

#include "config.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace spdlog
{
    class logger;
}

namespace navis
{
    struct AuditEvent
    {
        std::string ts;
        std::string session_id;
        std::string action;
        std::string result;
        nlohmann::json details;

        static AuditEvent now(const std::string &session_id,
                              const std::string &action,
                              const std::string &result,
                              nlohmann::json details = nlohmann::json::object());

        nlohmann::json to_json() const;
    };

    /**
     * Structured decision/reward log. One JSON object per line, written to
     * the audit log file, or to the default logger when no path is set.
     */
    class AuditLogger
    {
    public:
        AuditLogger();
        explicit AuditLogger(const AuditConfig &cfg);

        void log(const AuditEvent &event);

        bool enabled() const { return enabled_; }

    private:
        bool enabled_{false};
        std::shared_ptr<spdlog::logger> sink_;
    };

} // namespace navis
