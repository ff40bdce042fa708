#include "navis/audit.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace navis
{

    AuditEvent AuditEvent::now(const std::string &session_id,
                               const std::string &action,
                               const std::string &result,
                               nlohmann::json details)
    {
        return AuditEvent{now_iso8601(), session_id, action, result, std::move(details)};
    }

    nlohmann::json AuditEvent::to_json() const
    {
        return nlohmann::json{{"ts", ts},
                              {"session_id", session_id},
                              {"action", action},
                              {"result", result},
                              {"details", details}};
    }

    AuditLogger::AuditLogger() = default;

    AuditLogger::AuditLogger(const AuditConfig &cfg) : enabled_(cfg.enabled)
    {
        if (!enabled_ || cfg.log_path.empty())
            return;

        try
        {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.log_path);
            sink_ = std::make_shared<spdlog::logger>("audit", file_sink);
            sink_->set_pattern("%v");
            sink_->flush_on(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &e)
        {
            spdlog::warn("Audit log {} unavailable, using default logger: {}", cfg.log_path, e.what());
            sink_.reset();
        }
    }

    void AuditLogger::log(const AuditEvent &event)
    {
        if (!enabled_)
            return;

        auto line = event.to_json().dump();
        if (sink_)
            sink_->info(line);
        else
            spdlog::info(line);
    }

} // namespace navis
