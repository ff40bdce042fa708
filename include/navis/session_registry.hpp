#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace navis
{

    /** 128-bit random session id as 32 lowercase hex characters */
    std::string generate_session_id();

    struct Session
    {
        std::string id;
        std::string phase{"idle"};
        std::string created_at;
        std::chrono::steady_clock::time_point expires_at{};

        nlohmann::json to_json(std::chrono::steady_clock::time_point now) const;
    };

    /**
     * Thread-safe registry of goal-resolution sessions keyed by id.
     * Expired sessions are invisible to lookups. create() reclaims them, as
     * does purge_expired().
     * Defaults: 24h TTL.
     */
    class SessionRegistry
    {
    public:
        using Clock = std::chrono::steady_clock;
        using NowFn = std::function<Clock::time_point()>;

        SessionRegistry();
        explicit SessionRegistry(std::chrono::seconds default_ttl, NowFn now = Clock::now);

        /** Also drops every expired session */
        Session create();
        Session create(std::chrono::seconds ttl);

        /** NotFound when the session is unknown or expired */
        Result<void> set_phase(const std::string &id, const std::string &phase);

        /** Returns false when there was no such session */
        bool end(const std::string &id);

        std::optional<Session> get(const std::string &id) const;

        /** Remove expired sessions; returns how many were removed */
        std::size_t purge_expired();

        /** Live (unexpired) sessions */
        std::size_t size() const;

        /** Session json with expiry measured on this registry's clock */
        nlohmann::json to_json(const Session &session) const;

        std::chrono::seconds default_ttl() const { return default_ttl_; }

    private:
        std::size_t erase_expired(Clock::time_point now);

        std::chrono::seconds default_ttl_;
        NowFn now_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Session> sessions_;
    };

} // namespace navis
