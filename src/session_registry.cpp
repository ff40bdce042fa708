#include "navis/session_registry.hpp"
#include <sodium.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>

namespace navis
{

    namespace
    {
        constexpr std::size_t kSessionIdBytes = 16;

        // Initialize libsodium on library load
        static struct SodiumInitializer
        {
            SodiumInitializer()
            {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("Failed to initialize libsodium");
                }
            }
        } sodium_initializer;
    } // namespace

    std::string generate_session_id()
    {
        std::array<unsigned char, kSessionIdBytes> bytes{};
        randombytes_buf(bytes.data(), bytes.size());

        std::array<char, kSessionIdBytes * 2 + 1> hex{};
        sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
        return std::string(hex.data());
    }

    nlohmann::json Session::to_json(std::chrono::steady_clock::time_point now) const
    {
        auto remaining = std::chrono::duration_cast<std::chrono::seconds>(expires_at - now);
        return nlohmann::json{
            {"session_id", id},
            {"phase", phase},
            {"created_at", created_at},
            {"expires_in_seconds", std::max<std::int64_t>(0, remaining.count())}};
    }

    SessionRegistry::SessionRegistry() : SessionRegistry(std::chrono::hours(24)) {}

    SessionRegistry::SessionRegistry(std::chrono::seconds default_ttl, NowFn now)
        : default_ttl_(default_ttl), now_(std::move(now))
    {
    }

    Session SessionRegistry::create()
    {
        return create(default_ttl_);
    }

    Session SessionRegistry::create(std::chrono::seconds ttl)
    {
        Session session;
        session.id = generate_session_id();
        session.created_at = now_iso8601();
        auto now = now_();
        session.expires_at = now + ttl;

        std::lock_guard lock(mutex_);
        auto removed = erase_expired(now);
        sessions_[session.id] = session;
        spdlog::debug("Session {} created, ttl {}s, {} expired reclaimed", session.id, ttl.count(), removed);
        return session;
    }

    std::size_t SessionRegistry::erase_expired(Clock::time_point now)
    {
        return std::erase_if(sessions_, [now](const auto &entry)
                             { return entry.second.expires_at <= now; });
    }

    nlohmann::json SessionRegistry::to_json(const Session &session) const
    {
        return session.to_json(now_());
    }

    Result<void> SessionRegistry::set_phase(const std::string &id, const std::string &phase)
    {
        auto now = now_();
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end() || it->second.expires_at <= now)
        {
            return std::unexpected(NavisError::not_found("Unknown or expired session: " + id));
        }
        it->second.phase = phase;
        return {};
    }

    bool SessionRegistry::end(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        return sessions_.erase(id) > 0;
    }

    std::optional<Session> SessionRegistry::get(const std::string &id) const
    {
        auto now = now_();
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end() || it->second.expires_at <= now)
            return std::nullopt;
        return it->second;
    }

    std::size_t SessionRegistry::purge_expired()
    {
        auto now = now_();
        std::lock_guard lock(mutex_);
        auto removed = erase_expired(now);
        if (removed > 0)
            spdlog::info("Purged {} expired sessions", removed);
        return removed;
    }

    std::size_t SessionRegistry::size() const
    {
        auto now = now_();
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(sessions_.begin(), sessions_.end(), [now](const auto &entry)
                                                      { return entry.second.expires_at > now; }));
    }

} // namespace navis
