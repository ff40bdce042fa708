#pragma once

#include "config.hpp"
#include "experience.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace navis
{

    /**
     * Abstract interface for durable experience storage. Records outlive
     * sessions so that they can be replayed for offline retraining.
     */
    class ExperienceStore
    {
    public:
        virtual ~ExperienceStore() = default;

        /**
         * Insert or replace an experience under its storage key.
         * @param experience record to persist
         */
        virtual Result<void> put(const Experience &experience) = 0;

        /**
         * All experiences of one session in append order.
         * @param session_id correlation id used as the key prefix
         */
        virtual Result<std::vector<Experience>> list_session(const std::string &session_id) = 0;
    };

    /**
     * RocksDB-backed ExperienceStore. Keys are "<session_id>:<zero-padded id>"
     * so that a prefix scan returns a session in append order.
     */
    class RocksDbExperienceStore : public ExperienceStore
    {
    public:
        /** Throws NavisError (StorageError) when the database cannot be opened */
        explicit RocksDbExperienceStore(const StorageConfig &cfg);
        ~RocksDbExperienceStore() override;

        Result<void> put(const Experience &experience) override;
        Result<std::vector<Experience>> list_session(const std::string &session_id) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace navis
