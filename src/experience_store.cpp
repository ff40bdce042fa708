#include "navis/experience_store.hpp"
#include <nlohmann/json.hpp>
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string_view>

namespace navis
{

    namespace
    {
        constexpr std::size_t kIdDigits = 20;

        // The remainder after "<session>:" must be the padded id alone, otherwise
        // the key belongs to a longer session id that shares the prefix.
        bool is_padded_id(std::string_view suffix)
        {
            return suffix.size() == kIdDigits &&
                   std::all_of(suffix.begin(), suffix.end(), [](char c)
                               { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
        }
    } // namespace

    class RocksDbExperienceStore::Impl
    {
    public:
        explicit Impl(const StorageConfig &cfg)
        {
            std::error_code ec;
            auto parent = std::filesystem::path(cfg.rocksdb_path).parent_path();
            if (!parent.empty())
                std::filesystem::create_directories(parent, ec);

            rocksdb::Options options;
            options.create_if_missing = true;
            auto status = rocksdb::DB::Open(options, cfg.rocksdb_path, &db);
            if (!status.ok())
            {
                throw NavisError::storage("RocksDB open failed: " + status.ToString());
            }
            spdlog::info("Experience store opened at {}", cfg.rocksdb_path);
        }

        ~Impl()
        {
            delete db;
        }

        Result<void> put(const Experience &exp)
        {
            auto status = db->Put(rocksdb::WriteOptions(), exp.storage_key(), exp.to_json().dump());
            if (!status.ok())
            {
                return std::unexpected(NavisError::storage("RocksDB Put failed: " + status.ToString()));
            }
            return {};
        }

        Result<std::vector<Experience>> list(const std::string &session_id)
        {
            std::vector<Experience> out;
            const std::string prefix = session_id + ":";

            std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
            for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next())
            {
                std::string_view key(it->key().data(), it->key().size());
                if (!is_padded_id(key.substr(prefix.size())))
                    continue;

                auto parsed = nlohmann::json::parse(it->value().ToString(), nullptr, false);
                if (parsed.is_discarded())
                {
                    spdlog::warn("Skipping unreadable experience record {}", it->key().ToString());
                    continue;
                }
                auto exp = Experience::from_json(parsed);
                if (!exp)
                {
                    spdlog::warn("Skipping experience record {}: {}", it->key().ToString(), exp.error().what());
                    continue;
                }
                out.push_back(std::move(*exp));
            }
            if (!it->status().ok())
            {
                return std::unexpected(NavisError::storage("RocksDB scan failed: " + it->status().ToString()));
            }
            return out;
        }

    private:
        rocksdb::DB *db{nullptr};
    };

    RocksDbExperienceStore::RocksDbExperienceStore(const StorageConfig &cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    RocksDbExperienceStore::~RocksDbExperienceStore() = default;

    Result<void> RocksDbExperienceStore::put(const Experience &experience)
    {
        return impl_->put(experience);
    }

    Result<std::vector<Experience>> RocksDbExperienceStore::list_session(const std::string &session_id)
    {
        return impl_->list(session_id);
    }

} // namespace navis
