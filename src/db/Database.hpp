#pragma once

#include <optional>
#include <string>

namespace signalnet::db
{
    // Key/value store for application settings. Backed by SQLite when built
    // with SIGNALNET_USE_SQLITE, by one flat file per key otherwise.
    class Database
    {
    public:
        explicit Database(std::string file_path);

        bool initialize(std::string *error = nullptr) const;

        bool saveValue(const std::string &key, const std::string &value, std::string *error = nullptr) const;
        // nullopt when the key is absent or on error; error is only set for the latter.
        std::optional<std::string> loadValue(const std::string &key, std::string *error = nullptr) const;
        bool removeValue(const std::string &key, std::string *error = nullptr) const;

        bool saveActiveNetworkConfigJson(const std::string &config_json, std::string *error = nullptr) const;
        std::optional<std::string> loadActiveNetworkConfigJson(std::string *error = nullptr) const;

        static constexpr const char *ACTIVE_NETWORK_CONFIG_KEY = "active_network_config";

    private:
        std::string file_path;
    };

} // namespace signalnet::db
