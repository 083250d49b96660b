#include "Database.hpp"

#ifdef SIGNALNET_USE_SQLITE
#include <sqlite3.h>
#include <memory>
#else
#include <cstdio>
#include <fstream>
#include <iterator>
#endif

#include <utility>

namespace signalnet::db
{
#ifdef SIGNALNET_USE_SQLITE
    namespace
    {
        struct ConnectionCloser
        {
            void operator()(sqlite3 *handle) const { sqlite3_close(handle); }
        };
        struct StatementFinalizer
        {
            void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
        };

        using Connection = std::unique_ptr<sqlite3, ConnectionCloser>;
        using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

        void setError(std::string *error, const std::string &message)
        {
            if (error)
            {
                *error = message;
            }
        }

        Connection openConnection(const std::string &file_path, std::string *error)
        {
            sqlite3 *raw = nullptr;
            const int rc = sqlite3_open(file_path.c_str(), &raw);
            Connection handle(raw);
            if (rc != SQLITE_OK)
            {
                setError(error, raw ? sqlite3_errmsg(raw) : "failed to open database");
                return nullptr;
            }
            return handle;
        }

        Statement prepare(sqlite3 *handle, const char *sql, std::string *error)
        {
            sqlite3_stmt *raw = nullptr;
            if (sqlite3_prepare_v2(handle, sql, -1, &raw, nullptr) != SQLITE_OK)
            {
                setError(error, sqlite3_errmsg(handle));
                sqlite3_finalize(raw);
                return nullptr;
            }
            return Statement(raw);
        }

        bool bindKey(sqlite3 *handle, sqlite3_stmt *stmt, int index, const std::string &text, std::string *error)
        {
            if (sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT) != SQLITE_OK)
            {
                setError(error, sqlite3_errmsg(handle));
                return false;
            }
            return true;
        }
    }
#else
    namespace
    {
        std::string fallbackPath(const std::string &file_path, const std::string &key)
        {
            return file_path + "." + key;
        }
    }
#endif

    Database::Database(std::string file_path)
        : file_path(std::move(file_path))
    {
    }

    bool Database::initialize(std::string *error) const
    {
#ifdef SIGNALNET_USE_SQLITE
        Connection handle = openConnection(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *create_sql =
            "CREATE TABLE IF NOT EXISTS app_config ("
            "key TEXT PRIMARY KEY,"
            "value TEXT NOT NULL"
            ");";

        char *errmsg = nullptr;
        if (sqlite3_exec(handle.get(), create_sql, nullptr, nullptr, &errmsg) != SQLITE_OK)
        {
            setError(error, errmsg ? errmsg : "failed to initialize schema");
            sqlite3_free(errmsg);
            return false;
        }
        return true;
#else
        std::ofstream out(file_path, std::ios::app);
        if (!out.good())
        {
            if (error)
            {
                *error = "failed to open fallback storage file";
            }
            return false;
        }
        return true;
#endif
    }

    bool Database::saveValue(const std::string &key, const std::string &value, std::string *error) const
    {
#ifdef SIGNALNET_USE_SQLITE
        Connection handle = openConnection(file_path, error);
        if (!handle)
        {
            return false;
        }

        Statement stmt = prepare(handle.get(),
                                 "INSERT INTO app_config(key, value) VALUES(?, ?) "
                                 "ON CONFLICT(key) DO UPDATE SET value = excluded.value;",
                                 error);
        if (!stmt || !bindKey(handle.get(), stmt.get(), 1, key, error) ||
            !bindKey(handle.get(), stmt.get(), 2, value, error))
        {
            return false;
        }

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            setError(error, sqlite3_errmsg(handle.get()));
            return false;
        }
        return true;
#else
        std::ofstream out(fallbackPath(file_path, key), std::ios::trunc);
        if (!out.good())
        {
            if (error)
            {
                *error = "failed to write fallback storage file";
            }
            return false;
        }
        out << value;
        return out.good();
#endif
    }

    std::optional<std::string> Database::loadValue(const std::string &key, std::string *error) const
    {
#ifdef SIGNALNET_USE_SQLITE
        Connection handle = openConnection(file_path, error);
        if (!handle)
        {
            return std::nullopt;
        }

        Statement stmt = prepare(handle.get(), "SELECT value FROM app_config WHERE key = ? LIMIT 1;", error);
        if (!stmt || !bindKey(handle.get(), stmt.get(), 1, key, error))
        {
            return std::nullopt;
        }

        const int step_rc = sqlite3_step(stmt.get());
        if (step_rc == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(stmt.get(), 0);
            return std::string(text ? reinterpret_cast<const char *>(text) : "");
        }
        if (step_rc != SQLITE_DONE)
        {
            setError(error, sqlite3_errmsg(handle.get()));
        }
        return std::nullopt;
#else
        (void)error;
        std::ifstream in(fallbackPath(file_path, key));
        if (!in.good())
        {
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (content.empty())
        {
            return std::nullopt;
        }
        return content;
#endif
    }

    bool Database::removeValue(const std::string &key, std::string *error) const
    {
#ifdef SIGNALNET_USE_SQLITE
        Connection handle = openConnection(file_path, error);
        if (!handle)
        {
            return false;
        }

        Statement stmt = prepare(handle.get(), "DELETE FROM app_config WHERE key = ?;", error);
        if (!stmt || !bindKey(handle.get(), stmt.get(), 1, key, error))
        {
            return false;
        }
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            setError(error, sqlite3_errmsg(handle.get()));
            return false;
        }
        return true;
#else
        // A missing file already means "no value"
        (void)error;
        std::remove(fallbackPath(file_path, key).c_str());
        return true;
#endif
    }

    bool Database::saveActiveNetworkConfigJson(const std::string &config_json, std::string *error) const
    {
        return saveValue(ACTIVE_NETWORK_CONFIG_KEY, config_json, error);
    }

    std::optional<std::string> Database::loadActiveNetworkConfigJson(std::string *error) const
    {
        return loadValue(ACTIVE_NETWORK_CONFIG_KEY, error);
    }
} // namespace signalnet::db
