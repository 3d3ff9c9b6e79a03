#include "sqlite.hpp"

namespace store::sqlite
{
    constexpr const char *COLUMN_TYPE_NAMES[]{"INTEGER", "TEXT", "REAL"};
    constexpr const char *PRAGMA_SYNCHRONOUS_FULL = "PRAGMA synchronous=FULL";
    constexpr const char *SQL_BEGIN_IMMEDIATE = "BEGIN IMMEDIATE TRANSACTION";
    constexpr const char *SQL_COMMIT = "COMMIT TRANSACTION";
    constexpr const char *SQL_ROLLBACK = "ROLLBACK TRANSACTION";

    /**
     * Opens a connection with extended result codes and the given busy timeout.
     * Writable connections create the file if missing and sync fully on commit.
     * @return 0 on success. -1 on failure, with *db left NULL.
     */
    int open_db(std::string_view db_name, sqlite3 **db, const uint64_t timeout_ms, const bool writable)
    {
        const int flags = writable ? (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE) : SQLITE_OPEN_READONLY;
        const int res = sqlite3_open_v2(db_name.data(), db, flags, NULL);
        if (res != SQLITE_OK)
        {
            LOG_ERROR << "Could not open " << db_name << ": " << (*db ? sqlite3_errmsg(*db) : sqlite3_errstr(res));
            sqlite3_close(*db);
            *db = NULL;
            return -1;
        }

        sqlite3_extended_result_codes(*db, 1);

        const int busy_ms = static_cast<int>(std::min<uint64_t>(timeout_ms, INT32_MAX));
        if (sqlite3_busy_timeout(*db, busy_ms) != SQLITE_OK)
        {
            LOG_ERROR << "Could not set busy timeout on " << db_name;
            close_db(db);
            return -1;
        }

        if (writable && exec_sql(*db, PRAGMA_SYNCHRONOUS_FULL) == -1)
        {
            close_db(db);
            return -1;
        }

        return 0;
    }

    // Runs one or more statements that return no rows.
    int exec_sql(sqlite3 *db, std::string_view sql)
    {
        char *err = NULL;
        if (sqlite3_exec(db, sql.data(), NULL, NULL, &err) != SQLITE_OK)
        {
            LOG_ERROR << "sqlite exec failed: " << (err ? err : sqlite3_errmsg(db)) << " [" << sql << "]";
            sqlite3_free(err);
            return -1;
        }
        return 0;
    }

    /**
     * Takes the database write lock up front. Other writers wait on the busy timeout
     * here instead of failing later at commit.
     */
    int begin_transaction(sqlite3 *db)
    {
        return exec_sql(db, SQL_BEGIN_IMMEDIATE);
    }

    int commit_transaction(sqlite3 *db)
    {
        return exec_sql(db, SQL_COMMIT);
    }

    // No-op when no transaction is open.
    int rollback_transaction(sqlite3 *db)
    {
        return sqlite3_get_autocommit(db) ? 0 : exec_sql(db, SQL_ROLLBACK);
    }

    int create_table(sqlite3 *db, std::string_view table_name, const std::vector<table_column_info> &column_info)
    {
        std::string sql = "CREATE TABLE IF NOT EXISTS " + std::string(table_name) + " (";
        bool first = true;
        for (const table_column_info &col : column_info)
        {
            if (!first)
                sql += ", ";
            first = false;

            sql += col.name + " " + COLUMN_TYPE_NAMES[col.column_type];
            if (col.is_key)
                sql += " PRIMARY KEY";
            if (!col.is_null)
                sql += " NOT NULL";
        }
        sql += ")";

        if (exec_sql(db, sql) == -1)
        {
            LOG_ERROR << "Failed to create table " << table_name;
            return -1;
        }
        return 0;
    }

    /**
     * Index name is derived as idx_<table>_<col1>_<col2>.
     */
    int create_index(sqlite3 *db, std::string_view table_name, std::string_view column_names, const bool is_unique)
    {
        std::string index_name = "idx_" + std::string(table_name) + "_" + std::string(column_names);
        std::replace(index_name.begin(), index_name.end(), ',', '_');

        const std::string sql = std::string(is_unique ? "CREATE UNIQUE INDEX" : "CREATE INDEX") +
                                " IF NOT EXISTS " + index_name + " ON " + std::string(table_name) +
                                "(" + std::string(column_names) + ")";

        if (exec_sql(db, sql) == -1)
        {
            LOG_ERROR << "Failed to create index " << index_name;
            return -1;
        }
        return 0;
    }

    /**
     * Creates a BEFORE trigger that aborts the statement with the given message.
     * @param event "DELETE", "UPDATE", or "UPDATE OF col1,col2".
     * @param when_condition Optional WHEN clause without the keyword.
     */
    int create_trigger(sqlite3 *db, std::string_view trigger_name, std::string_view event, std::string_view table_name,
                       std::string_view when_condition, std::string_view message)
    {
        std::ostringstream sql;
        sql << "CREATE TRIGGER IF NOT EXISTS " << trigger_name << " BEFORE " << event << " ON " << table_name;
        if (!when_condition.empty())
            sql << " WHEN " << when_condition;
        sql << " BEGIN SELECT RAISE(ABORT, '" << message << "'); END";

        if (exec_sql(db, sql.str()) == -1)
        {
            LOG_ERROR << "Failed to create trigger " << trigger_name;
            return -1;
        }
        return 0;
    }

    /**
     * True if the last failure on the connection came from a unique index clash or a trigger abort.
     */
    bool is_constraint_violation(sqlite3 *db)
    {
        return (sqlite3_extended_errcode(db) & 0xff) == SQLITE_CONSTRAINT;
    }

    int close_db(sqlite3 **db)
    {
        if (*db == NULL)
            return 0;

        if (sqlite3_close(*db) != SQLITE_OK)
        {
            LOG_ERROR << "Could not close database: " << sqlite3_errmsg(*db);
            return -1;
        }

        *db = NULL;
        return 0;
    }

    const std::string get_text(sqlite3_stmt *stmt, const int idx)
    {
        const unsigned char *text = sqlite3_column_text(stmt, idx);
        if (text == NULL)
            return {};
        return std::string(reinterpret_cast<const char *>(text), sqlite3_column_bytes(stmt, idx));
    }

    const std::optional<std::string> get_optional_text(sqlite3_stmt *stmt, const int idx)
    {
        if (sqlite3_column_type(stmt, idx) == SQLITE_NULL)
            return std::nullopt;
        return get_text(stmt, idx);
    }

    int bind_text(sqlite3_stmt *stmt, const int idx, std::string_view text)
    {
        // An empty view may carry a null data pointer, which sqlite would store as NULL.
        return sqlite3_bind_text(stmt, idx, text.data() ? text.data() : "", text.size(), SQLITE_TRANSIENT);
    }

    int bind_optional_text(sqlite3_stmt *stmt, const int idx, const std::optional<std::string> &text)
    {
        return text ? bind_text(stmt, idx, *text) : sqlite3_bind_null(stmt, idx);
    }

} // namespace store::sqlite
