#ifndef _UL_STORE_SQLITE_
#define _UL_STORE_SQLITE_

#include "../pchheader.hpp"

namespace store::sqlite
{
    // Declared column affinity. Values index COLUMN_TYPE_NAMES in sqlite.cpp.
    enum COLUMN_DATA_TYPE
    {
        INT,
        TEXT,
        REAL
    };

    struct table_column_info
    {
        std::string name;
        COLUMN_DATA_TYPE column_type;
        bool is_key;  // Declared as the PRIMARY KEY.
        bool is_null; // false adds NOT NULL.

        table_column_info(std::string_view name, const COLUMN_DATA_TYPE &column_type, const bool is_key = false, const bool is_null = true)
            : name(name), column_type(column_type), is_key(is_key), is_null(is_null)
        {
        }
    };

    int open_db(std::string_view db_name, sqlite3 **db, const uint64_t timeout_ms, const bool writable);

    int exec_sql(sqlite3 *db, std::string_view sql);

    int begin_transaction(sqlite3 *db);

    int commit_transaction(sqlite3 *db);

    int rollback_transaction(sqlite3 *db);

    int create_table(sqlite3 *db, std::string_view table_name, const std::vector<table_column_info> &column_info);

    int create_index(sqlite3 *db, std::string_view table_name, std::string_view column_names, const bool is_unique);

    int create_trigger(sqlite3 *db, std::string_view trigger_name, std::string_view event, std::string_view table_name,
                       std::string_view when_condition, std::string_view message);

    bool is_constraint_violation(sqlite3 *db);

    int close_db(sqlite3 **db);

    const std::string get_text(sqlite3_stmt *stmt, const int idx);

    int bind_text(sqlite3_stmt *stmt, const int idx, std::string_view text);

    int bind_optional_text(sqlite3_stmt *stmt, const int idx, const std::optional<std::string> &text);

    const std::optional<std::string> get_optional_text(sqlite3_stmt *stmt, const int idx);

} // namespace store::sqlite

#endif
