#ifndef _UL_STORE_STORE_
#define _UL_STORE_STORE_

#include "../pchheader.hpp"
#include "../errors.hpp"
#include "sqlite.hpp"

// Ends the open transaction of 'db' (commit when 'ret' is 0, rollback otherwise), closes the
// connection and returns. A failed commit turns a success into a persistence error.
#define STORE_TXN_RETURN(db, ret)                                              \
    {                                                                          \
        int txn_ret = (ret);                                                   \
        if (txn_ret == 0 && store::sqlite::commit_transaction(db) == -1)       \
            txn_ret = errors::PERSISTENCE_ERROR;                               \
        if (txn_ret != 0)                                                      \
            store::sqlite::rollback_transaction(db);                           \
        store::close(&db);                                                     \
        return txn_ret;                                                        \
    }

// Closes the connection and returns.
#define STORE_RETURN(db, ret) \
    {                         \
        store::close(&db);    \
        return (ret);         \
    }

/**
 * Owns the ledger database location and schema. Every operation opens its own short-lived
 * connection through open() so concurrent callers never share sqlite handles.
 */
namespace store
{
    constexpr const char *BASELINES_TABLE = "baselines";
    constexpr const char *ENTRIES_TABLE = "entries";
    constexpr const char *ATTRIBUTION_LOGS_TABLE = "attribution_logs";
    constexpr const char *INVOICES_TABLE = "invoices";
    constexpr const char *META_TABLE = "meta";

    int init(std::string_view db_file);

    void deinit();

    int open(sqlite3 **db, const uint64_t timeout_ms, const bool writable = true);

    int close(sqlite3 **db);

    //------Internal-use functions for this namespace.

    int initialize_db(sqlite3 *db);

    int create_append_only_triggers(sqlite3 *db);

    int check_ledger_version(sqlite3 *db);

} // namespace store

#endif
