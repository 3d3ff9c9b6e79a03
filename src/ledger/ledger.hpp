#ifndef _UL_LEDGER_LEDGER_
#define _UL_LEDGER_LEDGER_

#include "../pchheader.hpp"
#include "ledger_common.hpp"

/**
 * Immutable ledger of attribution decisions. All functions work on a connection (and transaction)
 * owned by the caller so that an entry can be written atomically with the changes it causes.
 */
namespace ledger
{
    int append(sqlite3 *db, ledger_entry &entry, attribution_log &log);

    int get_by_external_id(sqlite3 *db, const std::string &client_id, const std::string &external_order_id, ledger_entry &entry);

    int get_by_seq_no(sqlite3 *db, const uint64_t seq_no, ledger_entry &entry);

    int get_chain_head(sqlite3 *db, const std::string &client_id, std::string &hash, uint64_t &created_at);

    int assign_invoice(sqlite3 *db, const uint64_t seq_no, const std::string &invoice_id);

    int query(sqlite3 *db, const entry_query &q, std::vector<ledger_entry> &entries);

    int latest_attributed(sqlite3 *db, const std::string &client_id, const uint64_t limit, std::vector<ledger_entry> &entries);

    int get_attribution_log(sqlite3 *db, const uint64_t seq_no, attribution_log &log);

    int get_client_stats(sqlite3 *db, const std::string &client_id, client_stats &stats);

    int anonymize(sqlite3 *db, const std::string &client_id, const std::string &external_order_id, ledger_entry &entry);

    int verify_client_chain(sqlite3 *db, const std::string &client_id, uint64_t &checked_count, uint64_t &broken_seq_no);

    const std::string compute_order_key(std::string_view client_id, std::string_view external_order_id);

    const std::string compute_pii_digest(const ledger_entry &entry);

    const std::string compute_data_hash(const ledger_entry &entry);

    const std::string compute_entry_hash(std::string_view prev_hash_hex, std::string_view data_hash_hex);

    //------Internal-use functions for this namespace.

    void populate_entry(sqlite3_stmt *stmt, ledger_entry &entry);

    int read_entries(sqlite3 *db, sqlite3_stmt *stmt, std::vector<ledger_entry> &entries);

    int insert_entry(sqlite3 *db, const ledger_entry &entry);

    int insert_attribution_log(sqlite3 *db, const attribution_log &log);

} // namespace ledger

#endif
