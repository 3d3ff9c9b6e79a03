#include "store.hpp"
#include "sqlite.hpp"
#include "../util/version.hpp"

#define SCHEMA_RETURN(ret)                       \
    {                                            \
        if (ret == -1)                           \
        {                                        \
            sqlite::rollback_transaction(db);    \
            return -1;                           \
        }                                        \
        return sqlite::commit_transaction(db);   \
    }

namespace store
{
    constexpr const char *JOURNAL_MODE_WAL = "PRAGMA journal_mode=WAL";
    constexpr const char *SELECT_LEDGER_VERSION = "SELECT value FROM meta WHERE key='ledger_version'";
    constexpr const char *INSERT_LEDGER_VERSION = "INSERT OR IGNORE INTO meta(key, value) VALUES('ledger_version', ?)";
    constexpr uint64_t INIT_TIMEOUT_MS = 10000;

    // Columns of an entry which can never change after insertion. Only PII columns (replaced by
    // anonymisation) and invoice_id (set once) are left out.
    constexpr const char *ENTRY_IMMUTABLE_COLUMNS =
        "seq_no,entry_hash,prev_hash,data_hash,pii_digest,client_id,platform,order_amount,attributed,confidence,"
        "baseline_revenue,incremental_revenue,uplift_pct,ad_spend_for_order,baseline_ad_spend,incremental_ad_spend,"
        "net_profit_uplift,fee_rate_ppm,fee_amount,fee_applicable,agents,explanation,created_at,order_key";

    // Columns of an invoice which can never change after generation. Only status and its timestamps move.
    constexpr const char *INVOICE_IMMUTABLE_COLUMNS =
        "invoice_id,client_id,billing_year,billing_month,period_start,period_end,baseline_revenue,baseline_ad_spend,"
        "actual_revenue,actual_ad_spend,incremental_revenue,incremental_ad_spend,net_profit_uplift,fee_rate_ppm,"
        "fee_amount,client_net_gain,client_roi,total_orders,attributed_orders,high_confidence_orders,"
        "accrued_order_fees,due_date,explanation,created_at";

    std::string db_path;
    bool init_success = false;

    /**
     * Prepares the ledger database at the given path, creating the schema if needed.
     * @param db_file Full path to the ledger sqlite file.
     * @return 0 on success. -1 on failure.
     */
    int init(std::string_view db_file)
    {
        db_path = db_file;

        sqlite3 *db = NULL;
        if (sqlite::open_db(db_path, &db, INIT_TIMEOUT_MS, true) == -1)
            return -1;

        // WAL mode is persistent in the database file, so it only needs to be set once here.
        if (sqlite::exec_sql(db, JOURNAL_MODE_WAL) == -1 ||
            initialize_db(db) == -1 ||
            check_ledger_version(db) == -1)
        {
            LOG_ERROR << "Error initializing ledger database at " << db_path;
            sqlite::close_db(&db);
            return -1;
        }

        sqlite::close_db(&db);
        init_success = true;
        LOG_INFO << "Ledger database ready at " << db_path;
        return 0;
    }

    void deinit()
    {
        init_success = false;
    }

    /**
     * Opens a new connection to the ledger database.
     * @param db Pointer to populate with the connection.
     * @param timeout_ms Caller supplied timeout for waiting on database locks.
     * @param writable Whether write access is needed.
     * @return 0 on success. -1 on failure.
     */
    int open(sqlite3 **db, const uint64_t timeout_ms, const bool writable)
    {
        if (!init_success)
        {
            LOG_ERROR << "Ledger database is not initialized.";
            return -1;
        }

        return sqlite::open_db(db_path, db, timeout_ms, writable);
    }

    int close(sqlite3 **db)
    {
        return sqlite::close_db(db);
    }

    /**
     * Sets up the tables, indexes and append-only triggers of a ledger database. Safe to run on an
     * already initialized database.
     * @param db Pointer to the db.
     * @returns returns 0 on success, or -1 on error.
    */
    int initialize_db(sqlite3 *db)
    {
        using namespace sqlite;

        if (begin_transaction(db) == -1)
            return -1;

        // Baselines table.
        {
            const std::vector<table_column_info> columns{
                table_column_info("client_id", COLUMN_DATA_TYPE::TEXT, true),
                table_column_info("baseline_revenue", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("baseline_order_count", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("baseline_aov", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("baseline_ad_spend", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("baseline_profit", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("current_revenue", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("current_order_count", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("current_ad_spend", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("total_incremental_revenue", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("total_incremental_ad_spend", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("total_net_profit_uplift", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("total_fees", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("sample_size", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("period_days", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("revenue_variance", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("data_quality", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("last_synced", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("version", COLUMN_DATA_TYPE::INT, false, false)};

            if (create_table(db, BASELINES_TABLE, columns) == -1)
                SCHEMA_RETURN(-1);
        }

        // Ledger entries table. seq_no is the rowid alias and gives the append order.
        {
            const std::vector<table_column_info> columns{
                table_column_info("seq_no", COLUMN_DATA_TYPE::INT, true),
                table_column_info("entry_hash", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("prev_hash", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("data_hash", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("pii_digest", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("client_id", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("platform", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("internal_order_id", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("external_order_id", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("order_amount", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("attributed", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("confidence", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("baseline_revenue", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("incremental_revenue", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("uplift_pct", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("ad_spend_for_order", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("baseline_ad_spend", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("incremental_ad_spend", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("net_profit_uplift", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("fee_rate_ppm", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("fee_amount", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("fee_applicable", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("agents", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("explanation", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("campaign_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("creative_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("touchpoint_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("anonymized", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("invoice_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("created_at", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("order_key", COLUMN_DATA_TYPE::TEXT, false, false)};

            if (create_table(db, ENTRIES_TABLE, columns) == -1 ||
                create_index(db, ENTRIES_TABLE, "client_id,external_order_id", true) == -1 ||
                create_index(db, ENTRIES_TABLE, "client_id,order_key", true) == -1 ||
                create_index(db, ENTRIES_TABLE, "entry_hash", true) == -1 ||
                create_index(db, ENTRIES_TABLE, "client_id,created_at", false) == -1 ||
                create_index(db, ENTRIES_TABLE, "client_id,attributed", false) == -1)
                SCHEMA_RETURN(-1);
        }

        // Attribution detail per entry.
        {
            const std::vector<table_column_info> columns{
                table_column_info("entry_seq_no", COLUMN_DATA_TYPE::INT, true),
                table_column_info("client_id", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("ad_touchpoint_score", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("acquisition_score", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("product_promotion_score", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("nurture_engagement_score", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("confidence_threshold", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("campaign_optimizer_share", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("acquisition_targeting_share", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("creative_promotion_share", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("nurture_flow_share", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("platform_share", COLUMN_DATA_TYPE::REAL, false, false),
                table_column_info("counterfactual_revenue", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("decision_engine", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("explanation", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("created_at", COLUMN_DATA_TYPE::INT, false, false)};

            if (create_table(db, ATTRIBUTION_LOGS_TABLE, columns) == -1)
                SCHEMA_RETURN(-1);
        }

        // Settlement invoices.
        {
            const std::vector<table_column_info> columns{
                table_column_info("invoice_id", COLUMN_DATA_TYPE::TEXT, true),
                table_column_info("client_id", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("billing_year", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("billing_month", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("period_start", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("period_end", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("baseline_revenue", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("baseline_ad_spend", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("actual_revenue", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("actual_ad_spend", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("incremental_revenue", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("incremental_ad_spend", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("net_profit_uplift", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("fee_rate_ppm", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("fee_amount", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("client_net_gain", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("client_roi", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("total_orders", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("attributed_orders", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("high_confidence_orders", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("accrued_order_fees", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("status", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("due_date", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("explanation", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("created_at", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("sent_at", COLUMN_DATA_TYPE::INT),
                table_column_info("paid_at", COLUMN_DATA_TYPE::INT)};

            if (create_table(db, INVOICES_TABLE, columns) == -1 ||
                create_index(db, INVOICES_TABLE, "client_id,billing_year,billing_month", true) == -1)
                SCHEMA_RETURN(-1);
        }

        // Ledger meta data.
        {
            const std::vector<table_column_info> columns{
                table_column_info("key", COLUMN_DATA_TYPE::TEXT, true),
                table_column_info("value", COLUMN_DATA_TYPE::TEXT, false, false)};

            if (create_table(db, META_TABLE, columns) == -1)
                SCHEMA_RETURN(-1);

            sqlite3_stmt *stmt = NULL;
            if (sqlite3_prepare_v2(db, INSERT_LEDGER_VERSION, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
                sqlite::bind_text(stmt, 1, version::LEDGER_VERSION) != SQLITE_OK ||
                sqlite3_step(stmt) != SQLITE_DONE)
            {
                LOG_ERROR << "Error writing ledger version. " << sqlite3_errmsg(db);
                sqlite3_finalize(stmt);
                SCHEMA_RETURN(-1);
            }
            sqlite3_finalize(stmt);
        }

        if (create_append_only_triggers(db) == -1)
            SCHEMA_RETURN(-1);

        SCHEMA_RETURN(0);
    }

    /**
     * Installs the triggers which make ledger history append-only at the database level, so that
     * no code path (or external sqlite client) can rewrite a recorded decision.
     */
    int create_append_only_triggers(sqlite3 *db)
    {
        const std::string entry_update = std::string("UPDATE OF ") + ENTRY_IMMUTABLE_COLUMNS;
        const std::string invoice_update = std::string("UPDATE OF ") + INVOICE_IMMUTABLE_COLUMNS;

        if (sqlite::create_trigger(db, "trg_entries_no_delete", "DELETE", ENTRIES_TABLE, "", "ledger entries are append-only") == -1 ||
            sqlite::create_trigger(db, "trg_entries_immutable", entry_update, ENTRIES_TABLE, "", "ledger entry fields are immutable") == -1 ||
            sqlite::create_trigger(db, "trg_entries_invoice_once", "UPDATE OF invoice_id", ENTRIES_TABLE,
                                   "OLD.invoice_id IS NOT NULL", "invoice id already assigned") == -1 ||
            sqlite::create_trigger(db, "trg_attribution_logs_no_delete", "DELETE", ATTRIBUTION_LOGS_TABLE, "", "attribution logs are append-only") == -1 ||
            sqlite::create_trigger(db, "trg_attribution_logs_immutable", "UPDATE", ATTRIBUTION_LOGS_TABLE, "", "attribution logs are immutable") == -1 ||
            sqlite::create_trigger(db, "trg_invoices_no_delete", "DELETE", INVOICES_TABLE, "", "invoices cannot be deleted") == -1 ||
            sqlite::create_trigger(db, "trg_invoices_immutable", invoice_update, INVOICES_TABLE, "", "invoice amounts are immutable") == -1)
            return -1;

        return 0;
    }

    /**
     * Checks that the database was written with a compatible ledger schema version.
     * @return 0 if compatible. -1 otherwise.
     */
    int check_ledger_version(sqlite3 *db)
    {
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, SELECT_LEDGER_VERSION, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            sqlite3_step(stmt) != SQLITE_ROW)
        {
            LOG_ERROR << "Error reading ledger version. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        const std::string ledger_version = sqlite::get_text(stmt, 0);
        sqlite3_finalize(stmt);

        if (version::version_compare(ledger_version, version::LEDGER_VERSION) != 0)
        {
            LOG_ERROR << "Ledger database version " << ledger_version << " is not compatible with " << version::LEDGER_VERSION;
            return -1;
        }

        return 0;
    }

} // namespace store
