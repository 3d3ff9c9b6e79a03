#include "settlement.hpp"
#include "../baseline/baseline.hpp"
#include "../crypto.hpp"
#include "../errors.hpp"
#include "../ledger/ledger.hpp"
#include "../store/store.hpp"
#include "../uplift/uplift.hpp"
#include "../util/money.hpp"
#include "../util/util.hpp"

namespace settlement
{
    constexpr const char *INVOICE_COLUMNS = "invoice_id, client_id, billing_year, billing_month, period_start, period_end,"
                                            " baseline_revenue, baseline_ad_spend, actual_revenue, actual_ad_spend,"
                                            " incremental_revenue, incremental_ad_spend, net_profit_uplift, fee_rate_ppm,"
                                            " fee_amount, client_net_gain, client_roi, total_orders, attributed_orders,"
                                            " high_confidence_orders, accrued_order_fees, status, due_date, explanation,"
                                            " created_at, sent_at, paid_at";

    constexpr const char *UPDATE_STATUS = "UPDATE invoices SET status=?, sent_at=COALESCE(sent_at, ?), paid_at=COALESCE(paid_at, ?)"
                                          " WHERE invoice_id=? AND status=?";

    constexpr uint64_t MAX_INVOICE_DUE_DAYS = 365;

    /**
     * Returns the invoice of a billing month, generating it on the first call. Entries settled by
     * the invoice are stamped with its id in the same transaction. Only months that have ended can be settled.
     * @param created Set to true if this call generated the invoice.
     * @return 0 on success. VALIDATION_ERROR on bad input or a month that has not ended. NOT_FOUND if the client has no baseline.
     *         PERSISTENCE_ERROR on storage failure or timeout.
     */
    int generate_or_return(const std::string &client_id, const int year, const int month, const generate_options &options,
                           invoice &inv, bool &created)
    {
        created = false;

        uint64_t period_start, period_end;
        if (client_id.empty() || util::get_month_range(year, month, period_start, period_end) == -1)
        {
            LOG_DEBUG << "Invalid settlement period " << year << "-" << month << " for client '" << client_id << "'";
            return errors::VALIDATION_ERROR;
        }

        if (options.fee_rate_ppm < 0 || options.fee_rate_ppm > money::PPM_SCALE ||
            options.invoice_due_days > MAX_INVOICE_DUE_DAYS ||
            (options.actual_ad_spend && (*options.actual_ad_spend < 0 || *options.actual_ad_spend > money::MAX_AMOUNT_CENTS)))
        {
            LOG_DEBUG << "Invalid settlement options for client " << client_id;
            return errors::VALIDATION_ERROR;
        }

        // Orders are stamped with engine time, so a month still running would keep receiving entries
        // its frozen invoice can never include.
        if (period_end > util::get_epoch_milliseconds())
        {
            LOG_DEBUG << "Settlement period " << year << "-" << month << " of client " << client_id << " has not ended.";
            return errors::VALIDATION_ERROR;
        }

        // Same per-client lock as order recording, so a month cannot be settled halfway through an append.
        util::key_guard guard;
        if (baseline::client_locks.lock(client_id, options.timeout_ms, guard) == -1)
        {
            LOG_WARNING << "Timed out waiting for client lock " << client_id;
            return errors::PERSISTENCE_ERROR;
        }

        sqlite3 *db = NULL;
        if (store::open(&db, options.timeout_ms, true) == -1)
            return errors::PERSISTENCE_ERROR;

        if (store::sqlite::begin_transaction(db) == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);

        const int existing = read_invoice(db, client_id, year, month, inv);
        if (existing == -1)
            STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);
        if (existing == 1)
        {
            LOG_DEBUG << "Returning existing invoice " << inv.invoice_id;
            STORE_TXN_RETURN(db, 0);
        }

        baseline::baseline_snapshot snapshot;
        const int baseline_res = baseline::read_baseline(db, client_id, snapshot);
        if (baseline_res == -1)
            STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);
        if (baseline_res == 0)
        {
            LOG_DEBUG << "No baseline for client " << client_id;
            STORE_TXN_RETURN(db, errors::NOT_FOUND);
        }

        ledger::entry_query q;
        q.client_id = client_id;
        q.from_ms = period_start;
        q.to_ms = period_end;
        std::vector<ledger::ledger_entry> entries;
        if (ledger::query(db, q, entries) == -1)
            STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);

        inv = invoice{};
        inv.client_id = client_id;
        inv.billing_year = year;
        inv.billing_month = month;
        inv.period_start = period_start;
        inv.period_end = period_end;
        inv.baseline_revenue = snapshot.baseline_revenue;
        inv.baseline_ad_spend = snapshot.baseline_ad_spend;
        inv.fee_rate_ppm = options.fee_rate_ppm;

        int64_t entry_ad_spend = 0;
        for (const ledger::ledger_entry &entry : entries)
        {
            inv.total_orders++;
            inv.actual_revenue += entry.order_amount;
            entry_ad_spend += entry.ad_spend_for_order;
            inv.accrued_order_fees += entry.fee_amount;
            if (entry.attributed)
            {
                inv.attributed_orders++;
                if (entry.confidence >= HIGH_CONFIDENCE)
                    inv.high_confidence_orders++;
            }
        }
        inv.actual_ad_spend = options.actual_ad_spend ? *options.actual_ad_spend : entry_ad_spend;

        uplift::period_input in;
        in.baseline_revenue = inv.baseline_revenue;
        in.baseline_ad_spend = inv.baseline_ad_spend;
        in.actual_revenue = inv.actual_revenue;
        in.actual_ad_spend = inv.actual_ad_spend;
        in.fee_rate_ppm = inv.fee_rate_ppm;
        const uplift::period_result res = uplift::calculate_period(in);

        inv.incremental_revenue = res.incremental_revenue;
        inv.incremental_ad_spend = res.incremental_ad_spend;
        inv.net_profit_uplift = res.net_profit_uplift;
        inv.fee_amount = res.fee_amount;
        inv.client_net_gain = res.client_net_gain;
        inv.client_roi = res.client_roi;

        inv.invoice_id = crypto::generate_uuid();
        inv.status = INVOICE_STATUS::DRAFT;
        inv.due_date = period_end + options.invoice_due_days * util::MS_PER_DAY;
        inv.created_at = util::get_epoch_milliseconds();
        inv.explanation = build_explanation(inv);

        if (insert_invoice(db, inv) == -1)
        {
            if (!store::sqlite::is_constraint_violation(db))
                STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);

            // Another writer settled the month first. Its invoice is the answer.
            store::sqlite::rollback_transaction(db);
            LOG_INFO << "Invoice for " << client_id << " " << year << "-" << month << " generated concurrently.";
            const int ret = read_invoice(db, client_id, year, month, inv) == 1 ? 0 : errors::PERSISTENCE_ERROR;
            STORE_RETURN(db, ret);
        }

        for (const ledger::ledger_entry &entry : entries)
        {
            if (entry.invoice_id)
                continue;

            const int ret = ledger::assign_invoice(db, entry.seq_no, inv.invoice_id);
            if (ret != 0)
                STORE_TXN_RETURN(db, ret);
        }

        if (store::sqlite::commit_transaction(db) == -1)
        {
            store::sqlite::rollback_transaction(db);
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);
        }

        created = true;
        LOG_INFO << "Invoice " << inv.invoice_id << " generated for " << client_id << " " << year << "-" << month
                 << " (orders: " << inv.total_orders << ", fee: " << money::to_string(inv.fee_amount) << ")";
        STORE_RETURN(db, 0);
    }

    /**
     * Fetches an already generated invoice.
     * @return 0 on success. NOT_FOUND if the month has not been settled. PERSISTENCE_ERROR on failure.
     */
    int get_invoice(const std::string &client_id, const int year, const int month, const uint64_t timeout_ms, invoice &inv)
    {
        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, false) == -1)
            return errors::PERSISTENCE_ERROR;

        const int res = read_invoice(db, client_id, year, month, inv);
        if (res == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);
        if (res == 0)
            STORE_RETURN(db, errors::NOT_FOUND);
        STORE_RETURN(db, 0);
    }

    /**
     * Moves an invoice along its lifecycle and stamps the matching timestamp.
     * @return 0 on success. CONFLICT if the transition is not allowed from the current status.
     *         NOT_FOUND if there is no invoice. PERSISTENCE_ERROR on failure.
     */
    int advance_status(const std::string &client_id, const int year, const int month, const INVOICE_STATUS status,
                       const uint64_t timeout_ms, invoice &inv)
    {
        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, true) == -1)
            return errors::PERSISTENCE_ERROR;

        if (store::sqlite::begin_transaction(db) == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);

        const int res = read_invoice(db, client_id, year, month, inv);
        if (res == -1)
            STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);
        if (res == 0)
            STORE_TXN_RETURN(db, errors::NOT_FOUND);

        if (!is_valid_transition(inv.status, status))
        {
            LOG_DEBUG << "Invoice " << inv.invoice_id << " cannot move from " << INVOICE_STATUS_NAMES[inv.status]
                      << " to " << INVOICE_STATUS_NAMES[status];
            STORE_TXN_RETURN(db, errors::CONFLICT);
        }

        const uint64_t now = util::get_epoch_milliseconds();
        const INVOICE_STATUS prev_status = inv.status;

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, UPDATE_STATUS, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            store::sqlite::bind_text(stmt, 1, INVOICE_STATUS_NAMES[status]) != SQLITE_OK ||
            (status == INVOICE_STATUS::SENT ? sqlite3_bind_int64(stmt, 2, now) : sqlite3_bind_null(stmt, 2)) != SQLITE_OK ||
            (status == INVOICE_STATUS::PAID ? sqlite3_bind_int64(stmt, 3, now) : sqlite3_bind_null(stmt, 3)) != SQLITE_OK ||
            store::sqlite::bind_text(stmt, 4, inv.invoice_id) != SQLITE_OK ||
            store::sqlite::bind_text(stmt, 5, INVOICE_STATUS_NAMES[prev_status]) != SQLITE_OK ||
            sqlite3_step(stmt) != SQLITE_DONE)
        {
            LOG_ERROR << "Error updating invoice status " << inv.invoice_id << ". " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);
        }
        sqlite3_finalize(stmt);

        if (sqlite3_changes(db) != 1 || read_invoice(db, client_id, year, month, inv) != 1)
            STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);

        LOG_INFO << "Invoice " << inv.invoice_id << " status " << INVOICE_STATUS_NAMES[prev_status] << " -> " << INVOICE_STATUS_NAMES[status];
        STORE_TXN_RETURN(db, 0);
    }

    bool is_valid_transition(const INVOICE_STATUS from, const INVOICE_STATUS to)
    {
        return (from == INVOICE_STATUS::DRAFT && to == INVOICE_STATUS::SENT) ||
               (from == INVOICE_STATUS::SENT && to == INVOICE_STATUS::PAID) ||
               (from == INVOICE_STATUS::SENT && to == INVOICE_STATUS::DISPUTED);
    }

    int status_from_string(std::string_view str, INVOICE_STATUS &status)
    {
        for (int i = INVOICE_STATUS::DRAFT; i <= INVOICE_STATUS::DISPUTED; i++)
        {
            if (str == INVOICE_STATUS_NAMES[i])
            {
                status = static_cast<INVOICE_STATUS>(i);
                return 0;
            }
        }
        return -1;
    }

    /**
     * Human readable summary of how the invoice amount was reached.
     */
    const std::string build_explanation(const invoice &inv)
    {
        std::ostringstream os;
        os << "Billing period " << inv.billing_year << "-" << std::setfill('0') << std::setw(2) << inv.billing_month << ": "
           << inv.total_orders << " orders reviewed, " << inv.attributed_orders << " attributed to the platform. "
           << "Revenue $" << money::to_string(inv.actual_revenue) << " against a baseline of $" << money::to_string(inv.baseline_revenue)
           << " (incremental $" << money::to_string(inv.incremental_revenue) << "). "
           << "Ad spend $" << money::to_string(inv.actual_ad_spend) << " against a baseline of $" << money::to_string(inv.baseline_ad_spend)
           << " (incremental $" << money::to_string(inv.incremental_ad_spend) << "). "
           << "Net profit uplift: $" << money::to_string(inv.net_profit_uplift) << ".";

        if (inv.fee_amount > 0)
        {
            os << " Performance fee at rate " << money::rate_to_string(inv.fee_rate_ppm) << ": $" << money::to_string(inv.fee_amount)
               << ". Client net gain: $" << money::to_string(inv.client_net_gain) << ".";
        }
        else
        {
            os << " Net profit uplift is not positive. No performance fee is charged.";
        }

        return os.str();
    }

    /**
     * @returns 1 if found. 0 if not found. -1 on failure.
     */
    int read_invoice(sqlite3 *db, const std::string &client_id, const int year, const int month, invoice &inv)
    {
        const std::string sql = std::string("SELECT ") + INVOICE_COLUMNS +
                                " FROM invoices WHERE client_id=? AND billing_year=? AND billing_month=?";

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            store::sqlite::bind_text(stmt, 1, client_id) == SQLITE_OK &&
            sqlite3_bind_int(stmt, 2, year) == SQLITE_OK &&
            sqlite3_bind_int(stmt, 3, month) == SQLITE_OK)
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                inv.invoice_id = store::sqlite::get_text(stmt, 0);
                inv.client_id = store::sqlite::get_text(stmt, 1);
                inv.billing_year = sqlite3_column_int(stmt, 2);
                inv.billing_month = sqlite3_column_int(stmt, 3);
                inv.period_start = sqlite3_column_int64(stmt, 4);
                inv.period_end = sqlite3_column_int64(stmt, 5);
                inv.baseline_revenue = sqlite3_column_int64(stmt, 6);
                inv.baseline_ad_spend = sqlite3_column_int64(stmt, 7);
                inv.actual_revenue = sqlite3_column_int64(stmt, 8);
                inv.actual_ad_spend = sqlite3_column_int64(stmt, 9);
                inv.incremental_revenue = sqlite3_column_int64(stmt, 10);
                inv.incremental_ad_spend = sqlite3_column_int64(stmt, 11);
                inv.net_profit_uplift = sqlite3_column_int64(stmt, 12);
                inv.fee_rate_ppm = sqlite3_column_int64(stmt, 13);
                inv.fee_amount = sqlite3_column_int64(stmt, 14);
                inv.client_net_gain = sqlite3_column_int64(stmt, 15);
                inv.client_roi = sqlite3_column_int64(stmt, 16);
                inv.total_orders = sqlite3_column_int64(stmt, 17);
                inv.attributed_orders = sqlite3_column_int64(stmt, 18);
                inv.high_confidence_orders = sqlite3_column_int64(stmt, 19);
                inv.accrued_order_fees = sqlite3_column_int64(stmt, 20);
                if (status_from_string(store::sqlite::get_text(stmt, 21), inv.status) == -1)
                {
                    LOG_ERROR << "Unknown status stored for invoice " << inv.invoice_id;
                    sqlite3_finalize(stmt);
                    return -1;
                }
                inv.due_date = sqlite3_column_int64(stmt, 22);
                inv.explanation = store::sqlite::get_text(stmt, 23);
                inv.created_at = sqlite3_column_int64(stmt, 24);
                inv.sent_at.reset();
                inv.paid_at.reset();
                if (sqlite3_column_type(stmt, 25) != SQLITE_NULL)
                    inv.sent_at = sqlite3_column_int64(stmt, 25);
                if (sqlite3_column_type(stmt, 26) != SQLITE_NULL)
                    inv.paid_at = sqlite3_column_int64(stmt, 26);
                sqlite3_finalize(stmt);
                return 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying invoice. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int insert_invoice(sqlite3 *db, const invoice &inv)
    {
        const std::string sql = std::string("INSERT INTO invoices(") + INVOICE_COLUMNS +
                                ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,NULL,NULL)";

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            store::sqlite::bind_text(stmt, 1, inv.invoice_id) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 2, inv.client_id) == SQLITE_OK &&
            sqlite3_bind_int(stmt, 3, inv.billing_year) == SQLITE_OK &&
            sqlite3_bind_int(stmt, 4, inv.billing_month) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 5, inv.period_start) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 6, inv.period_end) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 7, inv.baseline_revenue) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 8, inv.baseline_ad_spend) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 9, inv.actual_revenue) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 10, inv.actual_ad_spend) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 11, inv.incremental_revenue) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 12, inv.incremental_ad_spend) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 13, inv.net_profit_uplift) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 14, inv.fee_rate_ppm) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 15, inv.fee_amount) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 16, inv.client_net_gain) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 17, inv.client_roi) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 18, inv.total_orders) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 19, inv.attributed_orders) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 20, inv.high_confidence_orders) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 21, inv.accrued_order_fees) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 22, INVOICE_STATUS_NAMES[inv.status]) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 23, inv.due_date) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 24, inv.explanation) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 25, inv.created_at) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error inserting invoice " << inv.invoice_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

} // namespace settlement
