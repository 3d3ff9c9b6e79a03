#include "baseline.hpp"
#include "../errors.hpp"
#include "../store/store.hpp"
#include "../store/sqlite.hpp"
#include "../util/money.hpp"
#include "../util/util.hpp"

namespace baseline
{
    constexpr const char *SELECT_BASELINE = "SELECT client_id, baseline_revenue, baseline_order_count, baseline_aov,"
                                            " baseline_ad_spend, baseline_profit, current_revenue, current_order_count,"
                                            " current_ad_spend, total_incremental_revenue, total_incremental_ad_spend,"
                                            " total_net_profit_uplift, total_fees, sample_size, period_days,"
                                            " revenue_variance, data_quality, last_synced, version"
                                            " FROM baselines WHERE client_id=?";

    constexpr const char *UPDATE_DELTA = "UPDATE baselines SET current_revenue=current_revenue+?, current_ad_spend=current_ad_spend+?,"
                                         " current_order_count=current_order_count+?,"
                                         " total_incremental_revenue=total_incremental_revenue+?,"
                                         " total_incremental_ad_spend=total_incremental_ad_spend+?,"
                                         " total_net_profit_uplift=total_net_profit_uplift+?, total_fees=total_fees+?,"
                                         " version=version+1 WHERE client_id=? AND version=?";

    constexpr const char *UPSERT_BASELINE = "INSERT INTO baselines(client_id, baseline_revenue, baseline_order_count, baseline_aov,"
                                            " baseline_ad_spend, baseline_profit, current_revenue, current_order_count, current_ad_spend,"
                                            " total_incremental_revenue, total_incremental_ad_spend, total_net_profit_uplift, total_fees,"
                                            " sample_size, period_days, revenue_variance, data_quality, last_synced, version)"
                                            " VALUES(?,?,?,?,?,?,0,0,0,0,0,0,0,?,?,?,?,?,1)"
                                            " ON CONFLICT(client_id) DO UPDATE SET baseline_revenue=excluded.baseline_revenue,"
                                            " baseline_order_count=excluded.baseline_order_count, baseline_aov=excluded.baseline_aov,"
                                            " baseline_ad_spend=excluded.baseline_ad_spend, baseline_profit=excluded.baseline_profit,"
                                            " current_revenue=0, current_order_count=0, current_ad_spend=0,"
                                            " sample_size=excluded.sample_size, period_days=excluded.period_days,"
                                            " revenue_variance=excluded.revenue_variance, data_quality=excluded.data_quality,"
                                            " last_synced=excluded.last_synced, version=baselines.version+1";

    constexpr const char *DATA_QUALITY_NAMES[]{"high", "medium", "low"};

    util::key_lock client_locks;

    /**
     * Grades how trustworthy a baseline is from the amount of history behind it.
     */
    DATA_QUALITY data_quality(const uint64_t sample_size, const uint64_t period_days, const double revenue_variance)
    {
        if (sample_size < 10 || period_days < 30)
            return DATA_QUALITY::LOW;

        if (sample_size < 30 || period_days < 90 || revenue_variance > 0.50)
            return DATA_QUALITY::MEDIUM;

        return DATA_QUALITY::HIGH;
    }

    const char *data_quality_to_string(const DATA_QUALITY quality)
    {
        return DATA_QUALITY_NAMES[quality];
    }

    int data_quality_from_string(std::string_view str, DATA_QUALITY &quality)
    {
        for (int i = DATA_QUALITY::HIGH; i <= DATA_QUALITY::LOW; i++)
        {
            if (str == DATA_QUALITY_NAMES[i])
            {
                quality = static_cast<DATA_QUALITY>(i);
                return 0;
            }
        }
        return -1;
    }

    /**
     * Historical ad spend per order, rounded half-even to the cent. 0 without baseline orders.
     */
    int64_t ad_spend_per_order(const baseline_snapshot &snapshot)
    {
        if (snapshot.baseline_order_count <= 0)
            return 0;
        return money::div_round_half_even(snapshot.baseline_ad_spend, snapshot.baseline_order_count);
    }

    /**
     * Fetches the baseline snapshot of a client.
     * @return 0 on success. NOT_FOUND if the client has no baseline. PERSISTENCE_ERROR on storage failure.
     */
    int get_baseline(const std::string &client_id, const uint64_t timeout_ms, baseline_snapshot &snapshot)
    {
        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, false) == -1)
            return errors::PERSISTENCE_ERROR;

        const int res = read_baseline(db, client_id, snapshot);
        if (res == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);
        if (res == 0)
            STORE_RETURN(db, errors::NOT_FOUND);

        STORE_RETURN(db, 0);
    }

    /**
     * Adds current-period revenue, ad spend and order count to a client's snapshot.
     * Counters only ever increase, so negative deltas are rejected.
     * @return 0 on success or an error code.
     */
    int apply_current_period_delta(const std::string &client_id, const int64_t revenue_delta, const int64_t ad_spend_delta,
                                   const int64_t order_delta, const uint64_t timeout_ms)
    {
        if (client_id.empty() || revenue_delta < 0 || ad_spend_delta < 0 || order_delta < 0 ||
            revenue_delta > money::MAX_AMOUNT_CENTS || ad_spend_delta > money::MAX_AMOUNT_CENTS)
        {
            LOG_DEBUG << "Invalid baseline delta for client " << client_id;
            return errors::VALIDATION_ERROR;
        }

        util::key_guard guard;
        if (client_locks.lock(client_id, timeout_ms, guard) == -1)
        {
            LOG_WARNING << "Timed out waiting for client lock " << client_id;
            return errors::PERSISTENCE_ERROR;
        }

        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, true) == -1)
            return errors::PERSISTENCE_ERROR;

        if (store::sqlite::begin_transaction(db) == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);

        baseline_snapshot snapshot;
        const int res = read_baseline(db, client_id, snapshot);
        if (res == -1)
            STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);
        if (res == 0)
            STORE_TXN_RETURN(db, errors::NOT_FOUND);

        period_delta delta;
        delta.revenue = revenue_delta;
        delta.ad_spend = ad_spend_delta;
        delta.orders = order_delta;
        STORE_TXN_RETURN(db, write_delta(db, client_id, snapshot.version, delta));
    }

    /**
     * Overwrites the historical fields of a client's baseline (creating it if needed) and resets
     * the current-period counters. Cumulative totals are kept.
     * @param in Values computed by the baseline job.
     * @param timeout_ms Store timeout.
     * @param snapshot Populated with the stored snapshot on success.
     * @return 0 on success or an error code.
     */
    int recalculate(const recalculation_input &in, const uint64_t timeout_ms, baseline_snapshot &snapshot)
    {
        if (in.client_id.empty() ||
            in.baseline_revenue < 0 || in.baseline_revenue > money::MAX_AMOUNT_CENTS ||
            in.baseline_ad_spend < 0 || in.baseline_ad_spend > money::MAX_AMOUNT_CENTS ||
            in.baseline_order_count < 0 ||
            !(in.revenue_variance >= 0) || !std::isfinite(in.revenue_variance))
        {
            LOG_DEBUG << "Invalid baseline recalculation input for client " << in.client_id;
            return errors::VALIDATION_ERROR;
        }

        const int64_t aov = in.baseline_order_count > 0 ? money::div_round_half_even(in.baseline_revenue, in.baseline_order_count) : 0;
        const DATA_QUALITY quality = data_quality(in.sample_size, in.period_days, in.revenue_variance);

        util::key_guard guard;
        if (client_locks.lock(in.client_id, timeout_ms, guard) == -1)
        {
            LOG_WARNING << "Timed out waiting for client lock " << in.client_id;
            return errors::PERSISTENCE_ERROR;
        }

        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, true) == -1)
            return errors::PERSISTENCE_ERROR;

        if (store::sqlite::begin_transaction(db) == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, UPSERT_BASELINE, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            store::sqlite::bind_text(stmt, 1, in.client_id) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 2, in.baseline_revenue) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 3, in.baseline_order_count) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 4, aov) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 5, in.baseline_ad_spend) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 6, in.baseline_revenue - in.baseline_ad_spend) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 7, in.sample_size) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 8, in.period_days) == SQLITE_OK &&
            sqlite3_bind_double(stmt, 9, in.revenue_variance) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 10, data_quality_to_string(quality)) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 11, util::get_epoch_milliseconds()) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
        }
        else
        {
            LOG_ERROR << "Error writing baseline for client " << in.client_id << ". " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);
        }

        if (read_baseline(db, in.client_id, snapshot) != 1)
            STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);

        LOG_INFO << "Baseline recalculated for client " << in.client_id << " (quality: " << data_quality_to_string(quality) << ")";
        STORE_TXN_RETURN(db, 0);
    }

    /**
     * Reads a client's snapshot using the given connection.
     * @returns 1 if found. 0 if not found. -1 on failure.
     */
    int read_baseline(sqlite3 *db, const std::string &client_id, baseline_snapshot &snapshot)
    {
        sqlite3_stmt *stmt = NULL;

        if (sqlite3_prepare_v2(db, SELECT_BASELINE, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            store::sqlite::bind_text(stmt, 1, client_id) == SQLITE_OK)
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                snapshot.client_id = store::sqlite::get_text(stmt, 0);
                snapshot.baseline_revenue = sqlite3_column_int64(stmt, 1);
                snapshot.baseline_order_count = sqlite3_column_int64(stmt, 2);
                snapshot.baseline_aov = sqlite3_column_int64(stmt, 3);
                snapshot.baseline_ad_spend = sqlite3_column_int64(stmt, 4);
                snapshot.baseline_profit = sqlite3_column_int64(stmt, 5);
                snapshot.current_revenue = sqlite3_column_int64(stmt, 6);
                snapshot.current_order_count = sqlite3_column_int64(stmt, 7);
                snapshot.current_ad_spend = sqlite3_column_int64(stmt, 8);
                snapshot.total_incremental_revenue = sqlite3_column_int64(stmt, 9);
                snapshot.total_incremental_ad_spend = sqlite3_column_int64(stmt, 10);
                snapshot.total_net_profit_uplift = sqlite3_column_int64(stmt, 11);
                snapshot.total_fees = sqlite3_column_int64(stmt, 12);
                snapshot.sample_size = sqlite3_column_int64(stmt, 13);
                snapshot.period_days = sqlite3_column_int64(stmt, 14);
                snapshot.revenue_variance = sqlite3_column_double(stmt, 15);
                if (data_quality_from_string(store::sqlite::get_text(stmt, 16), snapshot.data_quality) == -1)
                    snapshot.data_quality = DATA_QUALITY::LOW;
                snapshot.last_synced = sqlite3_column_int64(stmt, 17);
                snapshot.version = sqlite3_column_int64(stmt, 18);
                sqlite3_finalize(stmt);
                return 1; // Baseline found.
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0; // Not found.
            }
        }

        LOG_ERROR << "Error when querying baseline from db. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Applies an additive delta guarded by the row version the caller read.
     * @return 0 on success. CONFLICT if the row changed since it was read. PERSISTENCE_ERROR on failure.
     */
    int write_delta(sqlite3 *db, const std::string &client_id, const uint64_t expected_version, const period_delta &delta)
    {
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, UPDATE_DELTA, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            sqlite3_bind_int64(stmt, 1, delta.revenue) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 2, delta.ad_spend) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 3, delta.orders) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 4, delta.incremental_revenue) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 5, delta.incremental_ad_spend) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 6, delta.net_profit_uplift) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 7, delta.fees) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 8, client_id) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 9, expected_version) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            if (sqlite3_changes(db) == 1)
                return 0;

            LOG_WARNING << "Baseline of client " << client_id << " changed concurrently.";
            return errors::CONFLICT;
        }

        LOG_ERROR << "Error applying baseline delta for client " << client_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return errors::PERSISTENCE_ERROR;
    }

} // namespace baseline
