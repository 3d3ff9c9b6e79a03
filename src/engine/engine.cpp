#include "engine.hpp"
#include "../attribution/attribution.hpp"
#include "../conf.hpp"
#include "../errors.hpp"
#include "../ledger/ledger.hpp"
#include "../store/store.hpp"
#include "../util/money.hpp"
#include "../util/util.hpp"

namespace engine
{
    constexpr size_t TOP_AGENT_COUNT = 3;

    /**
     * Decides attribution for an order and records the decision. The ledger entry, its attribution
     * log and the client's baseline counters are written in one transaction under the client lock.
     * Recording the same (client, external order id) again returns the original entry.
     * @param ev The order event.
     * @param timeout_ms Caller timeout for the client lock and the store.
     * @param result The recorded (or previously recorded) entry.
     * @return 0 on success. VALIDATION_ERROR, NOT_FOUND (no baseline) or PERSISTENCE_ERROR on failure.
     */
    int record_order(const order_event &ev, const uint64_t timeout_ms, attribution_result &result)
    {
        result = attribution_result{};

        int ret = validate_order(ev);
        if (ret != 0)
            return ret;

        util::key_guard guard;
        if (baseline::client_locks.lock(ev.client_id, timeout_ms, guard) == -1)
        {
            LOG_WARNING << "Timed out waiting for client lock " << ev.client_id;
            return errors::PERSISTENCE_ERROR;
        }

        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, true) == -1)
            return errors::PERSISTENCE_ERROR;

        if (store::sqlite::begin_transaction(db) == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);

        const int existing = ledger::get_by_external_id(db, ev.client_id, ev.external_order_id, result.entry);
        if (existing == -1)
            STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);
        if (existing == 1)
        {
            result.duplicate = true;
            LOG_INFO << "Order " << ev.external_order_id << " of client " << ev.client_id << " already recorded as entry " << result.entry.seq_no;
            STORE_TXN_RETURN(db, 0);
        }

        baseline::baseline_snapshot snapshot;
        const int baseline_res = baseline::read_baseline(db, ev.client_id, snapshot);
        if (baseline_res == -1)
            STORE_TXN_RETURN(db, errors::PERSISTENCE_ERROR);
        if (baseline_res == 0)
        {
            LOG_DEBUG << "No baseline for client " << ev.client_id;
            STORE_TXN_RETURN(db, errors::NOT_FOUND);
        }

        attribution::decision_input in;
        in.order_amount = ev.order_amount;
        in.baseline_aov = snapshot.baseline_aov;
        in.baseline_ad_spend_per_order = baseline::ad_spend_per_order(snapshot);
        in.ad_spend_for_order = ev.ad_spend.value_or(in.baseline_ad_spend_per_order);
        in.confidence = ev.confidence;
        in.scores = ev.scores;
        in.threshold = conf::cfg.attribution.confidence_threshold;
        in.fee_rate_ppm = conf::get_fee_rate_ppm(ev.client_id);

        attribution::decision d;
        ret = attribution::decide(in, d);
        if (ret != 0)
            STORE_TXN_RETURN(db, ret);

        ledger::ledger_entry &entry = result.entry;
        entry.client_id = ev.client_id;
        entry.platform = ev.platform.empty() ? DEFAULT_PLATFORM : ev.platform;
        entry.internal_order_id = ev.internal_order_id;
        entry.external_order_id = ev.external_order_id;
        entry.order_amount = ev.order_amount;
        entry.attributed = d.attributed;
        entry.confidence = ev.confidence;
        entry.baseline_revenue = snapshot.baseline_aov;
        entry.incremental_revenue = d.incremental_revenue;
        entry.uplift_pct = d.uplift_pct;
        entry.ad_spend_for_order = in.ad_spend_for_order;
        entry.baseline_ad_spend = in.baseline_ad_spend_per_order;
        entry.incremental_ad_spend = d.incremental_ad_spend;
        entry.net_profit_uplift = d.net_profit_uplift;
        entry.fee_rate_ppm = in.fee_rate_ppm;
        entry.fee_amount = d.fee_amount;
        entry.fee_applicable = d.fee_applicable;
        entry.agents = d.agents;
        entry.explanation = d.explanation;
        entry.campaign_id = ev.campaign_id;
        entry.creative_id = ev.creative_id;
        entry.touchpoint_id = ev.touchpoint_id;
        entry.created_at = util::get_epoch_milliseconds();

        ledger::attribution_log log;
        log.scores = ev.scores;
        log.confidence_threshold = in.threshold;
        log.shares = d.shares;
        log.counterfactual_revenue = d.counterfactual_revenue;
        log.decision_engine = attribution::DECISION_ENGINE;
        log.explanation = d.explanation;

        ret = ledger::append(db, entry, log);
        if (ret == errors::CONFLICT)
        {
            // Entry now holds the stored original.
            result.duplicate = true;
            STORE_TXN_RETURN(db, 0);
        }
        if (ret != 0)
            STORE_TXN_RETURN(db, ret);

        baseline::period_delta delta;
        delta.revenue = entry.order_amount;
        delta.ad_spend = entry.ad_spend_for_order;
        delta.orders = 1;
        if (entry.attributed)
        {
            delta.incremental_revenue = entry.incremental_revenue;
            delta.incremental_ad_spend = entry.incremental_ad_spend;
            delta.net_profit_uplift = entry.net_profit_uplift;
            delta.fees = entry.fee_amount;
        }

        ret = baseline::write_delta(db, ev.client_id, snapshot.version, delta);
        if (ret != 0)
            STORE_TXN_RETURN(db, ret);

        if (store::sqlite::commit_transaction(db) == -1)
        {
            store::sqlite::rollback_transaction(db);
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);
        }

        LOG_INFO << "Order " << entry.external_order_id << " of client " << entry.client_id << " recorded as entry " << entry.seq_no
                 << (entry.attributed ? " (attributed, fee: " + money::to_string(entry.fee_amount) + ")" : " (not attributed)");
        STORE_RETURN(db, 0);
    }

    /**
     * Baseline, current period and attribution performance of a client, with fee scenarios.
     * @return 0 on success. NOT_FOUND if the client has no baseline. PERSISTENCE_ERROR on failure.
     */
    int get_client_summary(const std::string &client_id, const uint64_t timeout_ms, client_summary &summary)
    {
        summary = client_summary{};
        if (!is_valid_id(client_id))
            return errors::VALIDATION_ERROR;

        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, false) == -1)
            return errors::PERSISTENCE_ERROR;

        // Snapshot and counts are read in one read transaction so they agree with each other.
        if (store::sqlite::exec_sql(db, "BEGIN") == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);

        const int res = baseline::read_baseline(db, client_id, summary.snapshot);
        ledger::client_stats stats;
        const int stats_res = res == 1 ? ledger::get_client_stats(db, client_id, stats) : 0;
        store::sqlite::rollback_transaction(db);
        store::close(&db);

        if (res == -1 || stats_res == -1)
            return errors::PERSISTENCE_ERROR;
        if (res == 0)
            return errors::NOT_FOUND;

        summary.total_orders = stats.total_entries;
        summary.attributed_orders = stats.attributed_entries;
        summary.attribution_rate = money::percent_hundredths(stats.attributed_entries, stats.total_entries);
        summary.roi = uplift::compute_roi(summary.snapshot.total_net_profit_uplift, summary.snapshot.total_fees);

        for (int i = 0; i < attribution::AGENT_COUNT; i++)
        {
            if (stats.agent_counts[i] > 0)
                summary.top_agents.push_back(agent_rank{static_cast<attribution::AGENT>(i), stats.agent_counts[i]});
        }
        std::stable_sort(summary.top_agents.begin(), summary.top_agents.end(),
                         [](const agent_rank &a, const agent_rank &b) { return a.orders > b.orders; });
        if (summary.top_agents.size() > TOP_AGENT_COUNT)
            summary.top_agents.resize(TOP_AGENT_COUNT);

        summary.scenarios = uplift::simulate_scenarios(summary.snapshot.baseline_revenue, summary.snapshot.baseline_ad_spend,
                                                       conf::get_fee_rate_ppm(client_id));
        return 0;
    }

    /**
     * Returns the month's invoice, generating it on first request.
     */
    int get_settlement(const std::string &client_id, const int year, const int month, const std::optional<int64_t> &actual_ad_spend,
                       const uint64_t timeout_ms, settlement::invoice &inv)
    {
        if (!is_valid_id(client_id))
            return errors::VALIDATION_ERROR;

        settlement::generate_options options;
        options.fee_rate_ppm = conf::get_fee_rate_ppm(client_id);
        options.invoice_due_days = conf::cfg.billing.invoice_due_days;
        options.actual_ad_spend = actual_ad_spend;
        options.timeout_ms = timeout_ms;

        bool created = false;
        return settlement::generate_or_return(client_id, year, month, options, inv, created);
    }

    int advance_invoice_status(const std::string &client_id, const int year, const int month, const settlement::INVOICE_STATUS status,
                               const uint64_t timeout_ms, settlement::invoice &inv)
    {
        if (!is_valid_id(client_id))
            return errors::VALIDATION_ERROR;

        return settlement::advance_status(client_id, year, month, status, timeout_ms, inv);
    }

    /**
     * Most recent attributed entries of a client, newest first.
     * @param limit Max entries. 0 selects the default. Capped at MAX_LIVE_LIMIT.
     */
    int get_live_attributions(const std::string &client_id, const uint64_t limit, const uint64_t timeout_ms,
                              std::vector<ledger::ledger_entry> &entries)
    {
        if (!is_valid_id(client_id))
            return errors::VALIDATION_ERROR;

        const uint64_t effective_limit = limit == 0 ? DEFAULT_LIVE_LIMIT : std::min(limit, MAX_LIVE_LIMIT);

        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, false) == -1)
            return errors::PERSISTENCE_ERROR;

        const int ret = ledger::latest_attributed(db, client_id, effective_limit, entries) == -1 ? errors::PERSISTENCE_ERROR : 0;
        STORE_RETURN(db, ret);
    }

    /**
     * The stored entry of one order together with its attribution detail.
     * @return 0 on success. NOT_FOUND if the order was never recorded. PERSISTENCE_ERROR on failure.
     */
    int get_order_attribution(const std::string &client_id, const std::string &external_order_id, const uint64_t timeout_ms,
                              ledger::ledger_entry &entry, ledger::attribution_log &log)
    {
        if (!is_valid_id(client_id) || !is_valid_id(external_order_id))
            return errors::VALIDATION_ERROR;

        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, false) == -1)
            return errors::PERSISTENCE_ERROR;

        int res = ledger::get_by_external_id(db, client_id, external_order_id, entry);
        if (res == 1)
            res = ledger::get_attribution_log(db, entry.seq_no, log);

        if (res == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);
        if (res == 0)
            STORE_RETURN(db, errors::NOT_FOUND);
        STORE_RETURN(db, 0);
    }

    int export_audit_trail(const std::string &client_id, const uint64_t from_ms, const uint64_t to_ms, const uint64_t timeout_ms,
                           std::vector<audit::audit_record> &records)
    {
        if (!is_valid_id(client_id))
            return errors::VALIDATION_ERROR;

        return audit::export_records(client_id, from_ms, to_ms, timeout_ms, records);
    }

    /**
     * Exports the audit trail into a flat file.
     * @param record_count Number of records written.
     */
    int export_audit_file(const std::string &client_id, const uint64_t from_ms, const uint64_t to_ms, const uint64_t timeout_ms,
                          const std::string &file_path, size_t &record_count)
    {
        std::vector<audit::audit_record> records;
        const int ret = export_audit_trail(client_id, from_ms, to_ms, timeout_ms, records);
        if (ret != 0)
            return ret;

        record_count = records.size();
        return audit::write_flat_file(file_path, records);
    }

    /**
     * Scrubs the personally identifying fields of a recorded order.
     * @return 0 on success. NOT_FOUND if the order is not recorded. PERSISTENCE_ERROR on failure.
     */
    int anonymize(const std::string &client_id, const std::string &external_order_id, const uint64_t timeout_ms, ledger::ledger_entry &entry)
    {
        if (!is_valid_id(client_id) || !is_valid_id(external_order_id))
            return errors::VALIDATION_ERROR;

        util::key_guard guard;
        if (baseline::client_locks.lock(client_id, timeout_ms, guard) == -1)
        {
            LOG_WARNING << "Timed out waiting for client lock " << client_id;
            return errors::PERSISTENCE_ERROR;
        }

        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, true) == -1)
            return errors::PERSISTENCE_ERROR;

        if (store::sqlite::begin_transaction(db) == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);

        const int ret = ledger::anonymize(db, client_id, external_order_id, entry);
        if (ret == 0)
            LOG_INFO << "Entry " << entry.seq_no << " of client " << client_id << " anonymized.";

        STORE_TXN_RETURN(db, ret);
    }

    int recalculate_baseline(const baseline::recalculation_input &in, const uint64_t timeout_ms, baseline::baseline_snapshot &snapshot)
    {
        if (!is_valid_id(in.client_id))
            return errors::VALIDATION_ERROR;

        return baseline::recalculate(in, timeout_ms, snapshot);
    }

    /**
     * Recomputes the stored hash chain of a client.
     * @param intact Set to whether every entry verified.
     */
    int verify_client_chain(const std::string &client_id, const uint64_t timeout_ms, bool &intact, uint64_t &checked_count, uint64_t &broken_seq_no)
    {
        if (!is_valid_id(client_id))
            return errors::VALIDATION_ERROR;

        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, false) == -1)
            return errors::PERSISTENCE_ERROR;

        const int res = ledger::verify_client_chain(db, client_id, checked_count, broken_seq_no);
        if (res == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);

        intact = res == 1;
        STORE_RETURN(db, 0);
    }

    /**
     * Checks the order event fields which the decision engine does not.
     * @return 0 if valid. VALIDATION_ERROR otherwise.
     */
    int validate_order(const order_event &ev)
    {
        if (!is_valid_id(ev.client_id) || !is_valid_id(ev.external_order_id) ||
            ev.internal_order_id.size() > MAX_ID_LEN || ev.platform.size() > MAX_ID_LEN)
        {
            LOG_DEBUG << "Invalid order identifiers.";
            return errors::VALIDATION_ERROR;
        }

        if (ev.order_amount < 0 || ev.order_amount > money::MAX_AMOUNT_CENTS ||
            (ev.ad_spend && (*ev.ad_spend < 0 || *ev.ad_spend > money::MAX_AMOUNT_CENTS)))
        {
            LOG_DEBUG << "Order amount out of range for order " << ev.external_order_id;
            return errors::VALIDATION_ERROR;
        }

        // Checked here as well as in the decision so that a malformed retry never matches a stored order.
        bool scores_valid = ev.confidence >= 0 && ev.confidence <= 1;
        for (const double score : ev.scores)
            scores_valid = scores_valid && score >= 0 && score <= 1;
        if (!scores_valid)
        {
            LOG_DEBUG << "Confidence or signal score out of range for order " << ev.external_order_id;
            return errors::VALIDATION_ERROR;
        }

        // Anonymised entries own ids with this prefix.
        if (ev.external_order_id.rfind(ledger::ANONYMIZED_ID_PREFIX, 0) == 0)
        {
            LOG_DEBUG << "Reserved external order id " << ev.external_order_id;
            return errors::VALIDATION_ERROR;
        }

        return 0;
    }

    bool is_valid_id(std::string_view id)
    {
        return !id.empty() && id.size() <= MAX_ID_LEN;
    }

} // namespace engine
