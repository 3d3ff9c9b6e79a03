#include "ledger.hpp"
#include "../attribution/attribution.hpp"
#include "../crypto.hpp"
#include "../errors.hpp"
#include "../store/sqlite.hpp"
#include "../util/util.hpp"

namespace ledger
{
    constexpr const char *ENTRY_COLUMNS = "seq_no, entry_hash, prev_hash, data_hash, pii_digest, client_id, platform,"
                                          " internal_order_id, external_order_id, order_amount, attributed, confidence,"
                                          " baseline_revenue, incremental_revenue, uplift_pct, ad_spend_for_order,"
                                          " baseline_ad_spend, incremental_ad_spend, net_profit_uplift, fee_rate_ppm,"
                                          " fee_amount, fee_applicable, agents, explanation, campaign_id, creative_id,"
                                          " touchpoint_id, anonymized, invoice_id, created_at, order_key";

    constexpr const char *INSERT_ENTRY = "INSERT INTO entries(entry_hash, prev_hash, data_hash, pii_digest, client_id, platform,"
                                         " internal_order_id, external_order_id, order_amount, attributed, confidence,"
                                         " baseline_revenue, incremental_revenue, uplift_pct, ad_spend_for_order,"
                                         " baseline_ad_spend, incremental_ad_spend, net_profit_uplift, fee_rate_ppm,"
                                         " fee_amount, fee_applicable, agents, explanation, campaign_id, creative_id,"
                                         " touchpoint_id, anonymized, invoice_id, created_at, order_key)"
                                         " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,0,NULL,?,?)";

    constexpr const char *INSERT_ATTRIBUTION_LOG = "INSERT INTO attribution_logs(entry_seq_no, client_id, ad_touchpoint_score,"
                                                   " acquisition_score, product_promotion_score, nurture_engagement_score,"
                                                   " confidence_threshold, campaign_optimizer_share, acquisition_targeting_share,"
                                                   " creative_promotion_share, nurture_flow_share, platform_share,"
                                                   " counterfactual_revenue, decision_engine, explanation, created_at)"
                                                   " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)";

    constexpr const char *SELECT_ATTRIBUTION_LOG = "SELECT entry_seq_no, client_id, ad_touchpoint_score, acquisition_score,"
                                                   " product_promotion_score, nurture_engagement_score, confidence_threshold,"
                                                   " campaign_optimizer_share, acquisition_targeting_share, creative_promotion_share,"
                                                   " nurture_flow_share, platform_share, counterfactual_revenue, decision_engine,"
                                                   " explanation, created_at FROM attribution_logs WHERE entry_seq_no=?";

    constexpr const char *SELECT_CHAIN_HEAD = "SELECT entry_hash, created_at FROM entries WHERE client_id=? ORDER BY seq_no DESC LIMIT 1";
    constexpr const char *UPDATE_INVOICE_ID = "UPDATE entries SET invoice_id=? WHERE seq_no=? AND invoice_id IS NULL";
    constexpr const char *UPDATE_ANONYMIZE = "UPDATE entries SET internal_order_id=?, external_order_id=?, campaign_id=NULL,"
                                             " creative_id=NULL, touchpoint_id=NULL, anonymized=1 WHERE seq_no=?";
    constexpr const char *SELECT_ENTRY_COUNTS = "SELECT COUNT(*), COALESCE(SUM(attributed), 0) FROM entries WHERE client_id=?";
    constexpr const char *SELECT_ATTRIBUTED_AGENTS = "SELECT agents FROM entries WHERE client_id=? AND attributed=1";

    // Field markers of the pii digest so that a missing reference never hashes like an empty one.
    constexpr std::string_view FIELD_ABSENT("\x00", 1);
    constexpr std::string_view FIELD_PRESENT("\x01", 1);

    // Separates order keys from every other hash over the same fields.
    constexpr std::string_view ORDER_KEY_DOMAIN("ul-order-key");

    /**
     * Appends a decision and its attribution log. The entry's chain hashes and seq_no are filled in here.
     * @param db Connection with an open write transaction.
     * @param entry Entry to append. On a duplicate order this is overwritten with the existing entry.
     * @param log Attribution log of the entry.
     * @return 0 on success. CONFLICT if the client already has an entry for the external order id
     *         (the existing entry is returned in 'entry'). PERSISTENCE_ERROR on failure.
     */
    int append(sqlite3 *db, ledger_entry &entry, attribution_log &log)
    {
        const int existing = get_by_external_id(db, entry.client_id, entry.external_order_id, entry);
        if (existing == -1)
            return errors::PERSISTENCE_ERROR;
        if (existing == 1)
        {
            LOG_DEBUG << "Duplicate order " << entry.external_order_id << " for client " << entry.client_id;
            return errors::CONFLICT;
        }

        uint64_t last_created_at = 0;
        if (get_chain_head(db, entry.client_id, entry.prev_hash, last_created_at) == -1)
            return errors::PERSISTENCE_ERROR;

        // Creation time never goes backwards within a client's chain.
        entry.created_at = std::max(entry.created_at, last_created_at);

        entry.anonymized = false;
        entry.invoice_id.reset();
        entry.order_key = compute_order_key(entry.client_id, entry.external_order_id);
        entry.pii_digest = compute_pii_digest(entry);
        entry.data_hash = compute_data_hash(entry);
        entry.entry_hash = compute_entry_hash(entry.prev_hash, entry.data_hash);

        if (insert_entry(db, entry) == -1)
            return store::sqlite::is_constraint_violation(db) ? errors::CONFLICT : errors::PERSISTENCE_ERROR;

        entry.seq_no = sqlite3_last_insert_rowid(db);

        log.entry_seq_no = entry.seq_no;
        log.client_id = entry.client_id;
        log.created_at = entry.created_at;
        if (insert_attribution_log(db, log) == -1)
            return errors::PERSISTENCE_ERROR;

        return 0;
    }

    /**
     * Get the entry a client recorded for an external order id. The lookup goes through the order key,
     * so an order is still found after anonymisation replaced its stored ids.
     * @returns 1 if found. 0 if not found. -1 on failure.
     */
    int get_by_external_id(sqlite3 *db, const std::string &client_id, const std::string &external_order_id, ledger_entry &entry)
    {
        const std::string sql = std::string("SELECT ") + ENTRY_COLUMNS + " FROM entries WHERE client_id=? AND order_key=?";
        const std::string order_key = compute_order_key(client_id, external_order_id);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            store::sqlite::bind_text(stmt, 1, client_id) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 2, order_key) == SQLITE_OK)
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                populate_entry(stmt, entry);
                sqlite3_finalize(stmt);
                return 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying ledger entry by order id. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * @returns 1 if found. 0 if not found. -1 on failure.
     */
    int get_by_seq_no(sqlite3 *db, const uint64_t seq_no, ledger_entry &entry)
    {
        const std::string sql = std::string("SELECT ") + ENTRY_COLUMNS + " FROM entries WHERE seq_no=?";

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            sqlite3_bind_int64(stmt, 1, seq_no) == SQLITE_OK)
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                populate_entry(stmt, entry);
                sqlite3_finalize(stmt);
                return 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying ledger entry " << seq_no << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Gets the entry hash and creation time of the client's latest entry. A client without entries
     * gets the genesis hash and 0.
     * @return 0 on success. -1 on failure.
     */
    int get_chain_head(sqlite3 *db, const std::string &client_id, std::string &hash, uint64_t &created_at)
    {
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, SELECT_CHAIN_HEAD, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            store::sqlite::bind_text(stmt, 1, client_id) == SQLITE_OK)
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW || result == SQLITE_DONE)
            {
                hash = result == SQLITE_ROW ? store::sqlite::get_text(stmt, 0) : GENESIS_HASH;
                created_at = result == SQLITE_ROW ? sqlite3_column_int64(stmt, 1) : 0;
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying last entry hash. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Stamps an invoice id on an entry. An entry can only ever be assigned one invoice.
     * @return 0 on success. CONFLICT if already assigned. NOT_FOUND if no such entry. PERSISTENCE_ERROR on failure.
     */
    int assign_invoice(sqlite3 *db, const uint64_t seq_no, const std::string &invoice_id)
    {
        if (invoice_id.empty())
            return errors::VALIDATION_ERROR;

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, UPDATE_INVOICE_ID, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            store::sqlite::bind_text(stmt, 1, invoice_id) != SQLITE_OK ||
            sqlite3_bind_int64(stmt, 2, seq_no) != SQLITE_OK ||
            sqlite3_step(stmt) != SQLITE_DONE)
        {
            LOG_ERROR << "Error assigning invoice to entry " << seq_no << ". " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return errors::PERSISTENCE_ERROR;
        }
        sqlite3_finalize(stmt);

        if (sqlite3_changes(db) == 1)
            return 0;

        // Nothing updated. Either the entry does not exist or it already carries an invoice.
        ledger_entry entry;
        const int res = get_by_seq_no(db, seq_no, entry);
        if (res == -1)
            return errors::PERSISTENCE_ERROR;
        if (res == 0)
            return errors::NOT_FOUND;

        LOG_WARNING << "Entry " << seq_no << " already assigned to invoice " << entry.invoice_id.value_or("");
        return errors::CONFLICT;
    }

    /**
     * Returns a client's entries within a time range in append order.
     * @return 0 on success. -1 on failure.
     */
    int query(sqlite3 *db, const entry_query &q, std::vector<ledger_entry> &entries)
    {
        const std::string sql = std::string("SELECT ") + ENTRY_COLUMNS +
                                " FROM entries WHERE client_id=? AND created_at>=? AND created_at<? AND seq_no>?"
                                " ORDER BY seq_no ASC LIMIT ?";

        const int64_t to_ms = q.to_ms > INT64_MAX ? INT64_MAX : q.to_ms;
        const int64_t limit = (q.limit == 0 || q.limit > INT64_MAX) ? -1 : q.limit;

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            store::sqlite::bind_text(stmt, 1, q.client_id) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 2, q.from_ms > INT64_MAX ? INT64_MAX : q.from_ms) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 3, to_ms) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 4, q.after_seq_no > INT64_MAX ? INT64_MAX : q.after_seq_no) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 5, limit) == SQLITE_OK)
        {
            return read_entries(db, stmt, entries);
        }

        LOG_ERROR << "Error when querying ledger entries. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Returns the most recent attributed entries of a client, newest first.
     * @return 0 on success. -1 on failure.
     */
    int latest_attributed(sqlite3 *db, const std::string &client_id, const uint64_t limit, std::vector<ledger_entry> &entries)
    {
        const std::string sql = std::string("SELECT ") + ENTRY_COLUMNS +
                                " FROM entries WHERE client_id=? AND attributed=1 ORDER BY seq_no DESC LIMIT ?";

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            store::sqlite::bind_text(stmt, 1, client_id) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 2, limit) == SQLITE_OK)
        {
            return read_entries(db, stmt, entries);
        }

        LOG_ERROR << "Error when querying latest attributions. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * @returns 1 if found. 0 if not found. -1 on failure.
     */
    int get_attribution_log(sqlite3 *db, const uint64_t seq_no, attribution_log &log)
    {
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, SELECT_ATTRIBUTION_LOG, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            sqlite3_bind_int64(stmt, 1, seq_no) == SQLITE_OK)
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                log.entry_seq_no = sqlite3_column_int64(stmt, 0);
                log.client_id = store::sqlite::get_text(stmt, 1);
                for (int i = 0; i < attribution::SIGNAL_COUNT; i++)
                    log.scores[i] = sqlite3_column_double(stmt, 2 + i);
                log.confidence_threshold = sqlite3_column_double(stmt, 6);
                for (int i = 0; i < attribution::AGENT_COUNT; i++)
                    log.shares[i] = sqlite3_column_double(stmt, 7 + i);
                log.counterfactual_revenue = sqlite3_column_int64(stmt, 12);
                log.decision_engine = store::sqlite::get_text(stmt, 13);
                log.explanation = store::sqlite::get_text(stmt, 14);
                log.created_at = sqlite3_column_int64(stmt, 15);
                sqlite3_finalize(stmt);
                return 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying attribution log " << seq_no << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Collects entry counts and per-agent credit counts of a client.
     * @return 0 on success. -1 on failure.
     */
    int get_client_stats(sqlite3 *db, const std::string &client_id, client_stats &stats)
    {
        stats = client_stats{};

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, SELECT_ENTRY_COUNTS, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            store::sqlite::bind_text(stmt, 1, client_id) != SQLITE_OK ||
            sqlite3_step(stmt) != SQLITE_ROW)
        {
            LOG_ERROR << "Error when counting ledger entries. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }
        stats.total_entries = sqlite3_column_int64(stmt, 0);
        stats.attributed_entries = sqlite3_column_int64(stmt, 1);
        sqlite3_finalize(stmt);

        stmt = NULL;
        if (sqlite3_prepare_v2(db, SELECT_ATTRIBUTED_AGENTS, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            store::sqlite::bind_text(stmt, 1, client_id) != SQLITE_OK)
        {
            LOG_ERROR << "Error when querying entry agents. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        int result;
        while ((result = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            std::vector<attribution::AGENT> agents;
            if (attribution::agents_from_string(store::sqlite::get_text(stmt, 0), agents) == -1)
            {
                LOG_WARNING << "Unknown agent name in ledger entry of client " << client_id;
                continue;
            }
            for (const attribution::AGENT agent : agents)
                stats.agent_counts[agent]++;
        }
        sqlite3_finalize(stmt);

        if (result != SQLITE_DONE)
        {
            LOG_ERROR << "Error when reading entry agents. " << sqlite3_errmsg(db);
            return -1;
        }

        return 0;
    }

    /**
     * Replaces the personally identifying fields of an entry in place. Financial fields, hashes
     * and the order key are untouched, so the hash chain stays verifiable and the original order id
     * is still recognised as a duplicate. Anonymising an entry twice is a no-op.
     * @param entry Populated with the anonymized entry.
     * @return 0 on success. NOT_FOUND if the order is not in the ledger. PERSISTENCE_ERROR on failure.
     */
    int anonymize(sqlite3 *db, const std::string &client_id, const std::string &external_order_id, ledger_entry &entry)
    {
        const int res = get_by_external_id(db, client_id, external_order_id, entry);
        if (res == -1)
            return errors::PERSISTENCE_ERROR;
        if (res == 0)
            return errors::NOT_FOUND;
        if (entry.anonymized)
            return 0;

        // Order ids are replaced by a per-entry value to keep (client_id, external_order_id) unique.
        const std::string anon_id = ANONYMIZED_ID_PREFIX + std::to_string(entry.seq_no);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, UPDATE_ANONYMIZE, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            store::sqlite::bind_text(stmt, 1, anon_id) != SQLITE_OK ||
            store::sqlite::bind_text(stmt, 2, anon_id) != SQLITE_OK ||
            sqlite3_bind_int64(stmt, 3, entry.seq_no) != SQLITE_OK ||
            sqlite3_step(stmt) != SQLITE_DONE)
        {
            LOG_ERROR << "Error anonymizing entry " << entry.seq_no << ". " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return errors::PERSISTENCE_ERROR;
        }
        sqlite3_finalize(stmt);

        if (get_by_seq_no(db, entry.seq_no, entry) != 1)
            return errors::PERSISTENCE_ERROR;

        return 0;
    }

    /**
     * Recomputes the hash chain of all entries of a client from the stored rows.
     * @param checked_count Number of entries verified.
     * @param broken_seq_no Seq no. of the first entry failing verification.
     * @returns 1 if the chain is intact. 0 if broken. -1 on failure.
     */
    int verify_client_chain(sqlite3 *db, const std::string &client_id, uint64_t &checked_count, uint64_t &broken_seq_no)
    {
        const std::string sql = std::string("SELECT ") + ENTRY_COLUMNS + " FROM entries WHERE client_id=? ORDER BY seq_no ASC";

        checked_count = 0;
        broken_seq_no = 0;

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            store::sqlite::bind_text(stmt, 1, client_id) != SQLITE_OK)
        {
            LOG_ERROR << "Error when reading ledger chain. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        std::string expected_prev = GENESIS_HASH;
        int result;
        while ((result = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            ledger_entry entry;
            populate_entry(stmt, entry);

            const bool pii_ok = entry.anonymized ||
                                (entry.pii_digest == compute_pii_digest(entry) &&
                                 entry.order_key == compute_order_key(entry.client_id, entry.external_order_id));
            if (!pii_ok ||
                entry.prev_hash != expected_prev ||
                entry.data_hash != compute_data_hash(entry) ||
                entry.entry_hash != compute_entry_hash(entry.prev_hash, entry.data_hash))
            {
                LOG_WARNING << "Ledger chain of client " << client_id << " broken at entry " << entry.seq_no;
                broken_seq_no = entry.seq_no;
                sqlite3_finalize(stmt);
                return 0;
            }

            expected_prev = entry.entry_hash;
            checked_count++;
        }
        sqlite3_finalize(stmt);

        if (result != SQLITE_DONE)
        {
            LOG_ERROR << "Error when reading ledger chain. " << sqlite3_errmsg(db);
            return -1;
        }

        return 1;
    }

    /**
     * Digest of the personally identifying fields of an entry (hex).
     */
    const std::string compute_pii_digest(const ledger_entry &entry)
    {
        std::vector<std::string_view> fields{entry.internal_order_id, entry.external_order_id};
        for (const std::optional<std::string> *ref : {&entry.campaign_id, &entry.creative_id, &entry.touchpoint_id})
        {
            if (*ref)
            {
                fields.push_back(FIELD_PRESENT);
                fields.push_back(**ref);
            }
            else
            {
                fields.push_back(FIELD_ABSENT);
            }
        }
        return util::to_hex(crypto::get_hash(fields));
    }

    /**
     * Idempotency key of an order (hex). One-way, so it can outlive the anonymised order id.
     */
    const std::string compute_order_key(std::string_view client_id, std::string_view external_order_id)
    {
        return util::to_hex(crypto::get_hash({ORDER_KEY_DOMAIN, client_id, external_order_id}));
    }

    /**
     * Digest of the canonical immutable fields of an entry (hex). PII only enters through pii_digest.
     */
    const std::string compute_data_hash(const ledger_entry &entry)
    {
        uint64_t confidence_bits;
        memcpy(&confidence_bits, &entry.confidence, sizeof(confidence_bits));

        const std::string amounts = util::uint64_to_string_bytes(entry.order_amount) +
                                    util::uint64_to_string_bytes(entry.attributed ? 1 : 0) +
                                    util::uint64_to_string_bytes(confidence_bits) +
                                    util::uint64_to_string_bytes(entry.baseline_revenue) +
                                    util::uint64_to_string_bytes(entry.incremental_revenue) +
                                    util::uint64_to_string_bytes(entry.uplift_pct) +
                                    util::uint64_to_string_bytes(entry.ad_spend_for_order) +
                                    util::uint64_to_string_bytes(entry.baseline_ad_spend) +
                                    util::uint64_to_string_bytes(entry.incremental_ad_spend) +
                                    util::uint64_to_string_bytes(entry.net_profit_uplift) +
                                    util::uint64_to_string_bytes(entry.fee_rate_ppm) +
                                    util::uint64_to_string_bytes(entry.fee_amount) +
                                    util::uint64_to_string_bytes(entry.fee_applicable ? 1 : 0) +
                                    util::uint64_to_string_bytes(entry.created_at);

        const std::string agents = attribution::agents_to_string(entry.agents);

        return util::to_hex(crypto::get_hash({entry.client_id, entry.platform, entry.order_key, entry.pii_digest, amounts, agents, entry.explanation}));
    }

    /**
     * Links an entry to its predecessor. blake3(prev_hash || data_hash) over the binary hashes (hex).
     */
    const std::string compute_entry_hash(std::string_view prev_hash_hex, std::string_view data_hash_hex)
    {
        return util::to_hex(crypto::get_hash(util::to_bin(prev_hash_hex), util::to_bin(data_hash_hex)));
    }

    void populate_entry(sqlite3_stmt *stmt, ledger_entry &entry)
    {
        entry.seq_no = sqlite3_column_int64(stmt, 0);
        entry.entry_hash = store::sqlite::get_text(stmt, 1);
        entry.prev_hash = store::sqlite::get_text(stmt, 2);
        entry.data_hash = store::sqlite::get_text(stmt, 3);
        entry.pii_digest = store::sqlite::get_text(stmt, 4);
        entry.client_id = store::sqlite::get_text(stmt, 5);
        entry.platform = store::sqlite::get_text(stmt, 6);
        entry.internal_order_id = store::sqlite::get_text(stmt, 7);
        entry.external_order_id = store::sqlite::get_text(stmt, 8);
        entry.order_amount = sqlite3_column_int64(stmt, 9);
        entry.attributed = sqlite3_column_int(stmt, 10) == 1;
        entry.confidence = sqlite3_column_double(stmt, 11);
        entry.baseline_revenue = sqlite3_column_int64(stmt, 12);
        entry.incremental_revenue = sqlite3_column_int64(stmt, 13);
        entry.uplift_pct = sqlite3_column_int64(stmt, 14);
        entry.ad_spend_for_order = sqlite3_column_int64(stmt, 15);
        entry.baseline_ad_spend = sqlite3_column_int64(stmt, 16);
        entry.incremental_ad_spend = sqlite3_column_int64(stmt, 17);
        entry.net_profit_uplift = sqlite3_column_int64(stmt, 18);
        entry.fee_rate_ppm = sqlite3_column_int64(stmt, 19);
        entry.fee_amount = sqlite3_column_int64(stmt, 20);
        entry.fee_applicable = sqlite3_column_int(stmt, 21) == 1;
        if (attribution::agents_from_string(store::sqlite::get_text(stmt, 22), entry.agents) == -1)
            LOG_WARNING << "Unknown agent name in ledger entry " << entry.seq_no;
        entry.explanation = store::sqlite::get_text(stmt, 23);
        entry.campaign_id = store::sqlite::get_optional_text(stmt, 24);
        entry.creative_id = store::sqlite::get_optional_text(stmt, 25);
        entry.touchpoint_id = store::sqlite::get_optional_text(stmt, 26);
        entry.anonymized = sqlite3_column_int(stmt, 27) == 1;
        entry.invoice_id = store::sqlite::get_optional_text(stmt, 28);
        entry.created_at = sqlite3_column_int64(stmt, 29);
        entry.order_key = store::sqlite::get_text(stmt, 30);
    }

    /**
     * Steps through a prepared entry select and finalizes it.
     * @return 0 on success. -1 on failure.
     */
    int read_entries(sqlite3 *db, sqlite3_stmt *stmt, std::vector<ledger_entry> &entries)
    {
        int result;
        while ((result = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            ledger_entry entry;
            populate_entry(stmt, entry);
            entries.push_back(std::move(entry));
        }
        sqlite3_finalize(stmt);

        if (result != SQLITE_DONE)
        {
            LOG_ERROR << "Error when reading ledger entries. " << sqlite3_errmsg(db);
            return -1;
        }
        return 0;
    }

    int insert_entry(sqlite3 *db, const ledger_entry &entry)
    {
        const std::string agents = attribution::agents_to_string(entry.agents);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, INSERT_ENTRY, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            store::sqlite::bind_text(stmt, 1, entry.entry_hash) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 2, entry.prev_hash) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 3, entry.data_hash) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 4, entry.pii_digest) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 5, entry.client_id) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 6, entry.platform) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 7, entry.internal_order_id) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 8, entry.external_order_id) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 9, entry.order_amount) == SQLITE_OK &&
            sqlite3_bind_int(stmt, 10, entry.attributed ? 1 : 0) == SQLITE_OK &&
            sqlite3_bind_double(stmt, 11, entry.confidence) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 12, entry.baseline_revenue) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 13, entry.incremental_revenue) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 14, entry.uplift_pct) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 15, entry.ad_spend_for_order) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 16, entry.baseline_ad_spend) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 17, entry.incremental_ad_spend) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 18, entry.net_profit_uplift) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 19, entry.fee_rate_ppm) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 20, entry.fee_amount) == SQLITE_OK &&
            sqlite3_bind_int(stmt, 21, entry.fee_applicable ? 1 : 0) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 22, agents) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 23, entry.explanation) == SQLITE_OK &&
            store::sqlite::bind_optional_text(stmt, 24, entry.campaign_id) == SQLITE_OK &&
            store::sqlite::bind_optional_text(stmt, 25, entry.creative_id) == SQLITE_OK &&
            store::sqlite::bind_optional_text(stmt, 26, entry.touchpoint_id) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 27, entry.created_at) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 28, entry.order_key) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error inserting ledger entry for order " << entry.external_order_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int insert_attribution_log(sqlite3 *db, const attribution_log &log)
    {
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, INSERT_ATTRIBUTION_LOG, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            sqlite3_bind_int64(stmt, 1, log.entry_seq_no) != SQLITE_OK ||
            store::sqlite::bind_text(stmt, 2, log.client_id) != SQLITE_OK)
        {
            LOG_ERROR << "Error preparing attribution log insert. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        bool bound = true;
        for (int i = 0; i < attribution::SIGNAL_COUNT; i++)
            bound = bound && sqlite3_bind_double(stmt, 3 + i, log.scores[i]) == SQLITE_OK;
        bound = bound && sqlite3_bind_double(stmt, 7, log.confidence_threshold) == SQLITE_OK;
        for (int i = 0; i < attribution::AGENT_COUNT; i++)
            bound = bound && sqlite3_bind_double(stmt, 8 + i, log.shares[i]) == SQLITE_OK;

        if (bound &&
            sqlite3_bind_int64(stmt, 13, log.counterfactual_revenue) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 14, log.decision_engine) == SQLITE_OK &&
            store::sqlite::bind_text(stmt, 15, log.explanation) == SQLITE_OK &&
            sqlite3_bind_int64(stmt, 16, log.created_at) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error inserting attribution log for entry " << log.entry_seq_no << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

} // namespace ledger
