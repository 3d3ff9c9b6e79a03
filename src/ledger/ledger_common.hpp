#ifndef _UL_LEDGER_LEDGER_COMMON_
#define _UL_LEDGER_LEDGER_COMMON_

#include "../pchheader.hpp"
#include "../attribution/signals.hpp"

namespace ledger
{
    // prev_hash of the first entry of every client (32 zero bytes, hex).
    const std::string GENESIS_HASH(64, '0');

    // Prefix of the order ids written in place of the originals by anonymisation.
    constexpr const char *ANONYMIZED_ID_PREFIX = "anon-";

    /**
     * Struct to hold ledger entry fields corresponding to the sqlite table.
     * Amounts are cents, rates are ppm and percentages are hundredths of a percent.
     * All the hashes are stored as hex strings.
     */
    struct ledger_entry
    {
        uint64_t seq_no = 0;

        // Hash chain.
        std::string entry_hash;
        std::string prev_hash;
        std::string data_hash;
        std::string pii_digest;
        std::string order_key; // One-way key of (client_id, external_order_id). Survives anonymisation.

        std::string client_id;
        std::string platform;
        std::string internal_order_id; // PII.
        std::string external_order_id; // PII. Unique per client.

        int64_t order_amount = 0;
        bool attributed = false;
        double confidence = 0;
        int64_t baseline_revenue = 0; // Baseline average order value the order was measured against.
        int64_t incremental_revenue = 0;
        int64_t uplift_pct = 0;
        int64_t ad_spend_for_order = 0;
        int64_t baseline_ad_spend = 0; // Baseline ad spend per order.
        int64_t incremental_ad_spend = 0;
        int64_t net_profit_uplift = 0;
        int64_t fee_rate_ppm = 0;
        int64_t fee_amount = 0;
        bool fee_applicable = false;
        std::vector<attribution::AGENT> agents;
        std::string explanation;

        // Optional PII references.
        std::optional<std::string> campaign_id;
        std::optional<std::string> creative_id;
        std::optional<std::string> touchpoint_id;

        bool anonymized = false;
        std::optional<std::string> invoice_id; // Set at most once by settlement.
        uint64_t created_at = 0;
    };

    /**
     * Explainability detail written together with every ledger entry.
     */
    struct attribution_log
    {
        uint64_t entry_seq_no = 0;
        std::string client_id;
        attribution::signal_scores scores{};
        double confidence_threshold = 0;
        attribution::agent_shares shares{};
        int64_t counterfactual_revenue = 0;
        std::string decision_engine;
        std::string explanation;
        uint64_t created_at = 0;
    };

    /**
     * Range filter over one client's entries. Results are in append order and can be resumed by
     * passing the last returned seq_no as after_seq_no.
     */
    struct entry_query
    {
        std::string client_id;
        uint64_t from_ms = 0;             // Inclusive.
        uint64_t to_ms = UINT64_MAX;      // Exclusive.
        uint64_t after_seq_no = 0;
        uint64_t limit = 0;               // 0 for no limit.
    };

    struct client_stats
    {
        uint64_t total_entries = 0;
        uint64_t attributed_entries = 0;
        std::array<uint64_t, attribution::AGENT_COUNT> agent_counts{}; // Attributed entries crediting each agent.
    };

} // namespace ledger

#endif
