#ifndef _UL_ENGINE_ENGINE_
#define _UL_ENGINE_ENGINE_

#include "../pchheader.hpp"
#include "../attribution/signals.hpp"
#include "../audit/audit_export.hpp"
#include "../baseline/baseline.hpp"
#include "../ledger/ledger_common.hpp"
#include "../settlement/settlement.hpp"
#include "../uplift/uplift.hpp"

/**
 * Operations exposed to external collaborators. Each operation is one synchronous unit of work
 * bounded by the caller's timeout. Fee rates and thresholds are resolved from the loaded config.
 */
namespace engine
{
    constexpr uint64_t DEFAULT_LIVE_LIMIT = 20;
    constexpr uint64_t MAX_LIVE_LIMIT = 100;
    constexpr size_t MAX_ID_LEN = 256;
    constexpr const char *DEFAULT_PLATFORM = "shopify";

    struct order_event
    {
        std::string client_id;
        std::string platform;
        std::string internal_order_id;
        std::string external_order_id;
        int64_t order_amount = 0;
        std::optional<int64_t> ad_spend; // Baseline ad spend per order when absent.
        double confidence = 0;
        attribution::signal_scores scores{};
        std::optional<std::string> campaign_id;
        std::optional<std::string> creative_id;
        std::optional<std::string> touchpoint_id;
    };

    struct attribution_result
    {
        ledger::ledger_entry entry;
        bool duplicate = false; // True if the order had already been recorded and the original is returned.
    };

    struct agent_rank
    {
        attribution::AGENT agent;
        uint64_t orders = 0;
    };

    struct client_summary
    {
        baseline::baseline_snapshot snapshot;
        uint64_t total_orders = 0;
        uint64_t attributed_orders = 0;
        int64_t attribution_rate = 0; // Hundredths of a percent of recorded orders.
        int64_t roi = 0;              // Hundredths of a percent. Cumulative uplift over fees.
        std::vector<agent_rank> top_agents;
        std::vector<uplift::scenario> scenarios;
    };

    int record_order(const order_event &ev, const uint64_t timeout_ms, attribution_result &result);

    int get_client_summary(const std::string &client_id, const uint64_t timeout_ms, client_summary &summary);

    int get_settlement(const std::string &client_id, const int year, const int month, const std::optional<int64_t> &actual_ad_spend,
                       const uint64_t timeout_ms, settlement::invoice &inv);

    int advance_invoice_status(const std::string &client_id, const int year, const int month, const settlement::INVOICE_STATUS status,
                               const uint64_t timeout_ms, settlement::invoice &inv);

    int get_live_attributions(const std::string &client_id, const uint64_t limit, const uint64_t timeout_ms,
                              std::vector<ledger::ledger_entry> &entries);

    int get_order_attribution(const std::string &client_id, const std::string &external_order_id, const uint64_t timeout_ms,
                              ledger::ledger_entry &entry, ledger::attribution_log &log);

    int export_audit_trail(const std::string &client_id, const uint64_t from_ms, const uint64_t to_ms, const uint64_t timeout_ms,
                           std::vector<audit::audit_record> &records);

    int export_audit_file(const std::string &client_id, const uint64_t from_ms, const uint64_t to_ms, const uint64_t timeout_ms,
                          const std::string &file_path, size_t &record_count);

    int anonymize(const std::string &client_id, const std::string &external_order_id, const uint64_t timeout_ms, ledger::ledger_entry &entry);

    int recalculate_baseline(const baseline::recalculation_input &in, const uint64_t timeout_ms, baseline::baseline_snapshot &snapshot);

    int verify_client_chain(const std::string &client_id, const uint64_t timeout_ms, bool &intact, uint64_t &checked_count, uint64_t &broken_seq_no);

    //------Internal-use functions for this namespace.

    int validate_order(const order_event &ev);

    bool is_valid_id(std::string_view id);

} // namespace engine

#endif
