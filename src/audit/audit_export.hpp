#ifndef _UL_AUDIT_AUDIT_EXPORT_
#define _UL_AUDIT_AUDIT_EXPORT_

#include "../pchheader.hpp"

/**
 * Read-only export of a client's ledger for external hash chain verification.
 */
namespace audit
{
    struct audit_record
    {
        uint64_t seq_no = 0;
        std::string entry_hash;
        std::string prev_hash;
        std::string data_hash;
        std::string external_order_id;
        std::string internal_order_id;
        int64_t order_amount = 0;
        int64_t incremental_revenue = 0;
        int64_t net_profit_uplift = 0;
        int64_t fee_amount = 0;
        double confidence = 0;
        bool attributed = false;
        std::optional<std::string> invoice_id;
        uint64_t created_at = 0;
    };

    int export_records(const std::string &client_id, const uint64_t from_ms, const uint64_t to_ms, const uint64_t timeout_ms,
                       std::vector<audit_record> &records);

    int write_flat_file(const std::string &file_path, const std::vector<audit_record> &records);

    int verify_chain(const std::vector<audit_record> &records, size_t &broken_index);

    const std::string to_csv_line(const audit_record &record);

} // namespace audit

#endif
