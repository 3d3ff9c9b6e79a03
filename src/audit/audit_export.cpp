#include "audit_export.hpp"
#include "../errors.hpp"
#include "../ledger/ledger.hpp"
#include "../store/store.hpp"
#include "../util/money.hpp"
#include "../util/util.hpp"

namespace audit
{
    constexpr uint64_t EXPORT_PAGE_SIZE = 500;
    constexpr mode_t EXPORT_FILE_PERMS = 0640;
    constexpr const char *CSV_HEADER = "seq_no,entry_hash,prev_hash,data_hash,external_order_id,internal_order_id,"
                                       "order_amount,incremental_revenue,net_profit_uplift,fee_amount,confidence,"
                                       "attributed,invoice_id,created_at\n";

    /**
     * Reads a client's entries within [from_ms, to_ms) in append order. Uses a read-only connection.
     * @return 0 on success. VALIDATION_ERROR on bad range. PERSISTENCE_ERROR on failure.
     */
    int export_records(const std::string &client_id, const uint64_t from_ms, const uint64_t to_ms, const uint64_t timeout_ms,
                       std::vector<audit_record> &records)
    {
        if (client_id.empty() || from_ms > to_ms)
        {
            LOG_DEBUG << "Invalid audit export range for client '" << client_id << "'";
            return errors::VALIDATION_ERROR;
        }

        sqlite3 *db = NULL;
        if (store::open(&db, timeout_ms, false) == -1)
            return errors::PERSISTENCE_ERROR;

        // Read inside one transaction so that all pages see the same snapshot.
        if (store::sqlite::exec_sql(db, "BEGIN") == -1)
            STORE_RETURN(db, errors::PERSISTENCE_ERROR);

        ledger::entry_query q;
        q.client_id = client_id;
        q.from_ms = from_ms;
        q.to_ms = to_ms;
        q.limit = EXPORT_PAGE_SIZE;

        while (true)
        {
            std::vector<ledger::ledger_entry> entries;
            if (ledger::query(db, q, entries) == -1)
            {
                store::sqlite::rollback_transaction(db);
                STORE_RETURN(db, errors::PERSISTENCE_ERROR);
            }

            for (const ledger::ledger_entry &entry : entries)
            {
                audit_record record;
                record.seq_no = entry.seq_no;
                record.entry_hash = entry.entry_hash;
                record.prev_hash = entry.prev_hash;
                record.data_hash = entry.data_hash;
                record.external_order_id = entry.external_order_id;
                record.internal_order_id = entry.internal_order_id;
                record.order_amount = entry.order_amount;
                record.incremental_revenue = entry.incremental_revenue;
                record.net_profit_uplift = entry.net_profit_uplift;
                record.fee_amount = entry.fee_amount;
                record.confidence = entry.confidence;
                record.attributed = entry.attributed;
                record.invoice_id = entry.invoice_id;
                record.created_at = entry.created_at;
                records.push_back(std::move(record));
            }

            if (entries.size() < EXPORT_PAGE_SIZE)
                break;
            q.after_seq_no = entries.back().seq_no;
        }

        store::sqlite::rollback_transaction(db);
        LOG_INFO << "Exported " << records.size() << " audit records for client " << client_id;
        STORE_RETURN(db, 0);
    }

    /**
     * Writes the records as a CSV flat file with a header line.
     * @return 0 on success. PERSISTENCE_ERROR on failure.
     */
    int write_flat_file(const std::string &file_path, const std::vector<audit_record> &records)
    {
        std::string content = CSV_HEADER;
        for (const audit_record &record : records)
            content.append(to_csv_line(record));

        if (util::write_file(file_path, content, EXPORT_FILE_PERMS) == -1)
            return errors::PERSISTENCE_ERROR;

        return 0;
    }

    /**
     * Checks the linkage of an exported sequence. Every record's entry hash must be derived from its
     * own prev and data hashes, and every prev hash must be the entry hash of the record before it.
     * The first record's prev hash is taken as given since the range may start mid-chain.
     * @param broken_index Index of the first failing record.
     * @returns 1 if the sequence is intact. 0 if broken.
     */
    int verify_chain(const std::vector<audit_record> &records, size_t &broken_index)
    {
        broken_index = 0;
        for (size_t i = 0; i < records.size(); i++)
        {
            const audit_record &record = records[i];
            if (record.entry_hash != ledger::compute_entry_hash(record.prev_hash, record.data_hash) ||
                (i > 0 && record.prev_hash != records[i - 1].entry_hash))
            {
                broken_index = i;
                return 0;
            }
        }
        return 1;
    }

    // Quotes a csv field when it contains a separator, quote or line break.
    const std::string csv_field(std::string_view value)
    {
        if (value.find_first_of(",\"\r\n") == std::string_view::npos)
            return std::string(value);

        std::string quoted = "\"";
        for (const char c : value)
        {
            if (c == '"')
                quoted.push_back('"');
            quoted.push_back(c);
        }
        quoted.push_back('"');
        return quoted;
    }

    const std::string to_csv_line(const audit_record &record)
    {
        std::ostringstream os;
        os << record.seq_no << ","
           << record.entry_hash << ","
           << record.prev_hash << ","
           << record.data_hash << ","
           << csv_field(record.external_order_id) << ","
           << csv_field(record.internal_order_id) << ","
           << money::to_string(record.order_amount) << ","
           << money::to_string(record.incremental_revenue) << ","
           << money::to_string(record.net_profit_uplift) << ","
           << money::to_string(record.fee_amount) << ","
           << std::fixed << std::setprecision(4) << record.confidence << ","
           << (record.attributed ? "true" : "false") << ","
           << csv_field(record.invoice_id.value_or("")) << ","
           << record.created_at << "\n";
        return os.str();
    }

} // namespace audit
