#ifndef _UL_API_API_JSON_
#define _UL_API_API_JSON_

#include "../pchheader.hpp"
#include "../engine/engine.hpp"

namespace api::json
{
    // Common fields of every request.
    struct request_header
    {
        std::string type;
        std::string id;
        std::string credential;
        uint64_t timeout_ms = 0; // 0 when the request does not carry a timeout.
    };

    int parse_request(jsoncons::ojson &d, std::string_view message);

    int extract_header(request_header &header, const jsoncons::ojson &d);

    int extract_string(std::string &value, const jsoncons::ojson &d, const char *field, const bool required = true);

    int extract_optional_string(std::optional<std::string> &value, const jsoncons::ojson &d, const char *field);

    int extract_amount(int64_t &cents, const jsoncons::ojson &d, const char *field);

    int extract_ratio(double &value, const jsoncons::ojson &d, const char *field);

    int extract_uint64(uint64_t &value, const jsoncons::ojson &d, const char *field, const bool required = true);

    int extract_order_event(engine::order_event &ev, const jsoncons::ojson &d);

    int extract_period(std::string &client_id, int &year, int &month, const jsoncons::ojson &d);

    int extract_ad_spend_total(std::optional<int64_t> &total, const jsoncons::ojson &d);

    int extract_range(std::string &client_id, uint64_t &from_ms, uint64_t &to_ms, const jsoncons::ojson &d);

    int extract_recalculation(baseline::recalculation_input &in, const jsoncons::ojson &d);

    void populate_entry(jsoncons::ojson &d, const ledger::ledger_entry &entry);

    void populate_attribution_log(jsoncons::ojson &d, const ledger::attribution_log &log);

    void populate_snapshot(jsoncons::ojson &d, const baseline::baseline_snapshot &snapshot);

    void populate_summary(jsoncons::ojson &d, const engine::client_summary &summary);

    void populate_invoice(jsoncons::ojson &d, const settlement::invoice &inv);

    void populate_audit_record(jsoncons::ojson &d, const audit::audit_record &record);

    const std::string create_response(std::string_view type, std::string_view id, const int code, const jsoncons::ojson &payload);

    const std::string create_error_response(std::string_view type, std::string_view id, const int code);

} // namespace api::json

#endif
