#include "api_json.hpp"
#include "api_common.hpp"
#include "../attribution/attribution.hpp"
#include "../errors.hpp"
#include "../util/money.hpp"
#include "../util/util.hpp"

namespace api::json
{
    /**
     * Parses a request line.
     * @param d Jsoncons document to which the parsed json should be loaded.
     * @param message The message to parse.
     *                Accepted message format:
     *                {
     *                  "type": "<request type>",
     *                  "credential": "<hex credential>",
     *                  "id": "<optional string echoed back>",
     *                  "timeout_ms": <optional integer>,
     *                  ...
     *                }
     * @return 0 on successful parsing. -1 for failure.
     */
    int parse_request(jsoncons::ojson &d, std::string_view message)
    {
        try
        {
            d = jsoncons::ojson::parse(message, jsoncons::strict_json_parsing());
        }
        catch (const std::exception &e)
        {
            LOG_DEBUG << "Api json message parsing failed. " << e.what();
            return -1;
        }

        if (!d.is_object())
        {
            LOG_DEBUG << "Api json message is not an object.";
            return -1;
        }

        // Check existence of msg type field.
        if (!d.contains(FLD_TYPE) || !d[FLD_TYPE].is<std::string>())
        {
            LOG_DEBUG << "Api json message 'type' missing or invalid.";
            return -1;
        }

        return 0;
    }

    /**
     * Extracts the fields common to every request.
     * @return 0 on successful extraction. -1 for failure.
     */
    int extract_header(request_header &header, const jsoncons::ojson &d)
    {
        header.type = d[FLD_TYPE].as<std::string>();

        if (d.contains(FLD_ID))
        {
            if (!d[FLD_ID].is<std::string>())
            {
                LOG_DEBUG << "Api request 'id' invalid.";
                return -1;
            }
            header.id = d[FLD_ID].as<std::string>();
        }

        if (extract_string(header.credential, d, FLD_CREDENTIAL, false) == -1 ||
            extract_uint64(header.timeout_ms, d, FLD_TIMEOUT_MS, false) == -1)
            return -1;

        return 0;
    }

    int extract_string(std::string &value, const jsoncons::ojson &d, const char *field, const bool required)
    {
        if (!d.contains(field))
        {
            if (required)
                LOG_DEBUG << "Api request '" << field << "' missing.";
            return required ? -1 : 0;
        }

        if (!d[field].is<std::string>())
        {
            LOG_DEBUG << "Api request '" << field << "' invalid.";
            return -1;
        }

        value = d[field].as<std::string>();
        return 0;
    }

    int extract_optional_string(std::optional<std::string> &value, const jsoncons::ojson &d, const char *field)
    {
        value.reset();
        if (!d.contains(field) || d[field].is_null())
            return 0;

        std::string str;
        if (extract_string(str, d, field) == -1)
            return -1;
        value = std::move(str);
        return 0;
    }

    /**
     * Extracts a currency amount. Decimal strings ("99.99") are preferred. Whole currency units
     * may be sent as integers. Binary floating point numbers are rejected.
     * @return 0 on successful extraction. -1 for failure.
     */
    int extract_amount(int64_t &cents, const jsoncons::ojson &d, const char *field)
    {
        if (!d.contains(field))
        {
            LOG_DEBUG << "Api request '" << field << "' missing.";
            return -1;
        }

        const jsoncons::ojson &v = d[field];
        if (v.is<std::string>())
        {
            if (money::parse_amount(v.as<std::string>(), cents) == 0)
                return 0;
        }
        else if (v.is<int64_t>())
        {
            const int64_t units = v.as<int64_t>();
            if (units >= -money::MAX_AMOUNT_CENTS / money::CENTS_PER_UNIT && units <= money::MAX_AMOUNT_CENTS / money::CENTS_PER_UNIT)
            {
                cents = units * money::CENTS_PER_UNIT;
                return 0;
            }
        }

        LOG_DEBUG << "Api request '" << field << "' is not a valid amount.";
        return -1;
    }

    int extract_ratio(double &value, const jsoncons::ojson &d, const char *field)
    {
        if (!d.contains(field) || !d[field].is<double>())
        {
            LOG_DEBUG << "Api request '" << field << "' missing or invalid.";
            return -1;
        }

        value = d[field].as<double>();
        return 0;
    }

    int extract_uint64(uint64_t &value, const jsoncons::ojson &d, const char *field, const bool required)
    {
        if (!d.contains(field))
        {
            if (required)
                LOG_DEBUG << "Api request '" << field << "' missing.";
            return required ? -1 : 0;
        }

        if (!d[field].is<uint64_t>())
        {
            LOG_DEBUG << "Api request '" << field << "' invalid.";
            return -1;
        }

        value = d[field].as<uint64_t>();
        return 0;
    }

    /**
     * Extracts an order event.
     * @param d The json document holding the record order request.
     *          Accepted format:
     *          {
     *            "type": "record_order",
     *            "client_id": "<string>",
     *            "platform": "<optional string>",
     *            "internal_order_id": "<optional string>",
     *            "external_order_id": "<string>",
     *            "order_amount": "<decimal string>",
     *            "ad_spend": "<optional decimal string>",
     *            "confidence": <0.0-1.0>,
     *            "signal_scores": {"ad_touchpoint": <0.0-1.0>, ...},
     *            "campaign_id": "<optional string>",
     *            "creative_id": "<optional string>",
     *            "touchpoint_id": "<optional string>"
     *          }
     * @return 0 on successful extraction. -1 for failure.
     */
    int extract_order_event(engine::order_event &ev, const jsoncons::ojson &d)
    {
        if (extract_string(ev.client_id, d, FLD_CLIENT_ID) == -1 ||
            extract_string(ev.platform, d, FLD_PLATFORM, false) == -1 ||
            extract_string(ev.internal_order_id, d, FLD_INTERNAL_ORDER_ID, false) == -1 ||
            extract_string(ev.external_order_id, d, FLD_EXTERNAL_ORDER_ID) == -1 ||
            extract_amount(ev.order_amount, d, FLD_ORDER_AMOUNT) == -1 ||
            extract_ratio(ev.confidence, d, FLD_CONFIDENCE) == -1 ||
            extract_optional_string(ev.campaign_id, d, FLD_CAMPAIGN_ID) == -1 ||
            extract_optional_string(ev.creative_id, d, FLD_CREATIVE_ID) == -1 ||
            extract_optional_string(ev.touchpoint_id, d, FLD_TOUCHPOINT_ID) == -1)
            return -1;

        ev.ad_spend.reset();
        if (d.contains(FLD_AD_SPEND) && !d[FLD_AD_SPEND].is_null())
        {
            int64_t ad_spend = 0;
            if (extract_amount(ad_spend, d, FLD_AD_SPEND) == -1)
                return -1;
            ev.ad_spend = ad_spend;
        }

        ev.scores.fill(0);
        if (d.contains(FLD_SIGNAL_SCORES))
        {
            if (!d[FLD_SIGNAL_SCORES].is_object())
            {
                LOG_DEBUG << "Api request 'signal_scores' invalid.";
                return -1;
            }

            for (const auto &member : d[FLD_SIGNAL_SCORES].object_range())
            {
                attribution::SIGNAL signal;
                if (attribution::signal_from_string(member.key(), signal) == -1 || !member.value().is<double>())
                {
                    LOG_DEBUG << "Api request signal score '" << member.key() << "' invalid.";
                    return -1;
                }
                ev.scores[signal] = member.value().as<double>();
            }
        }

        return 0;
    }

    int extract_period(std::string &client_id, int &year, int &month, const jsoncons::ojson &d)
    {
        uint64_t y = 0, m = 0;
        if (extract_string(client_id, d, FLD_CLIENT_ID) == -1 ||
            extract_uint64(y, d, FLD_YEAR) == -1 ||
            extract_uint64(m, d, FLD_MONTH) == -1)
            return -1;

        if (y > 9999 || m < 1 || m > 12)
        {
            LOG_DEBUG << "Api request billing period invalid.";
            return -1;
        }

        year = y;
        month = m;
        return 0;
    }

    /**
     * Sums the optional per-platform ad spend map of a settlement request.
     *          "ad_spend_by_platform": {"<platform>": "<decimal string>", ...}
     * @param total Set only when the map is present.
     * @return 0 on successful extraction. -1 for failure.
     */
    int extract_ad_spend_total(std::optional<int64_t> &total, const jsoncons::ojson &d)
    {
        total.reset();
        if (!d.contains(FLD_AD_SPEND_BY_PLATFORM))
            return 0;

        const jsoncons::ojson &spend = d[FLD_AD_SPEND_BY_PLATFORM];
        if (!spend.is_object())
        {
            LOG_DEBUG << "Api request 'ad_spend_by_platform' invalid.";
            return -1;
        }

        int64_t sum = 0;
        for (const auto &member : spend.object_range())
        {
            int64_t cents = 0;
            if (extract_amount(cents, spend, member.key().data()) == -1 || cents < 0)
                return -1;

            sum += cents;
            if (sum > money::MAX_AMOUNT_CENTS)
            {
                LOG_DEBUG << "Api request ad spend total out of range.";
                return -1;
            }
        }

        total = sum;
        return 0;
    }

    int extract_range(std::string &client_id, uint64_t &from_ms, uint64_t &to_ms, const jsoncons::ojson &d)
    {
        from_ms = 0;
        to_ms = UINT64_MAX;
        if (extract_string(client_id, d, FLD_CLIENT_ID) == -1 ||
            extract_uint64(from_ms, d, FLD_FROM, false) == -1 ||
            extract_uint64(to_ms, d, FLD_TO, false) == -1)
            return -1;
        return 0;
    }

    int extract_recalculation(baseline::recalculation_input &in, const jsoncons::ojson &d)
    {
        uint64_t order_count = 0;
        if (extract_string(in.client_id, d, FLD_CLIENT_ID) == -1 ||
            extract_amount(in.baseline_revenue, d, FLD_BASELINE_REVENUE) == -1 ||
            extract_uint64(order_count, d, FLD_BASELINE_ORDER_COUNT) == -1 ||
            extract_amount(in.baseline_ad_spend, d, FLD_BASELINE_AD_SPEND) == -1 ||
            extract_uint64(in.sample_size, d, FLD_SAMPLE_SIZE) == -1 ||
            extract_uint64(in.period_days, d, FLD_PERIOD_DAYS) == -1)
            return -1;

        if (order_count > static_cast<uint64_t>(INT64_MAX))
            return -1;
        in.baseline_order_count = order_count;

        in.revenue_variance = 0;
        if (d.contains(FLD_REVENUE_VARIANCE) && extract_ratio(in.revenue_variance, d, FLD_REVENUE_VARIANCE) == -1)
            return -1;

        return 0;
    }

    void populate_entry(jsoncons::ojson &d, const ledger::ledger_entry &entry)
    {
        d["seq_no"] = entry.seq_no;
        d["entry_hash"] = entry.entry_hash;
        d["prev_hash"] = entry.prev_hash;
        d["client_id"] = entry.client_id;
        d["platform"] = entry.platform;
        d["internal_order_id"] = entry.internal_order_id;
        d["external_order_id"] = entry.external_order_id;
        d["order_amount"] = money::to_string(entry.order_amount);
        d["attributed"] = entry.attributed;
        d["confidence"] = entry.confidence;
        d["baseline_revenue"] = money::to_string(entry.baseline_revenue);
        d["incremental_revenue"] = money::to_string(entry.incremental_revenue);
        d["uplift_pct"] = money::to_string(entry.uplift_pct);
        d["ad_spend_for_order"] = money::to_string(entry.ad_spend_for_order);
        d["baseline_ad_spend"] = money::to_string(entry.baseline_ad_spend);
        d["incremental_ad_spend"] = money::to_string(entry.incremental_ad_spend);
        d["net_profit_uplift"] = money::to_string(entry.net_profit_uplift);
        d["fee_rate"] = money::rate_to_string(entry.fee_rate_ppm);
        d["fee_amount"] = money::to_string(entry.fee_amount);
        d["fee_applicable"] = entry.fee_applicable;

        jsoncons::ojson agents(jsoncons::json_array_arg);
        for (const attribution::AGENT agent : entry.agents)
            agents.push_back(attribution::AGENT_NAMES[agent]);
        d["agents"] = std::move(agents);

        d["explanation"] = entry.explanation;
        d["campaign_id"] = entry.campaign_id ? jsoncons::ojson(*entry.campaign_id) : jsoncons::ojson::null();
        d["creative_id"] = entry.creative_id ? jsoncons::ojson(*entry.creative_id) : jsoncons::ojson::null();
        d["touchpoint_id"] = entry.touchpoint_id ? jsoncons::ojson(*entry.touchpoint_id) : jsoncons::ojson::null();
        d["anonymized"] = entry.anonymized;
        d["invoice_id"] = entry.invoice_id ? jsoncons::ojson(*entry.invoice_id) : jsoncons::ojson::null();
        d["created_at"] = entry.created_at;
    }

    void populate_attribution_log(jsoncons::ojson &d, const ledger::attribution_log &log)
    {
        jsoncons::ojson scores;
        for (int i = 0; i < attribution::SIGNAL_COUNT; i++)
            scores[attribution::SIGNAL_NAMES[i]] = log.scores[i];

        jsoncons::ojson shares;
        for (int i = 0; i < attribution::AGENT_COUNT; i++)
        {
            if (log.shares[i] > 0)
                shares[attribution::AGENT_NAMES[i]] = log.shares[i];
        }

        d["signal_scores"] = std::move(scores);
        d["confidence_threshold"] = log.confidence_threshold;
        d["agent_shares"] = std::move(shares);
        d["counterfactual_revenue"] = money::to_string(log.counterfactual_revenue);
        d["decision_engine"] = log.decision_engine;
        d["explanation"] = log.explanation;
    }

    void populate_snapshot(jsoncons::ojson &d, const baseline::baseline_snapshot &snapshot)
    {
        jsoncons::ojson base;
        base["revenue"] = money::to_string(snapshot.baseline_revenue);
        base["order_count"] = snapshot.baseline_order_count;
        base["average_order_value"] = money::to_string(snapshot.baseline_aov);
        base["ad_spend"] = money::to_string(snapshot.baseline_ad_spend);
        base["profit"] = money::to_string(snapshot.baseline_profit);
        base["data_quality"] = baseline::data_quality_to_string(snapshot.data_quality);
        base["sample_size"] = snapshot.sample_size;
        base["period_days"] = snapshot.period_days;
        base["last_synced"] = snapshot.last_synced;

        jsoncons::ojson current;
        current["revenue"] = money::to_string(snapshot.current_revenue);
        current["order_count"] = snapshot.current_order_count;
        current["ad_spend"] = money::to_string(snapshot.current_ad_spend);

        jsoncons::ojson incremental;
        incremental["revenue"] = money::to_string(snapshot.total_incremental_revenue);
        incremental["ad_spend"] = money::to_string(snapshot.total_incremental_ad_spend);
        incremental["net_profit_uplift"] = money::to_string(snapshot.total_net_profit_uplift);
        incremental["fees"] = money::to_string(snapshot.total_fees);

        d["client_id"] = snapshot.client_id;
        d["baseline"] = std::move(base);
        d["current"] = std::move(current);
        d["incremental"] = std::move(incremental);
    }

    void populate_summary(jsoncons::ojson &d, const engine::client_summary &summary)
    {
        populate_snapshot(d, summary.snapshot);
        d["total_orders"] = summary.total_orders;
        d["attributed_orders"] = summary.attributed_orders;
        d["attribution_rate"] = money::to_string(summary.attribution_rate);
        d["roi"] = money::to_string(summary.roi);

        jsoncons::ojson top_agents(jsoncons::json_array_arg);
        for (const engine::agent_rank &rank : summary.top_agents)
        {
            jsoncons::ojson agent;
            agent["agent"] = attribution::AGENT_NAMES[rank.agent];
            agent["orders"] = rank.orders;
            top_agents.push_back(std::move(agent));
        }
        d["top_agents"] = std::move(top_agents);

        jsoncons::ojson scenarios(jsoncons::json_array_arg);
        for (const uplift::scenario &s : summary.scenarios)
        {
            jsoncons::ojson scenario;
            scenario["name"] = s.name;
            scenario["actual_revenue"] = money::to_string(s.actual_revenue);
            scenario["net_profit_uplift"] = money::to_string(s.result.net_profit_uplift);
            scenario["fee_amount"] = money::to_string(s.result.fee_amount);
            scenario["client_net_gain"] = money::to_string(s.result.client_net_gain);
            scenarios.push_back(std::move(scenario));
        }
        d["scenarios"] = std::move(scenarios);
    }

    void populate_invoice(jsoncons::ojson &d, const settlement::invoice &inv)
    {
        d["invoice_id"] = inv.invoice_id;
        d["client_id"] = inv.client_id;
        d["year"] = inv.billing_year;
        d["month"] = inv.billing_month;
        d["period_start"] = inv.period_start;
        d["period_end"] = inv.period_end;
        d["baseline_revenue"] = money::to_string(inv.baseline_revenue);
        d["baseline_ad_spend"] = money::to_string(inv.baseline_ad_spend);
        d["actual_revenue"] = money::to_string(inv.actual_revenue);
        d["actual_ad_spend"] = money::to_string(inv.actual_ad_spend);
        d["incremental_revenue"] = money::to_string(inv.incremental_revenue);
        d["incremental_ad_spend"] = money::to_string(inv.incremental_ad_spend);
        d["net_profit_uplift"] = money::to_string(inv.net_profit_uplift);
        d["fee_rate"] = money::rate_to_string(inv.fee_rate_ppm);
        d["fee_amount"] = money::to_string(inv.fee_amount);
        d["client_net_gain"] = money::to_string(inv.client_net_gain);
        d["client_roi"] = money::to_string(inv.client_roi);
        d["total_orders"] = inv.total_orders;
        d["attributed_orders"] = inv.attributed_orders;
        d["high_confidence_orders"] = inv.high_confidence_orders;
        d["accrued_order_fees"] = money::to_string(inv.accrued_order_fees);
        d["invoice_status"] = settlement::INVOICE_STATUS_NAMES[inv.status];
        d["due_date"] = util::to_iso_date(inv.due_date);
        d["explanation"] = inv.explanation;
        d["created_at"] = inv.created_at;
        d["sent_at"] = inv.sent_at ? jsoncons::ojson(*inv.sent_at) : jsoncons::ojson::null();
        d["paid_at"] = inv.paid_at ? jsoncons::ojson(*inv.paid_at) : jsoncons::ojson::null();
    }

    void populate_audit_record(jsoncons::ojson &d, const audit::audit_record &record)
    {
        d["seq_no"] = record.seq_no;
        d["entry_hash"] = record.entry_hash;
        d["prev_hash"] = record.prev_hash;
        d["data_hash"] = record.data_hash;
        d["external_order_id"] = record.external_order_id;
        d["order_amount"] = money::to_string(record.order_amount);
        d["incremental_revenue"] = money::to_string(record.incremental_revenue);
        d["net_profit_uplift"] = money::to_string(record.net_profit_uplift);
        d["fee_amount"] = money::to_string(record.fee_amount);
        d["confidence"] = record.confidence;
        d["attributed"] = record.attributed;
        d["created_at"] = record.created_at;
    }

    /**
     * Constructs a response line.
     *            Message format:
     *            {
     *              "type": "<request type>_result",
     *              "id": "<request id if given>",
     *              "status": "ok" | "error",
     *              "error": "<error code name>", // Only on error.
     *              ... payload fields
     *            }
     */
    const std::string create_response(std::string_view type, std::string_view id, const int code, const jsoncons::ojson &payload)
    {
        jsoncons::ojson d;
        d[FLD_TYPE] = std::string(type).append(RESULT_SUFFIX);
        if (!id.empty())
            d[FLD_ID] = std::string(id);
        d[FLD_STATUS] = code == 0 ? STATUS_OK : STATUS_ERROR;
        if (code != 0)
            d[FLD_ERROR] = errors::to_string(code);

        if (payload.is_object())
        {
            for (const auto &member : payload.object_range())
                d[member.key()] = member.value();
        }

        std::string msg;
        d.dump(msg);
        msg.push_back('\n');
        return msg;
    }

    const std::string create_error_response(std::string_view type, std::string_view id, const int code)
    {
        return create_response(type, id, code, jsoncons::ojson());
    }

} // namespace api::json
