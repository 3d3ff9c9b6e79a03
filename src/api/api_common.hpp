#ifndef _UL_API_API_COMMON_
#define _UL_API_API_COMMON_

#include "../pchheader.hpp"

namespace api
{
    // Message field names
    constexpr const char *FLD_TYPE = "type";
    constexpr const char *FLD_ID = "id";
    constexpr const char *FLD_CREDENTIAL = "credential";
    constexpr const char *FLD_TIMEOUT_MS = "timeout_ms";
    constexpr const char *FLD_STATUS = "status";
    constexpr const char *FLD_ERROR = "error";
    constexpr const char *FLD_CLIENT_ID = "client_id";
    constexpr const char *FLD_PLATFORM = "platform";
    constexpr const char *FLD_INTERNAL_ORDER_ID = "internal_order_id";
    constexpr const char *FLD_EXTERNAL_ORDER_ID = "external_order_id";
    constexpr const char *FLD_ORDER_AMOUNT = "order_amount";
    constexpr const char *FLD_AD_SPEND = "ad_spend";
    constexpr const char *FLD_CONFIDENCE = "confidence";
    constexpr const char *FLD_SIGNAL_SCORES = "signal_scores";
    constexpr const char *FLD_CAMPAIGN_ID = "campaign_id";
    constexpr const char *FLD_CREATIVE_ID = "creative_id";
    constexpr const char *FLD_TOUCHPOINT_ID = "touchpoint_id";
    constexpr const char *FLD_YEAR = "year";
    constexpr const char *FLD_MONTH = "month";
    constexpr const char *FLD_AD_SPEND_BY_PLATFORM = "ad_spend_by_platform";
    constexpr const char *FLD_INVOICE_STATUS = "invoice_status";
    constexpr const char *FLD_LIMIT = "limit";
    constexpr const char *FLD_FROM = "from";
    constexpr const char *FLD_TO = "to";
    constexpr const char *FLD_BASELINE_REVENUE = "baseline_revenue";
    constexpr const char *FLD_BASELINE_ORDER_COUNT = "baseline_order_count";
    constexpr const char *FLD_BASELINE_AD_SPEND = "baseline_ad_spend";
    constexpr const char *FLD_SAMPLE_SIZE = "sample_size";
    constexpr const char *FLD_PERIOD_DAYS = "period_days";
    constexpr const char *FLD_REVENUE_VARIANCE = "revenue_variance";

    // Request types
    constexpr const char *MSGTYPE_RECORD_ORDER = "record_order";
    constexpr const char *MSGTYPE_CLIENT_SUMMARY = "client_summary";
    constexpr const char *MSGTYPE_SETTLEMENT = "settlement";
    constexpr const char *MSGTYPE_INVOICE_STATUS = "invoice_status";
    constexpr const char *MSGTYPE_LIVE_ATTRIBUTIONS = "live_attributions";
    constexpr const char *MSGTYPE_ORDER_ATTRIBUTION = "order_attribution";
    constexpr const char *MSGTYPE_AUDIT_EXPORT = "audit_export";
    constexpr const char *MSGTYPE_ANONYMIZE = "anonymize";
    constexpr const char *MSGTYPE_BASELINE_RECALCULATE = "baseline_recalculate";

    // Suffix of response types ("record_order" -> "record_order_result").
    constexpr const char *RESULT_SUFFIX = "_result";
    // Response type used when the request type itself could not be read.
    constexpr const char *MSGTYPE_INVALID_REQUEST = "invalid_request";

    constexpr const char *STATUS_OK = "ok";
    constexpr const char *STATUS_ERROR = "error";

} // namespace api

#endif
