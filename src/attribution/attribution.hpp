#ifndef _UL_ATTRIBUTION_ATTRIBUTION_
#define _UL_ATTRIBUTION_ATTRIBUTION_

#include "../pchheader.hpp"
#include "signals.hpp"

/**
 * Per-order attribution decision. Pure computation over fixed-point inputs with no storage access.
 */
namespace attribution
{
    // Identifies the decision rules recorded with every attribution log.
    constexpr const char *DECISION_ENGINE = "multi_signal_v1";

    constexpr double DEFAULT_CONFIDENCE_THRESHOLD = 0.70;

    struct decision_input
    {
        int64_t order_amount = 0;                // Order value in cents.
        int64_t baseline_aov = 0;                // Baseline average order value in cents.
        int64_t ad_spend_for_order = 0;          // Ad spend attributed to this order in cents.
        int64_t baseline_ad_spend_per_order = 0; // Historical ad spend per order in cents.
        double confidence = 0;                   // Attribution confidence (0.0-1.0).
        signal_scores scores{};                  // Per-signal evidence (0.0-1.0 each).
        double threshold = DEFAULT_CONFIDENCE_THRESHOLD;
        int64_t fee_rate_ppm = 0; // Performance fee rate in parts-per-million.
    };

    struct decision
    {
        bool attributed = false;
        bool fee_applicable = false;
        int64_t incremental_revenue = 0;  // Cents.
        int64_t uplift_pct = 0;           // Hundredths of a percent.
        int64_t incremental_ad_spend = 0; // Cents.
        int64_t net_profit_uplift = 0;    // Cents.
        int64_t fee_amount = 0;           // Cents. Never negative.
        std::vector<AGENT> agents;        // Contributing agents in fixed enum order.
        agent_shares shares{};            // Contribution share per agent (sums to 1 when attributed).
        int64_t counterfactual_revenue = 0;
        std::string explanation;
    };

    int validate_input(const decision_input &in);

    int decide(const decision_input &in, decision &out);

    void extract_contributing_agents(const signal_scores &scores, std::vector<AGENT> &agents, agent_shares &shares);

    const std::string build_explanation(const signal_scores &scores, const decision &d);

    const std::string format_ratio(const double value, const int digits = 2);

    const std::string agents_to_string(const std::vector<AGENT> &agents);

    int agents_from_string(std::string_view str, std::vector<AGENT> &agents);

} // namespace attribution

#endif
