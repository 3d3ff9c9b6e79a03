#ifndef _UL_ATTRIBUTION_SIGNALS_
#define _UL_ATTRIBUTION_SIGNALS_

#include "../pchheader.hpp"

namespace attribution
{
    // Evidence kinds supplied with an order by the external signal engine.
    // Any new signal must be added to every table below in the same order.
    enum SIGNAL
    {
        AD_TOUCHPOINT = 0,
        ACQUISITION = 1,
        PRODUCT_PROMOTION = 2,
        NURTURE_ENGAGEMENT = 3,
        SIGNAL_COUNT = 4
    };

    // Platform agents an attributed order can be credited to. PLATFORM is the generic fallback.
    enum AGENT
    {
        CAMPAIGN_OPTIMIZER = 0,
        ACQUISITION_TARGETING = 1,
        CREATIVE_PROMOTION = 2,
        NURTURE_FLOW = 3,
        PLATFORM = 4,
        AGENT_COUNT = 5
    };

    constexpr const char *SIGNAL_NAMES[SIGNAL_COUNT]{"ad_touchpoint", "acquisition", "product_promotion", "nurture_engagement"};

    // Minimum score for a signal to count as a contributing cause.
    constexpr double SIGNAL_CUTOFFS[SIGNAL_COUNT]{0.3, 0.4, 0.3, 0.3};

    // The agent credited when a signal qualifies.
    constexpr AGENT SIGNAL_AGENTS[SIGNAL_COUNT]{CAMPAIGN_OPTIMIZER, ACQUISITION_TARGETING, CREATIVE_PROMOTION, NURTURE_FLOW};

    // Cause phrase used in explanations when a signal qualifies.
    constexpr const char *SIGNAL_CAUSES[SIGNAL_COUNT]{
        "Customer engaged with a platform-managed ad campaign",
        "Customer was acquired through platform-optimized targeting",
        "Customer bought a product featured in platform creatives",
        "Customer returned through a platform nurture flow"};

    constexpr const char *AGENT_NAMES[AGENT_COUNT]{"campaign_optimizer", "acquisition_targeting", "creative_promotion", "nurture_flow", "platform"};

    typedef std::array<double, SIGNAL_COUNT> signal_scores;
    typedef std::array<double, AGENT_COUNT> agent_shares;

    int signal_from_string(std::string_view name, SIGNAL &signal);

    int agent_from_string(std::string_view name, AGENT &agent);

} // namespace attribution

#endif
