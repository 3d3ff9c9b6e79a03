#include "attribution.hpp"
#include "../errors.hpp"
#include "../util/money.hpp"
#include "../uplift/uplift.hpp"

namespace attribution
{
    int signal_from_string(std::string_view name, SIGNAL &signal)
    {
        for (int i = 0; i < SIGNAL_COUNT; i++)
        {
            if (name == SIGNAL_NAMES[i])
            {
                signal = static_cast<SIGNAL>(i);
                return 0;
            }
        }
        return -1;
    }

    int agent_from_string(std::string_view name, AGENT &agent)
    {
        for (int i = 0; i < AGENT_COUNT; i++)
        {
            if (name == AGENT_NAMES[i])
            {
                agent = static_cast<AGENT>(i);
                return 0;
            }
        }
        return -1;
    }

    bool is_unit_interval(const double value)
    {
        // NaN fails both comparisons.
        return value >= 0.0 && value <= 1.0;
    }

    /**
     * Checks the decision input ranges.
     * @return 0 if valid. VALIDATION_ERROR otherwise.
     */
    int validate_input(const decision_input &in)
    {
        if (!is_unit_interval(in.confidence))
        {
            LOG_DEBUG << "Attribution confidence out of range: " << in.confidence;
            return errors::VALIDATION_ERROR;
        }

        if (!is_unit_interval(in.threshold))
        {
            LOG_DEBUG << "Attribution threshold out of range: " << in.threshold;
            return errors::VALIDATION_ERROR;
        }

        for (int i = 0; i < SIGNAL_COUNT; i++)
        {
            if (!is_unit_interval(in.scores[i]))
            {
                LOG_DEBUG << "Signal score " << SIGNAL_NAMES[i] << " out of range: " << in.scores[i];
                return errors::VALIDATION_ERROR;
            }
        }

        if (in.order_amount < 0 || in.order_amount > money::MAX_AMOUNT_CENTS ||
            in.baseline_aov < 0 || in.baseline_aov > money::MAX_AMOUNT_CENTS ||
            in.ad_spend_for_order < 0 || in.ad_spend_for_order > money::MAX_AMOUNT_CENTS ||
            in.baseline_ad_spend_per_order < 0 || in.baseline_ad_spend_per_order > money::MAX_AMOUNT_CENTS)
        {
            LOG_DEBUG << "Attribution amount out of range.";
            return errors::VALIDATION_ERROR;
        }

        if (in.fee_rate_ppm < 0 || in.fee_rate_ppm > money::PPM_SCALE)
        {
            LOG_DEBUG << "Fee rate out of range: " << in.fee_rate_ppm;
            return errors::VALIDATION_ERROR;
        }

        return 0;
    }

    /**
     * Decides whether an order is attributed to the platform and computes its uplift and fee.
     * The same input always produces the same decision, explanation text included.
     * @param in Order, baseline and evidence values.
     * @param out Decision to populate.
     * @return 0 on success. VALIDATION_ERROR on out of range input.
     */
    int decide(const decision_input &in, decision &out)
    {
        out = decision{};

        const int ret = validate_input(in);
        if (ret != 0)
            return ret;

        out.counterfactual_revenue = in.baseline_aov;

        // Confidence gate. Nothing further is computed for a low confidence order.
        if (in.confidence < in.threshold)
        {
            // Widen until the two values print differently so a gated order never reads as meeting its threshold.
            int digits = 2;
            while (digits < 17 && format_ratio(in.confidence, digits) == format_ratio(in.threshold, digits))
                digits++;
            out.explanation = "Attribution confidence " + format_ratio(in.confidence, digits) +
                              " is below the required threshold " + format_ratio(in.threshold, digits) +
                              ". Order not attributed. No fee applies.";
            return 0;
        }

        out.incremental_revenue = in.order_amount - in.baseline_aov;
        if (out.incremental_revenue <= 0)
        {
            out.explanation = "Order value $" + money::to_string(in.order_amount) +
                              " does not exceed the baseline average order value $" + money::to_string(in.baseline_aov) +
                              ". Order not attributed. No fee applies.";
            return 0;
        }

        out.attributed = true;
        out.uplift_pct = money::percent_hundredths(out.incremental_revenue, in.baseline_aov);

        const uplift::order_result res = uplift::calculate_order(out.incremental_revenue, in.ad_spend_for_order,
                                                                 in.baseline_ad_spend_per_order, in.fee_rate_ppm);
        out.incremental_ad_spend = res.incremental_ad_spend;
        out.net_profit_uplift = res.net_profit_uplift;
        out.fee_amount = res.fee_amount;
        out.fee_applicable = res.fee_applicable;

        extract_contributing_agents(in.scores, out.agents, out.shares);
        out.explanation = build_explanation(in.scores, out);

        // A confident order can still have its uplift eaten by ad spend.
        if (!out.fee_applicable)
            out.explanation.append(" Net profit uplift is not positive. No fee applies.");

        return 0;
    }

    /**
     * Credits agents for the qualifying signals. Shares are the qualifying scores normalized to sum to 1.
     * When nothing qualifies the whole order is credited to the generic platform agent.
     */
    void extract_contributing_agents(const signal_scores &scores, std::vector<AGENT> &agents, agent_shares &shares)
    {
        agents.clear();
        shares.fill(0);

        double total = 0;
        for (int i = 0; i < SIGNAL_COUNT; i++)
        {
            if (scores[i] >= SIGNAL_CUTOFFS[i])
            {
                agents.push_back(SIGNAL_AGENTS[i]);
                shares[SIGNAL_AGENTS[i]] = scores[i];
                total += scores[i];
            }
        }

        if (agents.empty())
        {
            agents.push_back(PLATFORM);
            shares[PLATFORM] = 1;
            return;
        }

        for (const AGENT agent : agents)
            shares[agent] /= total;
    }

    /**
     * Builds the explanation of an attributed order. Causes are listed in fixed signal order
     * followed by the numeric values.
     */
    const std::string build_explanation(const signal_scores &scores, const decision &d)
    {
        std::vector<std::string_view> causes;
        for (int i = 0; i < SIGNAL_COUNT; i++)
        {
            if (scores[i] >= SIGNAL_CUTOFFS[i])
                causes.push_back(SIGNAL_CAUSES[i]);
        }

        std::string text;
        if (causes.empty())
        {
            text = "Attributed to general platform activity";
        }
        else
        {
            for (size_t i = 0; i < causes.size(); i++)
            {
                if (i > 0)
                    text.append(i == causes.size() - 1 ? (causes.size() == 2 ? " and " : ", and ") : ", ");
                text.append(causes[i]);
            }
        }

        text.append(". Incremental revenue: $").append(money::to_string(d.incremental_revenue));
        text.append(" (").append(money::to_string(d.uplift_pct)).append("% uplift).");
        text.append(" Net profit uplift: $").append(money::to_string(d.net_profit_uplift)).append(".");
        text.append(" Performance fee: $").append(money::to_string(d.fee_amount)).append(".");
        return text;
    }

    /**
     * Formats a 0-1 ratio with the given number of fraction digits.
     */
    const std::string format_ratio(const double value, const int digits)
    {
        std::ostringstream os;
        os << std::fixed << std::setprecision(digits) << value;
        return os.str();
    }

    /**
     * Serializes an agent list as comma separated agent names.
     */
    const std::string agents_to_string(const std::vector<AGENT> &agents)
    {
        std::string str;
        for (const AGENT agent : agents)
        {
            if (!str.empty())
                str.append(",");
            str.append(AGENT_NAMES[agent]);
        }
        return str;
    }

    int agents_from_string(std::string_view str, std::vector<AGENT> &agents)
    {
        agents.clear();
        while (!str.empty())
        {
            const size_t pos = str.find(',');
            const std::string_view name = str.substr(0, pos);

            AGENT agent;
            if (agent_from_string(name, agent) == -1)
                return -1;
            agents.push_back(agent);

            if (pos == std::string_view::npos)
                break;
            str.remove_prefix(pos + 1);
        }
        return 0;
    }

} // namespace attribution
