#include "version.hpp"

namespace version
{
    /**
     * Splits a dotted version string into its numeric components.
     * @return 0 on success. -1 if any component is empty or non-numeric.
     */
    int parse_components(std::string_view ver, std::vector<uint64_t> &components)
    {
        size_t start = 0;
        while (true)
        {
            const size_t dot = ver.find('.', start);
            const std::string_view part = ver.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
            if (part.empty() || part.size() > 9 || part.find_first_not_of("0123456789") != std::string_view::npos)
                return -1;

            uint64_t value = 0;
            for (const char c : part)
                value = value * 10 + (c - '0');
            components.push_back(value);

            if (dot == std::string_view::npos)
                return 0;
            start = dot + 1;
        }
    }

    /**
     * Compares two dotted version strings. Missing trailing components count as zero.
     * @return -1 if x < y, 0 if equal, 1 if x > y and -2 if either string is malformed.
     */
    int version_compare(const std::string &x, const std::string &y)
    {
        std::vector<uint64_t> cx, cy;
        if (parse_components(x, cx) == -1 || parse_components(y, cy) == -1)
            return -2;

        const size_t count = std::max(cx.size(), cy.size());
        cx.resize(count, 0);
        cy.resize(count, 0);

        if (cx < cy)
            return -1;
        return cx == cy ? 0 : 1;
    }
}
