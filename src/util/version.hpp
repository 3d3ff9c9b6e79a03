#ifndef _UL_UTIL_VERSION_
#define _UL_UTIL_VERSION_

#include "../pchheader.hpp"

namespace version
{
    // upliftledger version. Written to new configs.
    constexpr const char *UL_VERSION = "1.0.0";

    // Minimum compatible config version (this will be used to validate configs).
    constexpr const char *MIN_CONFIG_VERSION = "1.0.0";

    // Ledger database schema version. Stored in the meta table of every ledger database.
    constexpr const char *LEDGER_VERSION = "1.1.0";

    int version_compare(const std::string &x, const std::string &y);

}

#endif
