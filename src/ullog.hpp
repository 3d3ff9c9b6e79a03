#ifndef _UL_ULLOG_
#define _UL_ULLOG_

#include "pchheader.hpp"

namespace ullog
{
    void init();

} // namespace ullog

#endif
