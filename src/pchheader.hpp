#ifndef _UL_PCHHEADER_
#define _UL_PCHHEADER_

// Enable boost strack trace.
#define BOOST_STACKTRACE_USE_BACKTRACE

#include <algorithm>
#include <array>
#include <atomic>
#include <blake3.h>
#include <boost/stacktrace.hpp>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <functional>
#include <iomanip>
#include <iostream>
#include <jsoncons/json.hpp>
#include <libgen.h>
#include <limits>
#include <limits.h>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <poll.h>
#include <pthread.h>
#include <set>
#include <shared_mutex>
#include <signal.h>
#include <sodium.h>
#include <sqlite3.h>
#include <sstream>
#include <stdlib.h>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#endif
