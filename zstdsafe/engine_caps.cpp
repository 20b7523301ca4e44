// engine_caps.cpp

#include "zstdsafe/engine_caps.hpp"
#include "zstdsafe/zstd_error.hpp"
#include "zstdsafe/tostr.hpp"
#include <zstd.h>
#include <iostream>

using namespace std;

namespace {
    /* bounds query fails only for parameters unknown to this library version */
    ZSTD_bounds
    checked_bounds(ZSTD_bounds b, char const * param_name) {
        if (ZSTD_isError(b.error))
            throw unsupported_feature(tostr("engine_caps::query: no bounds for [", param_name, "]: ",
                                            ZSTD_getErrorName(b.error)));
        return b;
    }
}

engine_caps
engine_caps::query()
{
    engine_caps retval;

    retval.min_level_ = ::ZSTD_minCLevel();
    retval.max_level_ = ::ZSTD_maxCLevel();
    retval.default_level_ = ZSTD_CLEVEL_DEFAULT;

    ZSTD_bounds wlog = checked_bounds(::ZSTD_cParam_getBounds(ZSTD_c_windowLog), "windowLog");
    retval.min_window_log_ = wlog.lowerBound;
    retval.max_window_log_ = wlog.upperBound;

    ZSTD_bounds wlogmax = checked_bounds(::ZSTD_dParam_getBounds(ZSTD_d_windowLogMax), "windowLogMax");
    retval.min_window_log_max_ = wlogmax.lowerBound;
    retval.max_window_log_max_ = wlogmax.upperBound;

    /* single-threaded builds report nbWorkers bounds [0, 0] */
    ZSTD_bounds workers = checked_bounds(::ZSTD_cParam_getBounds(ZSTD_c_nbWorkers), "nbWorkers");
    retval.max_workers_ = workers.upperBound;

    retval.version_number_ = ::ZSTD_versionNumber();
    retval.version_string_ = ::ZSTD_versionString();

    return retval;
}

void
engine_caps::display(std::ostream & os) const
{
    os << "<engine_caps"
       << " :version " << version_string_
       << " :level [" << min_level_ << ", " << max_level_ << "]"
       << " :default-level " << default_level_
       << " :window-log [" << min_window_log_ << ", " << max_window_log_ << "]"
       << " :window-log-max [" << min_window_log_max_ << ", " << max_window_log_max_ << "]"
       << " :max-workers " << max_workers_
       << ">";
}
