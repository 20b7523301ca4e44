// parameters.cpp

#include "zstdsafe/parameters.hpp"
#include "zstdsafe/zstd_error.hpp"
#include "zstdsafe/tostr.hpp"
#include <iostream>

using namespace std;

compress_parameters::compress_parameters()
    : compress_parameters(engine_caps::query())
{}

compress_parameters::compress_parameters(engine_caps const & caps)
    : caps_{caps},
      level_{caps.default_level()}
{}

compress_parameters &
compress_parameters::set_level(int x)
{
    if ((x < caps_.min_level()) || (x > caps_.max_level()))
        throw invalid_parameter(tostr("compress_parameters::set_level: level ", x,
                                      " outside supported range [", caps_.min_level(), ", ", caps_.max_level(), "]"));

    level_ = x;
    return *this;
}

compress_parameters &
compress_parameters::set_window_log(int x)
{
    if ((x != 0)
        && ((x < caps_.min_window_log()) || (x > caps_.max_window_log())))
    {
        throw invalid_parameter(tostr("compress_parameters::set_window_log: window log ", x,
                                      " outside supported range [", caps_.min_window_log(), ", ", caps_.max_window_log(), "]"));
    }

    window_log_ = x;
    return *this;
}

compress_parameters &
compress_parameters::set_checksum(bool x)
{
    checksum_ = x;
    return *this;
}

compress_parameters &
compress_parameters::set_workers(int x)
{
    if (x < 0)
        throw invalid_parameter(tostr("compress_parameters::set_workers: expected non-negative worker count, got ", x));

    if ((x > 0) && !caps_.multithread())
        throw unsupported_feature(tostr("compress_parameters::set_workers: ", x, " workers requested,",
                                        " but libzstd ", caps_.version_string(), " built without multithreading"));

    if (x > caps_.max_workers())
        throw invalid_parameter(tostr("compress_parameters::set_workers: ", x, " workers exceeds limit ",
                                      caps_.max_workers()));

    workers_ = x;
    return *this;
}

compress_parameters &
compress_parameters::set_pledged_src_size(std::optional<size_type> x)
{
    pledged_src_size_ = x;
    return *this;
}

compress_parameters &
compress_parameters::set_content_size_flag(bool x)
{
    content_size_flag_ = x;
    return *this;
}

compress_parameters &
compress_parameters::set_dictionary(dictionary const & x)
{
    dict_ = x;
    dict_ref_.reset();
    return *this;
}

compress_parameters &
compress_parameters::set_dictionary(std::shared_ptr<encoder_dictionary const> x)
{
    if (!x)
        throw invalid_parameter("compress_parameters::set_dictionary: expected non-null prepared dictionary");

    dict_ = dictionary();
    dict_ref_ = std::move(x);
    return *this;
}

void
compress_parameters::display(std::ostream & os) const
{
    os << "<compress_parameters"
       << " :level " << level_
       << " :window-log " << window_log_
       << " :checksum " << checksum_
       << " :workers " << workers_;
    if (pledged_src_size_)
        os << " :pledged-src-size " << *pledged_src_size_;
    os << " :content-size-flag " << content_size_flag_;
    if (!dict_.empty())
        os << " :dict-size " << dict_.size() << " :dict-id " << dict_.dict_id();
    if (dict_ref_)
        os << " :dict-ref-id " << dict_ref_->dict_id();
    os << ">";
}

decompress_parameters::decompress_parameters()
    : decompress_parameters(engine_caps::query())
{}

decompress_parameters::decompress_parameters(engine_caps const & caps)
    : caps_{caps}
{}

decompress_parameters &
decompress_parameters::set_window_log_max(int x)
{
    if ((x != 0)
        && ((x < caps_.min_window_log_max()) || (x > caps_.max_window_log_max())))
    {
        throw invalid_parameter(tostr("decompress_parameters::set_window_log_max: window log ", x,
                                      " outside supported range [", caps_.min_window_log_max(),
                                      ", ", caps_.max_window_log_max(), "]"));
    }

    window_log_max_ = x;
    return *this;
}

decompress_parameters &
decompress_parameters::set_dictionary(dictionary const & x)
{
    dict_ = x;
    dict_ref_.reset();
    return *this;
}

decompress_parameters &
decompress_parameters::set_dictionary(std::shared_ptr<decoder_dictionary const> x)
{
    if (!x)
        throw invalid_parameter("decompress_parameters::set_dictionary: expected non-null prepared dictionary");

    dict_ = dictionary();
    dict_ref_ = std::move(x);
    return *this;
}

void
decompress_parameters::display(std::ostream & os) const
{
    os << "<decompress_parameters"
       << " :window-log-max " << window_log_max_;
    if (!dict_.empty())
        os << " :dict-size " << dict_.size() << " :dict-id " << dict_.dict_id();
    if (dict_ref_)
        os << " :dict-ref-id " << dict_ref_->dict_id();
    os << ">";
}
