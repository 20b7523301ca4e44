// dictionary.cpp

#include "zstdsafe/dictionary.hpp"
#include "zstdsafe/zsafe.hpp"
#include "zstdsafe/zstd_error.hpp"
#include "zstdsafe/tostr.hpp"
#include <zstd.h>
#include <zdict.h>
#include <fstream>
#include <iterator>
#include <numeric>
#include <stdexcept>

using namespace std;

namespace {
    vector<uint8_t>
    read_file(string const & path)
    {
        ifstream fs(path, ios::in|ios::binary);
        if (!fs)
            throw std::runtime_error(tostr("dictionary: unable to open input file [", path, "]"));

        vector<uint8_t> retval((istreambuf_iterator<char>(fs)),
                               istreambuf_iterator<char>());

        if (fs.bad())
            throw std::runtime_error(tostr("dictionary: failed reading [", path, "]"));

        return retval;
    }

    /* true iff @p dict starts with the zstd dictionary magic number;  such content
     * must parse as a zstd dictionary,  anything else is loaded as raw content
     */
    bool
    has_dictionary_header(dictionary const & dict)
    {
        if (dict.size() < 4)
            return false;

        uint8_t const * p = dict.data();
        uint32_t magic = (uint32_t(p[0])
                          | (uint32_t(p[1]) << 8)
                          | (uint32_t(p[2]) << 16)
                          | (uint32_t(p[3]) << 24));

        return magic == ZSTD_MAGIC_DICTIONARY;
    }

    /* native dictionary digest returned null:  either malformed content,  or out of memory */
    [[noreturn]] void
    raise_dict_failure(dictionary const & dict, char const * ctx)
    {
        if (has_dictionary_header(dict))
            throw invalid_parameter(tostr(ctx, " failed: malformed zstd dictionary",
                                          " :dict-size ", dict.size(), " :dict-id ", dict.dict_id()));

        /* raw content is never rejected */
        throw allocation_error(tostr(ctx, " failed: out of memory :dict-size ", dict.size()));
    }
}

dictionary::dictionary(vector<uint8_t> bytes)
    : bytes_{make_shared<vector<uint8_t> const>(std::move(bytes))}
{}

dictionary
dictionary::copy_of(cbyte_span const & bytes)
{
    return dictionary(vector<uint8_t>(bytes.lo(), bytes.hi()));
}

dictionary
dictionary::from_file(string const & path)
{
    return dictionary(read_file(path));
}

dictionary
dictionary::train(vector<vector<uint8_t>> const & samples,
                  size_type max_z)
{
    vector<uint8_t> data;
    vector<size_t> sizes;

    sizes.reserve(samples.size());
    for (vector<uint8_t> const & s : samples) {
        data.insert(data.end(), s.begin(), s.end());
        sizes.push_back(s.size());
    }

    return train_from_continuous(data, sizes, max_z);
}

dictionary
dictionary::train_from_continuous(vector<uint8_t> const & data,
                                  vector<size_t> const & sample_sizes,
                                  size_type max_z)
{
    size_t total_z = std::accumulate(sample_sizes.begin(), sample_sizes.end(), size_t(0));

    if (total_z != data.size())
        throw invalid_parameter(tostr("dictionary::train_from_continuous: sample sizes add up to ", total_z,
                                      ", expected ", data.size()));

    if (max_z == 0)
        throw invalid_parameter("dictionary::train_from_continuous: expected non-zero max dictionary size");

    vector<uint8_t> dict_v(max_z);

    size_t dict_z = ::ZDICT_trainFromBuffer(dict_v.data(),
                                            dict_v.size(),
                                            data.data(),
                                            sample_sizes.data(),
                                            static_cast<unsigned>(sample_sizes.size()));

    /* ZDICT errors share zstd's error-code space */
    if (::ZDICT_isError(dict_z))
        zsafe::raise(dict_z, "dictionary::train_from_continuous: ZDICT_trainFromBuffer");

    dict_v.resize(dict_z);

    return dictionary(std::move(dict_v));
}

dictionary
dictionary::train_from_files(vector<string> const & paths,
                             size_type max_z)
{
    vector<uint8_t> data;
    vector<size_t> sizes;

    for (string const & path : paths) {
        vector<uint8_t> contents = read_file(path);

        data.insert(data.end(), contents.begin(), contents.end());
        sizes.push_back(contents.size());
    }

    return train_from_continuous(data, sizes, max_z);
}

unsigned
dictionary::dict_id() const
{
    if (this->empty())
        return 0;

    return ::ZSTD_getDictID_fromDict(this->data(), this->size());
}

encoder_dictionary::encoder_dictionary(dictionary const & dict, int level)
    : level_{level},
      native_{::ZSTD_createCDict(dict.data(), dict.size(), level)}
{
    if (!native_)
        raise_dict_failure(dict, "encoder_dictionary: ZSTD_createCDict");
}

unsigned
encoder_dictionary::dict_id() const
{
    return ::ZSTD_getDictID_fromCDict(native_.get());
}

decoder_dictionary::decoder_dictionary(dictionary const & dict)
    : native_{::ZSTD_createDDict(dict.data(), dict.size())}
{
    if (!native_)
        raise_dict_failure(dict, "decoder_dictionary: ZSTD_createDDict");
}

unsigned
decoder_dictionary::dict_id() const
{
    return ::ZSTD_getDictID_fromDDict(native_.get());
}
