// buffered_compress_zengine.cpp

#include "zstdsafe/buffered_compress_zengine.hpp"

using namespace std;

step_result
buffered_compress_zengine::compress_chunk(directive d)
{
    if (zs_algo_.have_input() || (d != directive::e_continue)) {
        chunk_result x = zs_algo_.compress_chunk(d);

        uc_in_buf_.consume(uc_in_buf_.contents().prefix(x.consumed.size()));
        z_out_buf_.produce(x.produced);

        return step_result{ x.consumed.size(), x.produced.size(), x.hint };
    } else {
        return step_result();
    }
}
