// buffered_decompress_zengine.cpp

#include "zstdsafe/buffered_decompress_zengine.hpp"

using namespace std;

step_result
buffered_decompress_zengine::decompress_chunk()
{
    if (!this->work_pending())
        return step_result{0, 0, mid_frame_flag_ ? 1u : 0u};

    chunk_result x = zs_algo_.decompress_chunk();

    z_in_buf_.consume(z_in_buf_.contents().prefix(x.consumed.size()));
    uc_out_buf_.produce(x.produced);

    output_pending_flag_ = zs_algo_.output_empty();

    if (x.hint == 0) {
        mid_frame_flag_ = false;
    } else if (x.consumed.size() > 0) {
        mid_frame_flag_ = true;
    }

    return step_result{ x.consumed.size(), x.produced.size(), x.hint };
}
