#include <cerrno>
#include <cstring>
#include <memory>

#include <base.hpp>

#include "pump.hpp"
#include "zpump.hpp"

using namespace std;

failure pump(stream &in, stream &out, const codec_entry &entry, codec_mode mode,
             level_t level, size_t buffer_size, pump_stats *stats) {
    if (buffer_size == 0 || buffer_size > MAX_BUFFER_SIZE)
        return failure(zerr::invalid_buffer_size, to_string(buffer_size));

    pump_stats local;
    pump_stats &st = stats ? *stats : local;
    st = pump_stats();

    auto src_buf = make_unique<uint8_t[]>(buffer_size);
    auto dst_buf = make_unique<uint8_t[]>(buffer_size);

    string err;
    codec_ptr cd = entry.factory(mode, level, err);
    if (!cd)
        return failure(zerr::codec_init_failed, entry.name, err);

    codec_window w { src_buf.get(), 0, dst_buf.get(), buffer_size };
    bool eof = false;
    for (;;) {
        if (w.src_sz == 0 && !eof) {
            ssize_t n = in.read(src_buf.get(), buffer_size);
            if (n < 0)
                return failure(zerr::stream_read_failed, {}, strerror(errno));
            eof = n == 0;
            st.bytes_in += n;
            w.src = src_buf.get();
            w.src_sz = n;
        }

        size_t src_before = w.src_sz;
        codec_status status = cd->process(w, eof);
        if (status == codec_status::ERROR)
            return failure(zerr::codec_failed, entry.name, cd->reason());

        size_t produced = buffer_size - w.dst_sz;
        if (produced) {
            ssize_t n = out.write(dst_buf.get(), produced);
            if (n < 0)
                return failure(zerr::stream_write_failed, {}, strerror(errno));
            if (static_cast<size_t>(n) != produced)
                return failure(zerr::stream_write_failed, {},
                               ssprintf("short write (%zd of %zu bytes)", n, produced));
            st.bytes_out += produced;
        }
        w.dst = dst_buf.get();
        w.dst_sz = buffer_size;

        if (status == codec_status::END) {
            // 流结束后不允许还有剩余输入
            if (w.src_sz == 0 && !eof) {
                ssize_t n = in.read(src_buf.get(), buffer_size);
                if (n < 0)
                    return failure(zerr::stream_read_failed, {}, strerror(errno));
                st.bytes_in += n;
                w.src_sz = n;
            }
            if (w.src_sz > 0)
                return failure(zerr::codec_failed, entry.name, "trailing data after end of stream");
            break;
        }
        // 没有消耗也没有产出，再调用也不会结束
        if (w.src_sz == src_before && produced == 0)
            return failure(zerr::codec_stalled, entry.name);
    }

    LOGD("%s %s: %llu bytes in, %llu bytes out\n", entry.name.data(),
         mode == codec_mode::ENCODE ? "encode" : "decode",
         (unsigned long long) st.bytes_in, (unsigned long long) st.bytes_out);
    return {};
}
