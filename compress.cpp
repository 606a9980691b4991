// 压缩/解压缩实现文件，支持多种压缩格式
#include <algorithm>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <zlib.h>
#include <bzlib.h>
#include <lzma.h>
#include <lz4frame.h>
#include <lz4hc.h>
#include <zopfli/util.h>
#include <zopfli/deflate.h>

#include <base.hpp>

#include "compress.hpp"

using namespace std;

codec_status codec::process(codec_window &w, bool finalize) {
    if (state != codec_status::OK)
        return state;

    // 从未收到输入的解码器直接结束，空输入解码为空输出
    if (mode == codec_mode::DECODE && finalize && !fed && w.src_sz == 0)
        return state = codec_status::END;

    size_t src_before = w.src_sz;
    size_t dst_before = w.dst_sz;
    codec_status ret = do_process(w, finalize);
    if (w.src_sz != src_before)
        fed = true;

    // 输入已耗尽且没有任何进展，说明流被截断
    if (ret == codec_status::OK && mode == codec_mode::DECODE && finalize &&
        src_before == 0 && w.dst_sz == dst_before)
        ret = fail("unexpected end of stream");

    state = ret;
    return ret;
}

codec_status codec::fail(string msg) {
    LOGD("codec error: %s\n", msg.data());
    err = std::move(msg);
    return codec_status::ERROR;
}

static int zlib_level(level_t level) {
    switch (level) {
        case FAST: return 1;
        case BEST: return 9;
        default:   return 6;
    }
}

// zlib/gzip会话
class gz_codec : public codec {
public:
    gz_codec(codec_mode mode, bool gzip) : codec(mode), gzip(gzip), strm{} {}

    ~gz_codec() override {
        if (!ready)
            return;
        switch (mode) {
        case codec_mode::DECODE:
            inflateEnd(&strm);     // 结束解压缩
            break;
        case codec_mode::ENCODE:
            deflateEnd(&strm);     // 结束压缩
            break;
        }
    }

    bool init(level_t level, string &err) {
        int wbits = gzip ? 15 | 16 : 15;  // 16表示gzip封装
        int code;
        switch (mode) {
        case codec_mode::DECODE:
            code = inflateInit2(&strm, wbits);
            break;
        case codec_mode::ENCODE:
        default:
            code = deflateInit2(&strm, zlib_level(level), Z_DEFLATED, wbits, 8, Z_DEFAULT_STRATEGY);
            break;
        }
        if (code != Z_OK) {
            err = ssprintf("zlib init failed (%d)", code);
            return false;
        }
        ready = true;
        return true;
    }

protected:
    codec_status do_process(codec_window &w, bool finalize) override {
        // gzip成员之间，后面没有数据就结束
        if (member_end) {
            if (w.src_sz == 0)
                return finalize ? codec_status::END : codec_status::OK;
            if (trailing || w.src[0] != 0x1f) {
                if (!trailing)
                    LOGW("gzip: trailing garbage ignored\n");
                trailing = true;
                advance(w, w.src_sz, 0);
                return codec_status::OK;
            }
            member_end = false;
        }

        uInt in_sz = static_cast<uInt>(std::min<size_t>(w.src_sz, UINT_MAX));
        uInt out_sz = static_cast<uInt>(std::min<size_t>(w.dst_sz, UINT_MAX));
        strm.next_in = const_cast<Bytef *>(w.src);
        strm.avail_in = in_sz;
        strm.next_out = w.dst;
        strm.avail_out = out_sz;

        int code;
        switch (mode) {
            case codec_mode::DECODE:
                code = inflate(&strm, Z_NO_FLUSH);                          // 执行解压缩
                break;
            case codec_mode::ENCODE:
            default:
                code = deflate(&strm, finalize ? Z_FINISH : Z_NO_FLUSH);    // 执行压缩
                break;
        }
        advance(w, in_sz - strm.avail_in, out_sz - strm.avail_out);

        switch (code) {
        case Z_OK:
        case Z_BUF_ERROR:
            return codec_status::OK;
        case Z_STREAM_END:
            if (mode == codec_mode::DECODE && gzip) {
                // 可能还有下一个gzip成员
                inflateReset(&strm);
                member_end = true;
                if (w.src_sz == 0 && finalize)
                    return codec_status::END;
                return codec_status::OK;
            }
            return codec_status::END;
        default:
            return fail(ssprintf("%s %s failed (%d)%s%s", gzip ? "gzip" : "zlib",
                                 mode == codec_mode::ENCODE ? "encode" : "decode", code,
                                 strm.msg ? ": " : "", strm.msg ? strm.msg : ""));
        }
    }

private:
    bool gzip;
    bool ready = false;
    bool member_end = false;
    bool trailing = false;
    z_stream strm;           // zlib流结构
};

// Zopfli编码器（高压缩比的gzip兼容压缩器）
class zopfli_codec : public codec {
public:
    zopfli_codec() : codec(codec_mode::ENCODE), zo{}, crc(crc32(0L, Z_NULL, 0)) {}

    ~zopfli_codec() override {
        free(out);             // 释放内存
    }

    bool init(level_t level, string &err) {
        ZopfliInitOptions(&zo);
        switch (level) {
            case FAST:
                zo.numiterations = 1;   // 已经比gzip -9更好
                break;
            case BEST:
                zo.numiterations = 15;
                break;
            default:
                zo.numiterations = 5;
                break;
        }
        zo.blocksplitting = level == BEST;

        in_buf.reset(new (nothrow) uint8_t[ZOPFLI_MASTER_BLOCK_SIZE]);
        if (!in_buf) {
            err = "out of memory";
            return false;
        }

        // 写入gzip头部
        ZOPFLI_APPEND_DATA(31, &out, &outsize);  /* ID1 */
        ZOPFLI_APPEND_DATA(139, &out, &outsize); /* ID2 */
        ZOPFLI_APPEND_DATA(8, &out, &outsize);   /* CM */
        ZOPFLI_APPEND_DATA(0, &out, &outsize);   /* FLG */
        /* MTIME */
        ZOPFLI_APPEND_DATA(0, &out, &outsize);
        ZOPFLI_APPEND_DATA(0, &out, &outsize);
        ZOPFLI_APPEND_DATA(0, &out, &outsize);
        ZOPFLI_APPEND_DATA(0, &out, &outsize);

        ZOPFLI_APPEND_DATA(2, &out, &outsize);  /* XFL, 2表示最佳压缩 */
        ZOPFLI_APPEND_DATA(3, &out, &outsize);  /* OS遵循Unix约定 */
        return true;
    }

protected:
    codec_status do_process(codec_window &w, bool finalize) override {
        for (;;) {
            // 未结束时保留最后一个字节，Zopfli会继续往里面写位
            size_t avail = done ? outsize : outsize - 1;
            size_t n = std::min(avail - out_pos, w.dst_sz);
            memcpy(w.dst, out + out_pos, n);
            out_pos += n;
            advance(w, 0, n);
            if (out_pos < avail)
                return codec_status::OK;  // 输出窗口已满
            if (done)
                return codec_status::END;
            if (out_pos != 0) {
                out[0] = out[outsize - 1];
                outsize = 1;
                out_pos = 0;
            }

            size_t take = std::min(w.src_sz, ZOPFLI_MASTER_BLOCK_SIZE - in_len);
            memcpy(in_buf.get() + in_len, w.src, take);
            in_len += take;
            advance(w, take, 0);

            if (in_len == ZOPFLI_MASTER_BLOCK_SIZE) {
                deflate_block(false);
            } else if (w.src_sz == 0 && finalize) {
                deflate_block(true);
                append_trailer();
                done = true;
            } else {
                return codec_status::OK;
            }
        }
    }

private:
    ZopfliOptions zo;                  // Zopfli选项
    unique_ptr<uint8_t[]> in_buf;      // 暂存一个主块的输入
    size_t in_len = 0;
    unsigned char *out = nullptr;      // 输出缓冲区
    size_t outsize = 0;                // 输出大小
    size_t out_pos = 0;                // 已交给调用者的位置
    unsigned long crc;                 // CRC校验和
    uint32_t in_total = 0;             // 输入总大小
    unsigned char bp = 0;              // 位位置
    bool done = false;

    void deflate_block(bool final) {
        in_total += in_len;                             // 累计输入大小
        crc = crc32(crc, in_buf.get(), in_len);         // 更新CRC校验和
        // 使用Zopfli压缩数据
        ZopfliDeflatePart(&zo, 2, final, in_buf.get(), 0, in_len, &bp, &out, &outsize);
        in_len = 0;
    }

    void append_trailer() {
        /* CRC校验和 */
        ZOPFLI_APPEND_DATA(crc % 256, &out, &outsize);
        ZOPFLI_APPEND_DATA((crc >> 8) % 256, &out, &outsize);
        ZOPFLI_APPEND_DATA((crc >> 16) % 256, &out, &outsize);
        ZOPFLI_APPEND_DATA((crc >> 24) % 256, &out, &outsize);

        /* ISIZE 原始数据大小 */
        ZOPFLI_APPEND_DATA(in_total % 256, &out, &outsize);
        ZOPFLI_APPEND_DATA((in_total >> 8) % 256, &out, &outsize);
        ZOPFLI_APPEND_DATA((in_total >> 16) % 256, &out, &outsize);
        ZOPFLI_APPEND_DATA((in_total >> 24) % 256, &out, &outsize);
    }
};

// bzip2会话
class bz_codec : public codec {
public:
    explicit bz_codec(codec_mode mode) : codec(mode), strm{} {}

    ~bz_codec() override {
        if (!ready)
            return;
        switch (mode) {
            case codec_mode::DECODE:
                BZ2_bzDecompressEnd(&strm);   // 结束解压缩
                break;
            case codec_mode::ENCODE:
                BZ2_bzCompressEnd(&strm);     // 结束压缩
                break;
        }
    }

    bool init(level_t level, string &err) {
        int code;
        switch (mode) {
        case codec_mode::DECODE:
            code = BZ2_bzDecompressInit(&strm, 0, 0);  // 初始化bzip2解压缩
            break;
        case codec_mode::ENCODE:
        default:
            // 块大小 100k-900k
            code = BZ2_bzCompressInit(&strm, level == FAST ? 1 : level == BEST ? 9 : 6, 0, 0);
            break;
        }
        if (code != BZ_OK) {
            err = ssprintf("bzip2 init failed (%d)", code);
            return false;
        }
        ready = true;
        return true;
    }

protected:
    codec_status do_process(codec_window &w, bool finalize) override {
        // BZ_RUN不接受空输入
        if (mode == codec_mode::ENCODE && !finalize && w.src_sz == 0)
            return codec_status::OK;

        // 两个bzip2流之间，后面没有数据就结束
        if (stream_end) {
            if (w.src_sz == 0)
                return finalize ? codec_status::END : codec_status::OK;
            if (w.src[0] != 'B')
                return fail("bzip2 decode failed: trailing data after end of stream");
            BZ2_bzDecompressEnd(&strm);
            strm = bz_stream{};
            int code = BZ2_bzDecompressInit(&strm, 0, 0);
            if (code != BZ_OK) {
                ready = false;
                return fail(ssprintf("bzip2 init failed (%d)", code));
            }
            stream_end = false;
        }

        unsigned in_sz = static_cast<unsigned>(std::min<size_t>(w.src_sz, UINT_MAX));
        unsigned out_sz = static_cast<unsigned>(std::min<size_t>(w.dst_sz, UINT_MAX));
        strm.next_in = reinterpret_cast<char *>(const_cast<uint8_t *>(w.src));
        strm.avail_in = in_sz;
        strm.next_out = reinterpret_cast<char *>(w.dst);
        strm.avail_out = out_sz;

        int code;
        switch (mode) {
        case codec_mode::DECODE:
            code = BZ2_bzDecompress(&strm);                                  // 执行解压缩
            break;
        case codec_mode::ENCODE:
        default:
            code = BZ2_bzCompress(&strm, finalize ? BZ_FINISH : BZ_RUN);    // 执行压缩
            break;
        }
        advance(w, in_sz - strm.avail_in, out_sz - strm.avail_out);

        if (code < 0) {
            return fail(ssprintf("bzip2 %s failed (%d)",
                                 mode == codec_mode::ENCODE ? "encode" : "decode", code));
        }
        if (code != BZ_STREAM_END)
            return codec_status::OK;
        if (mode == codec_mode::DECODE) {
            // 可能还有下一个bzip2流
            stream_end = true;
            if (w.src_sz == 0 && finalize)
                return codec_status::END;
            return codec_status::OK;
        }
        return codec_status::END;
    }

private:
    bool ready = false;
    bool stream_end = false;
    bz_stream strm;        // bzip2流结构
};

// LZMA/XZ会话
class lzma_codec : public codec {
public:
    lzma_codec(codec_mode mode, bool xz) : codec(mode), xz(xz), strm(LZMA_STREAM_INIT) {}

    ~lzma_codec() override {
        lzma_end(&strm);                    // 结束LZMA流
    }

    bool init(level_t level, string &err) {
        lzma_options_lzma opt;

        // 初始化预设
        if (lzma_lzma_preset(&opt, level == FAST ? 1 : level == BEST ? 9 : 6)) {
            err = "LZMA preset is not supported";
            return false;
        }
        lzma_filter filters[] = {
            { .id = LZMA_FILTER_LZMA2, .options = &opt },
            { .id = LZMA_VLI_UNKNOWN, .options = nullptr },
        };

        lzma_ret code;
        if (mode == codec_mode::DECODE) {
            // 多个xz流首尾相接时依次解码
            code = xz ? lzma_stream_decoder(&strm, UINT64_MAX, LZMA_CONCATENATED)
                      : lzma_alone_decoder(&strm, UINT64_MAX);      // LZMA格式解码
        } else {
            code = xz ? lzma_stream_encoder(&strm, filters, LZMA_CHECK_CRC32)  // XZ格式编码
                      : lzma_alone_encoder(&strm, &opt);                       // LZMA格式编码
        }
        if (code != LZMA_OK) {
            err = ssprintf("LZMA initialization failed (%d)", code);
            return false;
        }
        return true;
    }

protected:
    codec_status do_process(codec_window &w, bool finalize) override {
        strm.next_in = w.src;
        strm.avail_in = w.src_sz;
        strm.next_out = w.dst;
        strm.avail_out = w.dst_sz;
        lzma_ret code = lzma_code(&strm, finalize ? LZMA_FINISH : LZMA_RUN);  // 执行LZMA操作
        advance(w, w.src_sz - strm.avail_in, w.dst_sz - strm.avail_out);

        switch (code) {
        case LZMA_OK:
            return codec_status::OK;
        case LZMA_STREAM_END:
            return codec_status::END;
        case LZMA_BUF_ERROR:
            // 没有进展；输入耗尽时由基类判定为截断
            return codec_status::OK;
        case LZMA_FORMAT_ERROR:
            return fail(ssprintf("%s decode failed: file format not recognized", xz ? "xz" : "lzma"));
        case LZMA_DATA_ERROR:
            return fail(ssprintf("%s decode failed: compressed data is corrupt", xz ? "xz" : "lzma"));
        default:
            return fail(ssprintf("%s %s failed (%d)", xz ? "xz" : "lzma",
                                 mode == codec_mode::ENCODE ? "encode" : "decode", code));
        }
    }

private:
    bool xz;
    lzma_stream strm;       // LZMA流结构
};

// LZ4F解码器
class lz4_decoder : public codec {
public:
    lz4_decoder() : codec(codec_mode::DECODE), ctx(nullptr) {}

    ~lz4_decoder() override {
        LZ4F_freeDecompressionContext(ctx);  // 释放解压缩上下文
    }

    bool init(level_t, string &err) {
        // 创建LZ4F解压缩上下文
        LZ4F_errorCode_t code = LZ4F_createDecompressionContext(&ctx, LZ4F_VERSION);
        if (LZ4F_isError(code)) {
            err = LZ4F_getErrorName(code);
            return false;
        }
        return true;
    }

protected:
    codec_status do_process(codec_window &w, bool finalize) override {
        // 两个帧之间，后面没有数据就结束
        if (frame_end && w.src_sz == 0)
            return finalize ? codec_status::END : codec_status::OK;
        frame_end = false;

        size_t read = w.src_sz;
        size_t write = w.dst_sz;
        // 执行LZ4F解压缩，返回值是下一次期望的输入大小
        size_t hint = LZ4F_decompress(ctx, w.dst, &write, w.src, &read, nullptr);
        if (LZ4F_isError(hint))
            return fail(ssprintf("LZ4F decode error: %s", LZ4F_getErrorName(hint)));
        advance(w, read, write);
        if (hint == 0) {
            // 帧结束，上下文自动重置，可以继续解码下一帧
            frame_end = true;
            if (w.src_sz == 0 && finalize)
                return codec_status::END;
        }
        return codec_status::OK;
    }

private:
    LZ4F_decompressionContext_t ctx;  // LZ4F解压缩上下文
    bool frame_end = false;
};

// LZ4F编码器
class lz4_encoder : public codec {
public:
    lz4_encoder() : codec(codec_mode::ENCODE), ctx(nullptr), prefs{} {}

    ~lz4_encoder() override {
        LZ4F_freeCompressionContext(ctx);  // 释放压缩上下文
    }

    bool init(level_t level, string &err) {
        LZ4F_errorCode_t code = LZ4F_createCompressionContext(&ctx, LZ4F_VERSION);
        if (LZ4F_isError(code)) {
            err = LZ4F_getErrorName(code);
            return false;
        }
        prefs.frameInfo.blockSizeID = LZ4F_max64KB;                            // 64KB块
        prefs.frameInfo.blockMode = LZ4F_blockIndependent;                     // 独立块模式
        prefs.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;     // 启用内容校验和
        prefs.frameInfo.blockChecksumFlag = LZ4F_noBlockChecksum;              // 不使用块校验和
        prefs.compressionLevel = level == FAST ? 0 : level == BEST ? LZ4HC_CLEVEL_DEFAULT : 4;
        prefs.autoFlush = 1;                                                   // 自动刷新

        capacity = LZ4F_compressBound(BLOCK_SZ, &prefs);  // 同时覆盖帧头和帧尾
        pending.reset(new (nothrow) uint8_t[capacity]);
        if (!pending) {
            err = "out of memory";
            return false;
        }
        return true;
    }

protected:
    codec_status do_process(codec_window &w, bool finalize) override {
        for (;;) {
            size_t n = std::min(pending_len - pending_pos, w.dst_sz);
            memcpy(w.dst, pending.get() + pending_pos, n);
            pending_pos += n;
            advance(w, 0, n);
            if (pending_pos < pending_len)
                return codec_status::OK;  // 输出窗口已满
            if (ended)
                return codec_status::END;
            pending_pos = pending_len = 0;

            size_t ret;
            if (!begun) {
                ret = LZ4F_compressBegin(ctx, pending.get(), capacity, &prefs);  // 开始压缩
                begun = true;
            } else if (w.src_sz > 0) {
                size_t take = std::min(w.src_sz, BLOCK_SZ);
                // 压缩数据块
                ret = LZ4F_compressUpdate(ctx, pending.get(), capacity, w.src, take, nullptr);
                if (!LZ4F_isError(ret))
                    advance(w, take, 0);
            } else if (finalize) {
                ret = LZ4F_compressEnd(ctx, pending.get(), capacity, nullptr);  // 结束压缩
                ended = true;
            } else {
                return codec_status::OK;
            }
            if (LZ4F_isError(ret))
                return fail(ssprintf("LZ4F encode error: %s", LZ4F_getErrorName(ret)));
            pending_len = ret;
        }
    }

private:
    LZ4F_compressionContext_t ctx;  // LZ4F压缩上下文
    LZ4F_preferences_t prefs;
    unique_ptr<uint8_t[]> pending;  // 还没交给调用者的输出
    size_t capacity = 0;
    size_t pending_len = 0;
    size_t pending_pos = 0;
    bool begun = false;
    bool ended = false;

    static constexpr size_t BLOCK_SZ = 1 << 16;  // 64KB块大小
};

template <class T, class... Args>
static codec_ptr init_codec(level_t level, string &err, Args &&...args) {
    auto c = make_unique<T>(std::forward<Args>(args)...);
    if (!c->init(level, err))
        return nullptr;
    return c;
}

// 编解码器工厂函数
codec_ptr make_codec(format_t fmt, codec_mode mode, level_t level, string &err) {
    bool enc = mode == codec_mode::ENCODE;
    switch (fmt) {
        case GZIP:
            return init_codec<gz_codec>(level, err, mode, true);
        case ZLIB:
            return init_codec<gz_codec>(level, err, mode, false);
        case ZOPFLI:
            // Zopfli输出是标准gzip
            if (enc)
                return init_codec<zopfli_codec>(level, err);
            return init_codec<gz_codec>(level, err, mode, true);
        case XZ:
            return init_codec<lzma_codec>(level, err, mode, true);
        case LZMA:
            return init_codec<lzma_codec>(level, err, mode, false);
        case BZIP2:
            return init_codec<bz_codec>(level, err, mode);
        case LZ4:
            if (enc)
                return init_codec<lz4_encoder>(level, err);
            return init_codec<lz4_decoder>(level, err);
        default:
            err = ssprintf("unsupported format (%d)", (int) fmt);
            return nullptr;
    }
}
