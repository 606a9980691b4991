// 分块编解码引擎
#pragma once

#include <cstdint>

#include <stream.hpp>

#include "errors.hpp"
#include "registry.hpp"

// 每次调用开始时清零
struct pump_stats {
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
};

// 从in读到EOF，经编解码后全部写入out。不关闭任何一个流。
// 编解码器结束后输入还有剩余数据时报codec_failed。
// 内存占用只有两个buffer_size大小的缓冲区，与输入大小无关。
failure pump(stream &in, stream &out, const codec_entry &entry, codec_mode mode,
             level_t level, size_t buffer_size, pump_stats *stats = nullptr);
