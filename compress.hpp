// 编解码接口定义
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "format.hpp"

enum class codec_mode {
    ENCODE,
    DECODE,
};

enum class codec_status {
    OK,     // 可以继续
    END,    // 流已结束
    ERROR,  // 数据损坏或不兼容
};

// 一次process的输入输出窗口，处理后指针前移、大小减少
struct codec_window {
    const uint8_t *src;
    size_t src_sz;
    uint8_t *dst;
    size_t dst_sz;
};

// 有状态的编解码会话，析构即释放底层资源
class codec {
public:
    explicit codec(codec_mode mode) : mode(mode) {}
    virtual ~codec() = default;
    codec(const codec &) = delete;
    codec &operator=(const codec &) = delete;

    // finalize表示不会再有输入
    codec_status process(codec_window &w, bool finalize);

    // 最近一次ERROR的原因
    const std::string &reason() const { return err; }

protected:
    virtual codec_status do_process(codec_window &w, bool finalize) = 0;

    codec_status fail(std::string msg);

    static void advance(codec_window &w, size_t consumed, size_t produced) {
        w.src += consumed;
        w.src_sz -= consumed;
        w.dst += produced;
        w.dst_sz -= produced;
    }

    const codec_mode mode;

private:
    std::string err;
    codec_status state = codec_status::OK;
    bool fed = false;
};

using codec_ptr = std::unique_ptr<codec>;

// 初始化失败返回nullptr，原因写入err
codec_ptr make_codec(format_t fmt, codec_mode mode, level_t level, std::string &err);
