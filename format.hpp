// 压缩格式与压缩级别定义
#pragma once

#include <cstddef>
#include <string_view>

// 压缩格式枚举
typedef enum {
    UNKNOWN,        // 未知格式
    GZIP,           // Gzip压缩
    ZOPFLI,         // Zopfli压缩（gzip兼容）
    ZLIB,           // zlib封装的deflate
    XZ,             // XZ压缩
    LZMA,           // LZMA遗留格式
    BZIP2,          // Bzip2压缩
    LZ4,            // LZ4帧格式
    FMT_END,
} format_t;

// 压缩级别预设
typedef enum {
    FAST,       // 速度优先
    BALANCED,   // 默认
    BEST,       // 压缩率优先
} level_t;

// 预设对应的推荐格式和缓冲区大小
struct level_preset {
    const char *name;
    format_t fmt;
    size_t buffer_size;
};

class Fmt2Name {
public:
    const char *operator[](format_t fmt);
};

class Name2Fmt {
public:
    // 忽略大小写
    format_t operator[](std::string_view name);
};

class Name2Level {
public:
    // 不认识的名字返回false
    bool operator()(std::string_view name, level_t &level);
};

const level_preset &get_preset(level_t level);

extern Name2Fmt name2fmt;
extern Fmt2Name fmt2name;
extern Name2Level name2level;
