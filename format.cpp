#include <base.hpp>

#include "format.hpp"
#include "zpump.hpp"

using namespace std;

Name2Fmt name2fmt;
Fmt2Name fmt2name;
Name2Level name2level;

// 算法名同时也是文件扩展名
const char *Fmt2Name::operator[](format_t fmt) {
    switch (fmt) {
        case GZIP:
            return "gzip";
        case ZOPFLI:
            return "zopfli";
        case ZLIB:
            return "zlib";
        case XZ:
            return "xz";
        case LZMA:
            return "lzma";
        case BZIP2:
            return "bzip2";
        case LZ4:
            return "lz4";
        default:
            return "raw";
    }
}

format_t Name2Fmt::operator[](std::string_view name) {
    for (int fmt = GZIP; fmt < FMT_END; ++fmt) {
        if (str_iequals(name, fmt2name[(format_t) fmt]))
            return (format_t) fmt;
    }
    return UNKNOWN;
}

static const level_preset presets[] = {
    { "fast",     LZ4,  FAST_BUFFER_SIZE },
    { "balanced", GZIP, DEFAULT_BUFFER_SIZE },
    { "best",     XZ,   DEFAULT_BUFFER_SIZE },
};

const level_preset &get_preset(level_t level) {
    return presets[level];
}

bool Name2Level::operator()(std::string_view name, level_t &level) {
    for (int i = FAST; i <= BEST; ++i) {
        if (str_iequals(name, presets[i].name)) {
            level = (level_t) i;
            return true;
        }
    }
    return false;
}
