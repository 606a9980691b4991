// compress/decompress命令流程
#pragma once

#include <optional>
#include <string>

#include "endpoint.hpp"
#include "errors.hpp"
#include "files.hpp"
#include "format.hpp"
#include "registry.hpp"

struct compress_opts {
    input_source input;
    std::string algorithm;                      // 为空时使用预设推荐的算法
    std::optional<output_destination> output;   // 为空时使用<input>.<algorithm>
    level_t level = BALANCED;
    size_t buffer_size = 0;                     // 0表示使用预设的大小
    bool force = false;
    bool progress = false;
};

struct decompress_opts {
    input_source input;
    std::string algorithm;                      // 为空时根据扩展名推断
    std::optional<output_destination> output;   // 为空时去掉扩展名
    size_t buffer_size = 0;                     // 0表示64KB
    bool force = false;
    bool progress = false;
};

class progress_reporter;

// 命令依赖的外部组件
struct cmd_context {
    const registry &reg;
    file_handler &files;
    bool stderr_tty = false;
    progress_reporter *reporter = nullptr;      // 非空时代替make_reporter的选择
};

// 失败时不会留下不完整的输出文件
failure run_compress(const compress_opts &opts, const cmd_context &ctx);
failure run_decompress(const decompress_opts &opts, const cmd_context &ctx);
