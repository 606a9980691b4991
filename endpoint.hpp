// 输入输出端点
#pragma once

#include <string>
#include <variant>

struct stdin_tag {};
struct stdout_tag {};

struct file_path {
    std::string path;
};

using input_source = std::variant<file_path, stdin_tag>;
using output_destination = std::variant<file_path, stdout_tag>;

// 文件端点返回路径，标准流返回nullptr
template <class Endpoint>
const std::string *path_of(const Endpoint &ep) {
    auto f = std::get_if<file_path>(&ep);
    return f ? &f->path : nullptr;
}

static inline std::string describe(const input_source &src) {
    auto p = path_of(src);
    return p ? *p : "stdin";
}

static inline std::string describe(const output_destination &dst) {
    auto p = path_of(dst);
    return p ? *p : "stdout";
}
