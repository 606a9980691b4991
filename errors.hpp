// 错误码定义
#pragma once

#include <string>
#include <system_error>

enum class zerr {
    ok = 0,

    // 用法/参数错误
    invalid_input_path = 100,
    invalid_output_path,
    input_output_same,
    path_traversal,
    output_exists,
    unknown_algorithm,
    algorithm_not_inferable,
    output_required,
    invalid_buffer_size,

    // 环境错误
    file_not_found = 200,
    file_not_readable,
    directory_not_writable,
    stream_open_failed,
    stream_read_failed,
    stream_write_failed,

    // 编解码错误
    codec_init_failed = 300,
    codec_failed,
    codec_stalled,

    // 未分类错误
    command_failed = 900,
};

// 错误来源
enum class err_origin {
    NONE,
    USAGE,
    ENVIRONMENT,
    CODEC,
    UNEXPECTED,
};

const std::error_category &zpump_category() noexcept;

std::error_code make_error_code(zerr e) noexcept;

namespace std {
template <>
struct is_error_code_enum<zerr> : true_type {};
}

err_origin origin_of(const std::error_code &ec);

// 一次操作的失败结果，code为空表示成功
struct failure {
    std::error_code code;
    std::string subject;   // 相关路径或算法名
    std::string reason;    // 底层原因
    std::string command;   // 仅未分类错误携带

    failure() = default;
    failure(zerr e, std::string subject = {}, std::string reason = {})
    : code(e), subject(std::move(subject)), reason(std::move(reason)) {}

    explicit operator bool() const { return static_cast<bool>(code); }
    bool is(zerr e) const { return code == e; }

    // 面向用户的单行消息
    std::string message() const;
};
