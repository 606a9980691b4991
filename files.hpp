// 文件与标准流访问
#pragma once

#include <cstdint>
#include <string>
#include <system_error>

#include <stream.hpp>

#include "endpoint.hpp"

class file_handler {
public:
    virtual ~file_handler() = default;

    virtual bool exists(const std::string &path) = 0;
    virtual bool readable(const std::string &path) = 0;
    virtual bool writable(const std::string &path) = 0;
    virtual std::error_code size(const std::string &path, int64_t &size) = 0;

    virtual std::error_code open_input(const input_source &src, stream_ptr &strm) = 0;
    // 文件已存在时截断
    virtual std::error_code open_output(const output_destination &dst, stream_ptr &strm) = 0;

    virtual std::error_code remove(const std::string &path) = 0;
    // 只删除空目录
    virtual std::error_code remove_dir(const std::string &path) = 0;
    // 逐级创建目录
    virtual std::error_code mkdirs(const std::string &path) = 0;
};

// 基于POSIX调用的实现
class fs_handler : public file_handler {
public:
    bool exists(const std::string &path) override;
    bool readable(const std::string &path) override;
    bool writable(const std::string &path) override;
    std::error_code size(const std::string &path, int64_t &size) override;

    std::error_code open_input(const input_source &src, stream_ptr &strm) override;
    std::error_code open_output(const output_destination &dst, stream_ptr &strm) override;

    std::error_code remove(const std::string &path) override;
    std::error_code remove_dir(const std::string &path) override;
    std::error_code mkdirs(const std::string &path) override;
};
