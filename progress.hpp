// 进度显示
#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

#include <stream.hpp>

#include "endpoint.hpp"

// total为0表示总大小未知
class progress_reporter {
public:
    virtual ~progress_reporter() = default;
    virtual void update(uint64_t processed, uint64_t total) = 0;
    virtual void set_description(std::string desc) = 0;
    // 结束时清理显示，成功失败都会调用
    virtual void complete() = 0;
};

class silent_reporter : public progress_reporter {
public:
    void update(uint64_t, uint64_t) override {}
    void set_description(std::string) override {}
    void complete() override {}
};

// 在终端上单行刷新：desc: [=====>    ] 45% 5.2 MB/s ETA 00:03
class terminal_reporter : public progress_reporter {
public:
    explicit terminal_reporter(FILE *out = stderr) : out(out) {}

    void update(uint64_t processed, uint64_t total) override;
    void set_description(std::string desc) override { this->desc = std::move(desc); }
    void complete() override;

private:
    using clock = std::chrono::steady_clock;

    FILE *out;
    std::string desc;
    clock::time_point start;
    clock::time_point last;
    bool started = false;
    bool drawn = false;
};

std::string format_bytes(uint64_t bytes);
std::string format_speed(uint64_t bytes, double elapsed);
std::string format_eta(uint64_t processed, uint64_t total, double elapsed);
std::string format_bar(double fraction, int width);
std::string format_progress_line(const std::string &desc, uint64_t processed, uint64_t total,
                                 double elapsed);

// 只有要求显示进度、stderr是终端、且输出不是stdout时才使用终端显示
std::unique_ptr<progress_reporter> make_reporter(bool requested, const output_destination &dst,
                                                 bool stderr_tty);

// 读取时统计字节数的过滤流
class progress_in_stream : public filter_stream {
public:
    progress_in_stream(stream_ptr &&base, uint64_t total, progress_reporter &reporter)
    : filter_stream(std::move(base)), total(total), reporter(reporter) {}

    ssize_t read(void *buf, size_t len) override;
    uint64_t processed() const { return count; }

private:
    uint64_t total;
    uint64_t count = 0;
    progress_reporter &reporter;
};

// 写入时统计字节数的过滤流
class progress_out_stream : public filter_stream {
public:
    progress_out_stream(stream_ptr &&base, uint64_t total, progress_reporter &reporter)
    : filter_stream(std::move(base)), total(total), reporter(reporter) {}

    ssize_t write(const void *buf, size_t len) override;
    uint64_t processed() const { return count; }

private:
    uint64_t total;
    uint64_t count = 0;
    progress_reporter &reporter;
};
