// 流接口定义
#pragma once

#include <sys/types.h>
#include <cstdio>
#include <memory>
#include <string>

// 最小读写接口，失败返回-1并设置errno
class stream {
public:
    virtual ssize_t read(void *buf, size_t len);
    virtual ssize_t write(const void *buf, size_t len);
    // 关闭底层资源，刷新失败返回false
    virtual bool close() { return true; }
    virtual ~stream() = default;
};

using stream_ptr = std::unique_ptr<stream>;

// 过滤流基类，默认全部转发给base
class filter_stream : public stream {
public:
    explicit filter_stream(stream_ptr &&base) : base(std::move(base)) {}

    ssize_t read(void *buf, size_t len) override;
    ssize_t write(const void *buf, size_t len) override;
    bool close() override;

protected:
    stream_ptr base;
};

// 内存流，写入追加到data末尾，读取从pos开始
class byte_stream : public stream {
public:
    byte_stream() = default;
    explicit byte_stream(std::string data) : data(std::move(data)) {}

    ssize_t read(void *buf, size_t len) override;
    ssize_t write(const void *buf, size_t len) override;

    const std::string &bytes() const { return data; }

private:
    std::string data;
    size_t pos = 0;
};

using sFILE = std::unique_ptr<FILE, decltype(&fclose)>;

static inline sFILE make_file(FILE *fp) {
    return sFILE(fp, fclose);
}

// FILE流，拥有并在close时关闭fp
class fp_stream : public stream {
public:
    explicit fp_stream(FILE *fp) : fp(make_file(fp)) {}

    ssize_t read(void *buf, size_t len) override;
    ssize_t write(const void *buf, size_t len) override;
    bool close() override;

private:
    sFILE fp;
};

// fd流，不拥有fd（用于标准输入输出）
class fd_stream : public stream {
public:
    explicit fd_stream(int fd) : fd(fd) {}

    ssize_t read(void *buf, size_t len) override;
    ssize_t write(const void *buf, size_t len) override;

private:
    int fd;
};
