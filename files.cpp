#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>

#include <base.hpp>

#include "files.hpp"

using namespace std;

static error_code last_error() {
    return error_code(errno, generic_category());
}

bool fs_handler::exists(const string &path) {
    return access(path.data(), F_OK) == 0;
}

bool fs_handler::readable(const string &path) {
    return xaccess(path.data(), R_OK) == 0;
}

bool fs_handler::writable(const string &path) {
    return xaccess(path.data(), W_OK) == 0;
}

error_code fs_handler::size(const string &path, int64_t &size) {
    struct stat st;
    if (xstat(path.data(), &st) < 0)
        return last_error();
    // 管道和设备文件没有确定大小
    size = S_ISREG(st.st_mode) ? st.st_size : 0;
    return {};
}

error_code fs_handler::open_input(const input_source &src, stream_ptr &strm) {
    if (holds_alternative<stdin_tag>(src)) {
        strm = make_unique<fd_stream>(STDIN_FILENO);
        return {};
    }
    FILE *fp = xfopen(get<file_path>(src).path.data(), "re");
    if (fp == nullptr)
        return last_error();
    strm = make_unique<fp_stream>(fp);
    return {};
}

error_code fs_handler::open_output(const output_destination &dst, stream_ptr &strm) {
    if (holds_alternative<stdout_tag>(dst)) {
        strm = make_unique<fd_stream>(STDOUT_FILENO);
        return {};
    }
    FILE *fp = xfopen(get<file_path>(dst).path.data(), "we");
    if (fp == nullptr)
        return last_error();
    strm = make_unique<fp_stream>(fp);
    return {};
}

error_code fs_handler::remove(const string &path) {
    if (xunlink(path.data()) < 0)
        return last_error();
    return {};
}

error_code fs_handler::remove_dir(const string &path) {
    if (xrmdir(path.data()) < 0)
        return last_error();
    return {};
}

error_code fs_handler::mkdirs(const string &path) {
    if (xmkdirs(path.data(), 0755) < 0)
        return last_error();
    return {};
}
