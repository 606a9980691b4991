#include <unistd.h>
#include <cerrno>
#include <string>

#include "logging.hpp"
#include "xwrap.hpp"

using namespace std;

FILE *xfopen(const char *pathname, const char *mode) {
    FILE *fp = fopen(pathname, mode);
    if (fp == nullptr) {
        PLOGD("fopen: %s", pathname);
    }
    return fp;
}

// 写满count字节，被信号打断时重试
ssize_t xwrite(int fd, const void *buf, size_t count) {
    size_t write_sz = 0;
    ssize_t ret;
    do {
        ret = write(fd, static_cast<const char *>(buf) + write_sz, count - write_sz);
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            PLOGD("write");
            return ret;
        }
        write_sz += ret;
    } while (write_sz != count && ret != 0);
    return write_sz;
}

ssize_t xread(int fd, void *buf, size_t count) {
    ssize_t ret;
    do {
        ret = read(fd, buf, count);
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) {
        PLOGD("read");
    }
    return ret;
}

int xaccess(const char *path, int mode) {
    int ret = access(path, mode);
    if (ret < 0) {
        PLOGD("access %s", path);
    }
    return ret;
}

int xstat(const char *pathname, struct stat *buf) {
    int ret = stat(pathname, buf);
    if (ret < 0) {
        PLOGD("stat %s", pathname);
    }
    return ret;
}

// 逐级创建目录，已存在不算失败
int xmkdirs(const char *pathname, mode_t mode) {
    string path(pathname);
    for (size_t pos = 1; pos <= path.size(); ++pos) {
        if (pos != path.size() && path[pos] != '/')
            continue;
        string part = path.substr(0, pos);
        if (mkdir(part.data(), mode) < 0 && errno != EEXIST) {
            PLOGD("mkdir %s %u", part.data(), mode);
            return -1;
        }
    }
    return 0;
}

int xunlink(const char *pathname) {
    int ret = unlink(pathname);
    if (ret < 0) {
        PLOGD("unlink %s", pathname);
    }
    return ret;
}

int xrmdir(const char *pathname) {
    int ret = rmdir(pathname);
    if (ret < 0) {
        PLOGD("rmdir %s", pathname);
    }
    return ret;
}
