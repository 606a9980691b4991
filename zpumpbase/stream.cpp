#include <unistd.h>
#include <cerrno>
#include <algorithm>
#include <cstring>

#include "stream.hpp"
#include "xwrap.hpp"

using namespace std;

ssize_t stream::read(void *buf, size_t len) {
    errno = ENOTSUP;
    return -1;
}

ssize_t stream::write(const void *buf, size_t len) {
    errno = ENOTSUP;
    return -1;
}

ssize_t filter_stream::read(void *buf, size_t len) {
    return base->read(buf, len);
}

ssize_t filter_stream::write(const void *buf, size_t len) {
    return base->write(buf, len);
}

bool filter_stream::close() {
    return base->close();
}

ssize_t byte_stream::read(void *buf, size_t len) {
    len = std::min(len, data.size() - pos);
    memcpy(buf, data.data() + pos, len);
    pos += len;
    return len;
}

ssize_t byte_stream::write(const void *buf, size_t len) {
    data.append(static_cast<const char *>(buf), len);
    return len;
}

ssize_t fp_stream::read(void *buf, size_t len) {
    if (!fp) {
        errno = EBADF;
        return -1;
    }
    size_t ret = fread(buf, 1, len, fp.get());
    if (ret == 0 && ferror(fp.get()))
        return -1;
    return ret;
}

ssize_t fp_stream::write(const void *buf, size_t len) {
    if (!fp) {
        errno = EBADF;
        return -1;
    }
    size_t ret = fwrite(buf, 1, len, fp.get());
    if (ret == 0 && len != 0)
        return -1;
    return ret;
}

bool fp_stream::close() {
    if (!fp)
        return true;
    return fclose(fp.release()) == 0;
}

ssize_t fd_stream::read(void *buf, size_t len) {
    return xread(fd, buf, len);
}

ssize_t fd_stream::write(const void *buf, size_t len) {
    return xwrite(fd, buf, len);
}
