// 系统调用封装，失败时记录日志并保留errno
#pragma once

#include <sys/stat.h>
#include <sys/types.h>
#include <cstdio>

FILE *xfopen(const char *pathname, const char *mode);
ssize_t xwrite(int fd, const void *buf, size_t count);
ssize_t xread(int fd, void *buf, size_t count);
int xaccess(const char *path, int mode);
int xstat(const char *pathname, struct stat *buf);
int xmkdirs(const char *pathname, mode_t mode);
int xunlink(const char *pathname);
int xrmdir(const char *pathname);
