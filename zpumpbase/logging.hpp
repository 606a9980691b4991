// 日志接口定义
#pragma once

#include <cerrno>
#include <cstdarg>
#include <cstring>

// 日志级别
enum {
    L_DEBUG,
    L_INFO,
    L_WARN,
    L_ERR
};

// 日志回调表，每个级别一个输出函数
struct log_callback {
    void (*d)(const char *fmt, va_list ap);
    void (*i)(const char *fmt, va_list ap);
    void (*w)(const char *fmt, va_list ap);
    void (*e)(const char *fmt, va_list ap);
    void (*ex)(int code);   // 错误日志后调用
};

extern log_callback log_cb;

void nop_log(const char *, va_list);
void nop_ex(int);

void no_logging();       // 关闭所有输出
void cmdline_logging();  // 输出到stderr，LOGE后退出

int log_handler(int prio, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

#define LOGD(...) log_handler(L_DEBUG, __VA_ARGS__)
#define LOGI(...) log_handler(L_INFO, __VA_ARGS__)
#define LOGW(...) log_handler(L_WARN, __VA_ARGS__)
#define LOGE(...) log_handler(L_ERR, __VA_ARGS__)

#define PLOGD(fmt, args...) LOGD(fmt " failed with %d: %s\n", ##args, errno, std::strerror(errno))
#define PLOGW(fmt, args...) LOGW(fmt " failed with %d: %s\n", ##args, errno, std::strerror(errno))
#define PLOGE(fmt, args...) LOGE(fmt " failed with %d: %s\n", ##args, errno, std::strerror(errno))
