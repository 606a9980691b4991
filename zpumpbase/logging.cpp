#include <cstdio>
#include <cstdlib>

#include "logging.hpp"
#include "misc.hpp"

void nop_log(const char *, va_list) {}

void nop_ex(int) {}

log_callback log_cb = {
    .d = nop_log,
    .i = nop_log,
    .w = nop_log,
    .e = nop_log,
    .ex = nop_ex,
};

void no_logging() {
    log_cb.d = nop_log;
    log_cb.i = nop_log;
    log_cb.w = nop_log;
    log_cb.e = nop_log;
    log_cb.ex = nop_ex;
}

static void vprintfe(const char *fmt, va_list ap) {
    vfprintf(stderr, fmt, ap);
}

void cmdline_logging() {
    // 调试输出由ZPUMP_VERBOSE控制
    log_cb.d = check_env("ZPUMP_VERBOSE") ? vprintfe : nop_log;
    log_cb.i = vprintfe;
    log_cb.w = vprintfe;
    log_cb.e = vprintfe;
    log_cb.ex = exit;
}

int log_handler(int prio, const char *fmt, ...) {
    // 保留errno
    int saved = errno;
    va_list argv;
    va_start(argv, fmt);
    switch (prio) {
    case L_DEBUG:
        log_cb.d(fmt, argv);
        break;
    case L_INFO:
        log_cb.i(fmt, argv);
        break;
    case L_WARN:
        log_cb.w(fmt, argv);
        break;
    case L_ERR:
        log_cb.e(fmt, argv);
        log_cb.ex(EXIT_FAILURE);
        break;
    default:
        break;
    }
    va_end(argv);
    errno = saved;
    return 0;
}
