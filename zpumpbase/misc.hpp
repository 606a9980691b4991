// 通用工具
#pragma once

#include <functional>
#include <string>
#include <string_view>

// 作用域结束时执行回调
class run_finally {
public:
    explicit run_finally(std::function<void()> &&fn) : fn(std::move(fn)) {}
    ~run_finally() { if (fn) fn(); }
    run_finally(const run_finally &) = delete;
    run_finally &operator=(const run_finally &) = delete;
private:
    std::function<void()> fn;
};

static inline bool str_starts(std::string_view s, std::string_view ss) {
    return s.size() >= ss.size() && s.compare(0, ss.size(), ss) == 0;
}

// ASCII小写
std::string str_lower(std::string_view s);

// 忽略大小写比较
bool str_iequals(std::string_view a, std::string_view b);

// 环境变量为 "1" 或 "true" 时返回true
bool check_env(const char *name);

// printf风格格式化到std::string
std::string ssprintf(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
