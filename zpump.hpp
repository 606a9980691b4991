// zpump公共常量
#pragma once

#include <cstddef>
#include <cstdint>

constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;     // 默认块大小 64KB
constexpr size_t FAST_BUFFER_SIZE = 256 * 1024;       // fast预设块大小 256KB
constexpr size_t MAX_BUFFER_SIZE = 64 * 1024 * 1024;  // 块大小上限 64MB

constexpr int PROGRESS_INTERVAL_MS = 100;   // 进度刷新间隔
constexpr int PROGRESS_BAR_WIDTH = 30;      // 进度条宽度
constexpr int PROGRESS_CLEAR_WIDTH = 80;    // 清行宽度

#define DECOMPRESS_COLLISION_SUFFIX ".out"
