// 算法注册表
#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "compress.hpp"

// 创建一个编解码会话，失败返回nullptr并写入err
using codec_factory = std::function<codec_ptr(codec_mode mode, level_t level, std::string &err)>;

struct codec_entry {
    std::string name;   // 小写算法名，同时作为文件扩展名
    format_t fmt;
    codec_factory factory;
};

class registry {
public:
    // 同名（忽略大小写）会覆盖
    void add(std::string_view name, format_t fmt, codec_factory factory);

    // 忽略大小写查找，找不到返回nullptr
    const codec_entry *lookup(std::string_view name) const;

    bool contains(std::string_view name) const { return lookup(name) != nullptr; }

    // 按名字排序
    std::vector<std::string> supported_names() const;

private:
    std::map<std::string, codec_entry> entries;
};

// 包含所有内置后端
registry default_registry();
