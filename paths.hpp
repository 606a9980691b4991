// 路径校验与默认输出路径
#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "registry.hpp"

// 纯字符串处理：合并重复的'/'，去掉'.'，只在绝对路径中消解".."
std::string normalize_path(std::string_view path);

// 最后一个路径分量的扩展名（不含'.'），没有则为空
std::string path_extension(std::string_view path);

// 所在目录，没有'/'时为"."
std::string parent_dir(std::string_view path);

failure validate_input_path(std::string_view path);
failure validate_output_path(std::string_view path, std::string_view input);

// <input>.<algorithm>
std::string compress_output_path(std::string_view input, std::string_view algorithm);

// 去掉与算法名相同的扩展名，结果已存在时追加".out"
std::string decompress_output_path(std::string_view input, std::string_view algorithm,
                                   const std::function<bool(const std::string &)> &exists);

// 扩展名是已注册的算法名时返回小写算法名，否则返回空
std::string infer_algorithm(std::string_view path, const registry &reg);
