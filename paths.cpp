#include <vector>

#include <base.hpp>

#include "paths.hpp"
#include "zpump.hpp"

using namespace std;

string normalize_path(string_view path) {
    bool absolute = !path.empty() && path[0] == '/';
    vector<string_view> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == string_view::npos)
            next = path.size();
        string_view part = path.substr(pos, next - pos);
        pos = next + 1;
        if (part.empty() || part == ".")
            continue;
        if (part == ".." && absolute) {
            if (!parts.empty())
                parts.pop_back();
            continue;
        }
        parts.push_back(part);
    }

    string result = absolute ? "/" : "";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i)
            result += '/';
        result += parts[i];
    }
    if (result.empty())
        result = ".";
    return result;
}

static bool is_traversal(const string &normalized) {
    return normalized.find("../") != string::npos || str_starts(normalized, "..");
}

string path_extension(string_view path) {
    size_t slash = path.rfind('/');
    string_view name = slash == string_view::npos ? path : path.substr(slash + 1);
    size_t dot = name.rfind('.');
    // ".bashrc"这种隐藏文件没有扩展名
    if (dot == string_view::npos || dot == 0)
        return {};
    return string(name.substr(dot + 1));
}

string parent_dir(string_view path) {
    size_t slash = path.rfind('/');
    if (slash == string_view::npos)
        return ".";
    if (slash == 0)
        return "/";
    return string(path.substr(0, slash));
}

failure validate_input_path(string_view path) {
    if (path.empty())
        return failure(zerr::invalid_input_path, {}, "path is empty");
    if (path.find('\0') != string_view::npos)
        return failure(zerr::invalid_input_path, string(path), "path contains null bytes");
    if (is_traversal(normalize_path(path)))
        return failure(zerr::path_traversal, string(path));
    return {};
}

failure validate_output_path(string_view path, string_view input) {
    if (path.empty())
        return failure(zerr::invalid_output_path, {}, "path is empty");
    if (path.find('\0') != string_view::npos)
        return failure(zerr::invalid_output_path, string(path), "path contains null bytes");
    string normalized = normalize_path(path);
    if (!input.empty() && normalized == normalize_path(input))
        return failure(zerr::input_output_same, string(path));
    if (is_traversal(normalized))
        return failure(zerr::path_traversal, string(path));
    return {};
}

string compress_output_path(string_view input, string_view algorithm) {
    string out(input);
    out += '.';
    out += algorithm;
    return out;
}

string decompress_output_path(string_view input, string_view algorithm,
                              const function<bool(const string &)> &exists) {
    string out(input);
    if (!algorithm.empty() && str_iequals(path_extension(input), algorithm))
        out.resize(input.size() - algorithm.size() - 1);
    if (exists(out))
        out += DECOMPRESS_COLLISION_SUFFIX;
    return out;
}

string infer_algorithm(string_view path, const registry &reg) {
    string ext = path_extension(path);
    if (ext.empty())
        return {};
    auto entry = reg.lookup(ext);
    return entry ? entry->name : string();
}
