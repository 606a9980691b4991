#include <base.hpp>

#include "registry.hpp"

using namespace std;

void registry::add(string_view name, format_t fmt, codec_factory factory) {
    string key = str_lower(name);
    entries[key] = codec_entry{ key, fmt, std::move(factory) };
}

const codec_entry *registry::lookup(string_view name) const {
    auto it = entries.find(str_lower(name));
    return it == entries.end() ? nullptr : &it->second;
}

vector<string> registry::supported_names() const {
    vector<string> names;
    names.reserve(entries.size());
    for (const auto &e : entries)
        names.push_back(e.first);
    return names;
}

registry default_registry() {
    registry r;
    for (int fmt = GZIP; fmt < FMT_END; ++fmt) {
        auto f = (format_t) fmt;
        r.add(fmt2name[f], f, [f](codec_mode mode, level_t level, string &err) {
            return make_codec(f, mode, level, err);
        });
    }
    return r;
}
