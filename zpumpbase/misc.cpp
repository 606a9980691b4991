#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#include "misc.hpp"

using namespace std;

string str_lower(string_view s) {
    string r(s);
    for (char &c : r)
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return r;
}

bool str_iequals(string_view a, string_view b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (tolower(static_cast<unsigned char>(a[i])) != tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

bool check_env(const char *name) {
    const char *val = getenv(name);
    return val != nullptr && (val == "1"sv || str_iequals(val, "true"));
}

string ssprintf(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    va_list copy;
    va_copy(copy, ap);
    int len = vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    string s;
    if (len > 0) {
        s.resize(len + 1);
        vsnprintf(s.data(), s.size(), fmt, ap);
        s.resize(len);
    }
    va_end(ap);
    return s;
}
