#include <algorithm>
#include <cmath>

#include <base.hpp>

#include "progress.hpp"
#include "zpump.hpp"

using namespace std;

string format_bytes(uint64_t bytes) {
    static const char *units[] = { "B", "KB", "MB", "GB", "TB" };
    double value = bytes;
    int unit = 0;
    while (value >= 1024 && unit < 4) {
        value /= 1024;
        ++unit;
    }
    if (unit == 0)
        return ssprintf("%llu B", (unsigned long long) bytes);
    return ssprintf("%.1f %s", value, units[unit]);
}

string format_speed(uint64_t bytes, double elapsed) {
    if (elapsed <= 0)
        return "0 B/s";
    return format_bytes(static_cast<uint64_t>(bytes / elapsed)) + "/s";
}

string format_eta(uint64_t processed, uint64_t total, double elapsed) {
    if (processed == 0 || elapsed <= 0 || processed > total)
        return "--:--";
    double rate = processed / elapsed;
    double remain = (total - processed) / rate;
    if (!isfinite(remain) || remain < 0)
        return "--:--";
    auto secs = static_cast<long long>(remain);
    return ssprintf("%02lld:%02lld", secs / 60, secs % 60);
}

string format_bar(double fraction, int width) {
    fraction = std::min(std::max(fraction, 0.0), 1.0);
    int filled = static_cast<int>(width * fraction);
    string bar;
    if (filled > 0) {
        bar.append(filled - 1, '=');
        bar += '>';
    }
    bar.append(width - filled, ' ');
    return bar;
}

string format_progress_line(const string &desc, uint64_t processed, uint64_t total, double elapsed) {
    string line = "\r";
    if (!desc.empty())
        line += desc + ": ";
    if (total > 0) {
        double fraction = static_cast<double>(processed) / total;
        line += ssprintf("[%s] %d%% %s ETA %s",
                         format_bar(fraction, PROGRESS_BAR_WIDTH).data(),
                         static_cast<int>(fraction * 100),
                         format_speed(processed, elapsed).data(),
                         format_eta(processed, total, elapsed).data());
    } else {
        line += format_speed(processed, elapsed) + " (bytes processed: " + format_bytes(processed) + ")";
    }
    return line;
}

void terminal_reporter::update(uint64_t processed, uint64_t total) {
    auto now = clock::now();
    if (!started) {
        start = now;
        started = true;
    } else if (drawn && now - last < chrono::milliseconds(PROGRESS_INTERVAL_MS)) {
        return;
    }
    last = now;
    drawn = true;
    double elapsed = chrono::duration<double>(now - start).count();
    string line = format_progress_line(desc, processed, total, elapsed);
    fputs(line.data(), out);
    fflush(out);
}

void terminal_reporter::complete() {
    string clear = "\r" + string(PROGRESS_CLEAR_WIDTH, ' ') + "\r";
    fputs(clear.data(), out);
    fflush(out);
}

unique_ptr<progress_reporter> make_reporter(bool requested, const output_destination &dst,
                                            bool stderr_tty) {
    if (requested && stderr_tty && !holds_alternative<stdout_tag>(dst))
        return make_unique<terminal_reporter>();
    return make_unique<silent_reporter>();
}

ssize_t progress_in_stream::read(void *buf, size_t len) {
    ssize_t ret = base->read(buf, len);
    if (ret > 0) {
        count += ret;
        reporter.update(count, total);
    }
    return ret;
}

ssize_t progress_out_stream::write(const void *buf, size_t len) {
    ssize_t ret = base->write(buf, len);
    if (ret > 0) {
        count += ret;
        reporter.update(count, total);
    }
    return ret;
}
