#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>

#include <warden/cxxcommon.hxx>
#include <warden/log.h>

namespace {

std::atomic<int> current_level {WARDEN_LOG_WARNING};
std::atomic<bool> colors_enabled {true};

/* Serializes writes to stderr so that messages from different threads
 * are not interleaved. */
std::mutex output_mtx;

/* Remove any CSI sequences (ESC '[' ... final byte) from s. */
std::string strip_escapes(const std::string &s) {
    std::string out;
    out.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\033' && i + 1 < s.size() && s[i + 1] == '[') {
            i += 2;
            while (i < s.size() && !(s[i] >= 0x40 && s[i] <= 0x7e)) {
                ++i;
            }
            continue;
        }
        out.push_back(s[i]);
    }

    return out;
}

std::string vformat(const char *fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int len = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);

    if (len < 0) {
        return std::string("<log formatting error: ") + fmt + ">";
    }

    std::size_t buffsz = static_cast<std::size_t>(len) + 1;
    std::unique_ptr<char[]> buff(new char[buffsz]);
    std::vsnprintf(buff.get(), buffsz, fmt, args);

    /* leave out the terminating Null */
    return std::string(buff.get(), buff.get() + buffsz - 1);
}

}  // namespace

extern "C" {

int get_current_log_level(void) {
    return current_level.load(std::memory_order_relaxed);
}

int set_current_log_level(int level) {
    if (level < WARDEN_LOG_CRIT || level > WARDEN_LOG_DEBUG) {
        return -1;
    }
    return current_level.exchange(level);
}

void set_log_colors(bool enabled) {
    colors_enabled.store(enabled, std::memory_order_relaxed);
}

bool get_log_colors(void) {
    return colors_enabled.load(std::memory_order_relaxed);
}

void log_message(int priority, const char *fmt, ...) {
    if (priority > get_current_log_level()) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    std::string msg = vformat(fmt, args);
    va_end(args);

    if (!get_log_colors()) {
        msg = strip_escapes(msg);
    }

    LOCK(output_mtx);
    std::fprintf(stderr, "%s\n", msg.c_str());
    std::fflush(stderr);
}

} /* extern "C" */
