#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <shared_mutex>
#include <sstream>
#include <string>

#include <warden/config.hxx>
#include <warden/exception.hxx>
#include <warden/guarded.hxx>
#include <warden/log.h>

using namespace std;

namespace warden {
namespace config {

namespace {

/* maximum allowable line length in config file */
constexpr size_t MAX_LINE_LEN = 1024;

const char *const ENV_CONFIG = "WARDEN_CONFIG";
const char *const ENV_LOG_LEVEL = "WARDEN_LOG_LEVEL";
const char *const ENV_LOG_COLOR = "WARDEN_LOG_COLOR";
const char *const ENV_SLOW_ACQUIRE = "WARDEN_SLOW_ACQUIRE_US";

const char *const KEY_LOG_LEVEL = "log.level";
const char *const KEY_LOG_COLOR = "log.color";
const char *const KEY_SLOW_ACQUIRE = "diagnostics.slow_acquire_threshold_us";

string trim(const string &s) {
    auto is_space = [](unsigned char c) {
        return std::isspace(c);
    };

    auto first = std::find_if_not(s.begin(), s.end(), is_space);
    auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();

    if (first >= last) {
        return "";
    }
    return string(first, last);
}

string lowercase(string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return s;
}

/* Cut off a trailing comment: '#' or ';' at the start of the value or
 * preceded by whitespace. */
string strip_comment(const string &s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '#' && s[i] != ';') {
            continue;
        }
        if (i == 0 || std::isspace(static_cast<unsigned char>(s[i - 1]))) {
            return s.substr(0, i);
        }
    }
    return s;
}

bool valid_name(const string &s) {
    if (s.empty()) {
        return false;
    }

    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

status line_error(size_t ln, const string &what) {
    return status::E("line " + to_string(ln) + ": " + what);
}

/* Apply the logging-related settings; the rest are read on demand. */
void apply_logging(const settings &s) {
    set_current_log_level(s.log_level);
    set_log_colors(s.log_colors);
}

guarded<settings, std::shared_mutex> &instance() {
    static guarded<settings, std::shared_mutex> g {[] {
        auto s = load();
        apply_logging(s);
        return s;
    }()};

    return g;
}

}  // namespace

status parse_string(const string &text, entries &out) {
    istringstream in(text);
    string line;
    string section;
    size_t ln = 0;

    while (std::getline(in, line)) {
        ++ln;

        if (line.size() > MAX_LINE_LEN) {
            return line_error(ln, "line too long");
        }

        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            auto close = line.find(']');
            if (close == string::npos) {
                return line_error(ln, "unterminated section title");
            }

            if (!trim(strip_comment(line.substr(close + 1))).empty()) {
                return line_error(ln, "trailing characters after section title");
            }

            auto name = trim(line.substr(1, close - 1));
            if (!valid_name(name)) {
                return line_error(ln, "invalid section name '" + name + "'");
            }

            section = name;
            continue;
        }

        auto eq = line.find('=');
        if (eq == string::npos) {
            return line_error(ln, "malformed entry, expected key = value");
        }

        auto key = trim(line.substr(0, eq));
        auto value = trim(strip_comment(line.substr(eq + 1)));

        if (!valid_name(key)) {
            return line_error(ln, "invalid key '" + key + "'");
        }

        if (section.empty()) {
            return line_error(ln, "entry '" + key + "' outside of any section");
        }

        out[section + "." + key] = value;
    }

    return status::OK();
}

status parse_file(const string &path, entries &out) {
    ifstream f(path);
    if (!f) {
        return status::E("cannot open config file '" + path + "'");
    }

    stringstream ss;
    ss << f.rdbuf();

    auto st = parse_string(ss.str(), out);
    OK_OR_RETURN(st, path);

    return status::OK();
}

optional<int> parse_log_level(const string &s) {
    static const map<string, int> names {
      {"crit",     WARDEN_LOG_CRIT   },
      {"critical", WARDEN_LOG_CRIT   },
      {"err",      WARDEN_LOG_ERR    },
      {"error",    WARDEN_LOG_ERR    },
      {"warn",     WARDEN_LOG_WARNING},
      {"warning",  WARDEN_LOG_WARNING},
      {"info",     WARDEN_LOG_INFO   },
      {"debug",    WARDEN_LOG_DEBUG  },
    };

    auto v = lowercase(trim(s));

    auto found = names.find(v);
    if (found != names.end()) {
        return found->second;
    }

    int level = -1;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), level);
    if (ec != std::errc() || ptr != v.data() + v.size()) {
        return {};
    }

    if (level < WARDEN_LOG_CRIT || level > WARDEN_LOG_DEBUG) {
        return {};
    }

    return level;
}

optional<bool> parse_bool(const string &s) {
    auto v = lowercase(trim(s));

    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        return true;
    }

    if (v == "false" || v == "no" || v == "off" || v == "0") {
        return false;
    }

    return {};
}

optional<chrono::microseconds> parse_microseconds(const string &s) {
    auto v = trim(s);

    std::uint64_t us = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), us);
    if (v.empty() || ec != std::errc() || ptr != v.data() + v.size()) {
        return {};
    }

    // must stay comparable against nanosecond waits
    constexpr auto MAX_US =
      chrono::duration_cast<chrono::microseconds>(chrono::nanoseconds::max())
        .count();
    if (us > static_cast<std::uint64_t>(MAX_US)) {
        return {};
    }

    return chrono::microseconds(static_cast<chrono::microseconds::rep>(us));
}

status settings::update(const entries &e) {
    settings s = *this;

    for (const auto &[k, v] : e) {
        if (k == KEY_LOG_LEVEL) {
            auto level = parse_log_level(v);
            if (!level) {
                return status::E("invalid value for " + k + ": '" + v + "'");
            }
            s.log_level = *level;
        } else if (k == KEY_LOG_COLOR) {
            auto color = parse_bool(v);
            if (!color) {
                return status::E("invalid value for " + k + ": '" + v + "'");
            }
            s.log_colors = *color;
        } else if (k == KEY_SLOW_ACQUIRE) {
            auto threshold = parse_microseconds(v);
            if (!threshold) {
                return status::E("invalid value for " + k + ": '" + v + "'");
            }
            s.slow_acquire_threshold = *threshold;
        } else {
            log_warn("ignoring unknown configuration key '%s'", k.c_str());
        }
    }

    *this = s;
    return status::OK();
}

status settings::update_from_environment() {
    entries e;

    if (const char *v = std::getenv(ENV_LOG_LEVEL)) {
        e[KEY_LOG_LEVEL] = v;
    }

    if (const char *v = std::getenv(ENV_LOG_COLOR)) {
        e[KEY_LOG_COLOR] = v;
    }

    if (const char *v = std::getenv(ENV_SLOW_ACQUIRE)) {
        e[KEY_SLOW_ACQUIRE] = v;
    }

    auto st = update(e);
    OK_OR_RETURN(st, "environment");

    return status::OK();
}

settings settings::from_entries(const entries &e) {
    settings s;

    auto st = s.update(e);
    if (!st) {
        exception::do_throwc<exception::config_error>("%s", st.e().c_str());
    }

    return s;
}

settings load() {
    settings s;

    if (const char *path = std::getenv(ENV_CONFIG)) {
        entries e;

        auto st = parse_file(path, e);
        if (st) {
            st = s.update(e);
        }

        if (st) {
            log_info("loaded configuration from '%s'", path);
        } else {
            log_error("failed to load configuration: %s", st.e().c_str());
        }
    }

    auto st = s.update_from_environment();
    if (!st) {
        log_error("ignoring environment overrides: %s", st.e().c_str());
    }

    return s;
}

settings current() {
    return instance().copy();
}

void apply_settings(const settings &s) {
    instance().apply([&s](settings &current) {
        current = s;
        apply_logging(current);
    });
}

void init() {
    instance();
}

}  // namespace config
}  // namespace warden
