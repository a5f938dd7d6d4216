#include <warden/config.hxx>
#include <warden/exception.hxx>
#include <warden/log.h>

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace warden;

namespace {

const char *const SAMPLE = R"(
# library settings
[log]
level = debug      ; everything
color=false

[diagnostics]
  slow_acquire_threshold_us = 2500
)";

/* Write <contents> to a file in the temp directory; removed on
 * destruction. */
class temp_file {
public:
    temp_file(const std::string &name, const std::string &contents)
        : m_path(std::filesystem::temp_directory_path() / name) {
        std::ofstream f(m_path);
        f << contents;
    }

    ~temp_file() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    std::string path() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

void clear_environment() {
    unsetenv("WARDEN_CONFIG");
    unsetenv("WARDEN_LOG_LEVEL");
    unsetenv("WARDEN_LOG_COLOR");
    unsetenv("WARDEN_SLOW_ACQUIRE_US");
}

}  // namespace

TEST_CASE("Parse well-formed ini text") {
    config::entries e;
    auto st = config::parse_string(SAMPLE, e);

    REQUIRE(st.ok());
    REQUIRE(e.size() == 3);
    REQUIRE(e["log.level"] == "debug");
    REQUIRE(e["log.color"] == "false");
    REQUIRE(e["diagnostics.slow_acquire_threshold_us"] == "2500");
}

TEST_CASE("Later entries override earlier ones") {
    config::entries e;
    auto st = config::parse_string("[log]\nlevel = info\n[log]\nlevel = crit\n", e);

    REQUIRE(st.ok());
    REQUIRE(e["log.level"] == "crit");
}

TEST_CASE("Malformed ini text is reported with its line number") {
    config::entries e;

    auto st = config::parse_string("[log]\nlevel debug\n", e);
    REQUIRE_FALSE(st.ok());
    REQUIRE(st.e().find("line 2") != std::string::npos);

    st = config::parse_string("level = debug\n", e);
    REQUIRE_FALSE(st.ok());
    REQUIRE(st.e().find("outside of any section") != std::string::npos);

    st = config::parse_string("\n\n[log\n", e);
    REQUIRE_FALSE(st.ok());
    REQUIRE(st.e().find("line 3") != std::string::npos);

    st = config::parse_string("[log] junk\n", e);
    REQUIRE_FALSE(st.ok());

    st = config::parse_string("[log]\n = value\n", e);
    REQUIRE_FALSE(st.ok());

    st = config::parse_string("[log]\nkey = " + std::string(2000, 'x') + "\n", e);
    REQUIRE_FALSE(st.ok());
    REQUIRE(st.e().find("too long") != std::string::npos);
}

TEST_CASE("Parse a file") {
    temp_file f("warden_config_test.ini", SAMPLE);

    config::entries e;
    auto st = config::parse_file(f.path(), e);
    REQUIRE(st.ok());
    REQUIRE(e["log.level"] == "debug");

    config::entries missing;
    st = config::parse_file("/nonexistent/warden.ini", missing);
    REQUIRE_FALSE(st.ok());
    REQUIRE(st.e().find("cannot open") != std::string::npos);
}

TEST_CASE("Value syntax") {
    REQUIRE(config::parse_log_level("debug") == WARDEN_LOG_DEBUG);
    REQUIRE(config::parse_log_level(" Warning ") == WARDEN_LOG_WARNING);
    REQUIRE(config::parse_log_level("err") == WARDEN_LOG_ERR);
    REQUIRE(config::parse_log_level("0") == WARDEN_LOG_CRIT);
    REQUIRE_FALSE(config::parse_log_level("5").has_value());
    REQUIRE_FALSE(config::parse_log_level("loud").has_value());

    REQUIRE(config::parse_bool("yes") == true);
    REQUIRE(config::parse_bool("OFF") == false);
    REQUIRE_FALSE(config::parse_bool("maybe").has_value());

    REQUIRE(config::parse_microseconds("1500") == 1500us);
    REQUIRE_FALSE(config::parse_microseconds("-1").has_value());
    REQUIRE_FALSE(config::parse_microseconds("10ms").has_value());
    REQUIRE_FALSE(config::parse_microseconds("").has_value());

    // out of range values must not wrap or overflow when compared as ns
    REQUIRE_FALSE(config::parse_microseconds("18446744073709551615").has_value());
    REQUIRE_FALSE(config::parse_microseconds("10000000000000000").has_value());

    const auto max_us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::nanoseconds::max());
    REQUIRE(config::parse_microseconds(std::to_string(max_us.count())) == max_us);
    REQUIRE_FALSE(
      config::parse_microseconds(std::to_string(max_us.count() + 1)).has_value());
}

TEST_CASE("Settings from entries") {
    config::entries e;
    REQUIRE(config::parse_string(SAMPLE, e).ok());

    auto s = config::settings::from_entries(e);
    REQUIRE(s.log_level == WARDEN_LOG_DEBUG);
    REQUIRE_FALSE(s.log_colors);
    REQUIRE(s.slow_acquire_threshold == 2500us);

    // a bad value leaves the settings untouched
    config::settings unchanged;
    auto st = unchanged.update({
      {"log.level", "info"},
      {"log.color", "purple"}
    });
    REQUIRE_FALSE(st.ok());
    REQUIRE(unchanged.log_level == WARDEN_LOG_WARNING);
    REQUIRE(unchanged.log_colors);

    REQUIRE_THROWS_AS(config::settings::from_entries({
                        {"diagnostics.slow_acquire_threshold_us", "soon"}
    }),
                      exception::config_error);

    // unknown keys are ignored
    REQUIRE(config::settings().update({{"misc.key", "v"}}).ok());
}

TEST_CASE("Environment overrides the configuration file") {
    clear_environment();

    temp_file f("warden_env_test.ini", SAMPLE);
    setenv("WARDEN_CONFIG", f.path().c_str(), 1);

    auto s = config::load();
    REQUIRE(s.log_level == WARDEN_LOG_DEBUG);
    REQUIRE(s.slow_acquire_threshold == 2500us);

    setenv("WARDEN_LOG_LEVEL", "error", 1);
    setenv("WARDEN_SLOW_ACQUIRE_US", "100", 1);
    s = config::load();
    REQUIRE(s.log_level == WARDEN_LOG_ERR);
    REQUIRE(s.slow_acquire_threshold == 100us);
    REQUIRE_FALSE(s.log_colors);

    // a bad override is skipped and the file values stand
    setenv("WARDEN_LOG_LEVEL", "shouting", 1);
    s = config::load();
    REQUIRE(s.log_level == WARDEN_LOG_DEBUG);

    // a missing file is skipped
    clear_environment();
    setenv("WARDEN_CONFIG", "/nonexistent/warden.ini", 1);
    s = config::load();
    REQUIRE(s.log_level == WARDEN_LOG_WARNING);

    clear_environment();
}

TEST_CASE("Process-wide settings") {
    clear_environment();
    config::init();

    auto s = config::current();
    s.log_level = WARDEN_LOG_INFO;
    s.log_colors = false;
    s.slow_acquire_threshold = 42us;
    config::apply_settings(s);

    auto now = config::current();
    REQUIRE(now.log_level == WARDEN_LOG_INFO);
    REQUIRE(now.slow_acquire_threshold == 42us);
    REQUIRE(get_current_log_level() == WARDEN_LOG_INFO);
    REQUIRE_FALSE(get_log_colors());

    s.log_level = WARDEN_LOG_WARNING;
    s.log_colors = true;
    config::apply_settings(s);
    REQUIRE(get_current_log_level() == WARDEN_LOG_WARNING);
}

TEST_CASE("Concurrent apply_settings keeps logging in step") {
    clear_environment();
    config::init();

    auto quiet = config::current();
    quiet.log_level = WARDEN_LOG_ERR;
    quiet.log_colors = false;

    auto loud = quiet;
    loud.log_level = WARDEN_LOG_INFO;
    loud.log_colors = true;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 2000; ++i) {
                config::apply_settings(t % 2 ? quiet : loud);
            }
        });
    }

    for (auto &t : threads) {
        t.join();
    }

    auto now = config::current();
    REQUIRE(get_current_log_level() == now.log_level);
    REQUIRE(get_log_colors() == now.log_colors);

    now.log_level = WARDEN_LOG_WARNING;
    now.log_colors = true;
    config::apply_settings(now);
}

TEST_CASE("Log level bounds") {
    int previous = set_current_log_level(WARDEN_LOG_DEBUG);
    REQUIRE(get_current_log_level() == WARDEN_LOG_DEBUG);

    REQUIRE(set_current_log_level(42) == -1);
    REQUIRE(get_current_log_level() == WARDEN_LOG_DEBUG);

    log_debug("debug message with argument %d", 1);
    log_debug("debug message without arguments");

    set_current_log_level(previous);
}

int main(int argc, char **argv) {
    doctest::Context ctx;

    ctx.setOption("abort-after",
                  1);  // default - stop after 5 failed asserts

    ctx.applyCommandLine(argc, argv);  // apply command line - argc / argv

    ctx.setOption("no-breaks",
                  true);  // override - don't break in the debugger

    int res = ctx.run();  // run test cases unless with --no-run

    if (ctx.shouldExit())  // query flags (and --exit) rely on this
    {
        return res;  // propagate the result of the tests
    }

    return res;
}
