#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <warden/log.h>
#include <warden/status.hxx>

namespace warden {
namespace config {

/*
 * Flat view of an .ini file: "section.key" -> value.
 *
 *   # comment
 *   [log]
 *   level = debug    ; trailing comment
 *
 * produces {"log.level": "debug"}. Later entries override earlier ones.
 */
using entries = std::map<std::string, std::string>;

/* Parse .ini text. On error, <out> holds the entries parsed up to the
 * offending line and the returned status names the line. */
status parse_string(const std::string &text, entries &out);

status parse_file(const std::string &path, entries &out);

/*
 * Typed library settings.
 *
 * [log]
 *   level = crit|error|warning|info|debug (or 0..4)
 *   color = true|false
 * [diagnostics]
 *   slow_acquire_threshold_us = <non-negative integer>; 0 disables
 *
 * Environment overrides (applied after any file):
 *   WARDEN_CONFIG            path of an .ini file to load
 *   WARDEN_LOG_LEVEL         same values as log.level
 *   WARDEN_LOG_COLOR         same values as log.color
 *   WARDEN_SLOW_ACQUIRE_US   same values as diagnostics.slow_acquire_threshold_us
 */
struct settings {
    int log_level = WARDEN_LOG_WARNING;
    bool log_colors = true;
    std::chrono::microseconds slow_acquire_threshold {0};

    /* Update the fields named in <e>; unknown keys are ignored with a
     * warning. Fields are left unchanged on error. */
    status update(const entries &e);

    /* Update the fields from the WARDEN_* environment variables
     * (WARDEN_CONFIG excepted). */
    status update_from_environment();

    /* Like update, but throws warden::exception::config_error on error. */
    static settings from_entries(const entries &e);
};

/* Helpers for the value syntax above; empty on error. */
std::optional<int> parse_log_level(const std::string &s);
std::optional<bool> parse_bool(const std::string &s);
std::optional<std::chrono::microseconds> parse_microseconds(const std::string &s);

/*
 * Build settings from the defaults, then the file named by WARDEN_CONFIG
 * (if set), then the other environment variables. Errors are logged and
 * the offending source is skipped.
 */
settings load();

/* Copy of the process-wide settings. The first call loads them (see
 * load()) and applies them. */
settings current();

/* Install new process-wide settings and apply the logging ones. */
void apply_settings(const settings &s);

/* Force the process-wide settings to be loaded now. */
void init();

}  // namespace config
}  // namespace warden
