#ifndef WARDEN_LOG_H
#define WARDEN_LOG_H


#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>

/*
 * Subset from man 3 syslog.
 * If a certain logging level is set, only messages with a log level value <= it
 * are reported when logged.
 */
enum logLevel {
    WARDEN_LOG_CRIT=0,
    WARDEN_LOG_ERR=1,
    WARDEN_LOG_WARNING=2,
    WARDEN_LOG_INFO=3,
    WARDEN_LOG_DEBUG=4
};

/*
 * return current log level */
int get_current_log_level(void);

/*
 * Set current log level to <level>, which must be one of the values in the
 * logLevel enumeration. Returns the previous level, or -1 if <level> is
 * out of range (in which case the current level is left unchanged). */
int set_current_log_level(int level);

/*
 * Enable or disable the ANSI color sequences in the message tags.
 * When disabled, the escape sequences are stripped out before the
 * message is written. */
void set_log_colors(bool enabled);
bool get_log_colors(void);

/*
 * see https://github.com/vcsaturninus/termite/termite.lua FMI.
 */
#define WARDEN_CSI          "\033["  /* \033=\e, but that's a nonstandard extension */
#define WARDEN_SGR_RESET    WARDEN_CSI"0m"

#define WARDEN_BLACK      30
#define WARDEN_RED        31
#define WARDEN_GREEN      32
#define WARDEN_YELLOW     33
#define WARDEN_BLUE       34
#define WARDEN_MAGENTA    35
#define WARDEN_CYAN       36
#define WARDEN_WHITE      37

#define WARDEN_STR__(x)   #x
#define WARDEN_TKN2STR(x) WARDEN_STR__(x)

#define warden_color(color, text) \
    WARDEN_CSI WARDEN_TKN2STR(color)"m" text WARDEN_SGR_RESET

/*
 * Write a printf-style formatted message to stderr if <priority> is <= the
 * current log level. A newline is appended. Safe to call from multiple
 * threads at once: each message is written out whole. */
void log_message(int priority, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

#define log_crit(...)   log_message(WARDEN_LOG_CRIT,    warden_color(WARDEN_MAGENTA, "[CRIT] ") __VA_ARGS__)
#define log_error(...)  log_message(WARDEN_LOG_ERR,     warden_color(WARDEN_RED,     "[ERROR] ") __VA_ARGS__)
#define log_warn(...)   log_message(WARDEN_LOG_WARNING, warden_color(WARDEN_BLUE,    "[WARN] ") __VA_ARGS__)
#define log_info(...)   log_message(WARDEN_LOG_INFO,    warden_color(WARDEN_GREEN,   "[INFO] ") __VA_ARGS__)

#define log_debug__(fmt, ...) \
    log_message(WARDEN_LOG_DEBUG, \
        warden_color(WARDEN_YELLOW, "[DEBUG] ") "%s(),%s:%d | " \
        fmt "%s", __func__, __FILE__, __LINE__, __VA_ARGS__)

/* To silence warning about variadic macro expecting two params;
 * Notice the empty string passed as the second argument will be fed to the "%s"
 * format specifier placed after 'fmt' in the log_debug__ macro above; no matter
 * what 'fmt' is, a string format specifier is added at the end of it and this
 * empty string is fed to it */
#define log_debug(...) log_debug__( __VA_ARGS__, "")


#ifdef __cplusplus
} /* extern "C" */
#endif


#endif  /* WARDEN_LOG_H */
