#pragma once

#include <exception>
#include <string>
#include <utility>

#include <warden/ioutils.hxx>
#include <warden/log.h>

namespace warden {
namespace exception {

/* Raised when an accessor that does not (or no longer) own the lock of
 * its guarded object is dereferenced. */
class bad_access : public std::exception {
public:
    explicit bad_access(const char *message) : m_errstring(message) {}

    explicit bad_access(const std::string &message) : m_errstring(message) {}

    virtual ~bad_access() noexcept {}

    virtual const char *what() const noexcept { return m_errstring.c_str(); }

protected:
    std::string m_errstring;
};

class bad_value : public std::exception {
public:
    explicit bad_value(const char *message) : m_errstring(message) {}

    explicit bad_value(const std::string &message) : m_errstring(message) {}

    virtual ~bad_value() noexcept {}

    virtual const char *what() const noexcept { return m_errstring.c_str(); }

protected:
    std::string m_errstring;
};

class config_error : public std::exception {
public:
    explicit config_error(const char *message) : m_errstring(message) {}

    explicit config_error(const std::string &message)
        : m_errstring(message) {}

    virtual ~config_error() noexcept {}

    virtual const char *what() const noexcept { return m_errstring.c_str(); }

protected:
    std::string m_errstring;
};

// Throw an exception with a formatted message.
// The input args are fed directly to snprintf
// to produce a formatted string.
// Example:
//    do_throwc<std::logic_error>("BUG in myfunc: %s", errstr);
template<typename exception_t, typename... msg>
[[noreturn]] void do_throwc(msg &&...vargs) {
    throw exception_t(utils::io::sfmt(std::forward<msg>(vargs)...));
}

}  // namespace exception
}  // namespace warden

/*
 * Verify that an accessor owns the lock of its guarded object before
 * the payload is handed out. A violation is logged and reported by
 * throwing warden::exception::bad_access.
 */
#ifdef WARDEN_DISABLE_ACCESS_CHECKS
#define WARDEN_CHECK_ACCESS(owns) \
    do {                          \
    } while (0)
#else
#define WARDEN_CHECK_ACCESS(owns)                                            \
    do {                                                                     \
        if (!(owns)) {                                                       \
            log_error("accessor used without holding the lock in %s",        \
                      __PRETTY_FUNCTION__);                                  \
            throw warden::exception::bad_access(                             \
              "Illegal attempt to dereference a released accessor in " +     \
              std::string(__PRETTY_FUNCTION__));                             \
        }                                                                    \
    } while (0)
#endif
