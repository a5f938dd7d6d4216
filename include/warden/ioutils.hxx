#pragma once

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

namespace warden {
namespace utils {
namespace io {

// Format a string printf-style.
template<typename... Args>
std::string sfmt(const std::string &fmt, Args... vargs) {
    /* get total number of characters that snprintf would've written; +1
     * since the return value does not account for the terminating NULL */
    int len = std::snprintf(nullptr, 0, fmt.c_str(), vargs...) + 1;
    if (len <= 0) {
        throw std::runtime_error("sfmt string formatting error");
    }

    size_t buffsz = static_cast<size_t>(len);
    std::unique_ptr<char[]> buff(new char[buffsz]);

    std::snprintf(buff.get(), buffsz, fmt.c_str(), vargs...);

    /* -1 to leave out the terminating Null */
    return std::string(buff.get(), buff.get() + buffsz - 1);
}

}  // namespace io
}  // namespace utils
}  // namespace warden
