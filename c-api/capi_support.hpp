#ifndef __CAPI_SUPPORT_HPP___
#define __CAPI_SUPPORT_HPP___

#include <cstring>
#include <exception>
#include <string>

/**
 * @file capi_support.hpp
 * @brief Helpers shared by the `extern "C"` entry points.
 */

namespace capi {

/**
 * @brief Run `body` and map any std::exception to `failure_code`.
 *
 * Exceptions must not cross the C boundary.
 */
template <typename Body>
int guarded(int failure_code, Body&& body) {
    try {
        return body();
    } catch (const std::exception&) {
        return failure_code;
    }
}

/**
 * @brief Whether `text` plus its terminating NUL fits in a buffer of `capacity` bytes.
 */
inline bool fits(const std::string& text, int capacity) {
    return capacity > 0 && text.size() < static_cast<size_t>(capacity);
}

/**
 * @brief Copy `text` NUL-terminated into `buffer`. Callers check fits() first.
 */
inline void copy_out(const std::string& text, char* buffer) {
    std::memcpy(buffer, text.c_str(), text.size() + 1);
}

} // namespace capi

#endif // __CAPI_SUPPORT_HPP___
