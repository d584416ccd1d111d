#pragma once

#include <exception>
#include <string>

namespace mwin::common {

// Text for a failure carried across an async boundary.
inline std::string describeException(const std::exception_ptr& error) {
    if (!error) {
        return "unknown error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& ex) {
        return ex.what();
    } catch (...) {
        return "non-standard exception";
    }
}

}  // namespace mwin::common
