#include "core/errors.hpp"

namespace muxcache {

bool is_connectivity_error(const std::exception_ptr& error) {
    if (!error) {
        return false;
    }
    try {
        std::rethrow_exception(error);
    } catch (const ConnectivityError&) {
        return true;
    } catch (const std::exception&) {
        return false;
    } catch (...) {
        return false;  // not an exception type we know
    }
}

std::string error_message(const std::exception_ptr& error) {
    if (!error) {
        return "";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "Unknown error";
    }
}

} // namespace muxcache
