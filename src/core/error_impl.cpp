module;

#include <coopmod/config.hpp>

module coopmod.core.error;

namespace coopmod {

auto coop_error_category::message(int ev) const -> std::string {
    switch (static_cast<errc>(ev)) {
        case errc::success:                 return "success";
        case errc::interrupted:             return "interrupted";
        case errc::critical_section_failed: return "critical section failed";
        case errc::operation_failed:        return "operation failed";
        case errc::invalid_argument:        return "invalid argument";
        case errc::unknown_error:           return "unknown error";
        default:                            return "unrecognized error";
    }
}

auto coop_category() noexcept -> const std::error_category& {
    static const coop_error_category instance;
    return instance;
}

auto error_from_exception(std::exception_ptr ep, errc fallback) noexcept
    -> std::error_code
{
    if (!ep)
        return make_error_code(fallback);
    try {
        std::rethrow_exception(ep);
    } catch (const std::system_error& e) {
        return e.code();
    } catch (...) {
        return make_error_code(fallback);
    }
}

} // namespace coopmod
