module;

#include <coopmod/config.hpp>

export module coopmod.core.error;

import std;

namespace coopmod {

// =============================================================================
// Error codes
// =============================================================================

/// Failures reported through completion continuations
export enum class errc {
    success = 0,

    // Cooperative cancellation
    interrupted,               ///< A cancellation point yielded the lock to waiters

    // Operation outcome
    critical_section_failed,   ///< Critical section threw a non-system_error exception
    operation_failed,          ///< Generic failure reported by a task

    // Usage
    invalid_argument,
    unknown_error,
};

// =============================================================================
// error_category
// =============================================================================

/// coopmod error category
export class coop_error_category : public std::error_category {
public:
    [[nodiscard]] auto name() const noexcept -> const char* override {
        return "coopmod";
    }

    [[nodiscard]] auto message(int ev) const -> std::string override;
};

/// Global coop_error_category instance
export [[nodiscard]] auto coop_category() noexcept
    -> const std::error_category&;

/// Build a std::error_code
export [[nodiscard]] inline auto make_error_code(errc e) noexcept
    -> std::error_code
{
    return {static_cast<int>(e), coop_category()};
}

/// True if ec signals a cooperative cancellation
export [[nodiscard]] inline auto is_interrupted(const std::error_code& ec) noexcept
    -> bool
{
    return ec == make_error_code(errc::interrupted);
}

/// Map an in-flight exception to the code a completion should receive.
/// std::system_error keeps its own code, anything else becomes `fallback`.
export [[nodiscard]] auto error_from_exception(std::exception_ptr ep,
                                               errc fallback) noexcept
    -> std::error_code;

} // namespace coopmod

// Register with std::error_code
template <>
struct std::is_error_code_enum<coopmod::errc> : std::true_type {};
