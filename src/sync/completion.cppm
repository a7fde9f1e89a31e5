/**
 * @file completion.cppm
 * @brief Continuation-passing convention shared by every coopmod primitive
 *
 * Every asynchronous operation takes a trailing completion that is invoked
 * exactly once with a result<T>: a value (or nothing, for T = void) on
 * success, a std::error_code on failure.
 *
 *   void fetch(int id, completion<std::string> done);
 *
 *   fetch(7, [](result<std::string> r) {
 *       if (!r) { logger::warn("fetch failed: {}", r.error().message()); return; }
 *       use(*r);
 *   });
 */
module;

#include <coopmod/config.hpp>

export module coopmod.sync.completion;

import std;
import coopmod.core.error;
import coopmod.core.log;

namespace coopmod {

/// Outcome delivered to a completion
export template <typename T>
using result = std::expected<T, std::error_code>;

/// Completion continuation
export template <typename T>
using completion = std::function<void(result<T>)>;

/// An asynchronous operation reduced to its completion: arguments are bound
/// by the caller, the completion is the only parameter
export template <typename T>
using async_fn = std::function<void(completion<T>)>;

/// Failure shorthand: `done(fail(errc::interrupted))`
export [[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code>
{
    return std::unexpected(ec);
}

export [[nodiscard]] inline auto fail(errc e)
    -> std::unexpected<std::error_code>
{
    return std::unexpected(make_error_code(e));
}

/// Wrap fn so only its first invocation goes through. Later calls are
/// dropped and logged at warn level with `what` as the subject.
/// Copies of the returned function share the same one-shot flag.
/// Args are given explicitly: make_once<result<int>>(fn, "...")
export template <typename... Args>
auto make_once(std::type_identity_t<std::function<void(Args...)>> fn, const char* what)
    -> std::function<void(Args...)>
{
    auto fired = std::make_shared<bool>(false);
    return [fn = std::move(fn), fired, what](Args... args) {
        if (*fired) {
            logger::warn("{} invoked more than once, ignored", what);
            return;
        }
        *fired = true;
        if (fn)
            fn(std::forward<Args>(args)...);
    };
}

} // namespace coopmod
