/**
 * @file join.cppm
 * @brief Fan-out / join for continuation-passing operations
 *
 * Usage Example:
 *   import coopmod.sync.join;
 *
 *   std::vector<async_fn<int>> tasks = {load_a, load_b, load_c};
 *
 *   parallel_locked<int>(std::move(tasks), [](join_result<int> r) {
 *       if (!r) {
 *           // r.error->first: first failure, r.error->errors: every failure
 *       }
 *       // r.values[i] is task i's value, nullopt where it failed
 *   });
 */
module;

#include <coopmod/config.hpp>

export module coopmod.sync.join;

import std;
import coopmod.core.error;
import coopmod.core.log;
import coopmod.sync.completion;
import coopmod.sync.wait_group;

namespace coopmod {

namespace detail {

template <typename T>
struct map_state {
    std::vector<std::optional<T>> slots;
    wait_group pending;
    completion<std::vector<T>> done;
    bool finished = false;
};

} // namespace detail

// =============================================================================
// map_join — launch every task, join when all completed
// =============================================================================

/// Start all tasks at once. done receives their values in task order, or the
/// first failure as soon as it happens (later completions are ignored).
/// An empty task list completes synchronously with an empty vector.
export template <typename T>
void map_join(std::vector<async_fn<T>> tasks, completion<std::vector<T>> done) {
    auto st = std::make_shared<detail::map_state<T>>();
    st->slots.resize(tasks.size());
    st->done = done ? std::move(done) : completion<std::vector<T>>([](result<std::vector<T>>) {});
    st->pending.add(static_cast<int>(tasks.size()));

    st->pending.wait([st] {
        if (st->finished)
            return;
        st->finished = true;
        std::vector<T> values;
        values.reserve(st->slots.size());
        for (auto& slot : st->slots)
            values.push_back(std::move(*slot));
        st->done(std::move(values));
    });

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        auto on_done = make_once<result<T>>([st, i](result<T> r) {
            if (r) {
                st->slots[i] = std::move(*r);
            } else if (!st->finished) {
                st->finished = true;
                st->done(fail(r.error()));
            }
            st->pending.done();
        }, "map_join task completion");

        if (!tasks[i]) {
            on_done(fail(errc::invalid_argument));
            continue;
        }
        tasks[i](std::move(on_done));
    }
}

// =============================================================================
// parallel_locked — join that never short-circuits
// =============================================================================

/// Aggregate failure: the first failure plus every failure in completion order
export struct join_error {
    std::error_code first;
    std::vector<std::error_code> errors;
};

export template <typename T>
struct join_result {
    std::vector<std::optional<T>> values;   ///< task order, nullopt where a task failed
    std::optional<join_error> error;        ///< set when at least one task failed

    explicit operator bool() const noexcept { return !error.has_value(); }
};

/// Run every task concurrently and wait for all of them. Failures do not
/// stop the join: they are collected and reported together in the result.
export template <typename T>
void parallel_locked(std::vector<async_fn<T>> tasks,
                     std::function<void(join_result<T>)> done)
{
    static_assert(!std::is_void_v<T>,
        "parallel_locked<T> needs a value type; use std::monostate for none");

    auto errors = std::make_shared<std::vector<std::error_code>>();
    auto count = tasks.size();

    std::vector<async_fn<std::optional<T>>> captured;
    captured.reserve(count);
    for (auto& task : tasks) {
        captured.push_back([errors, task = std::move(task)](completion<std::optional<T>> next) {
            if (!task) {
                errors->push_back(make_error_code(errc::invalid_argument));
                next(std::optional<T>{});
                return;
            }
            // The join only ever sees success; real outcomes go to `errors`
            task([errors, next](result<T> r) {
                if (!r) {
                    errors->push_back(r.error());
                    next(std::optional<T>{});
                    return;
                }
                next(std::optional<T>(std::move(*r)));
            });
        });
    }

    map_join<std::optional<T>>(std::move(captured),
        [errors, count, done = std::move(done)](result<std::vector<std::optional<T>>> r) {
            join_result<T> out;
            if (r) {
                out.values = std::move(*r);
            } else {
                // map_join was only ever told "success"
                logger::error("parallel_locked: join failed unexpectedly: {}", r.error().message());
                out.values.resize(count);
                errors->push_back(r.error());
            }
            if (!errors->empty()) {
                logger::debug("parallel_locked: {} of {} task(s) failed", errors->size(), count);
                out.error = join_error{errors->front(), *errors};
            }
            if (done)
                done(std::move(out));
        });
}

} // namespace coopmod
