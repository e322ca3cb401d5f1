/**
 * @file retry.h
 * @brief Bounded retry combinator
 */

#ifndef CYMO_CORE_RETRY_H
#define CYMO_CORE_RETRY_H

#include "types.h"

#include <cstddef>
#include <type_traits>
#include <utility>

namespace cymo {

/**
 * @brief Result of a bounded retry: the last result plus the attempt count
 */
template <typename T>
struct retry_result {
    result<T> value;
    std::size_t attempts = 0;
};

/**
 * @brief Run @p operation until it succeeds, at most retry_limit + 1 times
 *
 * There is no delay between attempts. @p on_failure is invoked after every
 * failed attempt that will be retried, with the error and the number of the
 * attempt that failed (1-based); it is where callers reconnect or log.
 *
 * @code
 * auto outcome = retry_with_limit(
 *     [&](std::size_t attempt) { return session.store(path, stream, mode); },
 *     3,
 *     [&](const error& err, std::size_t attempt) { reconnect(); });
 * @endcode
 */
template <typename Operation, typename OnFailure>
[[nodiscard]] auto retry_with_limit(Operation&& operation, std::size_t retry_limit,
                                    OnFailure&& on_failure)
    -> retry_result<typename std::invoke_result_t<Operation&, std::size_t>::value_type> {
    using value_type = typename std::invoke_result_t<Operation&, std::size_t>::value_type;

    const std::size_t max_attempts = retry_limit + 1;
    std::size_t attempt = 1;
    for (;; ++attempt) {
        auto outcome = operation(attempt);
        if (outcome.has_value() || attempt >= max_attempts) {
            return retry_result<value_type>{std::move(outcome), attempt};
        }
        on_failure(outcome.error(), attempt);
    }
}

/**
 * @brief retry_with_limit without a failure hook
 */
template <typename Operation>
[[nodiscard]] auto retry_with_limit(Operation&& operation, std::size_t retry_limit) {
    return retry_with_limit(std::forward<Operation>(operation), retry_limit,
                            [](const error&, std::size_t) {});
}

}  // namespace cymo

#endif  // CYMO_CORE_RETRY_H
