#ifndef POLL_HPP
#define POLL_HPP

#include <chrono>       // for milliseconds
#include <cstdint>      // for uint32_t
#include <functional>   // for invoke
#include <optional>     // for optional
#include <string_view>  // for string_view
#include <thread>       // for sleep_for
#include <type_traits>  // for invoke_result_t, remove_cvref_t

#include <spdlog/spdlog.h>

namespace strata::utils {

/// @brief Timeout budget for a polling loop: attempts x interval.
struct PollPolicy final {
    std::uint32_t attempts{10};
    std::chrono::milliseconds interval{1000};
};

/// @brief Bounded poll used for every kernel-consistency wait.
///
/// Invokes @p probe up to policy.attempts times, sleeping policy.interval
/// between attempts, until it yields a value.
/// @param what Short description for the log, e.g. "partition /dev/sda2".
/// @param probe Callable returning std::optional<T>. It is expected to rescan
///              the device tree itself on every call.
/// @return The first engaged value, or std::nullopt once the budget is exhausted.
template <typename Probe>
auto poll_until(const PollPolicy& policy, std::string_view what, Probe&& probe) noexcept
    -> std::remove_cvref_t<std::invoke_result_t<Probe&>> {
    for (std::uint32_t attempt = 1; attempt <= policy.attempts; ++attempt) {
        auto res = std::invoke(probe);
        if (res.has_value()) {
            return res;
        }
        spdlog::debug("[poll] {} not ready (attempt {}/{})", what, attempt, policy.attempts);
        if (attempt != policy.attempts && policy.interval.count() > 0) {
            std::this_thread::sleep_for(policy.interval);
        }
    }
    spdlog::error("[poll] {} timed out after {} attempts", what, policy.attempts);
    return std::nullopt;
}

}  // namespace strata::utils

#endif  // POLL_HPP
