#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>

#include <utility>

namespace shaderpad {

// Moves a successfully built candidate into the live slot. On failure the
// slot is left untouched and the candidate's error is returned.
//
// beforeCommit runs only on success, right before the move. Reload passes
// a device idle wait here so the old object is no longer in use when its
// destructor runs.
template <typename T, typename BeforeCommit>
[[nodiscard]] Result<void> replaceIfOk(T& live, Result<T>&& candidate,
                                       BeforeCommit&& beforeCommit) {
    if (!candidate.ok()) {
        return std::move(candidate).error();
    }
    std::forward<BeforeCommit>(beforeCommit)();
    live = std::move(candidate).value();
    return {};
}

template <typename T>
[[nodiscard]] Result<void> replaceIfOk(T& live, Result<T>&& candidate) {
    return replaceIfOk(live, std::move(candidate), [] {});
}

} // namespace shaderpad
