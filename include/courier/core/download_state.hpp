// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace courier::core {

enum class DownloadState : std::uint8_t {
    queued,      // Waiting for a dispatch slot
    running,     // Dispatched, engine is transferring
    paused,      // Paused by the user or the engine
    retrying,    // Waiting to be dispatched again after a transient failure
    canceled,    // Canceled or failed to dispatch
    missing,     // Engine no longer knows about the transfer
    done         // Engine reported completion
};

// Operations that only act in a subset of states
enum class Capability : std::uint8_t {
    forcable,    // resume(): state still carries request intent
    pausable,    // pause()
    cancelable   // cancel()
};

inline constexpr std::array<DownloadState, 4> FORCABLE_STATES{
    DownloadState::queued, DownloadState::paused,
    DownloadState::canceled, DownloadState::retrying};

inline constexpr std::array<DownloadState, 3> PAUSABLE_STATES{
    DownloadState::running, DownloadState::queued, DownloadState::retrying};

inline constexpr std::array<DownloadState, 4> CANCELABLE_STATES{
    DownloadState::running, DownloadState::queued,
    DownloadState::paused, DownloadState::retrying};

inline constexpr std::array<DownloadState, 7> ALL_STATES{
    DownloadState::queued, DownloadState::running, DownloadState::paused,
    DownloadState::retrying, DownloadState::canceled, DownloadState::missing,
    DownloadState::done};

[[nodiscard]] constexpr std::span<const DownloadState> states_for(Capability cap) noexcept {
    switch (cap) {
        case Capability::forcable:   return FORCABLE_STATES;
        case Capability::pausable:   return PAUSABLE_STATES;
        case Capability::cancelable: return CANCELABLE_STATES;
    }
    return {};
}

[[nodiscard]] constexpr bool permits(Capability cap, DownloadState state) noexcept {
    auto states = states_for(cap);
    return std::find(states.begin(), states.end(), state) != states.end();
}

[[nodiscard]] std::string_view to_string(DownloadState state) noexcept;
[[nodiscard]] std::string_view to_string(Capability cap) noexcept;

[[nodiscard]] std::optional<DownloadState> parse_state(std::string_view name) noexcept;

} // namespace courier::core
