// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/core/download_state.hpp>

namespace courier::core {

std::string_view to_string(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::queued:    return "queued";
        case DownloadState::running:   return "running";
        case DownloadState::paused:    return "paused";
        case DownloadState::retrying:  return "retrying";
        case DownloadState::canceled:  return "canceled";
        case DownloadState::missing:   return "missing";
        case DownloadState::done:      return "done";
    }
    return "unknown";
}

std::string_view to_string(Capability cap) noexcept {
    switch (cap) {
        case Capability::forcable:   return "forcable";
        case Capability::pausable:   return "pausable";
        case Capability::cancelable: return "cancelable";
    }
    return "unknown";
}

std::optional<DownloadState> parse_state(std::string_view name) noexcept {
    for (auto state : ALL_STATES) {
        if (to_string(state) == name) {
            return state;
        }
    }
    return std::nullopt;
}

} // namespace courier::core
