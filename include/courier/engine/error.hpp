// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace courier::engine {

// Failures reported by the host download engine
enum class EngineErrc {
    success = 0,
    not_found,
    rejected,
    not_resumable,
    unavailable,
    invalid_request,
};

namespace detail {

struct EngineErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "courier::engine";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<EngineErrc>(ev)) {
            case EngineErrc::success:          return "Success";
            case EngineErrc::not_found:        return "No such download";
            case EngineErrc::rejected:         return "Download rejected";
            case EngineErrc::not_resumable:    return "Download cannot be resumed";
            case EngineErrc::unavailable:      return "Engine unavailable";
            case EngineErrc::invalid_request:  return "Invalid request";
            default:                           return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::EngineErrcCategory& engine_errc_category() noexcept {
    static detail::EngineErrcCategory category;
    return category;
}

inline std::error_code make_error_code(EngineErrc e) noexcept {
    return {static_cast<int>(e), engine_errc_category()};
}

} // namespace courier::engine

namespace std {

template<>
struct is_error_code_enum<courier::engine::EngineErrc> : true_type {};

} // namespace std
