// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace courier::core {

enum class CourierErrc {
    success = 0,
    invalid_state,
    dispatch_failed,
    control_failed,
    unknown_download,
};

namespace detail {

struct CourierErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "courier::core";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<CourierErrc>(ev)) {
            case CourierErrc::success:           return "Success";
            case CourierErrc::invalid_state:     return "Invalid state";
            case CourierErrc::dispatch_failed:   return "Engine rejected the download";
            case CourierErrc::control_failed:    return "Engine rejected the control request";
            case CourierErrc::unknown_download:  return "Unknown download";
            default:                             return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::CourierErrcCategory& courier_errc_category() noexcept {
    static detail::CourierErrcCategory category;
    return category;
}

inline std::error_code make_error_code(CourierErrc e) noexcept {
    return {static_cast<int>(e), courier_errc_category()};
}

} // namespace courier::core

namespace std {

template<>
struct is_error_code_enum<courier::core::CourierErrc> : true_type {};

} // namespace std
