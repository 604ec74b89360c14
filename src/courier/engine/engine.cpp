// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/engine/engine.hpp>
#include <algorithm>

namespace courier::engine {

bool DispatchRequest::has_header(std::string_view name) const noexcept {
    return std::any_of(headers.begin(), headers.end(),
                       [name](const Header& h) { return h.name == name; });
}

std::size_t DispatchRequest::remove_header(std::string_view name) noexcept {
    return std::erase_if(headers, [name](const Header& h) { return h.name == name; });
}

std::string_view to_string(TransferState state) noexcept {
    switch (state) {
        case TransferState::in_progress: return "in_progress";
        case TransferState::interrupted: return "interrupted";
        case TransferState::complete:    return "complete";
    }
    return "unknown";
}

} // namespace courier::engine
