// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/core/visibility.hpp>

namespace courier::core {

VisibilitySuppressor::Scope::Scope(VisibilitySuppressor& owner) noexcept
    : owner_(owner) {
    owner_.acquire();
}

VisibilitySuppressor::Scope::~Scope() {
    owner_.release();
}

std::uint32_t VisibilitySuppressor::depth() const noexcept {
    auto lock = std::lock_guard(mutex_);
    return depth_;
}

void VisibilitySuppressor::acquire() noexcept {
    auto lock = std::lock_guard(mutex_);
    if (depth_++ == 0) {
        engine_.set_visibility(false);
    }
}

void VisibilitySuppressor::release() noexcept {
    auto lock = std::lock_guard(mutex_);
    if (depth_ > 0 && --depth_ == 0) {
        engine_.set_visibility(true);
    }
}

} // namespace courier::core
