// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <courier/engine/engine.hpp>
#include <cstdint>
#include <mutex>

namespace courier::core {

// Hides the engine's download indicator while at least one Scope is alive.
// Nested and overlapping scopes are counted; the indicator comes back when
// the last one ends.
class VisibilitySuppressor {
public:
    class Scope {
    public:
        explicit Scope(VisibilitySuppressor& owner) noexcept;
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        Scope(Scope&&) = delete;
        Scope& operator=(Scope&&) = delete;

    private:
        VisibilitySuppressor& owner_;
    };

    explicit VisibilitySuppressor(engine::Engine& engine) noexcept : engine_(engine) {}

    [[nodiscard]] Scope suppress() noexcept { return Scope(*this); }

    [[nodiscard]] std::uint32_t depth() const noexcept;

private:
    void acquire() noexcept;
    void release() noexcept;

    engine::Engine& engine_;
    std::uint32_t depth_{0};
    mutable std::mutex mutex_;
};

} // namespace courier::core
