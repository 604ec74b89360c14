// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <courier/engine/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace courier::engine {

// Engine-assigned handle of one transfer; 0 means "not dispatched"
using ExternalId = std::uint64_t;

struct Header {
    std::string name;
    std::string value;
};

// Everything the engine needs to start a transfer
struct DispatchRequest {
    std::string filename;                 // Destination path
    std::string conflict_action;          // e.g. "uniquify", "overwrite"
    bool save_as{false};                  // Never prompt interactively
    std::string url;
    std::optional<std::string> method;    // Set iff body is set
    std::optional<std::string> body;
    std::vector<Header> headers;
    std::optional<bool> incognito;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;
    // Returns the number of headers removed
    std::size_t remove_header(std::string_view name) noexcept;
};

enum class TransferState : std::uint8_t {
    in_progress,
    interrupted,
    complete
};

// Engine's view of one transfer
struct EngineStatus {
    ExternalId id{0};
    std::int64_t bytes_received{0};
    std::int64_t total_bytes{0};
    std::optional<std::int64_t> file_size;
    std::string filename;
    TransferState state{TransferState::in_progress};
    bool paused{false};
    std::optional<std::string> error;
    bool can_resume{false};
};

// What the host platform lets a dispatch carry
struct EngineTraits {
    bool request_headers{true};
    bool private_dispatch{true};
};

// Capability surface of the host download engine.
//
// Calls block until the engine answers. Implementations must tolerate calls
// from the owning thread and from the Janitor's worker thread.
class Engine {
public:
    virtual ~Engine() = default;

    // EngineErrc::not_found when the engine has no such entry
    [[nodiscard]] virtual std::expected<EngineStatus, std::error_code>
    search(ExternalId id) = 0;

    [[nodiscard]] virtual std::expected<ExternalId, std::error_code>
    dispatch(const DispatchRequest& request) = 0;

    // Some engines only answer once the transfer finishes; never wait on it
    // from the owning thread.
    [[nodiscard]] virtual std::error_code resume(ExternalId id) = 0;

    [[nodiscard]] virtual std::error_code pause(ExternalId id) = 0;
    [[nodiscard]] virtual std::error_code cancel(ExternalId id) = 0;

    // Forget a finished or dead entry
    [[nodiscard]] virtual std::error_code erase(ExternalId id) = 0;

    // Toggle the host's global download indicator
    virtual void set_visibility(bool visible) noexcept = 0;

    [[nodiscard]] virtual EngineTraits traits() const noexcept = 0;
};

[[nodiscard]] std::string_view to_string(TransferState state) noexcept;

} // namespace courier::engine
