// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <courier/core/download_state.hpp>
#include <courier/engine/engine.hpp>

namespace courier::core {

class Download;

// What a Download needs from the collection that owns it
class Registrar {
public:
    virtual ~Registrar() = default;

    // Schedule eventual persistence of the task
    virtual void set_dirty(Download& download) = 0;

    virtual void changed_state(Download& download, DownloadState old_state,
                               DownloadState new_state) = 0;

    // Route engine events for `id` to `download`; non-owning
    virtual void add_external_id(engine::ExternalId id, Download& download) = 0;
    virtual void remove_external_id(engine::ExternalId id) = 0;

    // Dispatch now, ahead of the regular scheduling order
    virtual void start_download(Download& download) = 0;
};

} // namespace courier::core
