#ifndef NOTESYNC_HPP
#define NOTESYNC_HPP

/*
 * notesync: a single document kept in sync between machines through one
 * versioned object in S3.
 * Copyright (c) 2026 notesync contributors
 * Licensed under the MIT License
 *
 * Versions are RFC 1123 timestamps with one second resolution. Reads are
 * conditional (If-Modified-Since), writes are optimistic (Last-Modified
 * must be newer than what is stored) unless forced.
 *
 * storage/s3_backend.hpp is not included here; it needs the AWS SDK.
 */

// Core Components
#include "core/status.hpp"
#include "core/version_token.hpp"
#include "core/versioned_object_store.hpp"

// Storage
#include "storage/object_backend.hpp"
#include "storage/memory_backend.hpp"

// Network
#include "network/base64.hpp"
#include "network/html_view.hpp"
#include "network/sync_endpoint.hpp"
#include "network/http_server.hpp"
#include "network/http_transport.hpp"

// Client
#include "client/sync_client.hpp"

// Configuration and logging
#include "config/arguments.hpp"
#include "config/server_config.hpp"
#include "config/client_config.hpp"
#include "logging.hpp"

namespace notesync {
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    static const char* VERSION_STRING = "1.0.0";
}

#endif // NOTESYNC_HPP
