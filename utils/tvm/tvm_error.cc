/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "tvm_error.hh"

namespace tvm {

std::string_view to_string(error_code code) noexcept {
    switch (code) {
    case error_code::bad_argument:
        return "BadArgument";
    case error_code::status_error:
        return "StatusError";
    case error_code::transport_error:
        return "TransportError";
    }
    return "Unknown";
}

static std::string format_fetch_error(seastar::http::reply::status_type status, const std::string& body, std::string_view reason) {
    if (reason.empty()) {
        return fmt::format("[{}] TVM request failed with status {}: {}", error_code::status_error, static_cast<int>(status), body);
    }
    return fmt::format("[{}] TVM request failed with status {} ({}): {}", error_code::status_error, static_cast<int>(status), reason, body);
}

remote_fetch_error::remote_fetch_error(seastar::http::reply::status_type status, std::string body, std::string_view reason)
    : tvm_exception(error_code::status_error, format_fetch_error(status, body, reason))
    , _status(status)
    , _body(std::move(body)) {
}

} // namespace tvm
