/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <seastar/http/reply.hh>

namespace tvm {

enum class error_code {
    bad_argument,
    status_error,
    transport_error,
};

std::string_view to_string(error_code code) noexcept;

class tvm_exception : public std::runtime_error {
    error_code _code;
public:
    tvm_exception(error_code code, const std::string& msg)
        : std::runtime_error(msg)
        , _code(code) {
    }
    [[nodiscard]] error_code code() const noexcept { return _code; }
};

// Invalid client configuration, raised before any I/O happens
class configuration_error : public tvm_exception {
public:
    explicit configuration_error(const std::string& msg)
        : tvm_exception(error_code::bad_argument, msg) {
    }
};

// The token vending machine answered with a non-success status or with a body
// that is not a credentials object
class remote_fetch_error : public tvm_exception {
    seastar::http::reply::status_type _status;
    std::string _body;
public:
    remote_fetch_error(seastar::http::reply::status_type status, std::string body, std::string_view reason = "");

    [[nodiscard]] seastar::http::reply::status_type status() const noexcept { return _status; }
    [[nodiscard]] const std::string& body() const noexcept { return _body; }
};

// The token vending machine could not be reached (DNS, connect, TLS, socket errors)
class transport_error : public tvm_exception {
public:
    explicit transport_error(const std::string& msg)
        : tvm_exception(error_code::transport_error, msg) {
    }
};

} // namespace tvm

template <> struct fmt::formatter<tvm::error_code> : fmt::formatter<std::string_view> {
    auto format(tvm::error_code code, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(tvm::to_string(code), ctx);
    }
};
