/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string_view>

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

namespace utils {

// Reads the whole file. Fails with std::system_error if it cannot be opened.
seastar::future<seastar::sstring> read_entire_file(std::filesystem::path path);

// Creates or truncates the file and writes `data` to it. The write is not
// atomic: a concurrent reader may observe a partially written file.
seastar::future<> write_entire_file(std::filesystem::path path, std::string_view data);

} // namespace utils
