/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "file_io.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>

namespace utils {

using namespace seastar;

future<sstring> read_entire_file(std::filesystem::path path) {
    auto f = co_await open_file_dma(path.native(), open_flags::ro);
    sstring data;
    std::exception_ptr ex;

    try {
        auto sz = co_await f.size();
        auto buf = co_await f.dma_read_exactly<char>(0, sz);
        data = sstring(buf.get(), buf.size());
    } catch (...) {
        ex = std::current_exception();
    }
    co_await f.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    co_return data;
}

future<> write_entire_file(std::filesystem::path path, std::string_view data) {
    auto f = co_await open_file_dma(path.native(), open_flags::create | open_flags::truncate | open_flags::wo);
    auto os = co_await make_file_output_stream(std::move(f));
    std::exception_ptr ex;

    try {
        co_await os.write(data.data(), data.size());
        co_await os.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await os.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

} // namespace utils
