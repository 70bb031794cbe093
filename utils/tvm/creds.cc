/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "creds.hh"

namespace tvm {

std::string_view endpoint_suffix(endpoint_kind kind) noexcept {
    switch (kind) {
    case endpoint_kind::aws_s3:
        return "aws/s3";
    case endpoint_kind::azure_blob:
        return "azure/blob";
    }
    return {};
}

std::string_view endpoint_name(endpoint_kind kind) noexcept {
    switch (kind) {
    case endpoint_kind::aws_s3:
        return "aws-s3";
    case endpoint_kind::azure_blob:
        return "azure-blob";
    }
    return "unknown";
}

std::optional<endpoint_kind> endpoint_from_name(std::string_view name) noexcept {
    for (auto kind : {endpoint_kind::aws_s3, endpoint_kind::azure_blob}) {
        if (name == endpoint_name(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

namespace {

// Consumes exactly `width` decimal digits from the front of str
std::optional<int> take_number(std::string_view& str, size_t width) {
    if (str.size() < width) {
        return std::nullopt;
    }
    int res = 0;
    for (size_t i = 0; i < width; ++i) {
        if (str[i] < '0' || str[i] > '9') {
            return std::nullopt;
        }
        res = res * 10 + (str[i] - '0');
    }
    str.remove_prefix(width);
    return res;
}

bool take_char(std::string_view& str, char c) {
    if (str.empty() || str.front() != c) {
        return false;
    }
    str.remove_prefix(1);
    return true;
}

} // anonymous namespace

// A timestamp without an offset designator is taken as UTC.
std::optional<clock_type::time_point> parse_iso8601(std::string_view str) {
    using namespace std::chrono;

    auto year = take_number(str, 4);
    if (!year || !take_char(str, '-')) {
        return std::nullopt;
    }
    auto month = take_number(str, 2);
    if (!month || !take_char(str, '-')) {
        return std::nullopt;
    }
    auto day = take_number(str, 2);
    if (!day || !take_char(str, 'T')) {
        return std::nullopt;
    }
    auto hour = take_number(str, 2);
    if (!hour || !take_char(str, ':')) {
        return std::nullopt;
    }
    auto minute = take_number(str, 2);
    if (!minute || !take_char(str, ':')) {
        return std::nullopt;
    }
    auto second = take_number(str, 2);
    if (!second || *hour > 23 || *minute > 59 || *second > 59) {
        return std::nullopt;
    }

    year_month_day ymd{std::chrono::year{*year}, std::chrono::month(*month), std::chrono::day(*day)};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    clock_type::duration fraction{};
    if (take_char(str, '.')) {
        nanoseconds frac{};
        size_t digits = 0;
        while (!str.empty() && str.front() >= '0' && str.front() <= '9') {
            if (digits < 9) {
                frac = frac * 10 + nanoseconds(str.front() - '0');
                ++digits;
            }
            str.remove_prefix(1);
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 9; ++digits) {
            frac *= 10;
        }
        fraction = duration_cast<clock_type::duration>(frac);
    }

    minutes offset{0};
    if (take_char(str, 'Z') || take_char(str, 'z')) {
        // UTC
    } else if (!str.empty() && (str.front() == '+' || str.front() == '-')) {
        int sign = str.front() == '-' ? -1 : 1;
        str.remove_prefix(1);
        auto off_hours = take_number(str, 2);
        if (!off_hours) {
            return std::nullopt;
        }
        take_char(str, ':');
        auto off_minutes = take_number(str, 2);
        if (!off_minutes || *off_hours > 23 || *off_minutes > 59) {
            return std::nullopt;
        }
        offset = sign * (hours(*off_hours) + minutes(*off_minutes));
    }
    if (!str.empty()) {
        return std::nullopt;
    }

    auto tp = sys_days(ymd) + hours(*hour) + minutes(*minute) + seconds(*second) - offset;
    return time_point_cast<clock_type::duration>(tp) + fraction;
}

std::string format_iso8601(clock_type::time_point tp) {
    using namespace std::chrono;
    auto ms = floor<milliseconds>(tp);
    auto days = floor<std::chrono::days>(ms);
    year_month_day ymd{days};
    hh_mm_ss hms{ms - days};
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
            int(ymd.year()), unsigned(ymd.month()), unsigned(ymd.day()),
            hms.hours().count(), hms.minutes().count(), hms.seconds().count(), hms.subseconds().count());
}

credentials::credentials(rjson::value blob)
    : _blob(std::move(blob))
{
    if (!_blob.IsObject()) {
        throw rjson::error("Credentials must be a JSON object");
    }
}

credentials::credentials(const credentials& o)
    : _blob(rjson::copy(o._blob))
{}

credentials& credentials::operator=(const credentials& o) {
    if (this != &o) {
        _blob = rjson::copy(o._blob);
    }
    return *this;
}

credentials credentials::parse(std::string_view str) {
    return credentials(rjson::parse(str));
}

std::optional<std::string_view> credentials::expiration() const {
    auto* exp = rjson::find(_blob, "expiration");
    if (!exp || !exp->IsString()) {
        return std::nullopt;
    }
    return rjson::to_string_view(*exp);
}

std::optional<clock_type::time_point> credentials::expires_at() const {
    auto exp = expiration();
    if (!exp) {
        return std::nullopt;
    }
    return parse_iso8601(*exp);
}

static clock_type::time_point required_expiration(const credentials& creds) {
    auto exp = rjson::get_string(creds.blob(), "expiration");
    auto tp = parse_iso8601(exp);
    if (!tp) {
        throw rjson::error(fmt::format("Invalid expiration timestamp: {}", exp));
    }
    return *tp;
}

aws_s3_credentials aws_s3_credentials::from(const credentials& creds) {
    const auto& blob = creds.blob();
    return aws_s3_credentials{
        .access_key_id = std::string(rjson::get_string(blob, "accessKeyId")),
        .secret_access_key = std::string(rjson::get_string(blob, "secretAccessKey")),
        .session_token = std::string(rjson::get_string(blob, "sessionToken")),
        .bucket = std::string(rjson::get_string(rjson::get(blob, "params"), "Bucket")),
        .expires_at = required_expiration(creds),
    };
}

azure_blob_credentials azure_blob_credentials::from(const credentials& creds) {
    const auto& blob = creds.blob();
    return azure_blob_credentials{
        .sas_url_private = std::string(rjson::get_string(blob, "sasURLPrivate")),
        .sas_url_public = std::string(rjson::get_string(blob, "sasURLPublic")),
        .expires_at = required_expiration(creds),
    };
}

} // namespace tvm
