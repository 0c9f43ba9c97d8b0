#include "tools/json_render.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <optional>

namespace sqlgate::render {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

std::optional<bool> parse_bool(std::string_view text) {
    const std::string lower = utils::to_lower(utils::trim(text));
    if (lower == "t" || lower == "true" || lower == "1") return true;
    if (lower == "f" || lower == "false" || lower == "0") return false;
    return std::nullopt;
}

} // anonymous namespace

bool is_finite_json_number(std::string_view text) {
    size_t i = 0;
    const size_t n = text.size();

    if (i < n && text[i] == '-') ++i;
    if (i >= n) return false;

    // int: 0 | [1-9][0-9]*
    if (text[i] == '0') {
        ++i;
    } else if (is_digit(text[i])) {
        while (i < n && is_digit(text[i])) ++i;
    } else {
        return false;
    }

    if (i < n && text[i] == '.') {
        ++i;
        if (i >= n || !is_digit(text[i])) return false;
        while (i < n && is_digit(text[i])) ++i;
    }

    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
        if (i >= n || !is_digit(text[i])) return false;
        while (i < n && is_digit(text[i])) ++i;
    }

    if (i != n) return false;

    // Reject magnitudes a double cannot hold (1e999)
    double parsed = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + n, parsed);
    return ec == std::errc{} && ptr == text.data() + n && std::isfinite(parsed);
}

std::string field(const FieldValue& value) {
    if (!value.data) {
        return "null";
    }
    const std::string& text = *value.data;

    if (value.type == GenericColumnType::BOOLEAN) {
        if (const auto b = parse_bool(text)) {
            return utils::booltostr(*b);
        }
        return utils::json_string(text);
    }
    if (is_numeric(value.type)) {
        return is_finite_json_number(text) ? text : utils::json_string(text);
    }
    if (value.type == GenericColumnType::BLOB) {
        return utils::json_string(base64::encode(text));
    }
    return utils::json_string(text);
}

std::string rows(const std::vector<ResultRow>& rows) {
    std::string out = "[";
    for (size_t r = 0; r < rows.size(); ++r) {
        if (r > 0) out += ',';
        out += '{';
        const auto& row = rows[r];
        bool first = true;
        for (size_t c = 0; c < row.size(); ++c) {
            const auto same_label = [&](const NamedField& f) { return f.label == row[c].label; };
            // Repeated label: keep the first position, show the last value
            if (std::any_of(row.begin(), row.begin() + c, same_label)) continue;
            const auto last = std::find_if(row.rbegin(), row.rend(), same_label);

            if (!first) out += ',';
            first = false;
            out += utils::json_string(row[c].label);
            out += ':';
            out += field(last->value);
        }
        out += '}';
    }
    out += ']';
    return out;
}

std::string connection(const ConnectionInfo& info) {
    return std::format(R"({{"connectionId":{},"url":{}}})",
        utils::json_string(info.handle), utils::json_string(info.url));
}

std::string connections(const std::vector<ConnectionInfo>& list) {
    std::string out = "[";
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) out += ',';
        out += connection(list[i]);
    }
    out += ']';
    return out;
}

std::string audit_entries(const std::vector<WriteAuditEntry>& entries) {
    std::string out = "[";
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        if (i > 0) out += ',';
        out += std::format(
            R"({{"timestamp":{},"connectionId":{},"verb":{},"durationMs":{},"affectedRows":{}}})",
            utils::to_epoch_millis(e.timestamp), utils::json_string(e.handle),
            utils::json_string(e.verb), e.duration.count(), e.affected_rows);
    }
    out += ']';
    return out;
}

std::string limits(const ResultLimits& limits) {
    return std::format(R"({{"maxQueryRows":{},"maxFieldLength":{}}})",
        limits.max_query_rows, limits.max_field_length);
}

std::string string_array(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += utils::json_string(values[i]);
    }
    out += ']';
    return out;
}

} // namespace sqlgate::render
