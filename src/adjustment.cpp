/// @file adjustment.cpp
/// @brief Adjustment parsing, rounding and amount formatting
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "adjustment.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace repricer_cpp {

namespace {

std::string_view trimWhitespace(std::string_view text) {
    auto isSpace = [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    };
    while (!text.empty() && isSpace(text.front())) text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back())) text.remove_suffix(1);
    return text;
}

// Add one to a run of decimal digits ("199" becomes "200", "99" becomes "100").
void incrementDigits(std::string& digits) {
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (*it != '9') {
            ++*it;
            return;
        }
        *it = '0';
    }
    digits.insert(digits.begin(), '1');
}

} // namespace

Adjustment Adjustment::absolute(double delta) {
    return Adjustment{Kind::Absolute, delta};
}

Adjustment Adjustment::percent(double delta) {
    return Adjustment{Kind::Percent, delta};
}

std::optional<Adjustment> Adjustment::parse(std::string_view text) {
    text = trimWhitespace(text);

    Kind kind = Kind::Absolute;
    if (!text.empty() && text.back() == '%') {
        kind = Kind::Percent;
        text.remove_suffix(1);
        text = trimWhitespace(text);
    }

    // std::from_chars rejects an explicit '+'.
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') return std::nullopt;
    }
    if (text.empty()) return std::nullopt;

    double delta = 0.0;
    char const* first = text.data();
    char const* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, delta, std::chars_format::fixed);
    if (ec != std::errc{} || ptr != last || !std::isfinite(delta)) {
        return std::nullopt;
    }
    return Adjustment{kind, delta};
}

double adjustedValue(double value, Adjustment const& adjustment) {
    double change = adjustment.delta;
    switch (adjustment.kind) {
        case Adjustment::Kind::Percent:
            change = value * adjustment.delta / 100.0;
            break;
        case Adjustment::Kind::Absolute:
            break;
    }
    return value + change;
}

std::string groupThousands(std::string_view digits) {
    std::string grouped;
    grouped.reserve(digits.size() + digits.size() / 3);
    std::size_t count = 0;
    for (std::size_t i = digits.size(); i > 0; --i) {
        if (count > 0 && count % 3 == 0) {
            grouped.push_back(',');
        }
        grouped.push_back(digits[i - 1]);
        ++count;
    }
    std::reverse(grouped.begin(), grouped.end());
    return grouped;
}

std::optional<std::string> formatAmount(double value) {
    if (!std::isfinite(value)) return std::nullopt;

    // Shortest fixed-notation text that reads back as |value|. The widest
    // cases are DBL_MAX (309 integer digits) and the smallest subnormal
    // (324 fraction digits).
    std::array<char, 400> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                                   std::fabs(value), std::chars_format::fixed);
    if (ec != std::errc{}) return std::nullopt;

    std::string_view text(buffer.data(), static_cast<std::size_t>(end - buffer.data()));
    std::size_t point = text.find('.');
    std::string_view fraction = point == std::string_view::npos ? std::string_view{} : text.substr(point + 1);

    // Integer digits followed by exactly two fraction digits.
    std::string digits(text.substr(0, point));
    digits.push_back(fraction.size() > 0 ? fraction[0] : '0');
    digits.push_back(fraction.size() > 1 ? fraction[1] : '0');
    if (fraction.size() > 2 && fraction[2] >= '5') {
        incrementDigits(digits);
    }

    std::string out;
    bool isZero = digits.find_first_not_of('0') == std::string::npos;
    if (std::signbit(value) && !isZero) out.push_back('-');
    out += groupThousands(std::string_view(digits).substr(0, digits.size() - 2));
    out.push_back('.');
    out.append(digits, digits.size() - 2, 2);
    return out;
}

std::optional<std::string> applyAdjustment(double value, Adjustment const& adjustment) {
    return formatAmount(adjustedValue(value, adjustment));
}

} // namespace repricer_cpp
