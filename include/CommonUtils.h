#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n\f\v");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n\f\v");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline std::string toUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

// Whitespace-delimited tokens; runs of whitespace never produce empty tokens.
inline std::vector<std::string> splitWhitespace(std::string_view s) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
        const size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
        if (i > start) tokens.emplace_back(s.substr(start, i - start));
    }
    return tokens;
}

inline std::string join(const std::vector<std::string>& parts, size_t begin, size_t end, char sep = ' ') {
    std::string out;
    for (size_t i = begin; i < end && i < parts.size(); ++i) {
        if (i > begin) out.push_back(sep);
        out += parts[i];
    }
    return out;
}

/**
 * @brief Divides only when the denominator is a usable positive value.
 * @post Returns fallback for zero, negative or non-finite denominators and never NaN/Inf.
 */
inline double safeRatio(double numerator, double denominator, double fallback = 0.0) {
    if (!std::isfinite(numerator) || !std::isfinite(denominator) || denominator <= 0.0) return fallback;
    const double out = numerator / denominator;
    return std::isfinite(out) ? out : fallback;
}

inline std::string formatDouble(double v, int prec = 2) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os.precision(prec);
    os << (std::isfinite(v) ? v : 0.0);
    return os.str();
}

// 1234567.8 -> "1,234,568"
inline std::string formatThousands(double v) {
    const long long rounded = std::llround(std::isfinite(v) ? v : 0.0);
    std::string digits = std::to_string(rounded < 0 ? -rounded : rounded);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3 + 1);
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (digits.size() - i) % 3 == 0) out.push_back(',');
        out.push_back(digits[i]);
    }
    return rounded < 0 ? "-" + out : out;
}

inline double quantileByNth(std::vector<double> values, double q) {
    if (values.empty()) return 0.0;
    if (q <= 0.0) return *std::min_element(values.begin(), values.end());
    if (q >= 1.0) return *std::max_element(values.begin(), values.end());

    const long double pos = static_cast<long double>(q) * static_cast<long double>(values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));

    std::nth_element(values.begin(), values.begin() + lo, values.end());
    const double loVal = values[lo];
    if (hi == lo) return loVal;

    std::nth_element(values.begin(), values.begin() + hi, values.end());
    const double hiVal = values[hi];
    const long double frac = pos - static_cast<long double>(lo);
    const long double out = static_cast<long double>(loVal) * (1.0L - frac) + static_cast<long double>(hiVal) * frac;
    return static_cast<double>(out);
}

} // namespace CommonUtils
