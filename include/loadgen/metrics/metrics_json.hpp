/**
 * @file metrics_json.hpp
 * @brief JSON serialization for metrics snapshots
 *
 * Report generators consume these documents; key names are stable.
 *
 * @see RFC 8259 - The JavaScript Object Notation (JSON) Data Interchange Format
 */

#pragma once

#include <loadgen/metrics/metrics_snapshot.hpp>

#include <cmath>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace loadgen::metrics {

/**
 * @brief Escape special characters in JSON string
 * @param str The string to escape
 * @return JSON-safe escaped string
 */
[[nodiscard]] inline std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 10);

    for (char c : str) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }

    return result;
}

/**
 * @brief Render a number; non-finite values become null
 */
[[nodiscard]] inline std::string json_number(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream oss;
    oss.precision(6);
    oss << std::fixed << value;
    auto text = oss.str();
    // Trim trailing zeros but keep one digit after the point
    while (text.size() > 2 && text.back() == '0' && text[text.size() - 2] != '.') {
        text.pop_back();
    }
    return text;
}

[[nodiscard]] inline std::string json_number(const std::optional<double>& value) {
    return value ? json_number(*value) : std::string{"null"};
}

/**
 * @brief Convert metrics_snapshot to JSON string
 * @param snap The snapshot to convert
 * @return JSON representation
 */
[[nodiscard]] inline std::string to_json(const metrics_snapshot& snap) {
    std::ostringstream oss;
    oss << "{"
        << R"("run_id":")" << escape_json_string(snap.run_id) << "\""
        << R"(,"attempted":)" << snap.attempted
        << R"(,"succeeded":)" << snap.succeeded
        << R"(,"failed":)" << snap.failed
        << R"(,"failures":{)"
        << R"("network_error":)" << snap.network_errors
        << R"(,"timeout":)" << snap.timeouts
        << R"(,"protocol_rejected":)" << snap.protocol_rejections
        << "}"
        << R"(,"retried":)" << snap.retried
        << R"(,"error_rate":)" << json_number(snap.error_rate)
        << R"(,"latency_ms":{)"
        << R"("defined":)" << (snap.percentiles_defined ? "true" : "false")
        << R"(,"p50":)" << json_number(snap.p50_ms)
        << R"(,"p95":)" << json_number(snap.p95_ms)
        << R"(,"p99":)" << json_number(snap.p99_ms)
        << R"(,"mean":)" << json_number(snap.mean_ms)
        << R"(,"min":)" << json_number(snap.min_ms)
        << R"(,"max":)" << json_number(snap.max_ms)
        << "}"
        << R"(,"throughput":)" << json_number(snap.throughput)
        << R"(,"window_throughput":)" << json_number(snap.window_throughput)
        << R"(,"window_ms":)" << snap.window.count()
        << R"(,"elapsed_ms":)" << snap.elapsed.count()
        << "}";
    return oss.str();
}

}  // namespace loadgen::metrics
