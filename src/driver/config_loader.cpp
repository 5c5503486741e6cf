/**
 * @file config_loader.cpp
 * @brief Implementation of config_loader
 */

#include <loadgen/driver/config_loader.hpp>
#include <loadgen/compat/format.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace loadgen::driver {

namespace {

constexpr std::size_t kMaxAeTitleLength = 16;
constexpr std::size_t kMaxConcurrency = 1024;

[[nodiscard]] auto trim(std::string_view str) -> std::string {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

[[nodiscard]] auto strip_quotes(std::string_view str) -> std::string {
    if (str.length() >= 2) {
        if ((str.front() == '"' && str.back() == '"') ||
            (str.front() == '\'' && str.back() == '\'')) {
            return std::string(str.substr(1, str.length() - 2));
        }
    }
    return std::string(str);
}

/**
 * @brief Drop a trailing " # comment" from an unquoted value
 */
[[nodiscard]] auto strip_comment(std::string_view value) -> std::string_view {
    if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
        return value;
    }
    const auto pos = value.find(" #");
    return pos == std::string_view::npos ? value : value.substr(0, pos);
}

[[nodiscard]] auto invalid_value(const std::string& key, const std::string& value,
                                 const std::string& expected) -> error_info {
    return error_info{error_codes::config_invalid_value,
                      "Invalid value for " + key + ": '" + value + "' (expected " +
                          expected + ")",
                      "loadgen"};
}

[[nodiscard]] auto parse_unsigned(const std::string& key, const std::string& raw)
    -> Result<std::uint64_t> {
    const auto value = trim(raw);
    std::uint64_t parsed = 0;
    const auto* first = value.data();
    const auto* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (value.empty() || ec != std::errc{} || ptr != last) {
        return Result<std::uint64_t>::err(invalid_value(key, raw, "non-negative integer"));
    }
    return Result<std::uint64_t>::ok(parsed);
}

[[nodiscard]] auto parse_double(const std::string& key, const std::string& raw)
    -> Result<double> {
    const auto value = trim(raw);
    if (value.empty()) {
        return Result<double>::err(invalid_value(key, raw, "number"));
    }
    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (errno != 0 || end != value.c_str() + value.size() || !std::isfinite(parsed)) {
        return Result<double>::err(invalid_value(key, raw, "number"));
    }
    return Result<double>::ok(parsed);
}

[[nodiscard]] auto parse_bool(const std::string& key, const std::string& raw)
    -> Result<bool> {
    auto v = trim(raw);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        return Result<bool>::ok(true);
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        return Result<bool>::ok(false);
    }
    return Result<bool>::err(invalid_value(key, raw, "boolean"));
}

[[nodiscard]] auto parse_port(const std::string& key, const std::string& raw)
    -> Result<std::uint16_t> {
    auto parsed = parse_unsigned(key, raw);
    if (parsed.is_err()) {
        return Result<std::uint16_t>::err(parsed.error());
    }
    if (parsed.value() == 0 || parsed.value() > std::numeric_limits<std::uint16_t>::max()) {
        return Result<std::uint16_t>::err(invalid_value(key, raw, "port 1-65535"));
    }
    return Result<std::uint16_t>::ok(static_cast<std::uint16_t>(parsed.value()));
}

[[nodiscard]] auto config_void_error(const std::string& message) -> VoidResult {
    return loadgen_void_error(error_codes::config_invalid_value, message);
}

}  // namespace

// =============================================================================
// Named Options
// =============================================================================

auto config_loader::from_options(const option_map& options) -> Result<core::load_config> {
    using config_result = Result<core::load_config>;

    static const std::vector<std::string> required_keys = {
        "targetHost", "targetPort", "targetIdentity", "targetRate",
        "concurrency", "maxErrorRate", "maxP95LatencyMs"};

    for (const auto& key : required_keys) {
        if (options.find(key) == options.end()) {
            return loadgen_error<core::load_config>(
                error_codes::config_missing_key,
                "Missing required configuration key: " + key, key);
        }
    }

    const bool has_duration = options.count("durationSeconds") > 0;
    const bool has_count = options.count("totalCount") > 0;
    if (has_duration == has_count) {
        return loadgen_error<core::load_config>(
            error_codes::config_stop_condition,
            has_duration ? "durationSeconds and totalCount are mutually exclusive"
                         : "Missing required configuration key: durationSeconds or totalCount",
            "durationSeconds|totalCount");
    }

    core::load_config config;
    const auto value_of = [&](const char* key) -> const std::string& {
        return options.at(key);
    };
    const auto has = [&](const char* key) { return options.count(key) > 0; };

    config.target.host = trim(value_of("targetHost"));
    config.target.called_ae = trim(value_of("targetIdentity"));
    if (has("localIdentity")) {
        config.target.calling_ae = trim(value_of("localIdentity"));
    }

    auto port = parse_port("targetPort", value_of("targetPort"));
    if (port.is_err()) {
        return config_result::err(port.error());
    }
    config.target.port = port.value();

    auto rate = parse_double("targetRate", value_of("targetRate"));
    if (rate.is_err()) {
        return config_result::err(rate.error());
    }
    config.target_rate = rate.value();

    auto concurrency = parse_unsigned("concurrency", value_of("concurrency"));
    if (concurrency.is_err()) {
        return config_result::err(concurrency.error());
    }
    config.concurrency = static_cast<std::size_t>(concurrency.value());

    if (has_duration) {
        auto duration = parse_double("durationSeconds", value_of("durationSeconds"));
        if (duration.is_err()) {
            return config_result::err(duration.error());
        }
        config.duration_seconds = duration.value();
    } else {
        auto count = parse_unsigned("totalCount", value_of("totalCount"));
        if (count.is_err()) {
            return config_result::err(count.error());
        }
        config.total_count = static_cast<std::size_t>(count.value());
    }

    auto max_error_rate = parse_double("maxErrorRate", value_of("maxErrorRate"));
    if (max_error_rate.is_err()) {
        return config_result::err(max_error_rate.error());
    }
    config.max_error_rate = max_error_rate.value();

    auto max_p95 = parse_double("maxP95LatencyMs", value_of("maxP95LatencyMs"));
    if (max_p95.is_err()) {
        return config_result::err(max_p95.error());
    }
    config.max_p95_latency_ms = max_p95.value();

    // Optional keys
    if (has("timeoutMs")) {
        auto timeout = parse_unsigned("timeoutMs", value_of("timeoutMs"));
        if (timeout.is_err()) {
            return config_result::err(timeout.error());
        }
        config.timeout = std::chrono::milliseconds{static_cast<long long>(timeout.value())};
    }
    if (has("retryCount")) {
        auto retries = parse_unsigned("retryCount", value_of("retryCount"));
        if (retries.is_err()) {
            return config_result::err(retries.error());
        }
        if (retries.value() > std::numeric_limits<std::uint32_t>::max()) {
            return config_result::err(
                invalid_value("retryCount", value_of("retryCount"), "at most 4294967295"));
        }
        config.retry_count = static_cast<std::uint32_t>(retries.value());
    }
    if (has("retryDelayMs")) {
        auto delay = parse_unsigned("retryDelayMs", value_of("retryDelayMs"));
        if (delay.is_err()) {
            return config_result::err(delay.error());
        }
        config.retry_delay = std::chrono::milliseconds{static_cast<long long>(delay.value())};
    }
    if (has("minThroughputRatio")) {
        auto ratio = parse_double("minThroughputRatio", value_of("minThroughputRatio"));
        if (ratio.is_err()) {
            return config_result::err(ratio.error());
        }
        config.min_throughput_ratio = ratio.value();
    }
    if (has("loadMultiplier")) {
        auto multiplier = parse_double("loadMultiplier", value_of("loadMultiplier"));
        if (multiplier.is_err()) {
            return config_result::err(multiplier.error());
        }
        config.load_multiplier = multiplier.value();
    }
    if (has("datasetRoot")) {
        config.dataset_root = trim(value_of("datasetRoot"));
    }
    if (has("sampleSize")) {
        auto size = parse_unsigned("sampleSize", value_of("sampleSize"));
        if (size.is_err()) {
            return config_result::err(size.error());
        }
        config.sample_size = static_cast<std::size_t>(size.value());
    }
    if (has("sampleSeed")) {
        auto seed = parse_unsigned("sampleSeed", value_of("sampleSeed"));
        if (seed.is_err()) {
            return config_result::err(seed.error());
        }
        config.sample_seed = seed.value();
    }
    if (has("verifyConnectivity")) {
        auto verify = parse_bool("verifyConnectivity", value_of("verifyConnectivity"));
        if (verify.is_err()) {
            return config_result::err(verify.error());
        }
        config.verify_connectivity = verify.value();
    }
    if (has("progressIntervalSeconds")) {
        auto interval = parse_unsigned("progressIntervalSeconds",
                                       value_of("progressIntervalSeconds"));
        if (interval.is_err()) {
            return config_result::err(interval.error());
        }
        config.progress_interval = std::chrono::seconds{static_cast<long long>(interval.value())};
    }

    auto valid = validate(config);
    if (valid.is_err()) {
        return config_result::err(valid.error());
    }
    return config_result::ok(std::move(config));
}

// =============================================================================
// YAML
// =============================================================================

auto config_loader::parse_yaml(std::string_view yaml_content) -> option_map {
    option_map values;
    std::istringstream stream{std::string(yaml_content)};
    std::string line;
    std::vector<std::pair<int, std::string>> path_stack;

    while (std::getline(stream, line)) {
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        const auto non_ws = line.find_first_not_of(" \t");
        if (line[non_ws] == '#') {
            continue;
        }

        int indent = 0;
        for (char c : line) {
            if (c == ' ') {
                ++indent;
            } else if (c == '\t') {
                indent += 2;
            } else {
                break;
            }
        }

        const auto trimmed = trim(line);
        const auto colon_pos = trimmed.find(':');
        if (colon_pos == std::string::npos) {
            continue;
        }

        const auto key = trim(std::string_view(trimmed).substr(0, colon_pos));
        const auto value = trim(strip_comment(
            std::string_view(trimmed).substr(colon_pos + 1)));

        while (!path_stack.empty() && path_stack.back().first >= indent) {
            path_stack.pop_back();
        }

        std::string full_path;
        for (const auto& [_, segment] : path_stack) {
            full_path += segment + ".";
        }
        full_path += key;

        if (value.empty()) {
            path_stack.emplace_back(indent, key);
        } else {
            values[full_path] = strip_quotes(value);
        }
    }

    return values;
}

auto config_loader::load(const std::filesystem::path& path) -> Result<core::load_config> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return loadgen_error<core::load_config>(
            error_codes::config_file_not_found,
            "Failed to open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

auto config_loader::load_from_string(std::string_view yaml_content)
    -> Result<core::load_config> {
    return from_options(parse_yaml(yaml_content));
}

// =============================================================================
// Environment
// =============================================================================

auto config_loader::apply_environment(core::load_config& config) -> VoidResult {
    return apply_environment(config, [](const char* name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name)) {
            return std::string{value};
        }
        return std::nullopt;
    });
}

auto config_loader::apply_environment(core::load_config& config, const env_lookup& lookup)
    -> VoidResult {
    if (auto host = lookup("LOADGEN_TARGET_HOST")) {
        config.target.host = trim(*host);
    }
    if (auto port = lookup("LOADGEN_TARGET_PORT")) {
        auto parsed = parse_port("LOADGEN_TARGET_PORT", *port);
        if (parsed.is_err()) {
            return VoidResult(parsed.error());
        }
        config.target.port = parsed.value();
    }
    if (auto ae = lookup("LOADGEN_TARGET_AE")) {
        config.target.called_ae = trim(*ae);
    }
    if (auto ae = lookup("LOADGEN_LOCAL_AE")) {
        config.target.calling_ae = trim(*ae);
    }
    if (auto rate = lookup("LOADGEN_TARGET_RATE")) {
        auto parsed = parse_double("LOADGEN_TARGET_RATE", *rate);
        if (parsed.is_err()) {
            return VoidResult(parsed.error());
        }
        config.target_rate = parsed.value();
    }
    if (auto multiplier = lookup("LOADGEN_LOAD_MULTIPLIER")) {
        auto parsed = parse_double("LOADGEN_LOAD_MULTIPLIER", *multiplier);
        if (parsed.is_err()) {
            return VoidResult(parsed.error());
        }
        config.load_multiplier = parsed.value();
    }
    if (auto duration = lookup("LOADGEN_DURATION_SECONDS")) {
        auto parsed = parse_double("LOADGEN_DURATION_SECONDS", *duration);
        if (parsed.is_err()) {
            return VoidResult(parsed.error());
        }
        config.duration_seconds = parsed.value();
        config.total_count.reset();
    }
    if (auto concurrency = lookup("LOADGEN_CONCURRENCY")) {
        auto parsed = parse_unsigned("LOADGEN_CONCURRENCY", *concurrency);
        if (parsed.is_err()) {
            return VoidResult(parsed.error());
        }
        config.concurrency = static_cast<std::size_t>(parsed.value());
    }
    if (auto root = lookup("LOADGEN_DATASET_ROOT")) {
        config.dataset_root = trim(*root);
    }

    return validate(config);
}

// =============================================================================
// Validation
// =============================================================================

auto config_loader::validate(const core::load_config& config) -> VoidResult {
    if (config.target.host.empty()) {
        return config_void_error("targetHost must not be empty");
    }
    if (config.target.port == 0) {
        return config_void_error("targetPort cannot be 0");
    }
    if (config.target.called_ae.empty() ||
        config.target.called_ae.length() > kMaxAeTitleLength) {
        return config_void_error("targetIdentity must be 1-16 characters");
    }
    if (config.target.calling_ae.empty() ||
        config.target.calling_ae.length() > kMaxAeTitleLength) {
        return config_void_error("localIdentity must be 1-16 characters");
    }
    if (!(config.target_rate > 0.0)) {
        return config_void_error("targetRate must be positive");
    }
    if (!(config.load_multiplier > 0.0)) {
        return config_void_error("loadMultiplier must be positive");
    }
    if (config.concurrency == 0 || config.concurrency > kMaxConcurrency) {
        return config_void_error(loadgen::compat::format(
            "concurrency must be within [1, {}]", kMaxConcurrency));
    }
    if (config.duration_seconds.has_value() == config.total_count.has_value()) {
        return loadgen_void_error(error_codes::config_stop_condition,
                                  "Exactly one of durationSeconds and totalCount must be set");
    }
    if (config.duration_seconds && !(*config.duration_seconds > 0.0)) {
        return config_void_error("durationSeconds must be positive");
    }
    if (config.total_count && *config.total_count == 0) {
        return config_void_error("totalCount must be positive");
    }
    if (config.timeout.count() <= 0) {
        return config_void_error("timeoutMs must be positive");
    }
    if (config.max_error_rate < 0.0 || config.max_error_rate > 1.0) {
        return config_void_error("maxErrorRate must be within [0, 1]");
    }
    if (!(config.max_p95_latency_ms > 0.0)) {
        return config_void_error("maxP95LatencyMs must be positive");
    }
    if (config.min_throughput_ratio &&
        (*config.min_throughput_ratio < 0.0 || *config.min_throughput_ratio > 1.0)) {
        return config_void_error("minThroughputRatio must be within [0, 1]");
    }
    if (config.sample_size && *config.sample_size == 0) {
        return config_void_error("sampleSize must be positive");
    }
    return ok();
}

}  // namespace loadgen::driver
