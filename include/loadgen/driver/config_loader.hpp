/**
 * @file config_loader.hpp
 * @brief Builds a load_config from named options, YAML files and environment
 *
 * Recognized keys (camelCase, as on the option surface):
 *
 * | Key                     | Required | Default      |
 * |-------------------------|----------|--------------|
 * | targetHost              | yes      |              |
 * | targetPort              | yes      |              |
 * | targetIdentity          | yes      |              |
 * | localIdentity           | no       | PERF_SENDER  |
 * | targetRate              | yes      |              |
 * | concurrency             | yes      |              |
 * | durationSeconds         | one of   |              |
 * | totalCount              | one of   |              |
 * | timeoutMs               | no       | 30000        |
 * | retryCount              | no       | 0            |
 * | retryDelayMs            | no       | 0            |
 * | maxErrorRate            | yes      |              |
 * | maxP95LatencyMs         | yes      |              |
 * | minThroughputRatio      | no       | (unchecked)  |
 * | loadMultiplier          | no       | 1.0          |
 * | datasetRoot             | no       |              |
 * | sampleSize              | no       | (all)        |
 * | sampleSeed              | no       | 0            |
 * | verifyConnectivity      | no       | true         |
 * | progressIntervalSeconds | no       | 5            |
 *
 * Unrecognized keys are ignored.
 *
 * @example
 * @code
 * auto config = config_loader::load("perf.yaml");
 * if (config.is_err()) {
 *     std::cerr << config.error().message << "\n";
 * }
 * @endcode
 */

#pragma once

#include <loadgen/core/load_config.hpp>
#include <loadgen/core/result.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace loadgen::driver {

/**
 * @brief Named run options, key to raw string value
 */
using option_map = std::map<std::string, std::string>;

/**
 * @brief Environment lookup used by apply_environment
 */
using env_lookup = std::function<std::optional<std::string>(const char*)>;

/**
 * @brief Loader and validator for load_config
 */
class config_loader {
public:
    /**
     * @brief Build and validate a configuration from named options
     *
     * @return load_config, or config_missing_key naming the first missing
     *         required key, config_invalid_value for unparseable values, or
     *         config_stop_condition unless exactly one of durationSeconds
     *         and totalCount is present
     */
    [[nodiscard]] static auto from_options(const option_map& options)
        -> Result<core::load_config>;

    /**
     * @brief Load a flat "key: value" YAML file
     */
    [[nodiscard]] static auto load(const std::filesystem::path& path)
        -> Result<core::load_config>;

    /**
     * @brief Load configuration from YAML text
     */
    [[nodiscard]] static auto load_from_string(std::string_view yaml_content)
        -> Result<core::load_config>;

    /**
     * @brief Parse YAML text into an option map
     *
     * Supports comments, blank lines and quoted values. Keys nested under a
     * section are stored as "section.key".
     */
    [[nodiscard]] static auto parse_yaml(std::string_view yaml_content) -> option_map;

    /**
     * @brief Override fields from LOADGEN_* environment variables
     *
     * LOADGEN_TARGET_HOST, LOADGEN_TARGET_PORT, LOADGEN_TARGET_AE,
     * LOADGEN_LOCAL_AE, LOADGEN_TARGET_RATE, LOADGEN_LOAD_MULTIPLIER,
     * LOADGEN_DURATION_SECONDS, LOADGEN_CONCURRENCY, LOADGEN_DATASET_ROOT.
     * The result is validated again.
     */
    [[nodiscard]] static auto apply_environment(core::load_config& config) -> VoidResult;

    /**
     * @brief apply_environment with an injectable lookup
     */
    [[nodiscard]] static auto apply_environment(core::load_config& config,
                                                const env_lookup& lookup) -> VoidResult;

    /**
     * @brief Check a configuration for consistency
     */
    [[nodiscard]] static auto validate(const core::load_config& config) -> VoidResult;
};

}  // namespace loadgen::driver
