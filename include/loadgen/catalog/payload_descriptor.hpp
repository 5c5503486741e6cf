/**
 * @file payload_descriptor.hpp
 * @brief Lightweight description of one test payload file
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace loadgen::catalog {

/**
 * @brief Identifies one DICOM Part-10 file used as a C-STORE payload
 *
 * Built by dataset_catalog from the file header only; pixel data is never
 * read. Descriptors are handed to the dispatcher by const reference and are
 * never modified after discovery.
 */
struct payload_descriptor {
    /// Absolute or root-relative path of the file
    std::filesystem::path path;

    /// File size on disk
    std::uintmax_t size_bytes{0};

    /// Modality (0008,0060), empty when absent
    std::string modality;

    /// SOP Class UID, from (0008,0016) or the meta group
    std::string sop_class_uid;

    /// SOP Instance UID, from (0008,0018) or the meta group
    std::string sop_instance_uid;

    /// Transfer Syntax UID (0002,0010)
    std::string transfer_syntax_uid;

    /// Patient ID (0010,0020), classification only
    std::optional<std::string> patient_id;

    /// Study Instance UID (0020,000D), classification only
    std::optional<std::string> study_instance_uid;
};

// =============================================================================
// Classification
// =============================================================================

/**
 * @brief Size buckets used by dataset_catalog::classify
 */
enum class size_bucket {
    small,
    medium,
    large
};

[[nodiscard]] constexpr auto to_string(size_bucket bucket) noexcept -> std::string_view {
    switch (bucket) {
        case size_bucket::small:
            return "small";
        case size_bucket::medium:
            return "medium";
        case size_bucket::large:
            return "large";
    }
    return "unknown";
}

/**
 * @brief Axis along which payloads are grouped
 */
enum class classify_axis {
    size,      ///< group by size_bucket
    modality   ///< group by modality code
};

/**
 * @brief Classification key: a size bucket or a modality code
 */
using payload_category = std::variant<size_bucket, std::string>;

/**
 * @brief Human readable name of a category ("small", "CT", ...)
 */
[[nodiscard]] inline auto to_string(const payload_category& category) -> std::string {
    if (const auto* bucket = std::get_if<size_bucket>(&category)) {
        return std::string{to_string(*bucket)};
    }
    return std::get<std::string>(category);
}

/**
 * @brief Byte-size thresholds for size buckets
 */
struct size_thresholds {
    /// Files up to this size are small
    std::uintmax_t small_max_bytes{1024 * 1024};

    /// Files up to this size (and above small) are medium; larger are large
    std::uintmax_t medium_max_bytes{10 * 1024 * 1024};
};

}  // namespace loadgen::catalog
