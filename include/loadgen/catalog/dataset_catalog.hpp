/**
 * @file dataset_catalog.hpp
 * @brief Discovery, classification and sampling of C-STORE payload files
 *
 * @example
 * @code
 * dataset_catalog catalog;
 * auto found = catalog.discover("/data/dicom");
 * if (found.is_err()) { ... }
 *
 * auto by_size = dataset_catalog::classify(found.value(), classify_axis::size);
 * auto picked = dataset_catalog::sample(found.value(), 50, 42);
 * @endcode
 */

#pragma once

#include <loadgen/catalog/dicom_header_reader.hpp>
#include <loadgen/catalog/payload_descriptor.hpp>
#include <loadgen/core/result.hpp>
#include <loadgen/di/ilogger.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <vector>

namespace loadgen::catalog {

/**
 * @brief Options controlling payload discovery
 */
struct catalog_options {
    /// Descend into subdirectories
    bool recursive{true};

    /// Upper bound on bytes read per file while extracting the header
    std::size_t max_header_bytes{dicom_header_reader::kDefaultMaxHeaderBytes};

    /// Thresholds used by classify(descriptors, classify_axis::size)
    size_thresholds thresholds{};
};

/**
 * @brief Category name used for files without a Modality attribute
 */
inline constexpr const char* kUnknownModality = "UNKNOWN";

/**
 * @brief Scans a directory tree for DICOM payloads
 *
 * The catalog never modifies files; discovery is a read-only traversal.
 *
 * Thread Safety: discover() may be called concurrently; the static query
 * functions are pure.
 */
class dataset_catalog {
public:
    explicit dataset_catalog(catalog_options options = {},
                             std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Discover payload files under root
     *
     * Candidate files (see is_candidate_file) that are not DICOM Part-10
     * files are skipped. The result is sorted by path.
     *
     * @param root Directory to scan
     * @return Descriptors, or catalog_root_not_found / catalog_empty
     */
    [[nodiscard]] auto discover(const std::filesystem::path& root) const
        -> Result<std::vector<payload_descriptor>>;

    /**
     * @brief Build a descriptor for a single file
     */
    [[nodiscard]] auto describe(const std::filesystem::path& file) const
        -> Result<payload_descriptor>;

    /**
     * @brief Group descriptors by size bucket or modality
     *
     * Relative input order is preserved inside each group. Empty groups are
     * not present in the map.
     */
    [[nodiscard]] static auto classify(const std::vector<payload_descriptor>& descriptors,
                                       classify_axis axis,
                                       const size_thresholds& thresholds = {})
        -> std::map<payload_category, std::vector<payload_descriptor>>;

    /**
     * @brief Size bucket of a single file size
     */
    [[nodiscard]] static auto bucket_for(std::uintmax_t size_bytes,
                                         const size_thresholds& thresholds = {}) noexcept
        -> size_bucket;

    /**
     * @brief Pick count descriptors in a seed-determined order
     *
     * The same input and seed always yield the same sequence, on any
     * platform.
     *
     * @return Sampled descriptors, or insufficient_data when count exceeds
     *         descriptors.size()
     */
    [[nodiscard]] static auto sample(const std::vector<payload_descriptor>& descriptors,
                                     std::size_t count,
                                     std::uint64_t seed)
        -> Result<std::vector<payload_descriptor>>;

    /**
     * @brief Check whether a path looks like a DICOM file by its extension
     *
     * Accepts .dcm / .dicom in any case and files without extension.
     */
    [[nodiscard]] static auto is_candidate_file(const std::filesystem::path& path) -> bool;

    [[nodiscard]] auto options() const noexcept -> const catalog_options& { return options_; }

private:
    catalog_options options_;
    dicom_header_reader reader_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace loadgen::catalog
