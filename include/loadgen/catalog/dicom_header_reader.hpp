/**
 * @file dicom_header_reader.hpp
 * @brief Bounded reader for the identifying attributes of a DICOM Part-10 file
 *
 * Reads the 128-byte preamble, the "DICM" prefix, the File Meta Information
 * group (0002) and the leading part of the main dataset, stopping after the
 * Study Instance UID (0020,000D). Sequences of undefined length are skipped
 * item by item. Pixel data is never reached.
 */

#pragma once

#include <loadgen/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace loadgen::catalog {

/// Implicit VR Little Endian
inline constexpr const char* kImplicitVrLittleEndian = "1.2.840.10008.1.2";
/// Explicit VR Little Endian
inline constexpr const char* kExplicitVrLittleEndian = "1.2.840.10008.1.2.1";
/// Deflated Explicit VR Little Endian
inline constexpr const char* kDeflatedExplicitVrLittleEndian = "1.2.840.10008.1.2.1.99";
/// Explicit VR Big Endian (retired)
inline constexpr const char* kExplicitVrBigEndian = "1.2.840.10008.1.2.2";

/**
 * @brief Attributes extracted from a DICOM header
 */
struct dicom_header {
    std::string transfer_syntax_uid;
    std::string media_storage_sop_class_uid;
    std::string media_storage_sop_instance_uid;

    std::string sop_class_uid;
    std::string sop_instance_uid;
    std::string modality;
    std::optional<std::string> patient_id;
    std::optional<std::string> study_instance_uid;

    /// true when the main dataset could be walked (little endian, not deflated)
    bool dataset_parsed{false};
};

/**
 * @brief Reads identifying attributes without loading the whole file
 */
class dicom_header_reader {
public:
    static constexpr std::size_t kPreambleSize = 128;
    static constexpr std::size_t kDefaultMaxHeaderBytes = 256 * 1024;

    explicit dicom_header_reader(std::size_t max_header_bytes = kDefaultMaxHeaderBytes)
        : max_header_bytes_(max_header_bytes) {}

    /**
     * @brief Read the header of a file on disk
     *
     * @return dicom_header, or invalid_dicom_file / file_read_error
     */
    [[nodiscard]] auto read(const std::filesystem::path& path) const
        -> Result<dicom_header>;

    /**
     * @brief Parse a header from an in-memory prefix of a file
     *
     * The buffer may be truncated anywhere after the meta group; attributes
     * located beyond its end are left empty.
     */
    [[nodiscard]] static auto parse(std::span<const uint8_t> data)
        -> Result<dicom_header>;

private:
    std::size_t max_header_bytes_;
};

}  // namespace loadgen::catalog
