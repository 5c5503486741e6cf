/**
 * @file dicom_header_reader.cpp
 * @brief Implementation of the bounded DICOM header reader
 */

#include <loadgen/catalog/dicom_header_reader.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <string_view>
#include <system_error>
#include <vector>

namespace loadgen::catalog {

namespace {

constexpr uint32_t kUndefinedLength = 0xFFFFFFFF;
constexpr int kMaxSequenceDepth = 16;
constexpr char kDicmPrefix[4] = {'D', 'I', 'C', 'M'};

// Tags as (group << 16) | element
constexpr uint32_t kMediaStorageSopClassUid = 0x00020002;
constexpr uint32_t kMediaStorageSopInstanceUid = 0x00020003;
constexpr uint32_t kTransferSyntaxUid = 0x00020010;
constexpr uint32_t kSopClassUid = 0x00080016;
constexpr uint32_t kSopInstanceUid = 0x00080018;
constexpr uint32_t kModality = 0x00080060;
constexpr uint32_t kPatientId = 0x00100020;
constexpr uint32_t kStudyInstanceUid = 0x0020000D;
constexpr uint32_t kItem = 0xFFFEE000;
constexpr uint32_t kItemDelimitation = 0xFFFEE00D;
constexpr uint32_t kSequenceDelimitation = 0xFFFEE0DD;

/**
 * @brief Read a 16-bit unsigned integer from little-endian bytes
 */
[[nodiscard]] auto read_uint16_le(std::span<const uint8_t> data) -> uint16_t {
    return static_cast<uint16_t>(data[0]) |
           static_cast<uint16_t>(static_cast<uint16_t>(data[1]) << 8);
}

/**
 * @brief Read a 32-bit unsigned integer from little-endian bytes
 */
[[nodiscard]] auto read_uint32_le(std::span<const uint8_t> data) -> uint32_t {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

/**
 * @brief VRs encoded with 2 reserved bytes and a 32-bit length in explicit VR
 */
[[nodiscard]] auto has_explicit_32bit_length(char first, char second) -> bool {
    static constexpr std::array<std::string_view, 13> kLongVrs = {
        "OB", "OD", "OF", "OL", "OV", "OW", "SQ", "SV", "UC", "UN", "UR", "UT", "UV"};
    const char vr[2] = {first, second};
    const std::string_view code{vr, 2};
    return std::find(kLongVrs.begin(), kLongVrs.end(), code) != kLongVrs.end();
}

struct element_header {
    uint32_t tag{0};
    uint32_t length{0};
    std::size_t header_size{0};
};

/**
 * @brief Decode the tag/VR/length header at offset
 * @return std::nullopt when the header does not fit in data
 */
[[nodiscard]] auto read_element_header(std::span<const uint8_t> data,
                                       std::size_t offset,
                                       bool explicit_vr) -> std::optional<element_header> {
    if (offset + 8 > data.size()) {
        return std::nullopt;
    }

    const uint16_t group = read_uint16_le(data.subspan(offset, 2));
    const uint16_t element = read_uint16_le(data.subspan(offset + 2, 2));
    const uint32_t tag = (static_cast<uint32_t>(group) << 16) | element;

    // Item and delimiter tags never carry a VR
    if (group == 0xFFFE || !explicit_vr) {
        return element_header{tag, read_uint32_le(data.subspan(offset + 4, 4)), 8};
    }

    const auto vr0 = static_cast<char>(data[offset + 4]);
    const auto vr1 = static_cast<char>(data[offset + 5]);
    if (has_explicit_32bit_length(vr0, vr1)) {
        if (offset + 12 > data.size()) {
            return std::nullopt;
        }
        return element_header{tag, read_uint32_le(data.subspan(offset + 8, 4)), 12};
    }
    return element_header{tag, read_uint16_le(data.subspan(offset + 6, 2)), 8};
}

[[nodiscard]] auto skip_sequence(std::span<const uint8_t> data, std::size_t offset,
                                 bool explicit_vr, int depth) -> std::optional<std::size_t>;

/**
 * @brief Skip the elements of an undefined-length item
 * @return Offset just past the item delimitation tag
 */
[[nodiscard]] auto skip_item_contents(std::span<const uint8_t> data, std::size_t offset,
                                      bool explicit_vr, int depth) -> std::optional<std::size_t> {
    while (true) {
        const auto header = read_element_header(data, offset, explicit_vr);
        if (!header) {
            return std::nullopt;
        }
        offset += header->header_size;

        if (header->tag == kItemDelimitation) {
            return offset;
        }
        if (header->length == kUndefinedLength) {
            const auto next = skip_sequence(data, offset, explicit_vr, depth + 1);
            if (!next) {
                return std::nullopt;
            }
            offset = *next;
        } else {
            offset += header->length;
        }
    }
}

/**
 * @brief Skip the items of an undefined-length sequence (or encapsulated value)
 * @return Offset just past the sequence delimitation tag
 */
auto skip_sequence(std::span<const uint8_t> data, std::size_t offset,
                   bool explicit_vr, int depth) -> std::optional<std::size_t> {
    if (depth > kMaxSequenceDepth) {
        return std::nullopt;
    }

    while (true) {
        const auto header = read_element_header(data, offset, explicit_vr);
        if (!header) {
            return std::nullopt;
        }
        offset += header->header_size;

        if (header->tag == kSequenceDelimitation) {
            return offset;
        }
        if (header->tag != kItem) {
            return std::nullopt;
        }
        if (header->length == kUndefinedLength) {
            const auto next = skip_item_contents(data, offset, explicit_vr, depth);
            if (!next) {
                return std::nullopt;
            }
            offset = *next;
        } else {
            offset += header->length;
        }
    }
}

/**
 * @brief Decode a string value, dropping space and NUL padding
 */
[[nodiscard]] auto to_trimmed_string(std::span<const uint8_t> value) -> std::string {
    std::string text(reinterpret_cast<const char*>(value.data()), value.size());
    const auto is_padding = [](char c) { return c == ' ' || c == '\0'; };

    while (!text.empty() && is_padding(text.back())) {
        text.pop_back();
    }
    const auto first = std::find_if_not(text.begin(), text.end(), is_padding);
    text.erase(text.begin(), first);
    return text;
}

}  // namespace

// =============================================================================
// Reading
// =============================================================================

auto dicom_header_reader::read(const std::filesystem::path& path) const
    -> Result<dicom_header> {
    std::error_code ec;
    const auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return loadgen_error<dicom_header>(
            error_codes::file_read_error,
            "Cannot stat file: " + path.string(), ec.message());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return loadgen_error<dicom_header>(
            error_codes::file_read_error,
            "Cannot open file: " + path.string());
    }

    const auto to_read = static_cast<std::size_t>(
        std::min<std::uintmax_t>(file_size, max_header_bytes_));
    std::vector<uint8_t> buffer(to_read);
    if (!file.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(to_read))) {
        return loadgen_error<dicom_header>(
            error_codes::file_read_error,
            "Failed to read header of " + path.string());
    }

    return parse(buffer);
}

auto dicom_header_reader::parse(std::span<const uint8_t> data)
    -> Result<dicom_header> {
    if (data.size() < kPreambleSize + 4) {
        return loadgen_error<dicom_header>(
            error_codes::invalid_dicom_file,
            "File too small to be a DICOM Part 10 file");
    }

    if (std::memcmp(data.data() + kPreambleSize, kDicmPrefix, 4) != 0) {
        return loadgen_error<dicom_header>(
            error_codes::invalid_dicom_file,
            "Missing DICM prefix at offset 128");
    }

    dicom_header header;
    std::size_t offset = kPreambleSize + 4;

    // File Meta Information is always Explicit VR Little Endian
    while (true) {
        const auto element = read_element_header(data, offset, true);
        if (!element || (element->tag >> 16) != 0x0002) {
            break;
        }
        if (element->length == kUndefinedLength) {
            return loadgen_error<dicom_header>(
                error_codes::invalid_dicom_file,
                "Undefined length in file meta information");
        }

        const auto value_offset = offset + element->header_size;
        if (value_offset + element->length > data.size()) {
            return loadgen_error<dicom_header>(
                error_codes::invalid_dicom_file,
                "Truncated file meta information");
        }

        const auto value = data.subspan(value_offset, element->length);
        switch (element->tag) {
            case kMediaStorageSopClassUid:
                header.media_storage_sop_class_uid = to_trimmed_string(value);
                break;
            case kMediaStorageSopInstanceUid:
                header.media_storage_sop_instance_uid = to_trimmed_string(value);
                break;
            case kTransferSyntaxUid:
                header.transfer_syntax_uid = to_trimmed_string(value);
                break;
            default:
                break;
        }
        offset = value_offset + element->length;
    }

    if (header.transfer_syntax_uid.empty()) {
        return loadgen_error<dicom_header>(
            error_codes::invalid_dicom_file,
            "Transfer Syntax UID (0002,0010) not found");
    }

    const bool walkable = header.transfer_syntax_uid != kDeflatedExplicitVrLittleEndian &&
                          header.transfer_syntax_uid != kExplicitVrBigEndian;
    if (walkable) {
        const bool explicit_vr = header.transfer_syntax_uid != kImplicitVrLittleEndian;
        header.dataset_parsed = true;

        while (true) {
            const auto element = read_element_header(data, offset, explicit_vr);
            if (!element || element->tag > kStudyInstanceUid) {
                break;
            }
            offset += element->header_size;

            if (element->length == kUndefinedLength) {
                const auto next = skip_sequence(data, offset, explicit_vr, 0);
                if (!next) {
                    break;
                }
                offset = *next;
                continue;
            }
            if (offset + element->length > data.size()) {
                break;
            }

            const auto value = data.subspan(offset, element->length);
            switch (element->tag) {
                case kSopClassUid:
                    header.sop_class_uid = to_trimmed_string(value);
                    break;
                case kSopInstanceUid:
                    header.sop_instance_uid = to_trimmed_string(value);
                    break;
                case kModality:
                    header.modality = to_trimmed_string(value);
                    break;
                case kPatientId:
                    header.patient_id = to_trimmed_string(value);
                    break;
                case kStudyInstanceUid:
                    header.study_instance_uid = to_trimmed_string(value);
                    break;
                default:
                    break;
            }
            offset += element->length;
        }
    }

    if (header.sop_class_uid.empty()) {
        header.sop_class_uid = header.media_storage_sop_class_uid;
    }
    if (header.sop_instance_uid.empty()) {
        header.sop_instance_uid = header.media_storage_sop_instance_uid;
    }

    return Result<dicom_header>::ok(std::move(header));
}

}  // namespace loadgen::catalog
