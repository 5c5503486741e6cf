/**
 * @file dataset_catalog.cpp
 * @brief Implementation of dataset_catalog
 */

#include <loadgen/catalog/dataset_catalog.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <numeric>
#include <random>
#include <system_error>

namespace loadgen::catalog {

namespace {

/**
 * @brief Uniform value in [0, bound) from a 64-bit engine
 *
 * Rejection sampling on the raw engine output; unlike
 * std::uniform_int_distribution the sequence is the same on every
 * standard library.
 */
[[nodiscard]] auto bounded_random(std::mt19937_64& engine, std::uint64_t bound) -> std::uint64_t {
    const std::uint64_t limit =
        std::numeric_limits<std::uint64_t>::max() -
        std::numeric_limits<std::uint64_t>::max() % bound;
    std::uint64_t value = engine();
    while (value >= limit) {
        value = engine();
    }
    return value % bound;
}

[[nodiscard]] auto to_lower(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

dataset_catalog::dataset_catalog(catalog_options options,
                                 std::shared_ptr<di::ILogger> logger)
    : options_(std::move(options)),
      reader_(options_.max_header_bytes),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// Discovery
// =============================================================================

auto dataset_catalog::is_candidate_file(const std::filesystem::path& path) -> bool {
    if (!path.has_extension()) {
        return true;
    }
    const auto ext = to_lower(path.extension().string());
    return ext == ".dcm" || ext == ".dicom";
}

auto dataset_catalog::describe(const std::filesystem::path& file) const
    -> Result<payload_descriptor> {
    auto header = reader_.read(file);
    if (header.is_err()) {
        return Result<payload_descriptor>::err(header.error());
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        return loadgen_error<payload_descriptor>(
            error_codes::file_read_error,
            "Cannot stat file: " + file.string(), ec.message());
    }

    auto& h = header.value();
    payload_descriptor descriptor;
    descriptor.path = file;
    descriptor.size_bytes = size;
    descriptor.modality = std::move(h.modality);
    descriptor.sop_class_uid = std::move(h.sop_class_uid);
    descriptor.sop_instance_uid = std::move(h.sop_instance_uid);
    descriptor.transfer_syntax_uid = std::move(h.transfer_syntax_uid);
    descriptor.patient_id = std::move(h.patient_id);
    descriptor.study_instance_uid = std::move(h.study_instance_uid);

    return Result<payload_descriptor>::ok(std::move(descriptor));
}

auto dataset_catalog::discover(const std::filesystem::path& root) const
    -> Result<std::vector<payload_descriptor>> {
    using result_type = Result<std::vector<payload_descriptor>>;

    std::error_code ec;
    if (!std::filesystem::exists(root, ec) || !std::filesystem::is_directory(root, ec)) {
        return loadgen_error<std::vector<payload_descriptor>>(
            error_codes::catalog_root_not_found,
            "Catalog root does not exist or is not a directory: " + root.string());
    }

    std::vector<payload_descriptor> descriptors;
    std::size_t skipped = 0;

    const auto visit = [&](const std::filesystem::directory_entry& entry) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || !is_candidate_file(entry.path())) {
            return;
        }

        auto descriptor = describe(entry.path());
        if (descriptor.is_err()) {
            ++skipped;
            logger_->debug_fmt("Skipping {}: {}", entry.path().string(),
                               descriptor.error().message);
            return;
        }
        descriptors.push_back(std::move(descriptor.value()));
    };

    const auto dir_options = std::filesystem::directory_options::skip_permission_denied;
    if (options_.recursive) {
        for (auto it = std::filesystem::recursive_directory_iterator(root, dir_options, ec);
             !ec && it != std::filesystem::recursive_directory_iterator();
             it.increment(ec)) {
            visit(*it);
        }
    } else {
        for (auto it = std::filesystem::directory_iterator(root, dir_options, ec);
             !ec && it != std::filesystem::directory_iterator();
             it.increment(ec)) {
            visit(*it);
        }
    }

    if (ec) {
        logger_->warn_fmt("Directory scan of {} stopped early: {}", root.string(), ec.message());
    }

    if (descriptors.empty()) {
        return loadgen_error<std::vector<payload_descriptor>>(
            error_codes::catalog_empty,
            "No DICOM payload files found under " + root.string());
    }

    std::sort(descriptors.begin(), descriptors.end(),
              [](const payload_descriptor& a, const payload_descriptor& b) {
                  return a.path < b.path;
              });

    logger_->info_fmt("Catalog {}: {} payloads discovered, {} files skipped",
                      root.string(), descriptors.size(), skipped);

    return result_type::ok(std::move(descriptors));
}

// =============================================================================
// Classification
// =============================================================================

auto dataset_catalog::bucket_for(std::uintmax_t size_bytes,
                                 const size_thresholds& thresholds) noexcept -> size_bucket {
    if (size_bytes <= thresholds.small_max_bytes) {
        return size_bucket::small;
    }
    if (size_bytes <= thresholds.medium_max_bytes) {
        return size_bucket::medium;
    }
    return size_bucket::large;
}

auto dataset_catalog::classify(const std::vector<payload_descriptor>& descriptors,
                               classify_axis axis,
                               const size_thresholds& thresholds)
    -> std::map<payload_category, std::vector<payload_descriptor>> {
    std::map<payload_category, std::vector<payload_descriptor>> groups;

    for (const auto& descriptor : descriptors) {
        payload_category key;
        switch (axis) {
            case classify_axis::size:
                key = bucket_for(descriptor.size_bytes, thresholds);
                break;
            case classify_axis::modality:
                key = descriptor.modality.empty() ? std::string{kUnknownModality}
                                                  : descriptor.modality;
                break;
        }
        groups[key].push_back(descriptor);
    }

    return groups;
}

// =============================================================================
// Sampling
// =============================================================================

auto dataset_catalog::sample(const std::vector<payload_descriptor>& descriptors,
                             std::size_t count,
                             std::uint64_t seed)
    -> Result<std::vector<payload_descriptor>> {
    if (count > descriptors.size()) {
        return loadgen_error<std::vector<payload_descriptor>>(
            error_codes::insufficient_data,
            "Requested " + std::to_string(count) + " payloads but only " +
                std::to_string(descriptors.size()) + " are available");
    }

    std::vector<std::size_t> order(descriptors.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    // Partial Fisher-Yates: the first count slots are the sample
    std::mt19937_64 engine(seed);
    for (std::size_t i = 0; i < count; ++i) {
        const auto remaining = static_cast<std::uint64_t>(order.size() - i);
        const auto j = i + static_cast<std::size_t>(bounded_random(engine, remaining));
        std::swap(order[i], order[j]);
    }

    std::vector<payload_descriptor> sampled;
    sampled.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        sampled.push_back(descriptors[order[i]]);
    }

    return Result<std::vector<payload_descriptor>>::ok(std::move(sampled));
}

}  // namespace loadgen::catalog
