/**
 * @file dataset_catalog_test.cpp
 * @brief Unit tests for payload discovery, classification and sampling
 */

#include <loadgen/catalog/dataset_catalog.hpp>

#include "part10_writer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <fstream>
#include <set>
#include <string>
#include <vector>

using namespace loadgen;
using namespace loadgen::catalog;
using loadgen::catalog::testing::part10_writer;
using loadgen::catalog::testing::temp_directory;

namespace {

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path);
    file << text;
}

auto make_descriptor(const std::string& name, std::uintmax_t size,
                     const std::string& modality) -> payload_descriptor {
    payload_descriptor d;
    d.path = name;
    d.size_bytes = size;
    d.modality = modality;
    return d;
}

auto paths_of(const std::vector<payload_descriptor>& descriptors) -> std::vector<std::string> {
    std::vector<std::string> paths;
    for (const auto& d : descriptors) {
        paths.push_back(d.path.string());
    }
    return paths;
}

}  // namespace

// =============================================================================
// Discovery
// =============================================================================

TEST_CASE("dataset_catalog discovers DICOM files recursively", "[catalog][discover]") {
    temp_directory dir("loadgen_catalog_discover_test");
    const auto& root = dir.path();
    std::filesystem::create_directories(root / "series1" / "nested");

    part10_writer().modality("CT").write(root / "b.dcm");
    part10_writer().modality("MR").write(root / "series1" / "a.DCM");
    part10_writer().modality("US").write(root / "series1" / "nested" / "IM0001");
    part10_writer().modality("CR").write(root / "series1" / "c.dicom");
    write_text(root / "notes.txt", "not a payload");
    write_text(root / "fake.dcm", "no preamble here");

    dataset_catalog catalog;

    SECTION("finds every Part-10 file and skips the rest") {
        auto result = catalog.discover(root);
        REQUIRE(result.is_ok());
        CHECK(result.value().size() == 4);

        const auto paths = paths_of(result.value());
        CHECK(std::is_sorted(paths.begin(), paths.end()));
        CHECK(std::none_of(paths.begin(), paths.end(), [](const std::string& p) {
            return p.find("fake.dcm") != std::string::npos ||
                   p.find("notes.txt") != std::string::npos;
        }));
    }

    SECTION("descriptors carry header attributes and size") {
        auto result = catalog.discover(root);
        REQUIRE(result.is_ok());

        const auto& found = result.value();
        const auto it = std::find_if(found.begin(), found.end(), [&](const auto& d) {
            return d.path == root / "b.dcm";
        });
        REQUIRE(it != found.end());
        CHECK(it->modality == "CT");
        CHECK(it->sop_class_uid == testing::kCtImageStorage);
        CHECK(it->transfer_syntax_uid == kExplicitVrLittleEndian);
        CHECK(it->size_bytes == std::filesystem::file_size(root / "b.dcm"));
    }

    SECTION("non-recursive scan stays at the top level") {
        catalog_options options;
        options.recursive = false;
        dataset_catalog flat(options);

        auto result = flat.discover(root);
        REQUIRE(result.is_ok());
        REQUIRE(result.value().size() == 1);
        CHECK(result.value().front().modality == "CT");
    }

    SECTION("discovery is repeatable") {
        auto first = catalog.discover(root);
        auto second = catalog.discover(root);
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        CHECK(paths_of(first.value()) == paths_of(second.value()));
    }
}

TEST_CASE("dataset_catalog discovery errors", "[catalog][discover][error]") {
    temp_directory dir("loadgen_catalog_error_test");
    dataset_catalog catalog;

    SECTION("missing root") {
        auto result = catalog.discover(dir.path() / "does_not_exist");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::catalog_root_not_found);
    }

    SECTION("root is a file") {
        const auto file = dir.path() / "single.dcm";
        part10_writer().write(file);
        auto result = catalog.discover(file);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::catalog_root_not_found);
    }

    SECTION("no matching files") {
        write_text(dir.path() / "readme.md", "# nothing here");
        write_text(dir.path() / "broken.dcm", "garbage");
        auto result = catalog.discover(dir.path());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::catalog_empty);
    }
}

TEST_CASE("dataset_catalog candidate file filter", "[catalog][discover]") {
    CHECK(dataset_catalog::is_candidate_file("image.dcm"));
    CHECK(dataset_catalog::is_candidate_file("IMAGE.DCM"));
    CHECK(dataset_catalog::is_candidate_file("scan.Dicom"));
    CHECK(dataset_catalog::is_candidate_file("IM000123"));
    CHECK_FALSE(dataset_catalog::is_candidate_file("report.pdf"));
    CHECK_FALSE(dataset_catalog::is_candidate_file("image.dcm.bak"));
}

// =============================================================================
// Classification
// =============================================================================

TEST_CASE("dataset_catalog classifies by size", "[catalog][classify]") {
    const std::vector<payload_descriptor> descriptors = {
        make_descriptor("a", 512, "CT"),
        make_descriptor("b", 2 * 1024 * 1024, "CT"),
        make_descriptor("c", 1024 * 1024, "MR"),
        make_descriptor("d", 50ull * 1024 * 1024, "MR"),
        make_descriptor("e", 10ull * 1024 * 1024, "US"),
    };

    SECTION("default thresholds, boundaries inclusive") {
        auto groups = dataset_catalog::classify(descriptors, classify_axis::size);

        REQUIRE(groups.size() == 3);
        CHECK(paths_of(groups[size_bucket::small]) == std::vector<std::string>{"a", "c"});
        CHECK(paths_of(groups[size_bucket::medium]) == std::vector<std::string>{"b", "e"});
        CHECK(paths_of(groups[size_bucket::large]) == std::vector<std::string>{"d"});
    }

    SECTION("custom thresholds") {
        size_thresholds thresholds;
        thresholds.small_max_bytes = 100;
        thresholds.medium_max_bytes = 1000;

        auto groups = dataset_catalog::classify(descriptors, classify_axis::size, thresholds);
        REQUIRE(groups.size() == 2);
        CHECK(groups[size_bucket::medium].size() == 1);
        CHECK(groups[size_bucket::large].size() == 4);
    }

    SECTION("bucket names") {
        CHECK(to_string(payload_category{size_bucket::small}) == "small");
        CHECK(to_string(payload_category{size_bucket::large}) == "large");
    }
}

TEST_CASE("dataset_catalog classifies by modality", "[catalog][classify]") {
    const std::vector<payload_descriptor> descriptors = {
        make_descriptor("1", 10, "CT"),
        make_descriptor("2", 10, "MR"),
        make_descriptor("3", 10, ""),
        make_descriptor("4", 10, "CT"),
    };

    auto groups = dataset_catalog::classify(descriptors, classify_axis::modality);

    REQUIRE(groups.size() == 3);
    CHECK(paths_of(groups[std::string{"CT"}]) == std::vector<std::string>{"1", "4"});
    CHECK(paths_of(groups[std::string{"MR"}]) == std::vector<std::string>{"2"});
    CHECK(paths_of(groups[std::string{kUnknownModality}]) == std::vector<std::string>{"3"});

    std::size_t total = 0;
    for (const auto& [category, members] : groups) {
        total += members.size();
    }
    CHECK(total == descriptors.size());
}

// =============================================================================
// Sampling
// =============================================================================

TEST_CASE("dataset_catalog sampling", "[catalog][sample]") {
    std::vector<payload_descriptor> descriptors;
    for (int i = 0; i < 20; ++i) {
        descriptors.push_back(make_descriptor("p" + std::to_string(i), 100, "CT"));
    }

    SECTION("same seed gives the same sequence") {
        auto first = dataset_catalog::sample(descriptors, 8, 42);
        auto second = dataset_catalog::sample(descriptors, 8, 42);
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        CHECK(paths_of(first.value()) == paths_of(second.value()));
    }

    SECTION("different seeds give different sequences") {
        auto a = dataset_catalog::sample(descriptors, 20, 1);
        auto b = dataset_catalog::sample(descriptors, 20, 2);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        CHECK(paths_of(a.value()) != paths_of(b.value()));
    }

    SECTION("sample has no duplicates") {
        auto result = dataset_catalog::sample(descriptors, 20, 7);
        REQUIRE(result.is_ok());
        const auto paths = paths_of(result.value());
        const std::set<std::string> unique(paths.begin(), paths.end());
        CHECK(unique.size() == 20);
    }

    SECTION("zero count yields an empty sample") {
        auto result = dataset_catalog::sample(descriptors, 0, 7);
        REQUIRE(result.is_ok());
        CHECK(result.value().empty());
    }

    SECTION("count larger than the catalog") {
        auto result = dataset_catalog::sample(descriptors, 21, 7);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::insufficient_data);
    }
}
