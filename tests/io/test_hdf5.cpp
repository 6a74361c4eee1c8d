// =============================================================================
// coexnet - HDF5 Store Tests
// =============================================================================
//
// Coverage for coexnet/io/hdf5.hpp and coexnet/io/network_store.hpp
//
// Functions tested:
//   write_labeled_matrix / read_labeled_matrix
//   write_analysis (layout, overwrite)
//
// Cases skip when the library is built without HDF5.
//
// =============================================================================

#include "test.hpp"

#include "coexnet/io/network_store.hpp"
#include "coexnet/kernel/network.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

using namespace coexnet;
using namespace coexnet::test;

#ifdef COEXNET_HAS_HDF5

namespace {

// Scratch file removed on both ends of a test
class TempFile {
public:
    explicit TempFile(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("coexnet_" + name + ".h5")) {
        std::filesystem::remove(path_);
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

kernel::network::AnalysisResult two_pairs_analysis(const std::string& id) {
    const auto x = fixture::two_pairs();
    const auto full = fixture::two_pairs_traits();
    TraitMatrix traits;
    traits.values = Matrix(3, 1);
    for (Index s = 0; s < 3; ++s) traits.values(s, 0) = full.values(s, 0);
    traits.row_names = full.row_names;
    traits.col_names = {"treated"};

    kernel::network::NetworkConfig cfg;
    cfg.analysis_id = id;
    cfg.power = 6;
    cfg.min_module_size = 2;
    cfg.modules_of_interest = {1, 2};
    cfg.gs_trait = "treated";
    return kernel::network::run_network_analysis(x, traits, cfg);
}

} // namespace

#endif // COEXNET_HAS_HDF5

COEXNET_TEST_BEGIN

// =============================================================================
// Labeled Matrices
// =============================================================================

COEXNET_TEST_SUITE(labeled_matrix)

COEXNET_TEST_CASE(round_trip) {
#ifdef COEXNET_HAS_HDF5
    TempFile tmp("labeled");
    const auto x = fixture::two_pairs();
    {
        auto file = io::h5::File::create(tmp.str());
        io::write_labeled_matrix(file, "expression", x);
    }

    const auto back = io::read_labeled_matrix(tmp.str(), "expression");
    COEXNET_ASSERT_EQ(back.rows(), Index(3));
    COEXNET_ASSERT_EQ(back.cols(), Index(4));
    COEXNET_ASSERT_TRUE(back.row_names == x.row_names);
    COEXNET_ASSERT_TRUE(back.col_names == x.col_names);
    COEXNET_ASSERT_EQ(max_abs_diff(back.values.view(), x.values.view()), Real(0));
#else
    COEXNET_SKIP("built without HDF5");
#endif
}

COEXNET_TEST_CASE(missing_group) {
#ifdef COEXNET_HAS_HDF5
    TempFile tmp("missing");
    {
        auto file = io::h5::File::create(tmp.str());
        io::write_labeled_matrix(file, "expression", fixture::two_pairs());
    }
    COEXNET_ASSERT_THROWS(io::read_labeled_matrix(tmp.str(), "traits"), ReadError);
#else
    COEXNET_SKIP("built without HDF5");
#endif
}

COEXNET_TEST_CASE(missing_file) {
#ifdef COEXNET_HAS_HDF5
    TempFile tmp("absent");
    COEXNET_ASSERT_THROWS(io::read_labeled_matrix(tmp.str(), "expression"), IOError);
#else
    COEXNET_SKIP("built without HDF5");
#endif
}

COEXNET_TEST_CASE(names_checked_on_write) {
#ifdef COEXNET_HAS_HDF5
    TempFile tmp("bad_names");
    auto x = fixture::two_pairs();
    x.col_names.pop_back();
    auto file = io::h5::File::create(tmp.str());
    COEXNET_ASSERT_THROWS(io::write_labeled_matrix(file, "expression", x), DimensionError);
#else
    COEXNET_SKIP("built without HDF5");
#endif
}

COEXNET_TEST_SUITE_END

// =============================================================================
// Analysis Results
// =============================================================================

COEXNET_TEST_SUITE(analysis)

COEXNET_TEST_CASE(layout) {
#ifdef COEXNET_HAS_HDF5
    TempFile tmp("layout");
    const auto result = two_pairs_analysis("run1");
    io::write_analysis(tmp.str(), result);

    io::h5::File file(tmp.str());
    COEXNET_ASSERT_TRUE(file.exists("run1"));
    auto root = file.open_group("run1");
    COEXNET_ASSERT_EQ(root.read_attr<double>("power"), 6.0);

    const auto powers = root.open_group("soft_threshold").read_dataset<double>("power");
    COEXNET_ASSERT_EQ(powers.size(), result.soft_threshold.size());

    auto assignment = root.open_group("assignment");
    const auto merged = assignment.read_dataset<int64_t>("merged");
    const std::vector<int64_t> expected = {1, 1, 2, 2};
    COEXNET_ASSERT_TRUE(merged == expected);
    const auto genes = assignment.open_dataset("gene_names").read_strings();
    COEXNET_ASSERT_STR_EQ(genes[3], "g4");

    const auto me = io::read_labeled_matrix(root, "eigengenes");
    COEXNET_ASSERT_EQ(me.cols(), Index(2));
    COEXNET_ASSERT_STR_EQ(me.col_names[0], "MEturquoise");
    COEXNET_ASSERT_STR_EQ(me.row_names[2], "s3");

    auto gene_group = root.open_group("genes");
    COEXNET_ASSERT_STR_EQ(gene_group.read_attr_string("gs_trait"), "treated");
    COEXNET_ASSERT_EQ(gene_group.read_dataset<double>("gs").size(), Size(4));

    COEXNET_ASSERT_TRUE(root.exists("hubs/turquoise"));
    COEXNET_ASSERT_TRUE(root.exists("hubs/blue"));
    const auto hubs = root.open_group("hubs").open_group("blue").read_dataset<int64_t>("hub_genes");
    const std::vector<int64_t> blue = {2, 3};
    COEXNET_ASSERT_EQ(hubs.size(), Size(2));
    COEXNET_ASSERT_TRUE(std::is_permutation(hubs.begin(), hubs.end(), blue.begin()));
#else
    COEXNET_SKIP("built without HDF5");
#endif
}

COEXNET_TEST_CASE(several_analyses_share_a_file) {
#ifdef COEXNET_HAS_HDF5
    TempFile tmp("shared");
    io::write_analysis(tmp.str(), two_pairs_analysis("a"));
    io::write_analysis(tmp.str(), two_pairs_analysis("b"));

    io::h5::File file(tmp.str());
    COEXNET_ASSERT_TRUE(file.exists("a"));
    COEXNET_ASSERT_TRUE(file.exists("b"));
#else
    COEXNET_SKIP("built without HDF5");
#endif
}

COEXNET_TEST_CASE(overwrite_policy) {
#ifdef COEXNET_HAS_HDF5
    TempFile tmp("overwrite");
    const auto result = two_pairs_analysis("run1");
    io::write_analysis(tmp.str(), result);

    COEXNET_ASSERT_THROWS(io::write_analysis(tmp.str(), result), WriteError);
    COEXNET_ASSERT_NO_THROW(io::write_analysis(tmp.str(), result, true));

    io::h5::File file(tmp.str());
    COEXNET_ASSERT_TRUE(file.exists("run1/genes"));
#else
    COEXNET_SKIP("built without HDF5");
#endif
}

COEXNET_TEST_CASE(repeated_hub_module_leaves_no_group) {
#ifdef COEXNET_HAS_HDF5
    TempFile tmp("repeated_hubs");
    auto result = two_pairs_analysis("run1");
    result.hubs.push_back(result.hubs.front());
    COEXNET_ASSERT_THROWS(io::write_analysis(tmp.str(), result), WriteError);

    io::h5::File file(tmp.str());
    COEXNET_ASSERT_FALSE(file.exists("run1"));
#else
    COEXNET_SKIP("built without HDF5");
#endif
}

COEXNET_TEST_CASE(empty_id_rejected) {
#ifdef COEXNET_HAS_HDF5
    TempFile tmp("empty_id");
    auto result = two_pairs_analysis("run1");
    result.analysis_id.clear();
    COEXNET_ASSERT_THROWS(io::write_analysis(tmp.str(), result), WriteError);
#else
    COEXNET_SKIP("built without HDF5");
#endif
}

COEXNET_TEST_SUITE_END

COEXNET_TEST_END

COEXNET_TEST_MAIN()
