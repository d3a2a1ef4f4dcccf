#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "kspacing/drivers.hpp"

using namespace kspacing;

namespace {

struct Argv {
    explicit Argv(std::vector<std::string> args) : store(std::move(args)) {
        for (auto& s : store) ptrs.push_back(s.data());
    }
    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> store;
    std::vector<char*> ptrs;
};

class DriverFiles : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("kspacing_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        const std::filesystem::path p = dir_ / name;
        std::ofstream(p) << content;
        return p.string();
    }
    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    static std::string slurp(const std::string& p) {
        std::ifstream in(p);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    int explicit_spacing(std::vector<std::string> args) {
        args.insert(args.begin(), "explicit_spacing");
        Argv a(std::move(args));
        out_.str("");
        err_.str("");
        return run_explicit_spacing(a.argc(), a.argv(), out_, err_);
    }
    int hamming_clusters(std::vector<std::string> args) {
        args.insert(args.begin(), "hamming_clusters");
        Argv a(std::move(args));
        out_.str("");
        err_.str("");
        return run_hamming_clusters(a.argc(), a.argv(), out_, err_);
    }

    std::filesystem::path dir_;
    std::ostringstream out_;
    std::ostringstream err_;
};

} // namespace

TEST_F(DriverFiles, ExplicitSpacingWritesSummaryAndCsv) {
    const std::string in = write("g.txt", "3\n1 2 1\n2 3 2\n1 3 3\n");
    const std::string csv = path("out.csv");
    EXPECT_EQ(explicit_spacing({"-i", in, "--k", "2", "--csv-out", csv}), 0);
    EXPECT_NE(out_.str().find("elements=3 edges=3 k=2 spacing=2"), std::string::npos);
    EXPECT_EQ(slurp(csv), "k,spacing\n2,2\n");
}

TEST_F(DriverFiles, ExplicitSpacingHonoursLabelBase) {
    const std::string in = write("g0.txt", "3\n0 1 1\n1 2 2\n0 2 3\n");
    EXPECT_EQ(explicit_spacing({"-i", in, "-k", "2", "--label-base", "0"}), 0);
    EXPECT_NE(out_.str().find("spacing=2"), std::string::npos);
}

TEST_F(DriverFiles, ExplicitSpacingUsageErrorsExitOne) {
    const std::string in = write("g.txt", "3\n1 2 1\n2 3 2\n1 3 3\n");
    EXPECT_EQ(explicit_spacing({}), 1);
    EXPECT_EQ(explicit_spacing({"-i", in, "--k", "x"}), 1);
    EXPECT_EQ(explicit_spacing({"-i", in, "--k", "2", "--label-base", "-3"}), 1);
    EXPECT_EQ(explicit_spacing({"-i", in, "--k", "2", "--label-base", "99999999999"}), 1);
    EXPECT_NE(err_.str().find("Usage:"), std::string::npos);
}

TEST_F(DriverFiles, ExplicitSpacingHelpExitsZero) {
    EXPECT_EQ(explicit_spacing({"--help"}), 0);
    EXPECT_NE(out_.str().find("--label-base"), std::string::npos);
}

TEST_F(DriverFiles, ExplicitSpacingParseErrorsExitTwo) {
    EXPECT_EQ(explicit_spacing({"-i", write("bad.txt", "3\n1 5 2\n"), "--k", "2"}), 2);
    EXPECT_EQ(explicit_spacing({"-i", path("missing.txt"), "--k", "2"}), 2);
}

TEST_F(DriverFiles, ExplicitSpacingClusteringErrorsExitFour) {
    const std::string in = write("g.txt", "3\n1 2 1\n2 3 2\n1 3 3\n");
    EXPECT_EQ(explicit_spacing({"-i", in, "--k", "3"}), 4);
    EXPECT_NE(err_.str().find("Invalid cluster target"), std::string::npos);

    const std::string sparse = write("sparse.txt", "4\n1 2 3\n");
    EXPECT_EQ(explicit_spacing({"-i", sparse, "--k", "2"}), 4);
    EXPECT_NE(err_.str().find("Clustering failed"), std::string::npos);
}

TEST_F(DriverFiles, ExplicitSpacingUnwritableCsvExitsThree) {
    const std::string in = write("g.txt", "3\n1 2 1\n2 3 2\n1 3 3\n");
    EXPECT_EQ(explicit_spacing({"-i", in, "--k", "2", "--csv-out", path("no_such_dir/out.csv")}), 3);
}

TEST_F(DriverFiles, HammingClustersWritesSummaryAndCsv) {
    const std::string in = write("b.txt", "4 3\n000\n0 0 1\n000\n111\n");
    const std::string csv = path("h.csv");
    EXPECT_EQ(hamming_clusters({"-i", in, "--spacing", "2,4", "--csv-out", csv}), 0);
    const std::string text = out_.str();
    EXPECT_NE(text.find("points=4 bits=3 distinct=3 spacing=2 clusters=2 largest=3"), std::string::npos);
    EXPECT_NE(text.find("spacing=4 clusters=1 largest=4"), std::string::npos);

    const std::string rows = slurp(csv);
    EXPECT_EQ(rows.rfind("spacing,clusters,distinct,cluster_sec\n", 0), 0u);
    EXPECT_NE(rows.find("\n2,2,3,"), std::string::npos);
    EXPECT_NE(rows.find("\n4,1,3,"), std::string::npos);
}

TEST_F(DriverFiles, HammingClustersHugeHeaderExitsTwo) {
    EXPECT_EQ(hamming_clusters({"-i", write("huge.txt", "4000000000 3\n000\n")}), 2);
    EXPECT_EQ(hamming_clusters({"-i", write("wide.txt", "1 999999999999\n01\n")}), 2);
}

TEST_F(DriverFiles, HammingClustersErrorCodes) {
    const std::string in = write("b.txt", "2 3\n000\n111\n");
    EXPECT_EQ(hamming_clusters({"-i", in, "--spacing", "two"}), 1);
    EXPECT_EQ(hamming_clusters({"-i", in, "--spacing", "0"}), 4);
    EXPECT_NE(err_.str().find("Invalid spacing threshold"), std::string::npos);
    EXPECT_EQ(hamming_clusters({"-i", in, "--csv-out", path("no_such_dir/h.csv")}), 3);
}
