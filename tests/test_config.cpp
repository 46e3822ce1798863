#include <gtest/gtest.h>
#include "../main/src/config.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"
#include "../main/src/tree_reducer.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;

    void SetUp() override {
        init_localization();
        // Reset to default
        reset_config();
        suite_work_dir = fs::absolute("tmp_config_test");
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(suite_work_dir);
    }

    void TearDown() override {
        reset_config();
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }

    fs::path write_config(const std::string& content) {
        fs::path p = suite_work_dir / "treesum.conf";
        std::ofstream f(p);
        f << content;
        return p;
    }
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(CONFIG_DIR, fs::path(TREESUM_CONF_DIR));
    EXPECT_EQ(CONFIG_FILE, fs::path(TREESUM_CONF_DIR) / "treesum.conf");
    EXPECT_EQ(get_hash_algorithm(), "sha256");
    EXPECT_EQ(get_jobs(), 1u);
    EXPECT_EQ(get_parallel_threshold(), 4096u);
}

TEST_F(ConfigTest, LoadsValues) {
    set_config_file(write_config(
        "# treesum settings\n"
        "\n"
        "algorithm = sha3-256\n"
        "jobs=8\n"
        "  parallel_threshold =  512  \n"));
    ASSERT_NO_THROW(load_config());

    TreeHashOptions options = get_tree_hash_options();
    EXPECT_EQ(options.algorithm, "sha3-256");
    EXPECT_EQ(options.jobs, 8u);
    EXPECT_EQ(options.parallel_threshold, 512u);
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    set_config_file(write_config("algorithm=sha3-256\njobs=8\n"));
    load_config();
    set_hash_algorithm("sha256");
    set_jobs(2);
    EXPECT_EQ(get_tree_hash_options().algorithm, "sha256");
    EXPECT_EQ(get_tree_hash_options().jobs, 2u);
}

TEST_F(ConfigTest, UnknownKeyIsOnlyAWarning) {
    set_config_file(write_config("colour=blue\njobs=3\n"));
    EXPECT_NO_THROW(load_config());
    EXPECT_EQ(get_jobs(), 3u);
}

TEST_F(ConfigTest, MalformedValuesThrow) {
    for (const char* content : {"jobs=0\n", "jobs=-1\n", "jobs=two\n", "parallel_threshold=\n", "algorithm=\n", "jobs\n"}) {
        reset_config();
        set_config_file(write_config(content));
        EXPECT_THROW(load_config(), TreesumException) << content;
    }
}

TEST_F(ConfigTest, MissingDefaultFileIsFine) {
    CONFIG_FILE = suite_work_dir / "not-there.conf";
    EXPECT_NO_THROW(load_config());
    EXPECT_EQ(get_hash_algorithm(), "sha256");
}

TEST_F(ConfigTest, MissingExplicitFileThrows) {
    set_config_file(suite_work_dir / "not-there.conf");
    EXPECT_THROW(load_config(), TreesumException);
}

TEST_F(ConfigTest, ZeroJobsRejected) {
    EXPECT_THROW(set_jobs(0), TreesumException);
    EXPECT_EQ(get_jobs(), 1u);
}

TEST_F(ConfigTest, ShippedConfigMatchesDefaults) {
    set_config_file(fs::path(TREESUM_SOURCE_DIR) / "conf/treesum.conf");
    ASSERT_NO_THROW(load_config());
    TreeHashOptions defaults;
    EXPECT_EQ(get_hash_algorithm(), defaults.algorithm);
    EXPECT_EQ(get_jobs(), defaults.jobs);
    EXPECT_EQ(get_parallel_threshold(), defaults.parallel_threshold);
}

TEST_F(ConfigTest, JobsAreCapped) {
    EXPECT_NO_THROW(set_jobs(MAX_JOBS));
    EXPECT_EQ(get_jobs(), MAX_JOBS);
    EXPECT_THROW(set_jobs(MAX_JOBS + 1), TreesumException);
    EXPECT_THROW(set_jobs(1000000), TreesumException);
    EXPECT_EQ(get_jobs(), MAX_JOBS);

    set_config_file(write_config("jobs=" + std::to_string(MAX_JOBS + 1) + "\n"));
    EXPECT_THROW(load_config(), TreesumException);
}

TEST_F(ConfigTest, ZeroThresholdRejected) {
    EXPECT_THROW(set_parallel_threshold(0), TreesumException);
    EXPECT_EQ(get_parallel_threshold(), 4096u);
    set_parallel_threshold(1);
    EXPECT_EQ(get_parallel_threshold(), 1u);
}
