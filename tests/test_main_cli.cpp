#include <gtest/gtest.h>

#include "testing.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <sys/wait.h>

#ifndef APGCHECK_BIN
#error "APGCHECK_BIN must point at the apgcheck executable"
#endif

namespace {

struct CliRun {
    int exit_code = -1;
    std::string out;
};

class MainCliTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config_ = temp_.Path() + "/apgcheck.conf";
        ASSERT_TRUE(testutil::WriteTextFile(
            config_, "{\"ScratchBaseDir\": \"" + temp_.Path() + "/scratch\", \"LogLevel\": \"none\"}"));
    }

    std::string Archive(const std::string& metadata) {
        const std::string path = temp_.Path() + "/pkg.apg";
        EXPECT_TRUE(testutil::WriteBytesFile(
            path, testutil::BuildTarXz(testutil::PackageEntries(metadata))));
        return path;
    }

    // Runs the binary with the test config in the environment; stdout only.
    CliRun Run(const std::string& args) const {
        const std::string out_path = temp_.Path() + "/stdout.txt";
        const std::string cmd = "APGCHECK_CONFIG_PATH='" + config_ + "' NO_COLOR=1 '" +
                                std::string(APGCHECK_BIN) + "' " + args + " > '" + out_path +
                                "' 2>/dev/null";
        CliRun run;
        const int status = std::system(cmd.c_str());
        if (status != -1 && WIFEXITED(status)) run.exit_code = WEXITSTATUS(status);
        run.out = testutil::ReadFile(out_path);
        return run;
    }

    testutil::TemporaryDirectory temp_;
    std::string config_;
};

TEST_F(MainCliTest, ValidPackageExitsZero) {
    const auto run = Run("-a '" + Archive(testutil::ValidMetadataV1()) + "'");
    EXPECT_EQ(run.exit_code, 0);
    EXPECT_EQ(run.out, "The file specified is the correct apg\n");
}

TEST_F(MainCliTest, InvalidPackageExitsOne) {
    const auto run = Run("--apgfile '" + Archive(R"({"name":"x"})") + "'");
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_EQ(run.out.rfind("SchemaValidationError: Missing or empty fields in metadata:\n", 0), 0U);
    EXPECT_NE(run.out.find("  - homepage\n"), std::string::npos);
}

TEST_F(MainCliTest, FormatVersionFlagSelectsSchema) {
    const auto archive = Archive(testutil::ValidMetadataV1());
    EXPECT_EQ(Run("-a '" + archive + "' -f 1").exit_code, 0);
    EXPECT_EQ(Run("-a '" + archive + "' --format-version 2").exit_code, 1);
}

TEST_F(MainCliTest, StdinIsAccepted) {
    const auto archive = Archive(testutil::ValidMetadataV1());
    EXPECT_EQ(Run("-a - < '" + archive + "'").exit_code, 0);
}

TEST_F(MainCliTest, MissingApgFileIsUsageError) {
    EXPECT_EQ(Run("").exit_code, 2);
    EXPECT_EQ(Run("-f 1").exit_code, 2);
}

TEST_F(MainCliTest, BadFormatVersionIsUsageError) {
    EXPECT_EQ(Run("-a x.apg -f 3").exit_code, 2);
}

TEST_F(MainCliTest, UnreadableExplicitConfigIsUsageError) {
    const auto archive = Archive(testutil::ValidMetadataV1());
    EXPECT_EQ(Run("-a '" + archive + "' -c '" + temp_.Path() + "/absent.conf'").exit_code, 2);

    ASSERT_TRUE(testutil::WriteTextFile(config_, "{\"LogLevel\": \"chatty\"}"));
    EXPECT_EQ(Run("-a '" + archive + "'").exit_code, 2);
}

TEST_F(MainCliTest, ConfigFormatVersionAppliesUnlessOverridden) {
    ASSERT_TRUE(testutil::WriteTextFile(
        config_, "{\"FormatVersion\": 2, \"ScratchBaseDir\": \"" + temp_.Path() + "\"}"));
    const auto archive = Archive(testutil::ValidMetadataV1());
    EXPECT_EQ(Run("-a '" + archive + "'").exit_code, 1);
    EXPECT_EQ(Run("-a '" + archive + "' -f 1").exit_code, 0);
}

TEST_F(MainCliTest, OutOfRangeConfigValuesAreUsageErrors) {
    const auto archive = Archive(testutil::ValidMetadataV1());
    ASSERT_TRUE(testutil::WriteTextFile(config_, "{\"MaxEntryBytes\": 1073741824}"));
    EXPECT_EQ(Run("-a '" + archive + "'").exit_code, 2);

    ASSERT_TRUE(testutil::WriteTextFile(config_, "{\"FormatVersion\": 4294967297}"));
    EXPECT_EQ(Run("-a '" + archive + "'").exit_code, 2);
}

TEST_F(MainCliTest, VersionAndHelpExitZero) {
    const auto version = Run("--version");
    EXPECT_EQ(version.exit_code, 0);
    EXPECT_EQ(version.out.rfind("apgcheck ", 0), 0U);
    EXPECT_EQ(Run("-h").exit_code, 0);
}

TEST_F(MainCliTest, MissingArchiveExitsOne) {
    const auto run = Run("-a '" + temp_.Path() + "/nope.apg'");
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_EQ(run.out.rfind("IOError: ", 0), 0U);
}

} // namespace
