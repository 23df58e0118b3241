/*
 * Copyright (c) 2026 The TABENCH Authors
 * 
 * This file is part of the TABENCH project.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#include <tabench/tabench.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace tabench;

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

std::string toCsv(const Dataset& ds) {
    std::ostringstream os;
    DatasetCsvWriter writer(os);
    writer.writeDataset(ds);
    return os.str();
}

} // namespace

// ============================================================================
// Test fixture
// ============================================================================

class CsvExportTest : public ::testing::Test {
protected:
    fs::path tmpDir_;

    void SetUp() override {
        // Per-test subdirectory prevents parallel TearDown races.
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = fs::temp_directory_path() / "tabench_csv_test"
                  / (std::string(info->test_suite_name()) + "_" + info->name());
        fs::remove_all(tmpDir_);
        fs::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tmpDir_, ec);
    }

    fs::path tmpFile(const std::string& name) const {
        return tmpDir_ / name;
    }
};

TEST_F(CsvExportTest, HeaderAndRows) {
    const auto lines = splitLines(toCsv(buildVariant(VARIANT_BASE, 2)));
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "id,group,city,segment,value,weight,revenue,active,bucket,user_key,session_key");
    EXPECT_EQ(lines[1], "0,A,Austin,consumer,252,0.94,236.88,true,low,u_0,s_0");
    EXPECT_EQ(lines[2], "1,B,Seattle,enterprise,577,1.61,928.97,false,mid,u_1,s_1");
}

TEST_F(CsvExportTest, NullCellsAreEmpty) {
    const auto lines = splitLines(toCsv(buildVariant(VARIANT_MISSING, 2)));
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "0,A,,,252,0.94,236.88,true,low,u_0,s_0");
    EXPECT_EQ(lines[2], "1,B,Seattle,enterprise,577,1.61,928.97,false,mid,u_1,s_1");
}

TEST_F(CsvExportTest, WideSchemaAppendsExtras) {
    const auto lines = splitLines(toCsv(buildVariant(VARIANT_WIDE, 1)));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find(",session_key,extra_0,extra_1,"), std::string::npos);
    EXPECT_EQ(lines[0].substr(lines[0].size() - 8), ",extra_9");
    // value 252: extra_k = (252 + k) % (50 + k)
    EXPECT_EQ(lines[1], "0,A,Austin,consumer,252,0.94,236.88,true,low,u_0,s_0,2,49,46,43,40,37,34,31,28,25");
}

TEST_F(CsvExportTest, QuotesSpecialStrings) {
    Row row;
    row.id = 7;
    row.group = "x,y";
    row.city = "say \"hi\"";
    row.segment = "line\nbreak";
    row.bucket = "low";
    row.user_key = "u";
    row.session_key = "s";

    std::ostringstream os;
    DatasetCsvWriter writer(os);
    writer.writeRow(row, {Column::ID, Column::GROUP, Column::CITY, Column::SEGMENT, Column::ACTIVE});
    EXPECT_EQ(os.str(), "7,\"x,y\",\"say \"\"hi\"\"\",\"line\nbreak\",false\n");
}

TEST_F(CsvExportTest, CustomDelimiter) {
    std::ostringstream os;
    DatasetCsvWriter writer(os, ';');
    writer.writeHeader({Column::ID, Column::VALUE});
    EXPECT_EQ(os.str(), "id;value\n");
}

TEST_F(CsvExportTest, WritesFileAndCreatesDirectories) {
    const fs::path out = tmpFile("nested/dir/base.csv");
    const Dataset ds = buildVariant(VARIANT_BASE, 50);
    EXPECT_EQ(writeDatasetCsv(out, ds), 50u);

    std::ifstream in(out);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), toCsv(ds));
}

TEST_F(CsvExportTest, RefusesToOverwriteWithoutFlag) {
    const fs::path out = tmpFile("existing.csv");
    { std::ofstream(out) << "keep me\n"; }
    const Dataset ds = buildVariant(VARIANT_BASE, 3);

    EXPECT_THROW(writeDatasetCsv(out, ds), IoFailure);
    {
        std::ifstream in(out);
        std::string line;
        std::getline(in, line);
        EXPECT_EQ(line, "keep me");
    }

    EXPECT_EQ(writeDatasetCsv(out, ds, true), 3u);
    std::ifstream in(out);
    std::string header;
    std::getline(in, header);
    EXPECT_EQ(header.substr(0, 9), "id,group,");
}

TEST_F(CsvExportTest, EmptyDatasetWritesHeaderOnly) {
    EXPECT_EQ(splitLines(toCsv(buildVariant(VARIANT_BASE, 0))).size(), 1u);
}
