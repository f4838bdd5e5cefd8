// trajectory_io_test.cpp — tests for reading and writing trajectory tables
//
// Covers CSV parsing (column aliases, quoted headers, R row names, missing
// p-values, malformed cells, exact int64 ids), Parquet round trips via Arrow,
// and extension dispatch.

#include <gtest/gtest.h>

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include "io/trajectory_io.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("trajectory_io_test_" + name)).string();
}

// Parquet file whose id and n columns are float64, as some upstream writers emit.
void write_double_keyed_parquet(const std::string& path, const std::vector<double>& ids,
                                const std::vector<double>& ns) {
    arrow::DoubleBuilder id_b, n_b, lbf_b, bnd_b;
    for (size_t i = 0; i < ids.size(); ++i) {
        ASSERT_TRUE(id_b.Append(ids[i]).ok());
        ASSERT_TRUE(n_b.Append(ns[i]).ok());
        ASSERT_TRUE(lbf_b.Append(0.0).ok());
        ASSERT_TRUE(bnd_b.Append(3.0).ok());
    }
    std::vector<std::shared_ptr<arrow::Array>> arrays(4);
    ASSERT_TRUE(id_b.Finish(&arrays[0]).ok());
    ASSERT_TRUE(n_b.Finish(&arrays[1]).ok());
    ASSERT_TRUE(lbf_b.Finish(&arrays[2]).ok());
    ASSERT_TRUE(bnd_b.Finish(&arrays[3]).ok());

    auto schema = arrow::schema({
        arrow::field("id", arrow::float64()),
        arrow::field("n", arrow::float64()),
        arrow::field("logBF", arrow::float64()),
        arrow::field("boundary", arrow::float64()),
    });
    auto table = arrow::Table::Make(schema, arrays);

    auto outfile = arrow::io::FileOutputStream::Open(path);
    ASSERT_TRUE(outfile.ok());
    ASSERT_TRUE(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), *outfile,
                                           static_cast<int64_t>(ids.size()))
                    .ok());
    ASSERT_TRUE((*outfile)->Close().ok());
}

}  // anonymous namespace

class TrajectoryIoTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& p : temp_files_) std::filesystem::remove(p);
    }

    std::string write_file(const std::string& name, const std::string& contents) {
        auto path = temp_path(name);
        std::ofstream out(path);
        out << contents;
        temp_files_.push_back(path);
        return path;
    }

    std::string track(const std::string& name) {
        auto path = temp_path(name);
        temp_files_.push_back(path);
        return path;
    }

    std::vector<std::string> temp_files_;
};

// ===========================================================================
// CSV
// ===========================================================================
TEST_F(TrajectoryIoTest, ReadsSimulationColumns) {
    auto path = write_file("basic.csv",
        "id,n,logBF,boundary,p.value\n"
        "1,10,0.25,6,0.4\n"
        "1,20,1.5,6,0.03\n"
        "2,10,-0.5,6,0.7\n");
    auto table = bfda_io::read_trajectory_csv(path);
    ASSERT_EQ(table.size(), 3u);
    const auto& r = table.rows()[1];
    EXPECT_EQ(r.id, 1);
    EXPECT_EQ(r.n, 20);
    EXPECT_DOUBLE_EQ(r.log_bf, 1.5);
    EXPECT_DOUBLE_EQ(r.boundary, 6.0);
    EXPECT_DOUBLE_EQ(r.p_value, 0.03);
}

TEST_F(TrajectoryIoTest, QuotedHeaderWithRowNamesAndReorderedColumns) {
    auto path = write_file("rnames.csv",
        "\"\",\"boundary\",\"n\",\"id\",\"log_bf\",\"p_value\"\n"
        "\"1\",10,20,7,-1.25,0.9\n");
    auto table = bfda_io::read_trajectory_csv(path);
    ASSERT_EQ(table.size(), 1u);
    const auto& r = table.rows()[0];
    EXPECT_EQ(r.id, 7);
    EXPECT_EQ(r.n, 20);
    EXPECT_DOUBLE_EQ(r.log_bf, -1.25);
    EXPECT_DOUBLE_EQ(r.boundary, 10.0);
    EXPECT_DOUBLE_EQ(r.p_value, 0.9);
}

TEST_F(TrajectoryIoTest, MissingPValuesBecomeNaN) {
    auto path = write_file("na.csv",
        "id,n,logBF,boundary,p.value\n"
        "1,10,0.1,3,NA\n"
        "2,10,0.1,3,\n");
    auto table = bfda_io::read_trajectory_csv(path);
    ASSERT_EQ(table.size(), 2u);
    EXPECT_TRUE(std::isnan(table.rows()[0].p_value));
    EXPECT_TRUE(std::isnan(table.rows()[1].p_value));
}

TEST_F(TrajectoryIoTest, PValueColumnIsOptional) {
    auto path = write_file("nop.csv",
        "id,n,logBF,boundary\n"
        "1,10,0.1,3\n"
        "\n"
        "1,20,0.2,3\n");
    auto table = bfda_io::read_trajectory_csv(path);
    ASSERT_EQ(table.size(), 2u);
    EXPECT_TRUE(std::isnan(table.rows()[1].p_value));
}

TEST_F(TrajectoryIoTest, MissingRequiredColumnThrows) {
    auto path = write_file("nolbf.csv", "id,n,boundary\n1,10,3\n");
    EXPECT_THROW(bfda_io::read_trajectory_csv(path), std::runtime_error);
}

TEST_F(TrajectoryIoTest, MalformedNumberThrows) {
    auto path = write_file("bad.csv", "id,n,logBF,boundary\n1,10,abc,3\n");
    EXPECT_THROW(bfda_io::read_trajectory_csv(path), std::runtime_error);
}

TEST_F(TrajectoryIoTest, NonIntegerNThrows) {
    auto path = write_file("frac.csv", "id,n,logBF,boundary\n1,10.5,0.1,3\n");
    EXPECT_THROW(bfda_io::read_trajectory_csv(path), std::runtime_error);
}

TEST_F(TrajectoryIoTest, ShortRowThrows) {
    auto path = write_file("short.csv", "id,n,logBF,boundary\n1,10\n");
    EXPECT_THROW(bfda_io::read_trajectory_csv(path), std::runtime_error);
}

TEST_F(TrajectoryIoTest, MissingFileThrows) {
    EXPECT_THROW(bfda_io::read_trajectory_csv(temp_path("does_not_exist.csv")),
                 std::runtime_error);
}

TEST_F(TrajectoryIoTest, EmptyFileThrows) {
    auto path = write_file("empty.csv", "");
    EXPECT_THROW(bfda_io::read_trajectory_csv(path), std::runtime_error);
}

// ===========================================================================
// Parquet
// ===========================================================================
TEST_F(TrajectoryIoTest, ParquetRoundTrip) {
    TrajectoryTable table;
    table.add_row(1, 10, 0.125, 6.0, 0.4);
    table.add_row(1, 20, 1.75, 6.0, 0.02);
    table.add_row(2, 10, -0.5, 6.0, std::nan(""));

    auto path = track("roundtrip.parquet");
    bfda_io::write_trajectory_parquet(table, path);
    auto back = bfda_io::read_trajectory_parquet(path);

    ASSERT_EQ(back.size(), table.size());
    for (size_t i = 0; i < table.size(); ++i) {
        const auto& a = table.rows()[i];
        const auto& b = back.rows()[i];
        EXPECT_EQ(a.id, b.id);
        EXPECT_EQ(a.n, b.n);
        EXPECT_DOUBLE_EQ(a.log_bf, b.log_bf);
        EXPECT_DOUBLE_EQ(a.boundary, b.boundary);
    }
    EXPECT_DOUBLE_EQ(back.rows()[1].p_value, 0.02);
    EXPECT_TRUE(std::isnan(back.rows()[2].p_value));
}

TEST_F(TrajectoryIoTest, ParquetSchemaAndNulls) {
    TrajectoryTable table;
    table.add_row(5, 40, 0.0, 3.0, std::nan(""));
    auto path = track("schema.parquet");
    bfda_io::write_trajectory_parquet(table, path);

    auto infile = arrow::io::ReadableFile::Open(path);
    ASSERT_TRUE(infile.ok());
    auto reader_result = parquet::arrow::OpenFile(*infile, arrow::default_memory_pool());
    ASSERT_TRUE(reader_result.ok()) << reader_result.status().ToString();
    auto reader = reader_result.MoveValueUnsafe();
    std::shared_ptr<arrow::Table> arrow_table;
    ASSERT_TRUE(reader->ReadTable(&arrow_table).ok());

    auto schema = arrow_table->schema();
    ASSERT_EQ(schema->num_fields(), 5);
    EXPECT_EQ(schema->field(0)->name(), "id");
    EXPECT_EQ(schema->field(1)->name(), "n");
    EXPECT_EQ(schema->field(2)->name(), "logBF");
    EXPECT_EQ(schema->field(3)->name(), "boundary");
    EXPECT_EQ(schema->field(4)->name(), "p.value");
    EXPECT_TRUE(schema->field(0)->type()->Equals(arrow::int64()));
    EXPECT_TRUE(schema->field(2)->type()->Equals(arrow::float64()));
    EXPECT_EQ(arrow_table->GetColumnByName("p.value")->null_count(), 1);
}

TEST_F(TrajectoryIoTest, ParquetLargeIdsStayDistinct) {
    // Above 2^53 neighbouring int64 values are not representable as double.
    const int64_t base = (int64_t{1} << 53) + 1;
    TrajectoryTable table;
    table.add_row(base, 10, 0.1, 3.0, 0.5);
    table.add_row(base + 1, 10, 0.2, 3.0, 0.5);

    auto path = track("large_ids.parquet");
    bfda_io::write_trajectory_parquet(table, path);
    auto back = bfda_io::read_trajectory_parquet(path);

    ASSERT_EQ(back.size(), 2u);
    EXPECT_EQ(back.rows()[0].id, base);
    EXPECT_EQ(back.rows()[1].id, base + 1);
    EXPECT_EQ(back.group_by_id().size(), 2u);
}

TEST_F(TrajectoryIoTest, ParquetWholeDoubleKeysAccepted) {
    auto path = track("double_keys.parquet");
    write_double_keyed_parquet(path, {1.0, 1.0, 2.0}, {10.0, 20.0, 10.0});
    auto table = bfda_io::read_trajectory_parquet(path);
    ASSERT_EQ(table.size(), 3u);
    EXPECT_EQ(table.rows()[1].id, 1);
    EXPECT_EQ(table.rows()[1].n, 20);
}

TEST_F(TrajectoryIoTest, ParquetNonIntegerNThrows) {
    auto path = track("frac_n.parquet");
    write_double_keyed_parquet(path, {1.0, 1.0}, {10.0, 10.5});
    EXPECT_THROW(bfda_io::read_trajectory_parquet(path), std::runtime_error);
}

TEST_F(TrajectoryIoTest, CsvLargeIdsStayDistinct) {
    auto path = write_file("large_ids.csv",
        "id,n,logBF,boundary\n"
        "9007199254740993,10,0.1,3\n"
        "9007199254740994,10,0.2,3\n");
    auto table = bfda_io::read_trajectory_csv(path);
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.rows()[0].id, int64_t{9007199254740993});
    EXPECT_EQ(table.rows()[1].id, int64_t{9007199254740994});
}

TEST_F(TrajectoryIoTest, CsvWholeNumberWithDecimalPointAccepted) {
    auto path = write_file("dotted.csv", "id,n,logBF,boundary\n1,40.0,0.1,Inf\n");
    auto table = bfda_io::read_trajectory_csv(path);
    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table.rows()[0].n, 40);
    EXPECT_TRUE(std::isinf(table.rows()[0].boundary));
}

TEST_F(TrajectoryIoTest, CsvInfiniteNThrows) {
    auto path = write_file("inf_n.csv", "id,n,logBF,boundary\n1,Inf,0.1,3\n");
    EXPECT_THROW(bfda_io::read_trajectory_csv(path), std::runtime_error);
}

TEST_F(TrajectoryIoTest, ParquetMissingFileThrows) {
    EXPECT_THROW(bfda_io::read_trajectory_parquet(temp_path("does_not_exist.parquet")),
                 std::runtime_error);
}

// ===========================================================================
// Dispatch
// ===========================================================================
TEST_F(TrajectoryIoTest, DispatchOnExtension) {
    auto csv = write_file("dispatch.csv", "id,n,logBF,boundary\n1,10,0.1,3\n");
    EXPECT_EQ(bfda_io::read_trajectory_table(csv).size(), 1u);

    TrajectoryTable table;
    table.add_row(1, 10, 0.1, 3.0, 0.5);
    table.add_row(2, 10, 0.2, 3.0, 0.5);
    auto pq = track("dispatch.parquet");
    bfda_io::write_trajectory_parquet(table, pq);
    EXPECT_EQ(bfda_io::read_trajectory_table(pq).size(), 2u);
}

TEST_F(TrajectoryIoTest, UnknownExtensionThrows) {
    auto path = write_file("table.tsv", "id\tn\n");
    EXPECT_THROW(bfda_io::read_trajectory_table(path), std::runtime_error);
}
