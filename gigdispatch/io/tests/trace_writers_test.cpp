#include <gigdispatch/io/trace_writers.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace gigdispatch::io;
using namespace gigdispatch::core;

class TraceWritersTest : public ::testing::Test {
protected:
    static TimePoint at(double seconds) { return time_from_seconds(seconds); }

    static void write_offer(TraceWriter& writer, double seconds) {
        writer.begin(at(seconds));
        writer.type("offer_created");
        writer.field("offer_id", uint64_t{7});
        writer.field("distance_km", 1.25);
        writer.field("worker", std::string_view{"w-1"});
        writer.end();
    }
};

// =============================================================================
// NullTraceWriter
// =============================================================================

TEST_F(TraceWritersTest, NullWriterAcceptsAllCalls) {
    NullTraceWriter writer;
    write_offer(writer, 0.0);
    write_offer(writer, 1.0);
}

// =============================================================================
// JsonTraceWriter
// =============================================================================

TEST_F(TraceWritersTest, JsonWriterEmptyArray) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
    }
    EXPECT_EQ(oss.str(), "[\n]\n");
}

TEST_F(TraceWritersTest, JsonWriterRecords) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        write_offer(writer, 1.5);
        writer.begin(at(2.0));
        writer.type("task_offered");
        writer.end();
    }

    EXPECT_EQ(oss.str(),
              "[\n"
              "  {\"time\": 1.5, \"type\": \"offer_created\", \"offer_id\": 7, "
              "\"distance_km\": 1.25, \"worker\": \"w-1\"},\n"
              "  {\"time\": 2, \"type\": \"task_offered\"}\n"
              "]\n");
}

TEST_F(TraceWritersTest, JsonWriterEscapesStrings) {
    std::ostringstream oss;
    JsonTraceWriter writer(oss);
    writer.begin(at(0.0));
    writer.type("offer_declined");
    writer.field("reason", std::string_view{"said \"no\"\n"});
    writer.end();
    writer.finalize();

    EXPECT_NE(oss.str().find(R"("reason": "said \"no\"\n")"), std::string::npos);
}

TEST_F(TraceWritersTest, JsonWriterFinalizeIsIdempotent) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.finalize();
        writer.finalize();
    }
    EXPECT_EQ(oss.str(), "[\n]\n");
}

// =============================================================================
// MemoryTraceWriter and TeeTraceWriter
// =============================================================================

TEST_F(TraceWritersTest, MemoryWriterKeepsTypedFields) {
    MemoryTraceWriter writer;
    write_offer(writer, 3.0);

    ASSERT_EQ(writer.records().size(), 1U);
    const auto& record = writer.records()[0];
    EXPECT_DOUBLE_EQ(record.time, 3.0);
    EXPECT_EQ(record.type, "offer_created");
    EXPECT_EQ(record.get_uint("offer_id"), 7U);
    EXPECT_DOUBLE_EQ(*record.get_double("distance_km"), 1.25);
    EXPECT_EQ(record.get_string("worker"), "w-1");

    // Numeric conversions between integer and floating fields
    EXPECT_DOUBLE_EQ(*record.get_double("offer_id"), 7.0);
    EXPECT_EQ(record.get_uint("distance_km"), 1U);
    EXPECT_FALSE(record.get_string("offer_id").has_value());
    EXPECT_FALSE(record.get_uint("missing").has_value());
}

TEST_F(TraceWritersTest, MemoryWriterFilters) {
    MemoryTraceWriter writer;
    write_offer(writer, 1.0);
    writer.begin(at(2.0));
    writer.type("task_offered");
    writer.end();
    write_offer(writer, 3.0);

    EXPECT_EQ(writer.count("offer_created"), 2U);
    EXPECT_EQ(writer.of_type("task_offered").size(), 1U);

    writer.clear();
    EXPECT_TRUE(writer.records().empty());
}

TEST_F(TraceWritersTest, TeeWriterDuplicatesRecords) {
    MemoryTraceWriter first;
    MemoryTraceWriter second;
    TeeTraceWriter tee(first, second);

    write_offer(tee, 1.0);

    ASSERT_EQ(first.records().size(), 1U);
    ASSERT_EQ(second.records().size(), 1U);
    EXPECT_EQ(second.records()[0].get_string("worker"), "w-1");
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TEST_F(TraceWritersTest, TextualWriterFormatsLines) {
    std::ostringstream oss;
    TextualTraceWriter writer(oss, false);

    write_offer(writer, 1.0);
    write_offer(writer, 1.5);

    std::string output = oss.str();
    auto newline = output.find('\n');
    ASSERT_NE(newline, std::string::npos);
    std::string first = output.substr(0, newline);
    std::string second = output.substr(newline + 1);

    EXPECT_NE(first.find("[     1.00000]"), std::string::npos);
    EXPECT_NE(first.find("(           )"), std::string::npos);
    EXPECT_NE(first.find("offer_created: offer_id = 7, distance_km = 1.25, worker = w-1"),
              std::string::npos);
    EXPECT_NE(second.find("(+   0.50000)"), std::string::npos);
    EXPECT_EQ(output.find("\033["), std::string::npos);
}

TEST_F(TraceWritersTest, TextualWriterColorsFailures) {
    std::ostringstream oss;
    TextualTraceWriter writer(oss, true);

    writer.begin(at(0.0));
    writer.type("allocation_failed");
    writer.end();

    EXPECT_NE(oss.str().find("\033[31m"), std::string::npos);
    EXPECT_NE(oss.str().find("\033[0m"), std::string::npos);
}
