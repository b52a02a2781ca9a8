#include <gigdispatch/core/clock.hpp>
#include <gigdispatch/core/tracer.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace gigdispatch::core;

namespace {

// Records the calls made by the tracer
class CallLog : public TraceWriter {
public:
    void begin(TimePoint time) override { calls.push_back("begin@" + std::to_string(time_to_seconds(time))); }
    void type(std::string_view name) override { calls.push_back("type:" + std::string(name)); }
    void field(std::string_view key, double) override { calls.push_back("double:" + std::string(key)); }
    void field(std::string_view key, uint64_t) override { calls.push_back("uint:" + std::string(key)); }
    void field(std::string_view key, std::string_view) override { calls.push_back("str:" + std::string(key)); }
    void end() override { calls.push_back("end"); }

    std::vector<std::string> calls;
};

} // anonymous namespace

TEST(TracerTest, WithoutWriterSkipsCallback) {
    ManualClock clock;
    Tracer tracer(clock);

    bool invoked = false;
    tracer.emit("offer_created", [&](TraceWriter&) { invoked = true; });
    EXPECT_FALSE(invoked);
}

TEST(TracerTest, EmitsOneFramedRecord) {
    ManualClock clock(time_from_seconds(2.0));
    CallLog log;
    Tracer tracer(clock, &log);

    tracer.emit("offer_created", [](TraceWriter& w) {
        w.field("offer_id", uint64_t{1});
        w.field("distance_km", 1.5);
        w.field("strategy", std::string_view{"nearest"});
    });

    ASSERT_EQ(log.calls.size(), 6U);
    EXPECT_EQ(log.calls[0], "begin@" + std::to_string(2.0));
    EXPECT_EQ(log.calls[1], "type:offer_created");
    EXPECT_EQ(log.calls[2], "uint:offer_id");
    EXPECT_EQ(log.calls[3], "double:distance_km");
    EXPECT_EQ(log.calls[4], "str:strategy");
    EXPECT_EQ(log.calls[5], "end");
}

TEST(TracerTest, SetWriterSwitchesDestination) {
    ManualClock clock;
    CallLog first;
    CallLog second;
    Tracer tracer(clock, &first);

    tracer.emit("a");
    tracer.set_writer(&second);
    tracer.emit("b");
    tracer.set_writer(nullptr);
    tracer.emit("c");

    EXPECT_EQ(first.calls.size(), 3U);
    ASSERT_EQ(second.calls.size(), 3U);
    EXPECT_EQ(second.calls[1], "type:b");
}
