#include <catch2/catch_test_macros.hpp>

#include <superbox/core/deadline.hpp>

#include <chrono>
#include <thread>

using namespace superbox;
using namespace std::chrono_literals;

TEST_CASE("Deadline: Never does not expire", "[core][deadline]") {
    auto d = Deadline::Never();
    CHECK(d.IsNever());
    CHECK_FALSE(d.Expired());
    CHECK(d.PollTimeoutMs() == -1);
    CHECK(d.Remaining(5s) == std::chrono::milliseconds{5000});
}

TEST_CASE("Deadline: After expires", "[core][deadline]") {
    auto d = Deadline::After(20ms);
    CHECK_FALSE(d.IsNever());
    std::this_thread::sleep_for(40ms);
    CHECK(d.Expired());
    CHECK(d.Remaining() == std::chrono::milliseconds{0});
    CHECK(d.PollTimeoutMs() == 0);
}

TEST_CASE("Deadline: Remaining is capped", "[core][deadline]") {
    auto d = Deadline::After(10s);
    CHECK(d.Remaining(100ms) == std::chrono::milliseconds{100});
    CHECK(d.Remaining() > std::chrono::milliseconds{9000});
}

TEST_CASE("Deadline: Cap picks the earlier horizon", "[core][deadline]") {
    auto far = Deadline::After(10s);
    auto capped = far.Cap(50ms);
    CHECK(capped.Remaining() <= std::chrono::milliseconds{50});

    auto near = Deadline::After(50ms);
    auto kept = near.Cap(10s);
    CHECK(kept.Remaining() <= std::chrono::milliseconds{50});

    auto never = Deadline::Never().Cap(50ms);
    CHECK_FALSE(never.IsNever());
}
