//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#include <turnstile/async/fake_clock.hpp>
//
#include <turnstile/async/fake_clock.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using namespace tstile::int_types;

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
TEST(FakeClockTest, TimeOnlyMovesWhenAdvanced)
{
    tstile::FakeClock clock;

    const tstile::FakeClock::TimePoint t0 = clock.now();
    EXPECT_EQ(clock.now(), t0);

    clock.advance(boost::posix_time::seconds(1));
    EXPECT_EQ(clock.now() - t0, boost::posix_time::seconds(1));

    clock.advance(boost::posix_time::hours(0));
    EXPECT_EQ(clock.now() - t0, boost::posix_time::seconds(1));

    EXPECT_EQ(clock.sleep_count(), 0u);
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
TEST(FakeClockTest, SleepCountsAndAdvances)
{
    tstile::FakeClock clock;
    const tstile::FakeClock::TimePoint t0 = clock.now();

    clock.sleep(boost::posix_time::milliseconds(30));
    clock.sleep(boost::posix_time::milliseconds(70));

    EXPECT_EQ(clock.sleep_count(), 2u);
    EXPECT_EQ(clock.total_sleep(), boost::posix_time::milliseconds(100));
    EXPECT_EQ(clock.now() - t0, boost::posix_time::milliseconds(100));

    // Negative sleeps are counted but never move time backwards.
    //
    clock.sleep(boost::posix_time::milliseconds(-5));

    EXPECT_EQ(clock.sleep_count(), 3u);
    EXPECT_EQ(clock.now() - t0, boost::posix_time::milliseconds(100));
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
TEST(FakeClockTest, AdvanceBackwardsDeath)
{
    tstile::FakeClock clock;

    EXPECT_DEATH(clock.advance(boost::posix_time::seconds(-1)), "FakeClock can not go backwards");
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
TEST(FakeClockTest, WaitLoopRunsInVirtualTime)
{
    tstile::FakeClock clock;
    tstile::FakeClock::WaitLoopType wait_loop = clock.make_wait_loop(tstile::PollingPolicy::fixed_interval(
        boost::posix_time::minutes(1).total_microseconds()));

    const tstile::FakeClock::TimePoint t0 = clock.now();
    usize n_polls = 0;

    tstile::Status status = wait_loop.run_until(
        [&]() -> tstile::StatusOr<bool> {
            n_polls += 1;
            return n_polls == 10;
        },
        tstile::None, "ten polls");

    EXPECT_TRUE(status.ok()) << TSTILE_INSPECT(status);
    EXPECT_EQ(n_polls, 10u);
    EXPECT_EQ(clock.sleep_count(), 9u);
    EXPECT_EQ(clock.now() - t0, boost::posix_time::minutes(9));
}

}  // namespace
