#include <lifecycle.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <array>

namespace {

enum class Event
{
    StdoutEnd,
    StderrEnd,
    Exit,
};

auto report(pyshell::Lifecycle& lifecycle, Event const event) -> bool
{
    switch (event)
    {
    case Event::StdoutEnd:
        return lifecycle.stdout_ended();
    case Event::StderrEnd:
        return lifecycle.stderr_ended();
    case Event::Exit:
        return lifecycle.exited(1, std::nullopt);
    }
    return false;
}

TEST(Lifecycle, ConvergesOnceInAnyOrder)
{
    std::array<Event, 3> events{Event::StdoutEnd, Event::StderrEnd, Event::Exit};
    do
    {
        pyshell::Lifecycle lifecycle;
        EXPECT_FALSE(report(lifecycle, events[0]));
        EXPECT_FALSE(report(lifecycle, events[1]));
        EXPECT_FALSE(lifecycle.is_finished());
        EXPECT_TRUE(report(lifecycle, events[2]));
        EXPECT_TRUE(lifecycle.is_finished());
    } while (std::next_permutation(events.begin(), events.end()));
}

TEST(Lifecycle, RepeatedReportsDoNotRefire)
{
    pyshell::Lifecycle lifecycle;
    EXPECT_FALSE(lifecycle.stdout_ended());
    EXPECT_FALSE(lifecycle.stdout_ended());
    EXPECT_FALSE(lifecycle.exited(0, std::nullopt));
    EXPECT_TRUE(lifecycle.stderr_ended());

    EXPECT_FALSE(lifecycle.stderr_ended());
    EXPECT_FALSE(lifecycle.stdout_ended());
    EXPECT_FALSE(lifecycle.exited(0, std::nullopt));
}

TEST(Lifecycle, FirstExitRecorded)
{
    pyshell::Lifecycle lifecycle;
    EXPECT_FALSE(lifecycle.has_exited());
    lifecycle.exited(std::nullopt, 15);
    lifecycle.exited(0, std::nullopt);

    EXPECT_TRUE(lifecycle.has_exited());
    EXPECT_EQ(lifecycle.exit_code(), std::nullopt);
    EXPECT_EQ(lifecycle.exit_signal(), 15);
    EXPECT_FALSE(lifecycle.abnormal());
}

TEST(Lifecycle, Abnormal)
{
    pyshell::Lifecycle clean;
    clean.exited(0, std::nullopt);
    EXPECT_FALSE(clean.abnormal());

    pyshell::Lifecycle failed;
    failed.exited(2, std::nullopt);
    EXPECT_TRUE(failed.abnormal());
    EXPECT_EQ(failed.exit_code(), 2);
}

} // namespace
