#include "MessageBar.hpp"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <gtest/gtest.h>

namespace
{
template <typename Pred>
bool
waitFor(Pred pred, int timeoutMs = 2000)
{
    QElapsedTimer timer;
    timer.start();
    while (!pred() && timer.elapsed() < timeoutMs)
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    return pred();
}
} // namespace

TEST(MessageBar, ShowsMessagesInOrder)
{
    MessageBar bar;
    bar.showMessage("first", 0.05f);
    bar.showMessage("second", 0.05f);

    EXPECT_TRUE(bar.isShowing());
    EXPECT_EQ(bar.currentMessage(), "first");

    EXPECT_TRUE(waitFor([&]() { return bar.currentMessage() == "second"; }));
    EXPECT_TRUE(waitFor([&]() { return !bar.isShowing(); }));
    EXPECT_TRUE(bar.currentMessage().isEmpty());
}

TEST(MessageBar, ClearDropsQueuedMessages)
{
    MessageBar bar;
    bar.showMessage("first", 10);
    bar.showMessage("second", 10);

    bar.clear();
    EXPECT_FALSE(bar.isShowing());
    EXPECT_TRUE(bar.currentMessage().isEmpty());

    QCoreApplication::processEvents();
    EXPECT_TRUE(bar.currentMessage().isEmpty());
}

TEST(MessageBar, RepeatedNoticeIsNotQueuedTwice)
{
    MessageBar bar;
    bar.showMessage("No panels found for this page", 0.05f);
    bar.showMessage("No panels found for this page", 0.05f);

    EXPECT_TRUE(waitFor([&]() { return !bar.isShowing(); }));
}
