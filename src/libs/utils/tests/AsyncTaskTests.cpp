// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/async/AsyncTask.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QObject>
#include <QtCore/QVector>
#include <QtTest/QTest>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>

namespace {

QCoreApplication* ensureCoreApp()
{
    if (auto* existing = QCoreApplication::instance())
        return existing;

    static int argc = 1;
    static char appName[] = "AsyncTaskTests";
    static char* argv[] = {appName, nullptr};
    static QCoreApplication app(argc, argv);
    return &app;
}

} // namespace

TEST(AsyncTaskTests, SerialQueueDeliversInSubmissionOrder)
{
    ensureCoreApp();

    Utils::Async::SerialTaskQueue queue;
    QObject context;
    QVector<int> completed;

    for (int i = 0; i < 50; ++i) {
        Utils::Async::run<int>(
            &context,
            [i] { return i; },
            [&completed](int value) { completed.push_back(value); },
            queue.pool());
    }

    ASSERT_TRUE(QTest::qWaitFor([&completed] { return completed.size() == 50; }, 5000));
    for (int i = 0; i < 50; ++i)
        EXPECT_EQ(completed.at(i), i);
}

TEST(AsyncTaskTests, DestroyedContextDropsCompletionButRunsWork)
{
    ensureCoreApp();

    Utils::Async::SerialTaskQueue queue;
    std::atomic<int> workRuns{0};
    int completions = 0;

    auto context = std::make_unique<QObject>();
    Utils::Async::run<int>(
        context.get(),
        [&workRuns] {
            ++workRuns;
            return 1;
        },
        [&completions](int) { ++completions; },
        queue.pool());
    context.reset();

    ASSERT_TRUE(queue.waitForIdle(5000));
    QCoreApplication::processEvents();

    EXPECT_EQ(workRuns.load(), 1);
    EXPECT_EQ(completions, 0);
}

TEST(AsyncTaskTests, ThrowingWorkDropsOnlyItsOwnCompletion)
{
    ensureCoreApp();

    Utils::Async::SerialTaskQueue queue;
    QObject context;
    QVector<int> completed;

    Utils::Async::run<int>(
        &context,
        []() -> int { throw std::runtime_error("disk on fire"); },
        [&completed](int value) { completed.push_back(value); },
        queue.pool());
    Utils::Async::run<int>(
        &context,
        [] { return 2; },
        [&completed](int value) { completed.push_back(value); },
        queue.pool());

    ASSERT_TRUE(QTest::qWaitFor([&completed] { return !completed.isEmpty(); }, 5000));
    ASSERT_TRUE(queue.waitForIdle(5000));
    QCoreApplication::processEvents();
    EXPECT_EQ(completed, QVector<int>{2});
}
