// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QMetaObject>
#include <QtCore/QPointer>
#include <QtCore/QThreadPool>
#include <QtCore/QRunnable>
#include <QtCore/Qt>

#include <exception>
#include <type_traits>
#include <utility>

namespace Utils::Async {

namespace detail {

template <typename Result, typename WorkFn, typename DoneFn>
class AsyncRunnable final : public QRunnable
{
public:
    AsyncRunnable(QPointer<QObject> context, bool hasContext, WorkFn work, DoneFn done)
        : m_context(std::move(context))
        , m_hasContext(hasContext)
        , m_work(std::move(work))
        , m_done(std::move(done))
    {
    }

    void run() override
    {
        // The work always runs; only the completion is dropped when nobody
        // is left to receive it, or when the work threw.
        if constexpr (std::is_void_v<Result>) {
            try {
                m_work();
            } catch (const std::exception& e) {
                qCWarning(utilslog) << "Async task failed:" << e.what();
                return;
            }

            if (!m_hasContext || !m_context)
                return;

            QPointer<QObject> guard = m_context;
            auto done = std::move(m_done);
            QMetaObject::invokeMethod(guard, [guard, done = std::move(done)]() mutable {
                if (guard)
                    done();
            }, Qt::QueuedConnection);
        } else {
            Result result{};
            try {
                result = m_work();
            } catch (const std::exception& e) {
                qCWarning(utilslog) << "Async task failed:" << e.what();
                return;
            }

            if (!m_hasContext || !m_context)
                return;

            QPointer<QObject> guard = m_context;
            auto done = std::move(m_done);
            QMetaObject::invokeMethod(guard,
                                      [guard, done = std::move(done), result = std::move(result)]() mutable {
                                          if (guard)
                                              done(std::move(result));
                                      },
                                      Qt::QueuedConnection);
        }
    }

private:
    QPointer<QObject> m_context;
    bool m_hasContext = false;
    WorkFn m_work;
    DoneFn m_done;
};

} // namespace detail

// Runs `work` on `pool` and delivers its result to `done` on the thread of
// `context`. A null or destroyed context drops the completion, not the work.
template <typename Result, typename Work, typename Done>
void run(QObject* context, Work&& work, Done&& done, QThreadPool* pool = QThreadPool::globalInstance())
{
    using WorkFn = std::decay_t<Work>;
    using DoneFn = std::decay_t<Done>;

    if (!pool)
        return;

    auto task = new detail::AsyncRunnable<Result, WorkFn, DoneFn>(
        QPointer<QObject>(context),
        context != nullptr,
        WorkFn(std::forward<Work>(work)),
        DoneFn(std::forward<Done>(done)));
    task->setAutoDelete(true);
    pool->start(task);
}

// A one-thread pool. Tasks start in submission order, so two tasks queued
// from the same thread can never overtake each other.
class SerialTaskQueue final
{
public:
    SerialTaskQueue()
    {
        m_pool.setMaxThreadCount(1);
    }

    ~SerialTaskQueue()
    {
        m_pool.waitForDone();
    }

    SerialTaskQueue(const SerialTaskQueue&) = delete;
    SerialTaskQueue& operator=(const SerialTaskQueue&) = delete;

    QThreadPool* pool() noexcept { return &m_pool; }

    bool waitForIdle(int msecs = -1)
    {
        return m_pool.waitForDone(msecs);
    }

private:
    QThreadPool m_pool;
};

} // namespace Utils::Async
