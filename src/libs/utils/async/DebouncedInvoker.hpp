// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QObject>
#include <QtCore/QTimer>

#include <algorithm>
#include <functional>

namespace Utils::Async {

// Single-shot, restartable timer around one action. Repeated trigger() calls
// coalesce into one invocation once the invoker has been quiet for delayMs().
// With a non-zero maxDelayMs() the first trigger of a burst also sets a
// deadline that later triggers cannot push back.
class UTILS_EXPORT DebouncedInvoker final : public QObject
{
    Q_OBJECT

public:
    explicit DebouncedInvoker(QObject* parent = nullptr)
        : QObject(parent)
    {
        m_timer.setSingleShot(true);
        connect(&m_timer, &QTimer::timeout, this, &DebouncedInvoker::fire);
    }

    explicit DebouncedInvoker(int delayMs, QObject* parent = nullptr)
        : DebouncedInvoker(parent)
    {
        setDelayMs(delayMs);
    }

    void setDelayMs(int ms)
    {
        m_delayMs = std::max(ms, 0);
    }

    int delayMs() const
    {
        return m_delayMs;
    }

    void setMaxDelayMs(int ms)
    {
        m_maxDelayMs = std::max(ms, 0);
    }

    int maxDelayMs() const
    {
        return m_maxDelayMs;
    }

    void setAction(std::function<void()> action)
    {
        m_action = std::move(action);
    }

    void trigger()
    {
        if (!m_action)
            return;

        if (!m_burst.isValid())
            m_burst.start();

        int interval = m_delayMs;
        if (m_maxDelayMs > 0) {
            const qint64 remaining = std::max<qint64>(0, m_maxDelayMs - m_burst.elapsed());
            interval = static_cast<int>(std::min<qint64>(interval, remaining));
        }
        m_timer.start(interval);
    }

    // Schedules the action after an explicit delay, ignoring the debounce
    // policy. Used for retries.
    void triggerAfter(int ms)
    {
        if (!m_action)
            return;

        if (!m_burst.isValid())
            m_burst.start();
        m_timer.start(std::max(ms, 0));
    }

    // Runs a pending action right away.
    bool flush()
    {
        if (!m_timer.isActive())
            return false;
        m_timer.stop();
        fire();
        return true;
    }

    void cancel()
    {
        m_timer.stop();
        m_burst.invalidate();
    }

    bool isPending() const
    {
        return m_timer.isActive();
    }

    int remainingMs() const
    {
        return m_timer.isActive() ? m_timer.remainingTime() : -1;
    }

private:
    void fire()
    {
        m_burst.invalidate();
        if (m_action)
            m_action();
    }

    QTimer m_timer;
    QElapsedTimer m_burst;
    std::function<void()> m_action;
    int m_delayMs = 0;
    int m_maxDelayMs = 0;
};

} // namespace Utils::Async
