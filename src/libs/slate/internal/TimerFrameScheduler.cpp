// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/internal/TimerFrameScheduler.hpp"

#include "slate/SlateConstants.hpp"

#include <QtCore/QTimer>

#include <algorithm>

namespace Slate::Internal {

TimerFrameScheduler::TimerFrameScheduler(QObject* parent)
    : TimerFrameScheduler(Constants::kFrameIntervalMs, parent)
{
}

TimerFrameScheduler::TimerFrameScheduler(int intervalMs, QObject* parent)
    : QObject(parent)
    , m_intervalMs(std::max(intervalMs, 0))
{
}

TimerFrameScheduler::~TimerFrameScheduler()
{
    for (auto it = m_pending.begin(); it != m_pending.end(); ++it)
        it->timer->stop();
}

FrameHandle TimerFrameScheduler::requestFrame(std::function<void()> callback)
{
    if (!callback)
        return 0;

    const FrameHandle handle = m_nextHandle++;

    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    timer->setTimerType(Qt::PreciseTimer);
    timer->setInterval(m_intervalMs);
    connect(timer, &QTimer::timeout, this, [this, handle] { fire(handle); });

    m_pending.insert(handle, Pending{timer, std::move(callback)});
    timer->start();
    return handle;
}

void TimerFrameScheduler::cancelFrame(FrameHandle handle)
{
    auto it = m_pending.find(handle);
    if (it == m_pending.end())
        return;

    it->timer->stop();
    it->timer->deleteLater();
    m_pending.erase(it);
}

void TimerFrameScheduler::fire(FrameHandle handle)
{
    auto it = m_pending.find(handle);
    if (it == m_pending.end())
        return;

    // Detach before invoking: the callback may request the next frame.
    Pending pending = std::move(it.value());
    m_pending.erase(it);
    pending.timer->deleteLater();

    if (pending.callback)
        pending.callback();
}

} // namespace Slate::Internal
