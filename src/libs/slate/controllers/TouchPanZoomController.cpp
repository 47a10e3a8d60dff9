// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/controllers/TouchPanZoomController.hpp"

#include "slate/api/IViewportHost.hpp"

#include <QtCore/QScopedValueRollback>

#include <utility>

namespace Slate::Controllers {

using Gestures::TouchPanZoomGesture;

TouchPanZoomController::TouchPanZoomController(Api::IViewportHost* host,
                                               TouchPanZoomOptions options,
                                               QObject* parent)
    : QObject(parent)
    , m_host(host)
    , m_options(std::move(options))
    , m_gesture(m_options.thresholds, m_options.limits)
{
    m_elapsed.start();
}

void TouchPanZoomController::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

qint64 TouchPanZoomController::now() const
{
    return m_clock ? m_clock() : m_elapsed.elapsed();
}

bool TouchPanZoomController::touchStarted(const QList<QPointF>& activePoints)
{
    if (m_inHandler)
        return false;
    QScopedValueRollback<bool> guard(m_inHandler, true);

    if (activePoints.size() != 2) {
        // A third finger ends the two-finger gesture without a tap.
        m_gesture.cancel();
        return false;
    }

    if (!m_host)
        return false;
    const auto state = m_host->viewportState();
    if (!state)
        return false;

    m_interacting = true;
    return m_gesture.begin(activePoints, *state, now());
}

bool TouchPanZoomController::touchMoved(const QList<QPointF>& activePoints)
{
    if (m_inHandler || !m_gesture.isActive() || activePoints.size() != 2)
        return false;
    QScopedValueRollback<bool> guard(m_inHandler, true);

    const auto next = m_gesture.move(activePoints);
    if (!next)
        return false;

    if (m_host && m_host->viewportState())
        m_host->updateViewport(ViewportUpdate::fromState(*next));
    return true;
}

bool TouchPanZoomController::touchEnded(const QList<QPointF>& activePoints)
{
    if (m_inHandler)
        return false;
    QScopedValueRollback<bool> guard(m_inHandler, true);

    const int remaining = activePoints.size();
    bool consumed = false;

    if (m_gesture.isActive() && remaining < 2) {
        const TouchPanZoomGesture::EndResult result = m_gesture.end(remaining, now());
        consumed = true;
        if (result.outcome == TouchPanZoomGesture::Outcome::TwoFingerTap) {
            if (m_options.onTwoFingerTap)
                m_options.onTwoFingerTap(result.centroid);
            emit twoFingerTapped(result.centroid);
        }
    }

    if (remaining == 0 && m_interacting)
        finishInteraction();

    return consumed;
}

void TouchPanZoomController::touchCancelled()
{
    if (m_inHandler)
        return;
    QScopedValueRollback<bool> guard(m_inHandler, true);

    m_gesture.cancel();
    if (m_interacting)
        finishInteraction();
}

void TouchPanZoomController::reset()
{
    m_gesture.cancel();
    m_interacting = false;
}

void TouchPanZoomController::finishInteraction()
{
    m_interacting = false;
    if (m_options.onGestureEnd)
        m_options.onGestureEnd();
    emit gestureFinished();
}

} // namespace Slate::Controllers
