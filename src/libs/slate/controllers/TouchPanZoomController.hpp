// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "slate/gestures/TouchGesture.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QObject>
#include <QtCore/QPointer>

#include <functional>

namespace Slate::Api {
class IViewportHost;
}

namespace Slate::Controllers {

struct SLATE_EXPORT TouchPanZoomOptions final {
    ZoomLimits limits;
    Gestures::TouchThresholds thresholds;
    // Called with the starting centroid when a two-finger gesture classifies as a tap.
    std::function<void(const QPointF&)> onTwoFingerTap;
    // Called once every finger has lifted after a two-finger gesture.
    std::function<void()> onGestureEnd;
};

class SLATE_EXPORT TouchPanZoomController final : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<qint64()>;

    explicit TouchPanZoomController(Api::IViewportHost* host,
                                    TouchPanZoomOptions options = {},
                                    QObject* parent = nullptr);

    void setClock(Clock clock);

    const Gestures::TouchPanZoomGesture& gesture() const noexcept { return m_gesture; }

    // True between two-finger start and the drop below two fingers.
    bool isTouchPanning() const noexcept { return m_gesture.isActive(); }
    // True from two-finger start until every finger is up.
    bool isInteracting() const noexcept { return m_interacting; }

    // Point lists hold the positions of the touches still down after the event.
    // Return values tell the caller whether to consume the event.
    bool touchStarted(const QList<QPointF>& activePoints);
    bool touchMoved(const QList<QPointF>& activePoints);
    bool touchEnded(const QList<QPointF>& activePoints);
    void touchCancelled();

    void reset();

signals:
    void twoFingerTapped(const QPointF& centroid);
    void gestureFinished();

private:
    qint64 now() const;
    void finishInteraction();

    QPointer<Api::IViewportHost> m_host;
    TouchPanZoomOptions m_options;
    Gestures::TouchPanZoomGesture m_gesture;
    bool m_interacting = false;
    bool m_inHandler = false;

    Clock m_clock;
    QElapsedTimer m_elapsed;
};

} // namespace Slate::Controllers
