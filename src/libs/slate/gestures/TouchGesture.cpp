// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/gestures/TouchGesture.hpp"

#include "slate/Tools.hpp"

#include <cmath>

namespace Slate::Gestures {

TouchGeometry touchCenterAndDistance(const QList<QPointF>& points)
{
    TouchGeometry out;
    if (points.size() < 2)
        return out;

    const QPointF& a = points.at(0);
    const QPointF& b = points.at(1);
    if (!Tools::Math::isFinitePoint(a) || !Tools::Math::isFinitePoint(b))
        return out;

    out.center = QPointF((a.x() + b.x()) / 2.0, (a.y() + b.y()) / 2.0);

    const double dist = std::hypot(b.x() - a.x(), b.y() - a.y());
    out.distance = (std::isfinite(dist) && dist > 0.0) ? dist : Constants::kDegenerateTouchDistance;
    return out;
}

TouchGestureState createTouchGestureState(const TouchGeometry& geometry,
                                          const ViewportState& viewport,
                                          qint64 nowMs)
{
    TouchGestureState g;
    g.centerX = geometry.center.x();
    g.centerY = geometry.center.y();
    g.distance = geometry.distance > 0.0 ? geometry.distance : Constants::kDegenerateTouchDistance;
    g.panX = viewport.panX;
    g.panY = viewport.panY;
    g.zoom = viewport.zoom;
    g.startTime = nowMs;
    g.movedEnough = false;
    return g;
}

ViewportState applyTouchPinch(const TouchGestureState& gesture,
                              const TouchGeometry& geometry,
                              const ZoomLimits& limits)
{
    ViewportState baseline;
    baseline.panX = gesture.panX;
    baseline.panY = gesture.panY;
    baseline.zoom = gesture.zoom;

    if (!Tools::Math::isUsableViewport(baseline) || gesture.distance <= 0.0)
        return baseline;

    const double scale = geometry.distance / gesture.distance;
    if (!std::isfinite(scale))
        return baseline;

    const double nextZoom = Tools::clampZoom(gesture.zoom * scale, limits);

    // World point under the starting centroid stays under the current centroid.
    const double worldX = (gesture.centerX - gesture.panX) / gesture.zoom;
    const double worldY = (gesture.centerY - gesture.panY) / gesture.zoom;

    ViewportState out;
    out.panX = geometry.center.x() - worldX * nextZoom;
    out.panY = geometry.center.y() - worldY * nextZoom;
    out.zoom = nextZoom;

    if (!Tools::Math::isUsableViewport(out))
        return baseline;
    return out;
}

bool exceedsTapThresholds(const TouchGestureState& gesture,
                          const TouchGeometry& geometry,
                          const TouchThresholds& thresholds)
{
    const double movePx = std::hypot(geometry.center.x() - gesture.centerX,
                                     geometry.center.y() - gesture.centerY);
    const double scaleChange = std::abs(geometry.distance / gesture.distance - 1.0);
    return movePx > thresholds.tapMaxMovePx || scaleChange > thresholds.tapMaxScaleChange;
}

bool isTwoFingerTap(const TouchGestureState& gesture, qint64 durationMs, const TouchThresholds& thresholds)
{
    return !gesture.movedEnough && durationMs < thresholds.tapMaxDurationMs;
}

TouchPanZoomGesture::TouchPanZoomGesture(TouchThresholds thresholds, ZoomLimits limits)
    : m_thresholds(thresholds)
    , m_limits(limits)
{
}

bool TouchPanZoomGesture::begin(const QList<QPointF>& points, const ViewportState& viewport, qint64 nowMs)
{
    if (points.size() != 2) {
        if (m_gesture)
            cancel();
        return false;
    }

    m_gesture = createTouchGestureState(touchCenterAndDistance(points), viewport, nowMs);
    qCDebug(slategesturelog) << "Two-finger gesture started at" << m_gesture->centerX << m_gesture->centerY;
    return true;
}

std::optional<ViewportState> TouchPanZoomGesture::move(const QList<QPointF>& points)
{
    if (!m_gesture || points.size() != 2)
        return std::nullopt;

    const TouchGeometry geometry = touchCenterAndDistance(points);
    if (!m_gesture->movedEnough && exceedsTapThresholds(*m_gesture, geometry, m_thresholds))
        m_gesture->movedEnough = true;

    return applyTouchPinch(*m_gesture, geometry, m_limits);
}

TouchPanZoomGesture::EndResult TouchPanZoomGesture::end(int remainingPoints, qint64 nowMs)
{
    EndResult result;
    if (!m_gesture || remainingPoints >= 2)
        return result;

    const TouchGestureState g = *m_gesture;
    m_gesture.reset();

    result.centroid = QPointF(g.centerX, g.centerY);
    result.outcome = isTwoFingerTap(g, nowMs - g.startTime, m_thresholds) ? Outcome::TwoFingerTap
                                                                          : Outcome::PanZoom;
    qCDebug(slategesturelog) << "Two-finger gesture ended"
                             << (result.outcome == Outcome::TwoFingerTap ? "as tap" : "as pan/zoom");
    return result;
}

TouchPanZoomGesture::EndResult TouchPanZoomGesture::cancel()
{
    EndResult result;
    if (!m_gesture)
        return result;

    result.centroid = QPointF(m_gesture->centerX, m_gesture->centerY);
    result.outcome = Outcome::Cancelled;
    m_gesture.reset();
    qCDebug(slategesturelog) << "Two-finger gesture cancelled";
    return result;
}

} // namespace Slate::Gestures
