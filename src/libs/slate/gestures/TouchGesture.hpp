// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "slate/SlateConstants.hpp"
#include "slate/SlateGlobal.hpp"
#include "slate/SlateTypes.hpp"

#include <QtCore/QList>
#include <QtCore/QPointF>

#include <optional>

namespace Slate::Gestures {

struct SLATE_EXPORT TouchGeometry final {
    QPointF center;
    double distance = Constants::kDegenerateTouchDistance;
};

/// Centroid and spread of the first two points. With fewer than two points, or two
/// coincident ones, the distance is 1 so callers can divide by it.
SLATE_EXPORT TouchGeometry touchCenterAndDistance(const QList<QPointF>& points);

// Snapshot taken when the second finger lands. The captured pan/zoom is the baseline
// for every later move of the same gesture.
struct SLATE_EXPORT TouchGestureState final {
    double centerX = 0.0;
    double centerY = 0.0;
    double distance = Constants::kDegenerateTouchDistance;
    double panX = 0.0;
    double panY = 0.0;
    double zoom = 1.0;
    qint64 startTime = 0;
    bool movedEnough = false;
};

struct SLATE_EXPORT TouchThresholds final {
    qint64 tapMaxDurationMs = Constants::kTapMaxDurationMs;
    double tapMaxMovePx = Constants::kTapMaxMovePx;
    double tapMaxScaleChange = Constants::kTapMaxScaleChange;
};

SLATE_EXPORT TouchGestureState createTouchGestureState(const TouchGeometry& geometry,
                                                       const ViewportState& viewport,
                                                       qint64 nowMs);

/// Viewport for the current finger geometry, computed from the gesture baseline.
SLATE_EXPORT ViewportState applyTouchPinch(const TouchGestureState& gesture,
                                           const TouchGeometry& geometry,
                                           const ZoomLimits& limits = {});

SLATE_EXPORT bool exceedsTapThresholds(const TouchGestureState& gesture,
                                       const TouchGeometry& geometry,
                                       const TouchThresholds& thresholds = {});

SLATE_EXPORT bool isTwoFingerTap(const TouchGestureState& gesture,
                                 qint64 durationMs,
                                 const TouchThresholds& thresholds = {});

// Idle -> TwoFingerActive -> Idle.
class SLATE_EXPORT TouchPanZoomGesture final
{
public:
    enum class State : quint8 { Idle, TwoFingerActive };
    enum class Outcome : quint8 { None, TwoFingerTap, PanZoom, Cancelled };

    struct EndResult final {
        Outcome outcome = Outcome::None;
        QPointF centroid;
    };

    TouchPanZoomGesture() = default;
    explicit TouchPanZoomGesture(TouchThresholds thresholds, ZoomLimits limits = {});

    State state() const noexcept { return m_gesture ? State::TwoFingerActive : State::Idle; }
    bool isActive() const noexcept { return m_gesture.has_value(); }
    const std::optional<TouchGestureState>& gesture() const noexcept { return m_gesture; }

    const TouchThresholds& thresholds() const noexcept { return m_thresholds; }
    const ZoomLimits& limits() const noexcept { return m_limits; }

    /// Enters TwoFingerActive when exactly two points are down. Any other count
    /// cancels an active gesture and returns false.
    bool begin(const QList<QPointF>& points, const ViewportState& viewport, qint64 nowMs);

    /// Proposed viewport for a move, or std::nullopt when idle or not exactly two points.
    std::optional<ViewportState> move(const QList<QPointF>& points);

    /// Leaves TwoFingerActive once fewer than two points remain and classifies the gesture.
    EndResult end(int remainingPoints, qint64 nowMs);

    EndResult cancel();

private:
    TouchThresholds m_thresholds;
    ZoomLimits m_limits;
    std::optional<TouchGestureState> m_gesture;
};

} // namespace Slate::Gestures
