#pragma once

#include "slate/SlateGlobal.hpp"
#include "slate/SlateTypes.hpp"

#include <QtCore/QPointF>

namespace Slate::Tools {

// -----------------------------------------------------------------------------
// Transform math. All functions are total: degenerate input never produces NaN.
// -----------------------------------------------------------------------------
namespace Math {

SLATE_EXPORT double clampZoom(double z, double minZoom, double maxZoom);
SLATE_EXPORT double clampZoom(double z, const ZoomLimits& limits = {});

SLATE_EXPORT bool isFinitePoint(const QPointF& p);
SLATE_EXPORT bool isUsableViewport(const ViewportState& vp);

SLATE_EXPORT QPointF worldFromScreen(const QPointF& screenPos, const ViewportState& vp);
SLATE_EXPORT QPointF screenFromWorld(const QPointF& worldPos, const ViewportState& vp);

/// Returns a viewport at \a nextZoom whose pan keeps the world point under \a anchor
/// fixed on screen. Returns \a vp unchanged if any intermediate is non-finite.
SLATE_EXPORT ViewportState zoomAtPoint(const QPointF& anchor, const ViewportState& vp, double nextZoom);

// Scroll is the world-unit camera offset used by drag and wheel panning.
SLATE_EXPORT QPointF scrollFromPan(const QPointF& pan, double zoom);
SLATE_EXPORT QPointF panFromScroll(const QPointF& scroll, double zoom);

SLATE_EXPORT QPointF scrollFromViewDrag(const QPointF& startScroll,
                                        const QPointF& startViewPos,
                                        const QPointF& currentViewPos,
                                        double zoom);

} // namespace Math

using Math::clampZoom;
using Math::worldFromScreen;
using Math::screenFromWorld;
using Math::zoomAtPoint;

} // namespace Slate::Tools
