#include "slate/Tools.hpp"

#include <QtCore/qmath.h>

#include <algorithm>
#include <cmath>

namespace Slate::Tools::Math {

double clampZoom(double z, double minZoom, double maxZoom)
{
    if (minZoom > maxZoom)
        std::swap(minZoom, maxZoom);
    if (std::isnan(z))
        return minZoom;
    return std::clamp(z, minZoom, maxZoom);
}

double clampZoom(double z, const ZoomLimits& limits)
{
    return clampZoom(z, limits.minZoom, limits.maxZoom);
}

bool isFinitePoint(const QPointF& p)
{
    return std::isfinite(p.x()) && std::isfinite(p.y());
}

bool isUsableViewport(const ViewportState& vp)
{
    return std::isfinite(vp.panX) && std::isfinite(vp.panY) && std::isfinite(vp.zoom) && vp.zoom > 0.0;
}

QPointF worldFromScreen(const QPointF& screenPos, const ViewportState& vp)
{
    if (!isUsableViewport(vp))
        return screenPos;

    const QPointF world((screenPos.x() - vp.panX) / vp.zoom, (screenPos.y() - vp.panY) / vp.zoom);
    return isFinitePoint(world) ? world : screenPos;
}

QPointF screenFromWorld(const QPointF& worldPos, const ViewportState& vp)
{
    if (!isUsableViewport(vp))
        return worldPos;

    const QPointF screen(worldPos.x() * vp.zoom + vp.panX, worldPos.y() * vp.zoom + vp.panY);
    return isFinitePoint(screen) ? screen : worldPos;
}

ViewportState zoomAtPoint(const QPointF& anchor, const ViewportState& vp, double nextZoom)
{
    if (!isUsableViewport(vp) || !std::isfinite(nextZoom) || nextZoom <= 0.0 || !isFinitePoint(anchor))
        return vp;

    const double worldX = (anchor.x() - vp.panX) / vp.zoom;
    const double worldY = (anchor.y() - vp.panY) / vp.zoom;

    ViewportState out;
    out.panX = anchor.x() - worldX * nextZoom;
    out.panY = anchor.y() - worldY * nextZoom;
    out.zoom = nextZoom;

    if (!isUsableViewport(out))
        return vp;
    return out;
}

QPointF scrollFromPan(const QPointF& pan, double zoom)
{
    if (!std::isfinite(zoom) || qFuzzyIsNull(zoom))
        return pan;
    return pan / zoom;
}

QPointF panFromScroll(const QPointF& scroll, double zoom)
{
    if (!std::isfinite(zoom))
        return scroll;
    return scroll * zoom;
}

QPointF scrollFromViewDrag(const QPointF& startScroll,
                           const QPointF& startViewPos,
                           const QPointF& currentViewPos,
                           double zoom)
{
    if (!std::isfinite(zoom) || qFuzzyIsNull(zoom))
        return startScroll;

    const QPointF deltaView = currentViewPos - startViewPos;
    const QPointF scroll = startScroll + (deltaView / zoom);
    return isFinitePoint(scroll) ? scroll : startScroll;
}

} // namespace Slate::Tools::Math
