// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/controllers/WheelZoomController.hpp"

#include "slate/Tools.hpp"
#include "slate/api/IViewportHost.hpp"

#include <cmath>

namespace Slate::Controllers {

WheelOutcome resolveWheel(const WheelInput& input,
                          const ViewportState& current,
                          const WheelZoomOptions& options)
{
    WheelOutcome out;
    out.viewport = current;

    const bool pan = input.modifierPan && !input.modifierZoomOnly;
    if (!pan && input.modifierShift && !input.modifierZoomOnly)
        return out;

    out.action = pan ? WheelAction::Pan : WheelAction::Zoom;

    if (!std::isfinite(input.deltaX) || !std::isfinite(input.deltaY) || !Tools::Math::isUsableViewport(current))
        return out;

    const double z = current.zoom;

    if (pan) {
        // Dividing by zoom keeps the perceived pan speed constant across zoom levels.
        const QPointF scroll = Tools::Math::scrollFromPan(current.pan(), z);
        const QPointF nextScroll(scroll.x() - input.deltaX / z, scroll.y() - input.deltaY / z);
        const QPointF nextPan = Tools::Math::panFromScroll(nextScroll, z);
        if (Tools::Math::isFinitePoint(nextPan)) {
            out.viewport.panX = nextPan.x();
            out.viewport.panY = nextPan.y();
        }
        return out;
    }

    const double delta = -input.deltaY * options.sensitivity * z;
    const double nextZoom = Tools::clampZoom(z + delta, options.limits);
    out.viewport = Tools::zoomAtPoint(input.position, current, nextZoom);
    return out;
}

ViewportState resolvePinchZoom(const QPointF& anchor,
                               double value,
                               const ViewportState& current,
                               const ZoomLimits& limits)
{
    if (!std::isfinite(value) || !Tools::Math::isUsableViewport(current))
        return current;

    const double nextZoom = Tools::clampZoom(current.zoom * std::pow(2.0, value), limits);
    return Tools::zoomAtPoint(anchor, current, nextZoom);
}

WheelZoomController::WheelZoomController(Api::IViewportHost* host, WheelZoomOptions options)
    : m_host(host)
    , m_options(options)
{
}

bool WheelZoomController::handleWheel(const WheelInput& input)
{
    if (!m_host)
        return false;

    const auto state = m_host->viewportState();
    if (!state)
        return false;

    const WheelOutcome outcome = resolveWheel(input, *state, m_options);
    if (outcome.action == WheelAction::Ignored)
        return false;

    propose(*state, outcome.viewport);
    return true;
}

bool WheelZoomController::handlePinch(const QPointF& anchor, double value)
{
    if (!m_host)
        return false;

    const auto state = m_host->viewportState();
    if (!state)
        return false;

    propose(*state, resolvePinchZoom(anchor, value, *state, m_options.limits));
    return true;
}

void WheelZoomController::propose(const ViewportState& before, const ViewportState& after)
{
    if (after == before || !m_host)
        return;
    m_host->updateViewport(ViewportUpdate::fromState(after));
}

} // namespace Slate::Controllers
