// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/internal/ViewportHostImpl.hpp"

#include "slate/Tools.hpp"

#include <QtCore/QtGlobal>

#include <cmath>
#include <utility>

namespace Slate::Internal {

ViewportHostImpl::ViewportHostImpl(QObject* parent)
    : Api::IViewportHost(parent)
{
    m_state.zoom = Tools::clampZoom(1.0, m_limits);
}

std::optional<ViewportState> ViewportHostImpl::viewportState() const
{
    if (!m_mounted)
        return std::nullopt;
    return m_state;
}

void ViewportHostImpl::updateViewport(const ViewportUpdate& update)
{
    ++m_updateCount;

    ViewportState next = m_state;
    if (update.panX) {
        if (std::isfinite(*update.panX))
            next.panX = *update.panX;
        else
            qCWarning(slatelog) << "Ignoring non-finite panX proposal";
    }
    if (update.panY) {
        if (std::isfinite(*update.panY))
            next.panY = *update.panY;
        else
            qCWarning(slatelog) << "Ignoring non-finite panY proposal";
    }
    if (update.zoom) {
        if (std::isfinite(*update.zoom) && *update.zoom > 0.0)
            next.zoom = Tools::clampZoom(*update.zoom, m_limits);
        else
            qCWarning(slatelog) << "Ignoring invalid zoom proposal" << *update.zoom;
    }

    setState(next);
}

void ViewportHostImpl::setState(const ViewportState& state)
{
    if (!Tools::Math::isUsableViewport(state))
        return;

    ViewportState clamped = state;
    clamped.zoom = Tools::clampZoom(state.zoom, m_limits);
    if (clamped == m_state)
        return;

    m_state = clamped;
    emit viewportChanged();
}

void ViewportHostImpl::resetView()
{
    setState(ViewportState{});
}

void ViewportHostImpl::setMounted(bool mounted)
{
    m_mounted = mounted;
}

void ViewportHostImpl::setZoomLimits(const ZoomLimits& limits)
{
    m_limits = limits;
    if (m_limits.minZoom > m_limits.maxZoom)
        std::swap(m_limits.minZoom, m_limits.maxZoom);

    const double clamped = Tools::clampZoom(m_state.zoom, m_limits);
    if (qFuzzyCompare(m_state.zoom, clamped))
        return;
    m_state.zoom = clamped;
    emit viewportChanged();
}

} // namespace Slate::Internal
