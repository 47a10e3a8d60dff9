// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/ViewportGestureHost.hpp"

#include "slate/Tools.hpp"
#include "slate/api/IViewportHost.hpp"
#include "slate/internal/TimerFrameScheduler.hpp"

#include <QtCore/QCoreApplication>
#include <QtGui/QContextMenuEvent>
#include <QtWidgets/QWidget>

#include <utility>

namespace Slate {

ViewportGestureHost::ViewportGestureHost(QWidget* surface,
                                         Api::IViewportHost* host,
                                         Config::GestureSettings settings,
                                         QObject* parent)
    : QObject(parent)
    , m_surface(surface)
    , m_host(host)
    , m_settings(settings)
{
}

ViewportGestureHost::~ViewportGestureHost()
{
    teardown();
}

void ViewportGestureHost::setFrameScheduler(Api::IFrameScheduler* scheduler)
{
    if (m_attached) {
        qCWarning(slatelog) << "setFrameScheduler called after attach; ignored";
        return;
    }
    m_scheduler = scheduler;
}

void ViewportGestureHost::attach()
{
    if (m_attached)
        return;
    if (!m_surface) {
        qCWarning(slatelog) << "ViewportGestureHost::attach: surface is gone";
        return;
    }
    m_attached = true;

    Controllers::WheelZoomOptions wheel;
    wheel.limits = m_settings.zoomLimits;
    wheel.sensitivity = m_settings.wheelZoomSensitivity;
    m_wheelTeardown = Controllers::setupWheelZoom(m_surface, m_host, wheel);

    QPointer<ViewportGestureHost> self(this);
    Controllers::TouchPanZoomOptions touch;
    touch.limits = m_settings.zoomLimits;
    touch.thresholds = m_settings.touch;
    touch.onTwoFingerTap = [self](const QPointF& centroid) {
        if (self)
            self->handleTwoFingerTap(centroid);
    };
    touch.onGestureEnd = [self]() {
        if (!self)
            return;
        emit self->touchInteractionFinished();
    };
    m_touchTeardown = Controllers::setupTouchPanZoom(m_surface, m_host, std::move(touch));

    if (!m_scheduler)
        m_scheduler = new Internal::TimerFrameScheduler(m_settings.frameIntervalMs, this);

    Controllers::DragPanOptions drag;
    drag.panButton = m_settings.panButton;
    m_dragTeardown = Controllers::setupDragPan(m_surface, m_host, m_scheduler, drag);

    qCDebug(slatelog) << "Viewport gestures attached to" << m_surface;
}

void ViewportGestureHost::teardown()
{
    if (!m_attached)
        return;
    m_attached = false;

    for (Controllers::Teardown* t : {&m_wheelTeardown, &m_touchTeardown, &m_dragTeardown}) {
        if (*t)
            (*t)();
        *t = {};
    }
}

void ViewportGestureHost::handleTwoFingerTap(const QPointF& centroid)
{
    QPointer<ViewportGestureHost> guard(this);
    emit twoFingerTapped(centroid);

    if (!guard || !m_contextMenuOnTap || !m_surface)
        return;
    const QPoint pos = centroid.toPoint();
    QCoreApplication::postEvent(m_surface,
                                new QContextMenuEvent(QContextMenuEvent::Other, pos, m_surface->mapToGlobal(pos)));
}

std::optional<ViewportState> ViewportGestureHost::viewportState() const
{
    if (!m_host)
        return std::nullopt;
    return m_host->viewportState();
}

std::optional<QPointF> ViewportGestureHost::worldFromScreen(const QPointF& screenPos) const
{
    const auto vp = viewportState();
    if (!vp || !Tools::Math::isUsableViewport(*vp))
        return std::nullopt;
    return Tools::Math::worldFromScreen(screenPos, *vp);
}

} // namespace Slate
