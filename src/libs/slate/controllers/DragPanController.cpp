// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/controllers/DragPanController.hpp"

#include "slate/Tools.hpp"
#include "slate/api/IFrameScheduler.hpp"
#include "slate/api/IViewportHost.hpp"

#include <QtCore/QScopedValueRollback>
#include <QtCore/QTimer>

#include <utility>

namespace Slate::Controllers {

DragPanController::DragPanController(Api::IViewportHost* host,
                                     Api::IFrameScheduler* scheduler,
                                     DragPanOptions options,
                                     QObject* parent)
    : QObject(parent)
    , m_host(host)
    , m_scheduler(scheduler)
    , m_options(options)
{
}

DragPanController::~DragPanController()
{
    teardown();
}

bool DragPanController::pointerDown(const PointerInput& input)
{
    if (m_tornDown || m_inHandler)
        return false;
    QScopedValueRollback<bool> guard(m_inHandler, true);

    if (input.button != m_options.panButton || isActive() || !m_host)
        return false;

    const auto vp = m_host->viewportState();
    if (!vp || !Tools::Math::isUsableViewport(*vp))
        return false;

    const QPointF startScroll = Tools::Math::scrollFromPan(vp->pan(), vp->zoom);

    m_state.startClientX = input.clientPos.x();
    m_state.startClientY = input.clientPos.y();
    m_state.startScrollX = startScroll.x();
    m_state.startScrollY = startScroll.y();
    m_state.startZoom = vp->zoom;
    m_state.prevClientX = input.clientPos.x();
    m_state.prevClientY = input.clientPos.y();
    m_state.didPan = false;
    m_state.activePointerId = input.pointerId;
    m_state.rafId = 0;

    m_contextMenuArmed = true;
    m_contextMenuHeld = false;
    m_replayHeldMenu = false;
    setCursor(PanCursor::Ready);

    qCDebug(slategesturelog) << "Drag-pan armed for pointer" << input.pointerId;
    return false;
}

bool DragPanController::pointerMove(const PointerInput& input)
{
    if (m_tornDown || m_inHandler)
        return false;
    QScopedValueRollback<bool> guard(m_inHandler, true);

    if (!isActive() || input.pointerId != *m_state.activePointerId)
        return false;
    // Stale move: the pan button was released without us seeing the release.
    if (!input.buttons.testFlag(m_options.panButton))
        return false;
    if (!m_host)
        return false;

    if (!m_state.didPan) {
        m_state.didPan = true;
        setCursor(PanCursor::Grabbing);
    }

    m_state.prevClientX = input.clientPos.x();
    m_state.prevClientY = input.clientPos.y();
    requestFrame();
    return true;
}

bool DragPanController::pointerUp(const PointerInput& input)
{
    if (m_tornDown || m_inHandler)
        return false;
    QScopedValueRollback<bool> guard(m_inHandler, true);

    if (!isActive() || input.pointerId != *m_state.activePointerId)
        return false;
    // Another button was released while the pan button is still held.
    if (input.buttons.testFlag(m_options.panButton))
        return false;

    const bool didPan = m_state.didPan;
    m_replayHeldMenu = m_contextMenuHeld && !didPan;
    m_contextMenuHeld = false;
    flushPendingFrame();
    release();
    emit panFinished(didPan);
    return didPan;
}

void DragPanController::cancel()
{
    if (m_tornDown || !isActive())
        return;

    const bool didPan = m_state.didPan;
    m_contextMenuHeld = false;
    m_replayHeldMenu = false;
    flushPendingFrame();
    release();
    emit panFinished(didPan);
}

ContextMenuAction DragPanController::contextMenuRequested()
{
    if (!m_contextMenuArmed)
        return ContextMenuAction::Deliver;

    // Fires once per drag interaction, suppressed or not.
    m_contextMenuArmed = false;

    if (isActive()) {
        m_contextMenuHeld = true;
        return ContextMenuAction::Hold;
    }
    return m_state.didPan ? ContextMenuAction::Suppress : ContextMenuAction::Deliver;
}

bool DragPanController::takeHeldContextMenu()
{
    return std::exchange(m_replayHeldMenu, false);
}

void DragPanController::teardown()
{
    if (m_tornDown)
        return;
    m_tornDown = true;

    if (m_state.rafId != 0 && m_scheduler)
        m_scheduler->cancelFrame(m_state.rafId);
    m_state.rafId = 0;
    m_state.activePointerId.reset();
    m_contextMenuArmed = false;
    m_contextMenuHeld = false;
    m_replayHeldMenu = false;
    setCursor(PanCursor::None);
}

void DragPanController::requestFrame()
{
    if (m_state.rafId != 0)
        return;

    if (!m_scheduler) {
        applyPanFromState();
        return;
    }

    m_state.rafId = m_scheduler->requestFrame([this] {
        m_state.rafId = 0;
        applyPanFromState();
    });
}

void DragPanController::applyPanFromState()
{
    if (!m_host || !m_host->viewportState())
        return;

    const double z = m_state.startZoom;
    const QPointF scroll = Tools::Math::scrollFromViewDrag(QPointF(m_state.startScrollX, m_state.startScrollY),
                                                           QPointF(m_state.startClientX, m_state.startClientY),
                                                           QPointF(m_state.prevClientX, m_state.prevClientY),
                                                           z);
    const QPointF pan = Tools::Math::panFromScroll(scroll, z);
    if (!Tools::Math::isFinitePoint(pan))
        return;

    m_host->updateViewport(ViewportUpdate::panOnly(pan));
}

void DragPanController::flushPendingFrame()
{
    if (m_state.rafId == 0)
        return;

    if (m_scheduler)
        m_scheduler->cancelFrame(m_state.rafId);
    m_state.rafId = 0;
    applyPanFromState();
}

void DragPanController::release()
{
    setCursor(PanCursor::None);
    m_state.activePointerId.reset();

    qCDebug(slategesturelog) << "Drag-pan released, panned:" << m_state.didPan;

    // Give the native context-menu event that follows the release a chance to
    // arrive, then stop listening for it unless a new drag has started.
    QTimer::singleShot(0, this, [this] {
        if (!m_state.activePointerId)
            m_contextMenuArmed = false;
    });
}

void DragPanController::setCursor(PanCursor cursor)
{
    if (m_cursor == cursor)
        return;
    m_cursor = cursor;
    emit cursorChanged(m_cursor);
}

} // namespace Slate::Controllers
