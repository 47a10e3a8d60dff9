// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/controllers/GestureEventFilters.hpp"

#include "slate/SlateConstants.hpp"
#include "slate/api/IFrameScheduler.hpp"
#include "slate/api/IViewportHost.hpp"
#include "slate/internal/TimerFrameScheduler.hpp"

#include <QtCore/QCoreApplication>
#include <QtGui/QContextMenuEvent>
#include <QtGui/QEventPoint>
#include <QtGui/QMouseEvent>
#include <QtGui/QNativeGestureEvent>
#include <QtGui/QTouchEvent>
#include <QtGui/QWheelEvent>
#include <QtWidgets/QWidget>

#include <utility>

namespace Slate::Controllers {

namespace {

Teardown makeTeardown(GestureEventFilter* filter)
{
    QPointer<GestureEventFilter> guard(filter);
    auto done = std::make_shared<bool>(false);
    return [guard, done]() {
        if (*done)
            return;
        *done = true;
        if (!guard)
            return;
        guard->detach();
        guard->deleteLater();
    };
}

Teardown noopTeardown()
{
    return [] {};
}

} // namespace

// -----------------------------------------------------------------------------
// GestureEventFilter
// -----------------------------------------------------------------------------

GestureEventFilter::GestureEventFilter(QWidget* surface)
    : QObject(surface)
    , m_surface(surface)
{
    if (m_surface) {
        m_surface->installEventFilter(this);
        m_attached = true;
    }
}

GestureEventFilter::~GestureEventFilter() = default;

void GestureEventFilter::detach()
{
    if (!m_attached)
        return;
    m_attached = false;
    if (m_surface)
        m_surface->removeEventFilter(this);
}

bool GestureEventFilter::isSurfaceEvent(const QObject* watched) const
{
    return m_attached && m_surface && watched == m_surface.data();
}

// -----------------------------------------------------------------------------
// Wheel
// -----------------------------------------------------------------------------

WheelEventFilter::WheelEventFilter(QWidget* surface, Api::IViewportHost* host, WheelZoomOptions options)
    : GestureEventFilter(surface)
    , m_controller(host, options)
{
}

WheelInput WheelEventFilter::wheelInputFromEvent(const QWheelEvent& event)
{
    QPointF delta;
    if (!event.pixelDelta().isNull()) {
        delta = QPointF(event.pixelDelta());
    } else {
        const double k = Constants::kWheelPixelsPerStep / Constants::kWheelAngleUnitsPerStep;
        delta = QPointF(event.angleDelta()) * k;
    }

    const Qt::KeyboardModifiers mods = event.modifiers();

    WheelInput in;
    in.position = event.position();
    in.deltaX = -delta.x();
    in.deltaY = -delta.y();
    in.modifierPan = mods.testAnyFlags(Qt::ControlModifier | Qt::MetaModifier);
    in.modifierZoomOnly = mods.testFlag(Qt::AltModifier);
    in.modifierShift = mods.testFlag(Qt::ShiftModifier);

    // Some platforms report Alt+wheel on the horizontal axis.
    if (in.modifierZoomOnly && in.deltaY == 0.0)
        in.deltaY = in.deltaX;

    return in;
}

bool WheelEventFilter::eventFilter(QObject* watched, QEvent* event)
{
    if (!isSurfaceEvent(watched))
        return QObject::eventFilter(watched, event);

    switch (event->type()) {
        case QEvent::Wheel: {
            auto* we = static_cast<QWheelEvent*>(event);
            if (m_controller.handleWheel(wheelInputFromEvent(*we))) {
                we->accept();
                return true;
            }
            break;
        }
        case QEvent::NativeGesture: {
            auto* ge = static_cast<QNativeGestureEvent*>(event);
            if (ge->gestureType() == Qt::ZoomNativeGesture
                && m_controller.handlePinch(ge->position(), ge->value())) {
                ge->accept();
                return true;
            }
            break;
        }
        default:
            break;
    }

    return QObject::eventFilter(watched, event);
}

// -----------------------------------------------------------------------------
// Touch
// -----------------------------------------------------------------------------

TouchEventFilter::TouchEventFilter(QWidget* surface, Api::IViewportHost* host, TouchPanZoomOptions options)
    : GestureEventFilter(surface)
    , m_controller(new TouchPanZoomController(host, std::move(options), this))
{
    if (surface)
        surface->setAttribute(Qt::WA_AcceptTouchEvents, true);
}

void TouchEventFilter::detach()
{
    if (m_controller)
        m_controller->reset();
    m_forwardedPointId.reset();
    GestureEventFilter::detach();
}

void TouchEventFilter::sendForwardedMouse(QEvent::Type type, const QTouchEvent& event)
{
    QWidget* w = surface();
    if (!w)
        return;

    const bool press = type == QEvent::MouseButtonPress;
    const bool release = type == QEvent::MouseButtonRelease;
    const Qt::MouseButton button = (press || release) ? Qt::LeftButton : Qt::NoButton;
    const Qt::MouseButtons held = release ? Qt::MouseButtons(Qt::NoButton) : Qt::MouseButtons(Qt::LeftButton);

    QMouseEvent mouse(type, m_forwardedLocal, m_forwardedScene, m_forwardedGlobal,
                      button, held, event.modifiers(), event.pointingDevice());
    QCoreApplication::sendEvent(w, &mouse);
}

// The touch sequence is always accepted at begin so a second finger can still
// join it. Qt then synthesizes no mouse events, so a lone finger the gesture does
// not use is forwarded here instead.
bool TouchEventFilter::forwardSingleFinger(const QTouchEvent& event, bool handledByGesture)
{
    const QList<QEventPoint>& points = event.points();

    if (!m_forwardedPointId) {
        if (event.type() != QEvent::TouchBegin || points.size() != 1 || handledByGesture)
            return false;
        const QEventPoint& p = points.first();
        m_forwardedPointId = p.id();
        m_forwardedLocal = p.position();
        m_forwardedScene = p.scenePosition();
        m_forwardedGlobal = p.globalPosition();
        sendForwardedMouse(QEvent::MouseButtonPress, event);
        return true;
    }

    const QEventPoint* tracked = nullptr;
    for (const QEventPoint& p : points) {
        if (p.id() == *m_forwardedPointId)
            tracked = &p;
    }

    if (tracked) {
        const QPointF pos = tracked->position();
        if (pos != m_forwardedLocal) {
            m_forwardedLocal = pos;
            m_forwardedScene = tracked->scenePosition();
            m_forwardedGlobal = tracked->globalPosition();
            if (tracked->state() != QEventPoint::State::Released)
                sendForwardedMouse(QEvent::MouseMove, event);
        }
    }

    // A second finger hands the sequence to the gesture.
    const bool ended = !tracked || tracked->state() == QEventPoint::State::Released
        || event.type() == QEvent::TouchEnd || points.size() > 1;
    if (ended) {
        sendForwardedMouse(QEvent::MouseButtonRelease, event);
        m_forwardedPointId.reset();
    }
    return true;
}

QList<QPointF> TouchEventFilter::activeTouchPoints(const QTouchEvent& event)
{
    QList<QPointF> out;
    for (const QEventPoint& p : event.points()) {
        if (p.state() != QEventPoint::State::Released)
            out.push_back(p.position());
    }
    return out;
}

bool TouchEventFilter::eventFilter(QObject* watched, QEvent* event)
{
    if (!isSurfaceEvent(watched))
        return QObject::eventFilter(watched, event);

    switch (event->type()) {
        case QEvent::TouchBegin:
        case QEvent::TouchUpdate:
        case QEvent::TouchEnd: {
            auto* te = static_cast<QTouchEvent*>(event);
            const QList<QPointF> active = activeTouchPoints(*te);

            bool pressed = false;
            bool released = false;
            for (const QEventPoint& p : te->points()) {
                pressed = pressed || p.state() == QEventPoint::State::Pressed;
                released = released || p.state() == QEventPoint::State::Released;
            }

            bool handled = false;
            if (event->type() == QEvent::TouchEnd || released)
                handled = m_controller->touchEnded(active);
            else if (pressed)
                handled = m_controller->touchStarted(active);
            else
                handled = m_controller->touchMoved(active);

            const bool forwarded = forwardSingleFinger(*te, handled);

            // The sequence must be accepted at begin or Qt stops delivering updates.
            if (event->type() == QEvent::TouchBegin) {
                te->accept();
                return true;
            }
            if (handled || forwarded) {
                te->accept();
                return true;
            }
            break;
        }
        case QEvent::TouchCancel:
            m_controller->touchCancelled();
            if (m_forwardedPointId) {
                sendForwardedMouse(QEvent::MouseButtonRelease, *static_cast<QTouchEvent*>(event));
                m_forwardedPointId.reset();
            }
            break;
        default:
            break;
    }

    return QObject::eventFilter(watched, event);
}

// -----------------------------------------------------------------------------
// Drag-pan
// -----------------------------------------------------------------------------

DragPanEventFilter::DragPanEventFilter(QWidget* surface,
                                       Api::IViewportHost* host,
                                       Api::IFrameScheduler* scheduler,
                                       DragPanOptions options)
    : GestureEventFilter(surface)
{
    if (!scheduler) {
        m_ownedScheduler = std::make_unique<Internal::TimerFrameScheduler>();
        scheduler = m_ownedScheduler.get();
    }

    m_controller = new DragPanController(host, scheduler, options, this);
    connect(m_controller, &DragPanController::cursorChanged, this, &DragPanEventFilter::applyCursor);
}

DragPanEventFilter::~DragPanEventFilter()
{
    // The owned scheduler goes before the child controller would.
    if (m_controller)
        m_controller->teardown();
}

void DragPanEventFilter::detach()
{
    if (m_controller)
        m_controller->teardown();
    m_heldMenu.reset();
    GestureEventFilter::detach();
}

PointerInput DragPanEventFilter::pointerInputFromEvent(const QMouseEvent& event)
{
    PointerInput in;
    in.pointerId = event.pointCount() > 0 ? static_cast<PointerId>(event.point(0).id()) : 0;
    in.clientPos = event.position();
    in.button = event.button();
    in.buttons = event.buttons();
    return in;
}

void DragPanEventFilter::applyCursor(PanCursor cursor)
{
    QWidget* w = surface();
    if (!w)
        return;

    switch (cursor) {
        case PanCursor::Ready:
            w->setCursor(Qt::OpenHandCursor);
            break;
        case PanCursor::Grabbing:
            w->setCursor(Qt::ClosedHandCursor);
            break;
        case PanCursor::None:
            w->unsetCursor();
            break;
    }
}

// Posted so the widget sees the release before the menu, as with a native
// release-time menu.
void DragPanEventFilter::replayHeldContextMenu()
{
    const std::optional<HeldContextMenu> held = std::exchange(m_heldMenu, std::nullopt);
    QWidget* w = surface();
    if (!held || !w)
        return;

    qCDebug(slategesturelog) << "Replaying context menu held during a drag that did not pan";
    QCoreApplication::postEvent(w, new QContextMenuEvent(held->reason, held->pos, held->globalPos, held->modifiers));
}

bool DragPanEventFilter::eventFilter(QObject* watched, QEvent* event)
{
    if (!isSurfaceEvent(watched))
        return QObject::eventFilter(watched, event);

    switch (event->type()) {
        case QEvent::MouseButtonPress:
            m_controller->pointerDown(pointerInputFromEvent(*static_cast<QMouseEvent*>(event)));
            break;
        case QEvent::MouseMove:
            if (m_controller->pointerMove(pointerInputFromEvent(*static_cast<QMouseEvent*>(event)))) {
                event->accept();
                return true;
            }
            break;
        case QEvent::MouseButtonRelease: {
            const bool consumed = m_controller->pointerUp(pointerInputFromEvent(*static_cast<QMouseEvent*>(event)));
            if (m_controller->takeHeldContextMenu())
                replayHeldContextMenu();
            else if (!m_controller->isActive())
                m_heldMenu.reset();
            if (consumed) {
                event->accept();
                return true;
            }
            break;
        }
        case QEvent::ContextMenu: {
            auto* ce = static_cast<QContextMenuEvent*>(event);
            switch (m_controller->contextMenuRequested()) {
                case ContextMenuAction::Hold:
                    m_heldMenu = HeldContextMenu{ce->reason(), ce->pos(), ce->globalPos(), ce->modifiers()};
                    ce->accept();
                    return true;
                case ContextMenuAction::Suppress:
                    ce->accept();
                    return true;
                case ContextMenuAction::Deliver:
                    break;
            }
            break;
        }
        case QEvent::Hide:
        case QEvent::WindowDeactivate:
            m_controller->cancel();
            m_heldMenu.reset();
            break;
        default:
            break;
    }

    return QObject::eventFilter(watched, event);
}

// -----------------------------------------------------------------------------
// Setup
// -----------------------------------------------------------------------------

Teardown setupWheelZoom(QWidget* surface, Api::IViewportHost* host, WheelZoomOptions options)
{
    if (!surface) {
        qCWarning(slategesturelog) << "setupWheelZoom: no surface";
        return noopTeardown();
    }
    return makeTeardown(new WheelEventFilter(surface, host, options));
}

Teardown setupTouchPanZoom(QWidget* surface, Api::IViewportHost* host, TouchPanZoomOptions options)
{
    if (!surface) {
        qCWarning(slategesturelog) << "setupTouchPanZoom: no surface";
        return noopTeardown();
    }
    return makeTeardown(new TouchEventFilter(surface, host, std::move(options)));
}

Teardown setupDragPan(QWidget* surface,
                      Api::IViewportHost* host,
                      Api::IFrameScheduler* scheduler,
                      DragPanOptions options)
{
    if (!surface) {
        qCWarning(slategesturelog) << "setupDragPan: no surface";
        return noopTeardown();
    }
    return makeTeardown(new DragPanEventFilter(surface, host, scheduler, options));
}

} // namespace Slate::Controllers
