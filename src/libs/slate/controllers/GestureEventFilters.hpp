// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "slate/controllers/DragPanController.hpp"
#include "slate/controllers/TouchPanZoomController.hpp"
#include "slate/controllers/WheelZoomController.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtGui/QContextMenuEvent>
#include <QtWidgets/QWidget>

#include <functional>
#include <memory>
#include <optional>

class QWheelEvent;
class QTouchEvent;
class QMouseEvent;

namespace Slate::Api {
class IFrameScheduler;
class IViewportHost;
}

namespace Slate::Controllers {

// Removes the listeners installed by a setup function. Safe to call more than once,
// and safe to call after the surface is gone.
using Teardown = std::function<void()>;

class SLATE_EXPORT GestureEventFilter : public QObject
{
    Q_OBJECT

public:
    explicit GestureEventFilter(QWidget* surface);
    ~GestureEventFilter() override;

    QWidget* surface() const { return m_surface.data(); }
    bool isAttached() const noexcept { return m_attached; }

    virtual void detach();

protected:
    // Only events delivered to the surface itself are handled.
    bool isSurfaceEvent(const QObject* watched) const;

private:
    QPointer<QWidget> m_surface;
    bool m_attached = false;
};

class SLATE_EXPORT WheelEventFilter final : public GestureEventFilter
{
    Q_OBJECT

public:
    WheelEventFilter(QWidget* surface, Api::IViewportHost* host, WheelZoomOptions options = {});

    WheelZoomController& controller() noexcept { return m_controller; }

    /// Converts a Qt wheel event to browser-convention deltas (positive deltaY scrolls down).
    static WheelInput wheelInputFromEvent(const QWheelEvent& event);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    WheelZoomController m_controller;
};

class SLATE_EXPORT TouchEventFilter final : public GestureEventFilter
{
    Q_OBJECT

public:
    TouchEventFilter(QWidget* surface, Api::IViewportHost* host, TouchPanZoomOptions options = {});

    TouchPanZoomController* controller() const noexcept { return m_controller; }

    void detach() override;

    // Positions of the touch points that are still down after \a event.
    static QList<QPointF> activeTouchPoints(const QTouchEvent& event);

    bool isForwardingToMouse() const noexcept { return m_forwardedPointId.has_value(); }

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    // Returns true while the event belongs to a forwarded sequence.
    bool forwardSingleFinger(const QTouchEvent& event, bool handledByGesture);
    void sendForwardedMouse(QEvent::Type type, const QTouchEvent& event);

    TouchPanZoomController* m_controller = nullptr; // child

    // A one-finger sequence the gesture declined, replayed to the surface as a left-button drag.
    std::optional<int> m_forwardedPointId;
    QPointF m_forwardedLocal;
    QPointF m_forwardedScene;
    QPointF m_forwardedGlobal;
};

class SLATE_EXPORT DragPanEventFilter final : public GestureEventFilter
{
    Q_OBJECT

public:
    // A null scheduler makes the filter own a timer-based one.
    DragPanEventFilter(QWidget* surface,
                       Api::IViewportHost* host,
                       Api::IFrameScheduler* scheduler = nullptr,
                       DragPanOptions options = {});
    ~DragPanEventFilter() override;

    DragPanController* controller() const noexcept { return m_controller; }

    void detach() override;

    static PointerInput pointerInputFromEvent(const QMouseEvent& event);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    struct HeldContextMenu {
        QContextMenuEvent::Reason reason = QContextMenuEvent::Mouse;
        QPoint pos;
        QPoint globalPos;
        Qt::KeyboardModifiers modifiers;
    };

    void applyCursor(PanCursor cursor);
    void replayHeldContextMenu();

    std::unique_ptr<Api::IFrameScheduler> m_ownedScheduler;
    DragPanController* m_controller = nullptr; // child
    std::optional<HeldContextMenu> m_heldMenu;
};

SLATE_EXPORT Teardown setupWheelZoom(QWidget* surface,
                                     Api::IViewportHost* host,
                                     WheelZoomOptions options = {});

SLATE_EXPORT Teardown setupTouchPanZoom(QWidget* surface,
                                        Api::IViewportHost* host,
                                        TouchPanZoomOptions options = {});

SLATE_EXPORT Teardown setupDragPan(QWidget* surface,
                                   Api::IViewportHost* host,
                                   Api::IFrameScheduler* scheduler = nullptr,
                                   DragPanOptions options = {});

} // namespace Slate::Controllers
