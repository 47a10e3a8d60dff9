// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "slate/SlateGlobal.hpp"
#include "slate/SlateTypes.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QPointF>
#include <QtCore/Qt>

#include <optional>

namespace Slate::Api {
class IFrameScheduler;
class IViewportHost;
}

namespace Slate::Controllers {

// Per-gesture state. Start values are captured once at pointer-down and never
// refreshed from the host while the drag is running.
struct SLATE_EXPORT DragState final {
    double prevClientX = 0.0;
    double prevClientY = 0.0;
    bool didPan = false;
    std::optional<PointerId> activePointerId;
    double startClientX = 0.0;
    double startClientY = 0.0;
    double startScrollX = 0.0;
    double startScrollY = 0.0;
    double startZoom = 1.0;
    FrameHandle rafId = 0;
};

struct SLATE_EXPORT PointerInput final {
    PointerId pointerId = 0;
    QPointF clientPos;
    Qt::MouseButton button = Qt::NoButton; // button that changed state (press/release)
    Qt::MouseButtons buttons;              // buttons held after the event
};

enum class PanCursor : quint8 { None, Ready, Grabbing };

// What to do with a native context-menu request.
enum class ContextMenuAction : quint8 {
    Deliver,  // let it reach the surface
    Suppress, // it follows a drag that panned
    Hold      // it arrived mid-drag; replay it only if the drag ends without panning
};

struct SLATE_EXPORT DragPanOptions final {
    Qt::MouseButton panButton = Qt::RightButton;
};

class SLATE_EXPORT DragPanController final : public QObject
{
    Q_OBJECT

public:
    DragPanController(Api::IViewportHost* host,
                      Api::IFrameScheduler* scheduler,
                      DragPanOptions options = {},
                      QObject* parent = nullptr);
    ~DragPanController() override;

    const DragState& state() const noexcept { return m_state; }
    const DragPanOptions& options() const noexcept { return m_options; }

    bool isActive() const noexcept { return m_state.activePointerId.has_value(); }
    bool hasPendingFrame() const noexcept { return m_state.rafId != 0; }
    bool isContextMenuSuppressionArmed() const noexcept { return m_contextMenuArmed; }
    bool isTornDown() const noexcept { return m_tornDown; }
    PanCursor cursor() const noexcept { return m_cursor; }

    // Return true when the event was used by the drag and should not reach the host.
    bool pointerDown(const PointerInput& input);
    bool pointerMove(const PointerInput& input);
    bool pointerUp(const PointerInput& input);

    // Pointer lost (window deactivated, surface hidden).
    void cancel();

    /// Call for every native context-menu request. Platforms that open the menu on
    /// press deliver it while the drag is active; such a request is held.
    ContextMenuAction contextMenuRequested();

    /// True once after a drag that held a context menu ended without panning.
    bool takeHeldContextMenu();

    // Idempotent.
    void teardown();

signals:
    void cursorChanged(Slate::Controllers::PanCursor cursor);
    void panFinished(bool didPan);

private:
    void requestFrame();
    void applyPanFromState();
    void flushPendingFrame();
    void release();
    void setCursor(PanCursor cursor);

    QPointer<Api::IViewportHost> m_host;
    Api::IFrameScheduler* m_scheduler = nullptr; // not owned
    DragPanOptions m_options;

    DragState m_state;
    PanCursor m_cursor = PanCursor::None;
    bool m_contextMenuArmed = false;
    bool m_contextMenuHeld = false;
    bool m_replayHeldMenu = false;
    bool m_inHandler = false;
    bool m_tornDown = false;
};

} // namespace Slate::Controllers
