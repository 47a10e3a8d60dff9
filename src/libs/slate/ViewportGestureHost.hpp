// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "slate/SlateGlobal.hpp"
#include "slate/SlateTypes.hpp"
#include "slate/api/IViewportHost.hpp"
#include "slate/config/SlateSettings.hpp"
#include "slate/controllers/GestureEventFilters.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

#include <optional>

namespace Slate::Api {
class IFrameScheduler;
}

namespace Slate {

// Binds wheel zoom, touch pan/zoom and drag-pan to one canvas surface and one
// viewport host.
class SLATE_EXPORT ViewportGestureHost final : public QObject
{
    Q_OBJECT

public:
    ViewportGestureHost(QWidget* surface,
                        Api::IViewportHost* host,
                        Config::GestureSettings settings = {},
                        QObject* parent = nullptr);
    ~ViewportGestureHost() override;

    QWidget* surface() const { return m_surface.data(); }
    Api::IViewportHost* viewportHost() const { return m_host.data(); }
    const Config::GestureSettings& settings() const noexcept { return m_settings; }

    // Must be called before attach(). Not owned. Without one, attach() creates a
    // timer-based scheduler running at settings().frameIntervalMs.
    void setFrameScheduler(Api::IFrameScheduler* scheduler);

    // On by default: a two-finger tap posts a context-menu event to the surface at
    // the tap centroid, after twoFingerTapped is emitted.
    bool contextMenuOnTwoFingerTap() const noexcept { return m_contextMenuOnTap; }
    void setContextMenuOnTwoFingerTap(bool enabled) { m_contextMenuOnTap = enabled; }

    bool isAttached() const noexcept { return m_attached; }
    void attach();

    // Idempotent.
    void teardown();

    std::optional<ViewportState> viewportState() const;
    std::optional<QPointF> worldFromScreen(const QPointF& screenPos) const;

signals:
    void twoFingerTapped(const QPointF& centroid);
    void touchInteractionFinished();

private:
    void handleTwoFingerTap(const QPointF& centroid);

    QPointer<QWidget> m_surface;
    QPointer<Api::IViewportHost> m_host;
    Config::GestureSettings m_settings;
    Api::IFrameScheduler* m_scheduler = nullptr;

    Controllers::Teardown m_wheelTeardown;
    Controllers::Teardown m_touchTeardown;
    Controllers::Teardown m_dragTeardown;

    bool m_attached = false;
    bool m_contextMenuOnTap = true;
};

} // namespace Slate
