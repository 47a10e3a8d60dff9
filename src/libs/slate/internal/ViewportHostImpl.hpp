// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "slate/api/IViewportHost.hpp"

namespace Slate::Internal {

// In-memory viewport owner. Clamps zoom to its limits and ignores non-finite proposals.
class SLATE_EXPORT ViewportHostImpl final : public Api::IViewportHost
{
    Q_OBJECT

public:
    explicit ViewportHostImpl(QObject* parent = nullptr);

    std::optional<ViewportState> viewportState() const override;
    void updateViewport(const ViewportUpdate& update) override;

    const ViewportState& state() const noexcept { return m_state; }
    void setState(const ViewportState& state);
    void resetView();

    bool isMounted() const noexcept { return m_mounted; }
    void setMounted(bool mounted);

    const ZoomLimits& zoomLimits() const noexcept { return m_limits; }
    void setZoomLimits(const ZoomLimits& limits);

    int updateCount() const noexcept { return m_updateCount; }

private:
    ViewportState m_state;
    ZoomLimits m_limits;
    bool m_mounted = true;
    int m_updateCount = 0;
};

} // namespace Slate::Internal
