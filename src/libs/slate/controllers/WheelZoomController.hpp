// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "slate/SlateConstants.hpp"
#include "slate/SlateGlobal.hpp"
#include "slate/SlateTypes.hpp"

#include <QtCore/QPointer>
#include <QtCore/QPointF>

namespace Slate::Api {
class IViewportHost;
}

namespace Slate::Controllers {

// Browser-convention deltas: positive deltaY scrolls down.
struct SLATE_EXPORT WheelInput final {
    QPointF position;
    double deltaX = 0.0;
    double deltaY = 0.0;
    bool modifierPan = false;      // Control / Meta
    bool modifierZoomOnly = false; // Alt
    bool modifierShift = false;
};

enum class WheelAction : quint8 { Ignored, Pan, Zoom };

struct SLATE_EXPORT WheelOutcome final {
    WheelAction action = WheelAction::Ignored;
    ViewportState viewport;
};

struct SLATE_EXPORT WheelZoomOptions final {
    ZoomLimits limits;
    double sensitivity = Constants::kWheelZoomSensitivity;
};

/// Classifies a wheel event against \a current and computes the proposed viewport.
/// Ignored events carry \a current unchanged.
SLATE_EXPORT WheelOutcome resolveWheel(const WheelInput& input,
                                       const ViewportState& current,
                                       const WheelZoomOptions& options = {});

/// Trackpad pinch: \a value is the native gesture's exponent, so the zoom factor is 2^value.
SLATE_EXPORT ViewportState resolvePinchZoom(const QPointF& anchor,
                                            double value,
                                            const ViewportState& current,
                                            const ZoomLimits& limits = {});

class SLATE_EXPORT WheelZoomController final
{
public:
    explicit WheelZoomController(Api::IViewportHost* host, WheelZoomOptions options = {});

    const WheelZoomOptions& options() const noexcept { return m_options; }
    void setOptions(const WheelZoomOptions& options) { m_options = options; }

    // Both return true when the event was handled and must not reach the native handler.
    bool handleWheel(const WheelInput& input);
    bool handlePinch(const QPointF& anchor, double value);

private:
    void propose(const ViewportState& before, const ViewportState& after);

    QPointer<Api::IViewportHost> m_host;
    WheelZoomOptions m_options;
};

} // namespace Slate::Controllers
