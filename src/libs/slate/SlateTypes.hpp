#pragma once

#include "slate/SlateConstants.hpp"
#include "slate/SlateGlobal.hpp"

#include <QtCore/QPointF>
#include <QtCore/QtGlobal>

#include <optional>

namespace Slate {

// Screen-space camera: a world point w is drawn at w * zoom + pan.
struct SLATE_EXPORT ViewportState final {
	double panX = 0.0;
	double panY = 0.0;
	double zoom = 1.0;

	QPointF pan() const noexcept { return QPointF(panX, panY); }

	friend bool operator==(const ViewportState& a, const ViewportState& b) noexcept
	{
		return a.panX == b.panX && a.panY == b.panY && a.zoom == b.zoom;
	}
	friend bool operator!=(const ViewportState& a, const ViewportState& b) noexcept { return !(a == b); }
};

// Partial proposal passed to IViewportHost::updateViewport. Unset fields keep the host's value.
struct SLATE_EXPORT ViewportUpdate final {
	std::optional<double> panX;
	std::optional<double> panY;
	std::optional<double> zoom;

	static ViewportUpdate fromState(const ViewportState& s)
	{
		ViewportUpdate u;
		u.panX = s.panX;
		u.panY = s.panY;
		u.zoom = s.zoom;
		return u;
	}

	static ViewportUpdate panOnly(const QPointF& pan)
	{
		ViewportUpdate u;
		u.panX = pan.x();
		u.panY = pan.y();
		return u;
	}

	bool isEmpty() const noexcept { return !panX && !panY && !zoom; }
};

struct SLATE_EXPORT ZoomLimits final {
	double minZoom = Constants::kMinZoom;
	double maxZoom = Constants::kMaxZoom;
};

using PointerId = qint64;
using FrameHandle = quint64;

} // namespace Slate
