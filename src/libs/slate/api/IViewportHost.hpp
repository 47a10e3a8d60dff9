#pragma once

#include "slate/SlateGlobal.hpp"
#include "slate/SlateTypes.hpp"

#include <QtCore/QObject>

#include <optional>

namespace Slate::Api {

// The canvas host owns the viewport. Gesture code reads it synchronously and proposes
// new values through updateViewport(); the host may clamp or batch further.
class SLATE_EXPORT IViewportHost : public QObject {
	Q_OBJECT

public:
	using QObject::QObject;
	~IViewportHost() override = default;

	// std::nullopt while the canvas is not mounted.
	virtual std::optional<ViewportState> viewportState() const = 0;
	virtual void updateViewport(const ViewportUpdate& update) = 0;

signals:
	void viewportChanged();
};

} // namespace Slate::Api
