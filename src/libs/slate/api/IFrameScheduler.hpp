#pragma once

#include "slate/SlateGlobal.hpp"
#include "slate/SlateTypes.hpp"

#include <functional>

namespace Slate::Api {

// Animation-frame cadence. A handle of 0 is never issued.
class SLATE_EXPORT IFrameScheduler {
public:
	virtual ~IFrameScheduler() = default;

	virtual FrameHandle requestFrame(std::function<void()> callback) = 0;
	// Unknown or already-fired handles are ignored.
	virtual void cancelFrame(FrameHandle handle) = 0;
};

} // namespace Slate::Api
