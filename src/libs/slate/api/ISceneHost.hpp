#pragma once

#include "slate/SlateGlobal.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QList>

namespace Slate::Api {

// Scene access used by merge call sites. The remapping engine never talks to it.
class SLATE_EXPORT ISceneHost {
public:
	virtual ~ISceneHost() = default;

	virtual QList<QJsonObject> sceneElements() const = 0;
	virtual void addFiles(const QList<QJsonObject>& files) = 0;
	virtual void updateScene(const QList<QJsonObject>& elements) = 0;
};

} // namespace Slate::Api
