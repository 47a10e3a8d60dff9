#include "SceneStore.hpp"

SceneStore::SceneStore(QObject* parent)
	: QObject(parent)
{
}

void SceneStore::addFiles(const QList<QJsonObject>& files)
{
	m_files.append(files);
}

void SceneStore::updateScene(const QList<QJsonObject>& elements)
{
	m_elements = elements;
	emit sceneChanged();
}
