#pragma once

#include "slate/api/ISceneHost.hpp"

#include <QtCore/QObject>

// In-memory element list for the demo application.
class SceneStore final : public QObject, public Slate::Api::ISceneHost
{
	Q_OBJECT

public:
	explicit SceneStore(QObject* parent = nullptr);

	QList<QJsonObject> sceneElements() const override { return m_elements; }
	void addFiles(const QList<QJsonObject>& files) override;
	void updateScene(const QList<QJsonObject>& elements) override;

	int fileCount() const { return m_files.size(); }

signals:
	void sceneChanged();

private:
	QList<QJsonObject> m_elements;
	QList<QJsonObject> m_files;
};
