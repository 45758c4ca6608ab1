#pragma once

#include "core/ipc/service_base.h"
#include "core/shared/settings.h"

#include <QTimer>

#include <memory>

namespace pc {

class EmbeddingManager;
class HybridQueryEngine;
class SessionIndexManager;

class RetrievalService : public ServiceBase {
    Q_OBJECT
public:
    explicit RetrievalService(QObject* parent = nullptr);
    RetrievalService(const RetrievalSettings& settings, QObject* parent);
    ~RetrievalService() override;

    SessionIndexManager& sessions() { return *m_sessions; }

protected:
    QJsonObject statusFields() const override;

private:
    QJsonObject handleUpload(uint64_t id, const QJsonObject& params);
    QJsonObject handleIndexStatus(uint64_t id, const QJsonObject& params);
    QJsonObject handleQuery(uint64_t id, const QJsonObject& params);
    QJsonObject handleTeardown(uint64_t id, const QJsonObject& params);

    void sweepIdleSessions();

    RetrievalSettings m_settings;
    std::shared_ptr<EmbeddingManager> m_embeddings;
    std::shared_ptr<SessionIndexManager> m_sessions;
    std::unique_ptr<HybridQueryEngine> m_queryEngine;
    QTimer m_sweepTimer;
};

} // namespace pc
