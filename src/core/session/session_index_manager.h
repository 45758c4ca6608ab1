#pragma once

#include "core/extraction/extractor.h"
#include "core/session/session.h"
#include "core/shared/errors.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QString>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace pc {

class EmbeddingManager;
class IndexingTask;

struct UploadFile {
    QString filename;
    QByteArray bytes;
};

struct UploadResult {
    std::optional<RetrievalError> error;
    QString sessionId;
    IndexingSnapshot snapshot;

    bool ok() const { return !error.has_value(); }
};

struct StatusResult {
    std::optional<RetrievalError> error;
    IndexingSnapshot snapshot;

    bool ok() const { return !error.has_value(); }
};

// SessionIndexManager — owns every live session and its background build.
//
// The registry mutex is held only for lookups and insert/erase; everything
// else happens under the session's own locks, so sessions index in parallel.
// An upload into a session that is already indexing is rejected with
// IndexingInProgress.
class SessionIndexManager {
public:
    struct Dependencies {
        std::shared_ptr<DocumentExtractor> extractor;
        std::shared_ptr<EmbeddingManager> embeddings;
    };

    // Called on the indexing thread.
    using BuildObserver = std::function<void(const QString& sessionId, bool started)>;
    using CompletionCallback =
        std::function<void(const QString& sessionId, const IndexingSnapshot& snapshot)>;

    SessionIndexManager(const RetrievalSettings& settings, Dependencies dependencies);
    ~SessionIndexManager();

    SessionIndexManager(const SessionIndexManager&) = delete;
    SessionIndexManager& operator=(const SessionIndexManager&) = delete;

    // Empty sessionId creates a session. Returns as soon as the batch is
    // accepted; indexing continues in the background.
    UploadResult upload(const QString& sessionId, std::vector<UploadFile> files);

    StatusResult status(const QString& sessionId);

    // Returns SessionNotFound for an unknown id.
    std::optional<RetrievalError> teardown(const QString& sessionId);

    // Removes sessions idle for longer than sessionTtlSeconds and joins
    // finished background threads. Returns the number of sessions removed.
    int sweepIdleSessions(const QDateTime& now = QDateTime::currentDateTimeUtc());

    // Blocks until the session's current build finishes. Returns false on
    // timeout or unknown session.
    bool waitForIndexing(const QString& sessionId, int timeoutMs);

    // Looks up a session and refreshes its activity timestamp.
    std::shared_ptr<Session> acquire(const QString& sessionId);

    std::optional<std::vector<DocumentRecord>> documents(const QString& sessionId);
    int sessionCount() const;
    const RetrievalSettings& settings() const { return m_settings; }

    void setBuildObserver(BuildObserver observer);
    void setCompletionCallback(CompletionCallback callback);

    static QString generateSessionId();

private:
    std::shared_ptr<Session> find(const QString& sessionId) const;
    std::shared_ptr<Session> createSession() const;
    std::optional<RetrievalError> validateFiles(const std::vector<UploadFile>& files) const;
    std::shared_ptr<IndexingTask> makeTask(const std::shared_ptr<Session>& session,
                                           std::vector<UploadFile> files,
                                           const std::vector<DocumentRecord>& records);
    void retire(std::shared_ptr<IndexingTask> task);
    void reapRetiredTasks(bool waitForAll);

    RetrievalSettings m_settings;
    Dependencies m_deps;

    mutable std::mutex m_registryMutex;
    QHash<QString, std::shared_ptr<Session>> m_sessions;

    std::mutex m_retiredMutex;
    std::vector<std::shared_ptr<IndexingTask>> m_retired;

    std::mutex m_observerMutex;
    BuildObserver m_buildObserver;
    CompletionCallback m_completionCallback;
};

} // namespace pc
