#pragma once

#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace pc {

class IndexingTask;
class SessionIndexes;
struct IndexingTaskResult;

struct UploadLimits {
    int64_t maxFileBytes = 0;
    int64_t maxSessionBytes = 0;
    int maxFiles = 0;
};

// One user's documents, indexes and indexing state.
//
// All state lives behind m_stateMutex, which is only ever held for short
// reads and transitions. The SessionIndexManager drives every transition.
class Session {
public:
    Session(QString id, std::shared_ptr<SessionIndexes> indexes, QDateTime createdAt);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const QString& id() const { return m_id; }
    const QDateTime& createdAt() const { return m_createdAt; }
    std::shared_ptr<SessionIndexes> indexes() const { return m_indexes; }

    int64_t lastActivityMs() const { return m_lastActivityMs.load(); }
    void touch(int64_t nowMs) { m_lastActivityMs.store(nowMs); }

    IndexingSnapshot snapshot() const;
    IndexingStatus status() const;
    bool isBuilding() const;
    std::vector<DocumentRecord> documents() const;
    std::optional<DocumentRecord> document(const QString& documentId) const;

    // ── Transitions (SessionIndexManager only) ──────────────

    // Accepts a batch: rejects when a build is running or the batch would
    // push the session past its cumulative limits, otherwise assigns document
    // ids and upload order, resets the counters to (0, batch size) and
    // enters Indexing.
    std::optional<RetrievalError> beginBuild(std::vector<DocumentRecord>& incoming,
                                             const UploadLimits& limits);

    // The last of totalFiles indexed documents moves the status to Done;
    // finishBuild() still closes the build.
    void recordDocument(const DocumentRecord& record, bool indexed);
    void finishBuild(const IndexingTaskResult& result);

    void setTask(std::shared_ptr<IndexingTask> task);
    std::shared_ptr<IndexingTask> takeTask();
    std::shared_ptr<IndexingTask> task() const;

private:
    const QString m_id;
    const QDateTime m_createdAt;
    const std::shared_ptr<SessionIndexes> m_indexes;
    std::atomic<int64_t> m_lastActivityMs{0};

    mutable std::mutex m_stateMutex;
    IndexingStatus m_status = IndexingStatus::Pending;
    int m_totalFiles = 0;
    int m_filesIndexed = 0;
    std::optional<QString> m_error;
    std::optional<QString> m_errorDocument;
    std::vector<DocumentRecord> m_documents;
    int64_t m_totalBytes = 0;
    int m_nextDocumentNumber = 1;
    bool m_building = false;
    std::shared_ptr<IndexingTask> m_task;
};

} // namespace pc
