#include "core/session/session.h"
#include "core/indexing/indexing_task.h"
#include "core/session/session_indexes.h"

namespace pc {

Session::Session(QString id, std::shared_ptr<SessionIndexes> indexes, QDateTime createdAt)
    : m_id(std::move(id))
    , m_createdAt(std::move(createdAt))
    , m_indexes(std::move(indexes))
{
    m_lastActivityMs.store(m_createdAt.toMSecsSinceEpoch());
}

Session::~Session() = default;

IndexingSnapshot Session::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    IndexingSnapshot snap;
    snap.status = m_status;
    snap.totalFiles = m_totalFiles;
    snap.filesIndexed = m_filesIndexed;
    snap.error = m_error;
    snap.errorDocument = m_errorDocument;
    snap.documentCount = static_cast<int>(m_documents.size());
    for (const DocumentRecord& record : m_documents) {
        snap.chunkCount += record.chunkCount;
    }
    snap.totalBytes = m_totalBytes;
    snap.createdAt = m_createdAt;
    return snap;
}

IndexingStatus Session::status() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_status;
}

bool Session::isBuilding() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_building;
}

std::vector<DocumentRecord> Session::documents() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_documents;
}

std::optional<DocumentRecord> Session::document(const QString& documentId) const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    for (const DocumentRecord& record : m_documents) {
        if (record.documentId == documentId) {
            return record;
        }
    }
    return std::nullopt;
}

std::optional<RetrievalError> Session::beginBuild(std::vector<DocumentRecord>& incoming,
                                                  const UploadLimits& limits)
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_building) {
        return RetrievalError{RetrievalErrorCode::IndexingInProgress,
                              QStringLiteral("session %1 is still indexing a previous upload")
                                  .arg(m_id)};
    }

    const int fileCount = static_cast<int>(m_documents.size() + incoming.size());
    if (fileCount > limits.maxFiles) {
        return RetrievalError{RetrievalErrorCode::UploadLimitExceeded,
                              QStringLiteral("a session holds at most %1 files (%2 requested)")
                                  .arg(limits.maxFiles)
                                  .arg(fileCount)};
    }
    int64_t batchBytes = 0;
    for (const DocumentRecord& record : incoming) {
        batchBytes += record.byteSize;
    }
    if (m_totalBytes + batchBytes > limits.maxSessionBytes) {
        return RetrievalError{RetrievalErrorCode::UploadLimitExceeded,
                              QStringLiteral("session upload total of %1 bytes exceeds the %2 byte limit")
                                  .arg(m_totalBytes + batchBytes)
                                  .arg(limits.maxSessionBytes)};
    }

    for (DocumentRecord& record : incoming) {
        record.documentId = QStringLiteral("doc-%1").arg(m_nextDocumentNumber);
        record.uploadOrder = m_nextDocumentNumber;
        ++m_nextDocumentNumber;
        record.outcome = ExtractionOutcome::Pending;
        m_totalBytes += record.byteSize;
        m_documents.push_back(record);
    }

    m_building = true;
    m_status = IndexingStatus::Indexing;
    m_totalFiles = static_cast<int>(incoming.size());
    m_filesIndexed = 0;
    m_error.reset();
    m_errorDocument.reset();
    return std::nullopt;
}

void Session::recordDocument(const DocumentRecord& record, bool indexed)
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    for (DocumentRecord& existing : m_documents) {
        if (existing.documentId == record.documentId) {
            existing = record;
            break;
        }
    }
    if (indexed && m_filesIndexed < m_totalFiles) {
        ++m_filesIndexed;
        if (m_filesIndexed == m_totalFiles && m_status == IndexingStatus::Indexing) {
            m_status = IndexingStatus::Done;
        }
    }
}

void Session::finishBuild(const IndexingTaskResult& result)
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_building = false;

    if (result.error) {
        m_status = IndexingStatus::Error;
        m_error = result.error->describe();
        m_errorDocument = result.errorDocument;
    } else if (result.cancelled) {
        m_status = IndexingStatus::Error;
        m_error = QStringLiteral("indexing cancelled");
    } else if (m_filesIndexed == m_totalFiles) {
        m_status = IndexingStatus::Done;
    } else {
        m_status = IndexingStatus::Error;
        m_error = QStringLiteral("indexed %1 of %2 file(s)").arg(m_filesIndexed).arg(m_totalFiles);
    }
}

void Session::setTask(std::shared_ptr<IndexingTask> task)
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_task = std::move(task);
}

std::shared_ptr<IndexingTask> Session::takeTask()
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return std::move(m_task);
}

std::shared_ptr<IndexingTask> Session::task() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_task;
}

} // namespace pc
