#include "core/session/session_index_manager.h"
#include "core/embedding/embedding_manager.h"
#include "core/indexing/indexing_task.h"
#include "core/session/session_indexes.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index.h"

#include <QRandomGenerator>

#include <chrono>

namespace pc {

namespace {

constexpr int kSessionIdWords = 4;   // 128 bits

int64_t nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

RetrievalError sessionNotFound(const QString& sessionId)
{
    return RetrievalError{RetrievalErrorCode::SessionNotFound,
                          QStringLiteral("no session with id '%1'").arg(sessionId)};
}

} // namespace

SessionIndexManager::SessionIndexManager(const RetrievalSettings& settings,
                                         Dependencies dependencies)
    : m_settings(settings)
    , m_deps(std::move(dependencies))
{
}

SessionIndexManager::~SessionIndexManager()
{
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(m_registryMutex);
        for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
            sessions.push_back(it.value());
        }
        m_sessions.clear();
    }

    for (const std::shared_ptr<Session>& session : sessions) {
        if (std::shared_ptr<IndexingTask> task = session->takeTask()) {
            task->cancel();
            session->indexes()->release();
            retire(std::move(task));
        }
    }
    reapRetiredTasks(true);
}

// ── Public API ──────────────────────────────────────────────

QString SessionIndexManager::generateSessionId()
{
    quint32 words[kSessionIdWords];
    QRandomGenerator::system()->fillRange(words, kSessionIdWords);
    const QByteArray raw(reinterpret_cast<const char*>(words), sizeof(words));
    return QString::fromLatin1(raw.toHex());
}

UploadResult SessionIndexManager::upload(const QString& sessionId, std::vector<UploadFile> files)
{
    UploadResult result;

    if (const std::optional<RetrievalError> invalid = validateFiles(files)) {
        result.error = invalid;
        result.sessionId = sessionId;
        return result;
    }

    const bool creating = sessionId.isEmpty();
    std::shared_ptr<Session> session = creating ? createSession() : find(sessionId);
    if (!session) {
        result.error = sessionNotFound(sessionId);
        return result;
    }
    session->touch(nowMs());

    std::vector<DocumentRecord> records;
    records.reserve(files.size());
    for (const UploadFile& file : files) {
        DocumentRecord record;
        record.filename = file.filename;
        record.byteSize = static_cast<int64_t>(file.bytes.size());
        records.push_back(std::move(record));
    }

    UploadLimits limits;
    limits.maxFileBytes = m_settings.maxFileBytes;
    limits.maxSessionBytes = m_settings.maxSessionBytes;
    limits.maxFiles = m_settings.maxFilesPerSession;

    if (const std::optional<RetrievalError> rejected = session->beginBuild(records, limits)) {
        LOG_INFO(pcIndex, "Upload rejected for session %s: %s",
                 qUtf8Printable(session->id()), qUtf8Printable(rejected->describe()));
        result.error = rejected;
        result.sessionId = creating ? QString() : session->id();
        return result;
    }

    // The previous build has finished (beginBuild succeeded); its thread may
    // still be unwinding.
    if (std::shared_ptr<IndexingTask> previous = session->takeTask()) {
        retire(std::move(previous));
    }

    if (creating) {
        std::lock_guard<std::mutex> lock(m_registryMutex);
        m_sessions.insert(session->id(), session);
    }

    std::shared_ptr<IndexingTask> task = makeTask(session, std::move(files), records);
    session->setTask(task);
    task->start();

    LOG_INFO(pcIndex, "Session %s accepted %d file(s)",
             qUtf8Printable(session->id()), static_cast<int>(records.size()));

    result.sessionId = session->id();
    result.snapshot = session->snapshot();
    return result;
}

StatusResult SessionIndexManager::status(const QString& sessionId)
{
    StatusResult result;
    std::shared_ptr<Session> session = acquire(sessionId);
    if (!session) {
        result.error = sessionNotFound(sessionId);
        return result;
    }
    result.snapshot = session->snapshot();
    return result;
}

std::optional<RetrievalError> SessionIndexManager::teardown(const QString& sessionId)
{
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(m_registryMutex);
        session = m_sessions.take(sessionId);
    }
    if (!session) {
        return sessionNotFound(sessionId);
    }

    std::shared_ptr<IndexingTask> task = session->takeTask();
    if (task) {
        task->cancel();
    }
    // Takes the exclusive index lock, so no insert can follow.
    session->indexes()->release();
    if (task) {
        retire(std::move(task));
    }

    LOG_INFO(pcIndex, "Session %s torn down", qUtf8Printable(sessionId));
    return std::nullopt;
}

int SessionIndexManager::sweepIdleSessions(const QDateTime& now)
{
    const int64_t cutoff = now.toMSecsSinceEpoch()
        - static_cast<int64_t>(m_settings.sessionTtlSeconds) * 1000;

    QStringList expired;
    {
        std::lock_guard<std::mutex> lock(m_registryMutex);
        for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
            if (it.value()->lastActivityMs() < cutoff) {
                expired.append(it.key());
            }
        }
    }

    int removed = 0;
    for (const QString& sessionId : expired) {
        if (!teardown(sessionId)) {
            ++removed;
        }
    }
    if (removed > 0) {
        LOG_INFO(pcIndex, "Idle sweep removed %d session(s)", removed);
    }

    reapRetiredTasks(false);
    return removed;
}

bool SessionIndexManager::waitForIndexing(const QString& sessionId, int timeoutMs)
{
    std::shared_ptr<Session> session = find(sessionId);
    if (!session) {
        return false;
    }
    std::shared_ptr<IndexingTask> task = session->task();
    if (!task) {
        return true;
    }
    return task->completion().wait_for(std::chrono::milliseconds(timeoutMs))
        == std::future_status::ready;
}

std::shared_ptr<Session> SessionIndexManager::acquire(const QString& sessionId)
{
    std::shared_ptr<Session> session = find(sessionId);
    if (session) {
        session->touch(nowMs());
    }
    return session;
}

std::optional<std::vector<DocumentRecord>> SessionIndexManager::documents(const QString& sessionId)
{
    std::shared_ptr<Session> session = acquire(sessionId);
    if (!session) {
        return std::nullopt;
    }
    return session->documents();
}

int SessionIndexManager::sessionCount() const
{
    std::lock_guard<std::mutex> lock(m_registryMutex);
    return static_cast<int>(m_sessions.size());
}

void SessionIndexManager::setBuildObserver(BuildObserver observer)
{
    std::lock_guard<std::mutex> lock(m_observerMutex);
    m_buildObserver = std::move(observer);
}

void SessionIndexManager::setCompletionCallback(CompletionCallback callback)
{
    std::lock_guard<std::mutex> lock(m_observerMutex);
    m_completionCallback = std::move(callback);
}

// ── Private helpers ─────────────────────────────────────────

std::shared_ptr<Session> SessionIndexManager::find(const QString& sessionId) const
{
    if (sessionId.isEmpty()) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(m_registryMutex);
    return m_sessions.value(sessionId);
}

std::shared_ptr<Session> SessionIndexManager::createSession() const
{
    const int dimensions = m_deps.embeddings ? m_deps.embeddings->dimensions()
                                             : m_settings.embeddingDimensions;
    auto indexes = std::make_shared<SessionIndexes>(
        createVectorIndex(m_settings.vectorBackend, dimensions), dimensions);
    return std::make_shared<Session>(generateSessionId(), std::move(indexes),
                                     QDateTime::currentDateTimeUtc());
}

std::optional<RetrievalError> SessionIndexManager::validateFiles(
    const std::vector<UploadFile>& files) const
{
    if (files.empty()) {
        return RetrievalError{RetrievalErrorCode::InvalidRequest,
                              QStringLiteral("no files in upload")};
    }
    if (static_cast<int>(files.size()) > m_settings.maxFilesPerSession) {
        return RetrievalError{RetrievalErrorCode::UploadLimitExceeded,
                              QStringLiteral("a session holds at most %1 files (%2 requested)")
                                  .arg(m_settings.maxFilesPerSession)
                                  .arg(files.size())};
    }
    for (const UploadFile& file : files) {
        if (file.filename.trimmed().isEmpty()) {
            return RetrievalError{RetrievalErrorCode::InvalidRequest,
                                  QStringLiteral("uploaded file has no name")};
        }
        if (static_cast<int64_t>(file.bytes.size()) > m_settings.maxFileBytes) {
            return RetrievalError{RetrievalErrorCode::UploadLimitExceeded,
                                  QStringLiteral("%1 is %2 bytes, the per-file limit is %3 bytes")
                                      .arg(file.filename)
                                      .arg(file.bytes.size())
                                      .arg(m_settings.maxFileBytes)};
        }
    }
    return std::nullopt;
}

std::shared_ptr<IndexingTask> SessionIndexManager::makeTask(
    const std::shared_ptr<Session>& session,
    std::vector<UploadFile> files,
    const std::vector<DocumentRecord>& records)
{
    std::vector<PendingDocument> pending;
    pending.reserve(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        pending.push_back(PendingDocument{records[i], std::move(files[i].bytes)});
    }

    IndexingTask::Dependencies deps;
    deps.extractor = m_deps.extractor;
    deps.embeddings = m_deps.embeddings;
    deps.indexes = session->indexes();
    deps.chunker.windowTokens = m_settings.chunkWindowTokens;
    deps.chunker.minTokens = m_settings.chunkMinTokens;
    deps.chunker.maxTokens = m_settings.chunkMaxTokens;
    deps.chunker.overlap = m_settings.chunkOverlap;
    deps.limits.maxPages = m_settings.maxPages;
    deps.limits.minCharsPerSquareInch = m_settings.minCharsPerSquareInch;

    const QString sessionId = session->id();
    const std::weak_ptr<Session> weakSession = session;

    IndexingTask::Callbacks callbacks;
    callbacks.started = [this, sessionId]() {
        BuildObserver observer;
        {
            std::lock_guard<std::mutex> lock(m_observerMutex);
            observer = m_buildObserver;
        }
        if (observer) {
            observer(sessionId, true);
        }
    };
    callbacks.documentFinished = [weakSession](const DocumentRecord& record, bool indexed) {
        if (std::shared_ptr<Session> s = weakSession.lock()) {
            s->recordDocument(record, indexed);
        }
    };
    callbacks.finished = [this, sessionId, weakSession](const IndexingTaskResult& taskResult) {
        IndexingSnapshot snapshot;
        if (std::shared_ptr<Session> s = weakSession.lock()) {
            s->finishBuild(taskResult);
            snapshot = s->snapshot();
        }

        BuildObserver observer;
        CompletionCallback completion;
        {
            std::lock_guard<std::mutex> lock(m_observerMutex);
            observer = m_buildObserver;
            completion = m_completionCallback;
        }
        if (observer) {
            observer(sessionId, false);
        }
        if (completion && !taskResult.cancelled) {
            completion(sessionId, snapshot);
        }
    };

    return std::make_shared<IndexingTask>(sessionId, std::move(pending), std::move(deps),
                                          std::move(callbacks));
}

void SessionIndexManager::retire(std::shared_ptr<IndexingTask> task)
{
    std::lock_guard<std::mutex> lock(m_retiredMutex);
    m_retired.push_back(std::move(task));
}

void SessionIndexManager::reapRetiredTasks(bool waitForAll)
{
    std::vector<std::shared_ptr<IndexingTask>> reaped;
    {
        std::lock_guard<std::mutex> lock(m_retiredMutex);
        auto it = m_retired.begin();
        while (it != m_retired.end()) {
            if (waitForAll || (*it)->isFinished()) {
                reaped.push_back(std::move(*it));
                it = m_retired.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const std::shared_ptr<IndexingTask>& task : reaped) {
        task->join();
    }
}

} // namespace pc
