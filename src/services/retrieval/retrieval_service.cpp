#include "retrieval_service.h"
#include "core/embedding/embedding_manager.h"
#include "core/extraction/pdf_extractor.h"
#include "core/ipc/message.h"
#include "core/query/hybrid_query_engine.h"
#include "core/session/session_index_manager.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/shared/types.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>

namespace pc {

namespace {

RetrievalSettings loadSettings()
{
    std::optional<RetrievalSettings> loaded = SettingsManager::load();
    if (!loaded) {
        LOG_INFO(pcCore, "No settings at %s, using defaults",
                 qUtf8Printable(SettingsManager::settingsFilePath()));
        return RetrievalSettings{};
    }
    return *loaded;
}

QJsonObject snapshotToJson(const QString& sessionId, const IndexingSnapshot& snapshot)
{
    QJsonObject json;
    json[QStringLiteral("session_id")] = sessionId;
    json[QStringLiteral("status")] = indexingStatusToString(snapshot.status);
    json[QStringLiteral("total_files")] = snapshot.totalFiles;
    json[QStringLiteral("files_indexed")] = snapshot.filesIndexed;
    if (snapshot.error) {
        json[QStringLiteral("error")] = *snapshot.error;
    }
    if (snapshot.errorDocument) {
        json[QStringLiteral("error_document")] = *snapshot.errorDocument;
    }
    json[QStringLiteral("document_count")] = snapshot.documentCount;
    json[QStringLiteral("chunk_count")] = snapshot.chunkCount;
    json[QStringLiteral("total_bytes")] = static_cast<qint64>(snapshot.totalBytes);
    return json;
}

QJsonObject documentToJson(const DocumentRecord& record)
{
    QJsonObject json;
    json[QStringLiteral("document_id")] = record.documentId;
    json[QStringLiteral("upload_order")] = record.uploadOrder;
    json[QStringLiteral("filename")] = record.filename;
    json[QStringLiteral("byte_size")] = static_cast<qint64>(record.byteSize);
    json[QStringLiteral("page_count")] = record.pageCount;
    json[QStringLiteral("scanned_page_count")] = record.scannedPageCount;
    json[QStringLiteral("chunk_count")] = record.chunkCount;
    json[QStringLiteral("outcome")] = extractionOutcomeToString(record.outcome);
    if (record.errorMessage) {
        json[QStringLiteral("error")] = *record.errorMessage;
    }
    return json;
}

QJsonObject hitToJson(const QueryHit& hit)
{
    QJsonObject json;
    json[QStringLiteral("chunk_id")] = hit.chunkId;
    json[QStringLiteral("document_id")] = hit.documentId;
    json[QStringLiteral("filename")] = hit.filename;
    json[QStringLiteral("chunk_index")] = hit.chunkIndex;
    json[QStringLiteral("page_start")] = hit.pageStart;
    json[QStringLiteral("page_end")] = hit.pageEnd;
    json[QStringLiteral("start_offset")] = hit.startOffset;
    json[QStringLiteral("end_offset")] = hit.endOffset;
    json[QStringLiteral("text")] = hit.text;
    json[QStringLiteral("score")] = hit.scores.score;

    QJsonObject breakdown;
    breakdown[QStringLiteral("vector")] = hit.scores.vectorScore;
    breakdown[QStringLiteral("keyword")] = hit.scores.keywordScore;
    if (hit.scores.rawVectorScore) {
        breakdown[QStringLiteral("vector_raw")] = *hit.scores.rawVectorScore;
        breakdown[QStringLiteral("vector_rank")] = hit.scores.vectorRank;
    }
    if (hit.scores.rawKeywordScore) {
        breakdown[QStringLiteral("keyword_raw")] = *hit.scores.rawKeywordScore;
        breakdown[QStringLiteral("keyword_rank")] = hit.scores.keywordRank;
    }
    json[QStringLiteral("signals")] = breakdown;
    return json;
}

} // namespace

RetrievalService::RetrievalService(QObject* parent)
    : RetrievalService(loadSettings(), parent)
{
}

RetrievalService::RetrievalService(const RetrievalSettings& settings, QObject* parent)
    : ServiceBase(QStringLiteral("retrieval"), parent)
    , m_settings(SettingsManager::sanitize(settings))
{
    EmbeddingManagerConfig embeddingConfig;
    embeddingConfig.batchSize = m_settings.embeddingBatchSize;
    embeddingConfig.maxRetries = m_settings.embeddingMaxRetries;
    embeddingConfig.retryBackoffMs = m_settings.embeddingRetryBackoffMs;
    m_embeddings = std::make_shared<EmbeddingManager>(createEmbeddingProvider(m_settings),
                                                      embeddingConfig);

    SessionIndexManager::Dependencies deps;
    deps.extractor = std::make_shared<PdfExtractor>();
    deps.embeddings = m_embeddings;
    m_sessions = std::make_shared<SessionIndexManager>(m_settings, std::move(deps));
    m_queryEngine = std::make_unique<HybridQueryEngine>(m_sessions, m_embeddings);

    m_sessions->setCompletionCallback([this](const QString& sessionId,
                                             const IndexingSnapshot& snapshot) {
        const QJsonObject params = snapshotToJson(sessionId, snapshot);
        QMetaObject::invokeMethod(this, [this, params]() {
            sendNotification(QStringLiteral("indexing_finished"), params);
        }, Qt::QueuedConnection);
    });

    registerMethod(QStringLiteral("upload"), [this](uint64_t id, const QJsonObject& params) {
        return handleUpload(id, params);
    });
    registerMethod(QStringLiteral("index_status"), [this](uint64_t id, const QJsonObject& params) {
        return handleIndexStatus(id, params);
    });
    registerMethod(QStringLiteral("query"), [this](uint64_t id, const QJsonObject& params) {
        return handleQuery(id, params);
    });
    registerMethod(QStringLiteral("teardown"), [this](uint64_t id, const QJsonObject& params) {
        return handleTeardown(id, params);
    });

    m_sweepTimer.setInterval(m_settings.sweepIntervalSeconds * 1000);
    connect(&m_sweepTimer, &QTimer::timeout, this, &RetrievalService::sweepIdleSessions);
    m_sweepTimer.start();

    LOG_INFO(pcIpc, "RetrievalService created (embedding=%s, dims=%d, vector=%s)",
             qUtf8Printable(m_embeddings->providerName()), m_embeddings->dimensions(),
             qUtf8Printable(m_settings.vectorBackend));
}

RetrievalService::~RetrievalService()
{
    m_sweepTimer.stop();
    m_sessions->setCompletionCallback({});
}

QJsonObject RetrievalService::statusFields() const
{
    QJsonObject fields;
    fields[QStringLiteral("sessions")] = m_sessions->sessionCount();
    fields[QStringLiteral("embedding_provider")] = m_embeddings->providerName();
    fields[QStringLiteral("embedding_available")] = m_embeddings->isAvailable();
    fields[QStringLiteral("vector_backend")] = m_settings.vectorBackend;
    return fields;
}

QJsonObject RetrievalService::handleUpload(uint64_t id, const QJsonObject& params)
{
    const QString sessionId = params.value(QStringLiteral("session_id")).toString();
    const QJsonArray filesJson = params.value(QStringLiteral("files")).toArray();

    std::vector<UploadFile> files;
    files.reserve(static_cast<size_t>(filesJson.size()));
    for (const QJsonValue& value : filesJson) {
        const QJsonObject fileJson = value.toObject();
        UploadFile file;
        file.filename = fileJson.value(QStringLiteral("name")).toString();

        if (fileJson.contains(QStringLiteral("data"))) {
            const QByteArray encoded = fileJson.value(QStringLiteral("data")).toString().toLatin1();
            auto decoded = QByteArray::fromBase64Encoding(
                encoded, QByteArray::Base64Encoding | QByteArray::AbortOnBase64DecodingErrors);
            if (!decoded) {
                return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                             QStringLiteral("'data' for %1 is not valid base64")
                                                 .arg(file.filename));
            }
            file.bytes = std::move(decoded.decoded);
        } else {
            const QString path = fileJson.value(QStringLiteral("path")).toString();
            if (path.isEmpty()) {
                return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                             QStringLiteral("File entry needs 'data' or 'path'"));
            }
            QFileInfo info(path);
            if (!info.isFile()) {
                return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                             QStringLiteral("File not found: %1").arg(path));
            }
            if (info.size() > m_settings.maxFileBytes) {
                return IpcMessage::makeRetrievalError(
                    id, RetrievalError{RetrievalErrorCode::UploadLimitExceeded,
                                       QStringLiteral("%1 is %2 bytes, the per-file limit is %3 bytes")
                                           .arg(path)
                                           .arg(info.size())
                                           .arg(m_settings.maxFileBytes)});
            }
            QFile handle(path);
            if (!handle.open(QIODevice::ReadOnly)) {
                return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                             QStringLiteral("Cannot read %1: %2")
                                                 .arg(path, handle.errorString()));
            }
            file.bytes = handle.readAll();
            if (file.filename.isEmpty()) {
                file.filename = info.fileName();
            }
        }
        files.push_back(std::move(file));
    }

    const UploadResult result = m_sessions->upload(sessionId, std::move(files));
    if (!result.ok()) {
        return IpcMessage::makeRetrievalError(id, *result.error);
    }
    return IpcMessage::makeResponse(id, snapshotToJson(result.sessionId, result.snapshot));
}

QJsonObject RetrievalService::handleIndexStatus(uint64_t id, const QJsonObject& params)
{
    const QString sessionId = params.value(QStringLiteral("session_id")).toString();
    const StatusResult status = m_sessions->status(sessionId);
    if (!status.ok()) {
        return IpcMessage::makeRetrievalError(id, *status.error);
    }

    QJsonObject result = snapshotToJson(sessionId, status.snapshot);
    if (params.value(QStringLiteral("include_documents")).toBool()) {
        QJsonArray documents;
        if (auto records = m_sessions->documents(sessionId)) {
            for (const DocumentRecord& record : *records) {
                documents.append(documentToJson(record));
            }
        }
        result[QStringLiteral("documents")] = documents;
    }
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RetrievalService::handleQuery(uint64_t id, const QJsonObject& params)
{
    QueryRequest request;
    request.sessionId = params.value(QStringLiteral("session_id")).toString();
    request.text = params.value(QStringLiteral("query")).toString();
    if (params.contains(QStringLiteral("max_results"))) {
        request.maxResults = params.value(QStringLiteral("max_results")).toInt();
    }

    const QueryResponse response = m_queryEngine->query(request);
    if (!response.ok()) {
        return IpcMessage::makeRetrievalError(id, *response.error);
    }

    QJsonArray hits;
    for (const QueryHit& hit : response.hits) {
        hits.append(hitToJson(hit));
    }

    QJsonObject result;
    result[QStringLiteral("session_id")] = request.sessionId;
    result[QStringLiteral("results")] = hits;
    result[QStringLiteral("vector_candidates")] = response.vectorCandidates;
    result[QStringLiteral("keyword_candidates")] = response.keywordCandidates;
    result[QStringLiteral("duration_ms")] = response.durationMs;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RetrievalService::handleTeardown(uint64_t id, const QJsonObject& params)
{
    const QString sessionId = params.value(QStringLiteral("session_id")).toString();
    if (const std::optional<RetrievalError> error = m_sessions->teardown(sessionId)) {
        return IpcMessage::makeRetrievalError(id, *error);
    }

    QJsonObject result;
    result[QStringLiteral("session_id")] = sessionId;
    result[QStringLiteral("removed")] = true;
    return IpcMessage::makeResponse(id, result);
}

void RetrievalService::sweepIdleSessions()
{
    const int removed = m_sessions->sweepIdleSessions();
    if (removed > 0) {
        QJsonObject params;
        params[QStringLiteral("removed")] = removed;
        params[QStringLiteral("remaining")] = m_sessions->sessionCount();
        sendNotification(QStringLiteral("sessions_expired"), params);
    }
}

} // namespace pc
