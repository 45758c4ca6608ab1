#include "core/indexing/indexing_task.h"
#include "core/embedding/embedding_manager.h"
#include "core/session/session_indexes.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <chrono>

namespace pc {

IndexingTask::IndexingTask(QString sessionId, std::vector<PendingDocument> documents,
                           Dependencies dependencies, Callbacks callbacks)
    : m_sessionId(std::move(sessionId))
    , m_documents(std::move(documents))
    , m_deps(std::move(dependencies))
    , m_callbacks(std::move(callbacks))
    , m_completion(m_promise.get_future().share())
{
}

IndexingTask::~IndexingTask()
{
    cancel();
    if (m_thread.joinable()) {
        if (m_thread.get_id() == std::this_thread::get_id()) {
            m_thread.detach();
        } else {
            m_thread.join();
        }
    }
}

void IndexingTask::start()
{
    if (m_thread.joinable()) {
        return;
    }
    m_thread = std::thread([this]() { run(); });
}

void IndexingTask::cancel()
{
    m_cancelled.store(true);
}

bool IndexingTask::isCancelled() const
{
    return m_cancelled.load();
}

bool IndexingTask::isFinished() const
{
    return m_completion.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void IndexingTask::join()
{
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

// ── Worker ──────────────────────────────────────────────────

void IndexingTask::run()
{
    if (m_callbacks.started) {
        m_callbacks.started();
    }

    QElapsedTimer timer;
    timer.start();
    IndexingTaskResult result = indexAll();

    LOG_INFO(pcIndex, "Session %s build finished in %lld ms: %d file(s), %d chunk(s)%s",
             qUtf8Printable(m_sessionId), static_cast<long long>(timer.elapsed()),
             result.filesIndexed, result.chunksInserted,
             result.cancelled ? " (cancelled)" : "");

    if (m_callbacks.finished) {
        m_callbacks.finished(result);
    }
    m_promise.set_value(std::move(result));
}

IndexingTaskResult IndexingTask::indexAll()
{
    IndexingTaskResult result;
    for (PendingDocument& document : m_documents) {
        if (isCancelled()) {
            result.cancelled = true;
            break;
        }
        if (!indexDocument(document, result)) {
            break;
        }
    }
    m_documents.clear();
    return result;
}

bool IndexingTask::indexDocument(PendingDocument& document, IndexingTaskResult& result)
{
    DocumentRecord& record = document.record;

    const ExtractionResult extraction = m_deps.extractor->extract(document.bytes, m_deps.limits);
    document.bytes = QByteArray();

    record.pageCount = extraction.pageCount;
    record.scannedPageCount = extraction.scannedPageCount;

    if (const std::optional<RetrievalError> failure = extractionError(extraction, record.filename)) {
        record.outcome = extraction.status == ExtractionResult::Status::NoTextLayer
            ? ExtractionOutcome::Scanned
            : ExtractionOutcome::Failed;
        record.errorMessage = failure->message;
        LOG_WARN(pcExtraction, "Session %s: %s", qUtf8Printable(m_sessionId),
                 qUtf8Printable(failure->describe()));
        if (!result.error) {
            result.error = failure;
            result.errorDocument = record.filename;
        }
        reportDocument(record, false);
        return true;
    }

    const Chunker chunker(m_deps.chunker);
    std::vector<Chunk> chunks = chunker.chunkDocument(record.documentId, record.uploadOrder,
                                                      extraction.pages);

    const size_t batchSize = static_cast<size_t>(
        std::max(1, m_deps.embeddings->config().batchSize));
    for (size_t begin = 0; begin < chunks.size(); begin += batchSize) {
        if (isCancelled()) {
            result.cancelled = true;
            return false;
        }

        const size_t end = std::min(chunks.size(), begin + batchSize);
        std::vector<QString> texts;
        texts.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            texts.push_back(chunks[i].text);
        }

        EmbeddingBatchResult embedded = m_deps.embeddings->embedTexts(texts);
        if (!embedded.ok()) {
            record.outcome = ExtractionOutcome::Ok;
            record.errorMessage = embedded.errorMessage;
            if (!result.error) {
                result.error = RetrievalError{
                    RetrievalErrorCode::EmbeddingUnavailable,
                    QStringLiteral("%1: %2").arg(record.filename, embedded.errorMessage)};
                result.errorDocument = record.filename;
            }
            LOG_ERROR(pcEmbedding, "Session %s: embedding unavailable while indexing %s: %s",
                      qUtf8Printable(m_sessionId), qUtf8Printable(record.filename),
                      qUtf8Printable(embedded.errorMessage));
            reportDocument(record, false);
            return false;
        }

        for (size_t i = begin; i < end; ++i) {
            Chunk& chunk = chunks[i];
            chunk.embedding = std::move(embedded.vectors[i - begin]);
            switch (m_deps.indexes->insertChunk(std::move(chunk), m_cancelled)) {
            case SessionIndexes::InsertResult::Inserted:
                ++result.chunksInserted;
                ++record.chunkCount;
                break;
            case SessionIndexes::InsertResult::Duplicate:
                break;
            case SessionIndexes::InsertResult::Cancelled:
                result.cancelled = true;
                return false;
            case SessionIndexes::InsertResult::Rejected:
                record.errorMessage =
                    QStringLiteral("%1: embedding has the wrong dimension for this index")
                        .arg(record.filename);
                if (!result.error) {
                    result.error = RetrievalError{RetrievalErrorCode::EmbeddingUnavailable,
                                                  record.errorMessage};
                    result.errorDocument = record.filename;
                }
                reportDocument(record, false);
                return false;
            }
        }
    }

    record.outcome = ExtractionOutcome::Ok;
    ++result.filesIndexed;
    LOG_DEBUG(pcIndex, "Session %s: indexed %s (%d pages, %d chunks)",
              qUtf8Printable(m_sessionId), qUtf8Printable(record.filename),
              record.pageCount, record.chunkCount);
    reportDocument(record, true);
    return true;
}

void IndexingTask::reportDocument(const DocumentRecord& record, bool indexed)
{
    if (m_callbacks.documentFinished) {
        m_callbacks.documentFinished(record, indexed);
    }
}

} // namespace pc
