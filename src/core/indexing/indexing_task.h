#pragma once

#include "core/extraction/extractor.h"
#include "core/indexing/chunker.h"
#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QString>

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace pc {

class EmbeddingManager;
class SessionIndexes;

// A validated upload waiting to be indexed. The bytes are dropped as soon as
// extraction has run.
struct PendingDocument {
    DocumentRecord record;
    QByteArray bytes;
};

struct IndexingTaskResult {
    bool cancelled = false;
    int filesIndexed = 0;
    int chunksInserted = 0;
    std::optional<RetrievalError> error;
    std::optional<QString> errorDocument;   // filename of the first failure
};

// IndexingTask — one session's background build over a batch of documents.
//
// For each document: extract, chunk, embed in provider-sized batches and
// insert every chunk into both indexes. An extraction failure is recorded on
// that document and the batch moves on; embedding unavailability stops the
// batch. Cancellation is checked before every insert.
//
// Progress and the final result go through the callbacks, on the task's own
// thread, before completion() becomes ready.
class IndexingTask {
public:
    struct Dependencies {
        std::shared_ptr<DocumentExtractor> extractor;
        std::shared_ptr<EmbeddingManager> embeddings;
        std::shared_ptr<SessionIndexes> indexes;
        ChunkerConfig chunker;
        ExtractionLimits limits;
    };

    struct Callbacks {
        std::function<void()> started;
        std::function<void(const DocumentRecord&, bool indexed)> documentFinished;
        std::function<void(const IndexingTaskResult&)> finished;
    };

    IndexingTask(QString sessionId, std::vector<PendingDocument> documents,
                 Dependencies dependencies, Callbacks callbacks);
    ~IndexingTask();

    IndexingTask(const IndexingTask&) = delete;
    IndexingTask& operator=(const IndexingTask&) = delete;

    void start();
    void cancel();
    bool isCancelled() const;
    bool isFinished() const;

    // Blocks until the worker thread has exited. Safe to call repeatedly.
    void join();

    std::shared_future<IndexingTaskResult> completion() const { return m_completion; }
    const QString& sessionId() const { return m_sessionId; }

private:
    void run();
    IndexingTaskResult indexAll();

    // Returns false when the batch must stop.
    bool indexDocument(PendingDocument& document, IndexingTaskResult& result);
    void reportDocument(const DocumentRecord& record, bool indexed);

    QString m_sessionId;
    std::vector<PendingDocument> m_documents;
    Dependencies m_deps;
    Callbacks m_callbacks;

    std::atomic<bool> m_cancelled{false};
    std::promise<IndexingTaskResult> m_promise;
    std::shared_future<IndexingTaskResult> m_completion;
    std::thread m_thread;
};

} // namespace pc
