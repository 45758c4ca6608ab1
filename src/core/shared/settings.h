#pragma once

#include <QString>
#include <cstdint>

namespace pc {

struct RetrievalSettings {
    // Upload limits
    int64_t maxFileBytes = 50LL * 1024 * 1024;       // 50 MB
    int64_t maxSessionBytes = 100LL * 1024 * 1024;   // 100 MB
    int maxFilesPerSession = 10;

    // Extraction
    int maxPages = 500;
    double minCharsPerSquareInch = 0.1;

    // Chunking
    int chunkWindowTokens = 500;
    int chunkMinTokens = 400;
    int chunkMaxTokens = 600;
    double chunkOverlap = 0.15;

    // Embedding
    QString embeddingProvider = QStringLiteral("hashing");   // "hashing" | "onnx"
    int embeddingDimensions = 384;
    int embeddingBatchSize = 32;
    int embeddingMaxRetries = 3;
    int embeddingRetryBackoffMs = 50;
    QString modelDir;

    // Vector index
    QString vectorBackend = QStringLiteral("hnsw");          // "hnsw" | "flat"

    // Query
    int vectorCandidates = 20;
    int keywordCandidates = 20;
    int maxResults = 8;
    double vectorWeight = 0.4;
    double keywordWeight = 0.6;

    // Session lifecycle
    int sessionTtlSeconds = 3600;
    int sweepIntervalSeconds = 60;
};

} // namespace pc
