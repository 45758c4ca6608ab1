#pragma once

#include "core/extraction/extractor.h"
#include "core/shared/chunk.h"

#include <QString>
#include <vector>

namespace pc {

// Configuration for the Chunker.
// Defined outside the class to avoid the "default member initializer needed
// within enclosing class" issue in C++.
struct ChunkerConfig {
    int windowTokens = 500;
    int minTokens = 400;
    int maxTokens = 600;
    double overlap = 0.15;
};

// Document text assembled from page texts, with the offset at which each
// page starts.
struct JoinedDocument {
    struct PageBreak {
        int offset = 0;
        int pageNumber = 1;
    };

    QString text;
    std::vector<PageBreak> pageBreaks;

    // Page containing the character at offset.
    int pageAt(int offset) const;
};

// Chunker — splits a document's page texts into overlapping token windows.
//
// Pages are joined with a blank line; scanned pages contribute nothing.
// A window of windowTokens tokens advances by
// windowTokens - round(windowTokens * overlap) tokens, so consecutive chunks
// share that many tokens. Only the final chunk may be shorter than the window.
// Each chunk receives a stable ID via computeChunkId(documentId, chunkIndex).
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    const Config& config() const { return m_config; }

    // Tokens shared by two consecutive chunks.
    int overlapTokens() const;
    int strideTokens() const;

    static JoinedDocument joinPages(const std::vector<PageText>& pages);

    // Returns an empty vector if the document has no tokens.
    std::vector<Chunk> chunkDocument(const QString& documentId, int documentOrder,
                                     const std::vector<PageText>& pages) const;

private:
    Config m_config;
};

} // namespace pc
