#include "core/indexing/chunker.h"
#include "core/indexing/text_tokenizer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace pc {

namespace {

const QString kPageSeparator = QStringLiteral("\n\n");

} // namespace

int JoinedDocument::pageAt(int offset) const
{
    int page = pageBreaks.empty() ? 1 : pageBreaks.front().pageNumber;
    for (const PageBreak& pageBreak : pageBreaks) {
        if (pageBreak.offset > offset) {
            break;
        }
        page = pageBreak.pageNumber;
    }
    return page;
}

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    // Sanity-check config bounds
    if (m_config.minTokens < 1) {
        m_config.minTokens = 1;
    }
    if (m_config.maxTokens < m_config.minTokens) {
        m_config.maxTokens = m_config.minTokens;
    }
    m_config.windowTokens = std::clamp(m_config.windowTokens,
                                       m_config.minTokens, m_config.maxTokens);
    m_config.overlap = std::clamp(m_config.overlap, 0.0, 0.5);
}

// ── Public API ──────────────────────────────────────────────

int Chunker::overlapTokens() const
{
    return static_cast<int>(std::lround(m_config.windowTokens * m_config.overlap));
}

int Chunker::strideTokens() const
{
    return std::max(1, m_config.windowTokens - overlapTokens());
}

JoinedDocument Chunker::joinPages(const std::vector<PageText>& pages)
{
    JoinedDocument doc;
    for (const PageText& page : pages) {
        if (page.scanned || page.text.isEmpty()) {
            continue;
        }
        if (!doc.text.isEmpty()) {
            doc.text += kPageSeparator;
        }
        doc.pageBreaks.push_back({static_cast<int>(doc.text.size()), page.pageNumber});
        doc.text += page.text;
    }
    return doc;
}

std::vector<Chunk> Chunker::chunkDocument(const QString& documentId, int documentOrder,
                                          const std::vector<PageText>& pages) const
{
    std::vector<Chunk> chunks;

    const JoinedDocument doc = joinPages(pages);
    const std::vector<TextToken> tokens = TextTokenizer::tokenize(doc.text);
    if (tokens.empty()) {
        return chunks;
    }

    const int tokenTotal = static_cast<int>(tokens.size());
    const int window = m_config.windowTokens;
    const int stride = strideTokens();

    int start = 0;
    int chunkIndex = 0;
    while (true) {
        const int end = std::min(start + window, tokenTotal);
        const TextToken& first = tokens[static_cast<size_t>(start)];
        const TextToken& last = tokens[static_cast<size_t>(end - 1)];

        Chunk c;
        c.chunkId = computeChunkId(documentId, chunkIndex);
        c.documentId = documentId;
        c.documentOrder = documentOrder;
        c.chunkIndex = chunkIndex;
        c.startOffset = first.start;
        c.endOffset = last.end;
        c.pageStart = doc.pageAt(first.start);
        c.pageEnd = doc.pageAt(last.start);
        c.tokenCount = end - start;
        c.text = doc.text.mid(c.startOffset, c.endOffset - c.startOffset);
        chunks.push_back(std::move(c));

        if (end == tokenTotal) {
            break;
        }
        start += stride;
        ++chunkIndex;
    }

    LOG_DEBUG(pcIndex, "Chunked %s: %d chunks from %d tokens",
              qUtf8Printable(documentId),
              static_cast<int>(chunks.size()),
              tokenTotal);

    return chunks;
}

} // namespace pc
