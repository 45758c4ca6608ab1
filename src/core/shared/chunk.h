#pragma once

#include <QJsonObject>
#include <QString>
#include <optional>
#include <vector>

namespace pc {

// A bounded span of one document's extracted text. Offsets index into the
// document text produced by the chunker (pages joined by a blank line).
struct Chunk {
    QString chunkId;
    QString documentId;
    int documentOrder = 0;
    int chunkIndex = 0;
    int pageStart = 1;
    int pageEnd = 1;
    int startOffset = 0;
    int endOffset = 0;
    int tokenCount = 0;
    QString text;
    std::vector<float> embedding;
};

// Compute stable chunk ID: SHA-256 of "documentId#chunkIndex"
QString computeChunkId(const QString& documentId, int chunkIndex);

// JSON record form, provenance and embedding included.
QJsonObject chunkToJson(const Chunk& chunk);
std::optional<Chunk> chunkFromJson(const QJsonObject& json);

} // namespace pc
