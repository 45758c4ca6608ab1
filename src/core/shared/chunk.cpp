#include "core/shared/chunk.h"

#include <QByteArray>
#include <QCryptographicHash>

#include <cstring>

namespace pc {

QString computeChunkId(const QString& documentId, int chunkIndex)
{
    const QString seed = documentId + QStringLiteral("#") + QString::number(chunkIndex);
    const QByteArray hash = QCryptographicHash::hash(
        seed.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

QJsonObject chunkToJson(const Chunk& chunk)
{
    QJsonObject json;
    json.insert(QStringLiteral("chunk_id"), chunk.chunkId);
    json.insert(QStringLiteral("document_id"), chunk.documentId);
    json.insert(QStringLiteral("document_order"), chunk.documentOrder);
    json.insert(QStringLiteral("chunk_index"), chunk.chunkIndex);
    json.insert(QStringLiteral("page_start"), chunk.pageStart);
    json.insert(QStringLiteral("page_end"), chunk.pageEnd);
    json.insert(QStringLiteral("start_offset"), chunk.startOffset);
    json.insert(QStringLiteral("end_offset"), chunk.endOffset);
    json.insert(QStringLiteral("token_count"), chunk.tokenCount);
    json.insert(QStringLiteral("text"), chunk.text);

    // Raw little-endian float32 payload, base64 encoded.
    const QByteArray raw(reinterpret_cast<const char*>(chunk.embedding.data()),
                         static_cast<int>(chunk.embedding.size() * sizeof(float)));
    json.insert(QStringLiteral("embedding_dims"), static_cast<int>(chunk.embedding.size()));
    json.insert(QStringLiteral("embedding"), QString::fromLatin1(raw.toBase64()));
    return json;
}

std::optional<Chunk> chunkFromJson(const QJsonObject& json)
{
    const QString chunkId = json.value(QStringLiteral("chunk_id")).toString();
    const QString documentId = json.value(QStringLiteral("document_id")).toString();
    if (chunkId.isEmpty() || documentId.isEmpty()) {
        return std::nullopt;
    }

    Chunk chunk;
    chunk.chunkId = chunkId;
    chunk.documentId = documentId;
    chunk.documentOrder = json.value(QStringLiteral("document_order")).toInt();
    chunk.chunkIndex = json.value(QStringLiteral("chunk_index")).toInt();
    chunk.pageStart = json.value(QStringLiteral("page_start")).toInt(1);
    chunk.pageEnd = json.value(QStringLiteral("page_end")).toInt(chunk.pageStart);
    chunk.startOffset = json.value(QStringLiteral("start_offset")).toInt();
    chunk.endOffset = json.value(QStringLiteral("end_offset")).toInt();
    chunk.tokenCount = json.value(QStringLiteral("token_count")).toInt();
    chunk.text = json.value(QStringLiteral("text")).toString();

    if (chunk.endOffset < chunk.startOffset || chunk.pageEnd < chunk.pageStart) {
        return std::nullopt;
    }

    const int dims = json.value(QStringLiteral("embedding_dims")).toInt(0);
    const QByteArray raw = QByteArray::fromBase64(
        json.value(QStringLiteral("embedding")).toString().toLatin1());
    if (dims < 0 || raw.size() != static_cast<int>(dims * sizeof(float))) {
        return std::nullopt;
    }
    chunk.embedding.resize(static_cast<size_t>(dims));
    if (dims > 0) {
        std::memcpy(chunk.embedding.data(), raw.constData(), static_cast<size_t>(raw.size()));
    }
    return chunk;
}

} // namespace pc
