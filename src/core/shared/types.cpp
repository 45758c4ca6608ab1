#include "core/shared/types.h"

namespace pc {

QString indexingStatusToString(IndexingStatus status)
{
    switch (status) {
    case IndexingStatus::Pending:  return QStringLiteral("pending");
    case IndexingStatus::Indexing: return QStringLiteral("indexing");
    case IndexingStatus::Done:     return QStringLiteral("done");
    case IndexingStatus::Error:    return QStringLiteral("error");
    }
    return QStringLiteral("pending");
}

IndexingStatus indexingStatusFromString(const QString& str)
{
    if (str == QLatin1String("indexing")) return IndexingStatus::Indexing;
    if (str == QLatin1String("done"))     return IndexingStatus::Done;
    if (str == QLatin1String("error"))    return IndexingStatus::Error;
    return IndexingStatus::Pending;
}

QString extractionOutcomeToString(ExtractionOutcome outcome)
{
    switch (outcome) {
    case ExtractionOutcome::Pending: return QStringLiteral("pending");
    case ExtractionOutcome::Ok:      return QStringLiteral("ok");
    case ExtractionOutcome::Scanned: return QStringLiteral("scanned");
    case ExtractionOutcome::Failed:  return QStringLiteral("failed");
    }
    return QStringLiteral("pending");
}

} // namespace pc
