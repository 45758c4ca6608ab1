#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(pcCore)
Q_DECLARE_LOGGING_CATEGORY(pcIndex)
Q_DECLARE_LOGGING_CATEGORY(pcExtraction)
Q_DECLARE_LOGGING_CATEGORY(pcEmbedding)
Q_DECLARE_LOGGING_CATEGORY(pcRetrieval)
Q_DECLARE_LOGGING_CATEGORY(pcIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
