#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(pcCore, "pdfchat.core")
Q_LOGGING_CATEGORY(pcIndex, "pdfchat.index")
Q_LOGGING_CATEGORY(pcExtraction, "pdfchat.extraction")
Q_LOGGING_CATEGORY(pcEmbedding, "pdfchat.embedding")
Q_LOGGING_CATEGORY(pcRetrieval, "pdfchat.retrieval")
Q_LOGGING_CATEGORY(pcIpc, "pdfchat.ipc")
