#include "core/extraction/text_cleaner.h"

namespace pc {

namespace {

bool isHorizontalSpace(QChar ch)
{
    return ch == QLatin1Char(' ') || ch == QLatin1Char('\t');
}

} // namespace

QString TextCleaner::clean(const QString& raw)
{
    if (raw.isEmpty()) {
        return raw;
    }

    QString result;
    result.reserve(raw.size());

    // Pass 1: strip control chars, normalize line endings and special spaces
    for (int i = 0; i < raw.size(); ++i) {
        const QChar ch = raw[i];
        const ushort code = ch.unicode();

        if (code == '\r') {
            if (i + 1 < raw.size() && raw[i + 1] == QLatin1Char('\n')) {
                ++i;
            }
            result.append(QLatin1Char('\n'));
            continue;
        }
        if (code == 0x0C) {
            result.append(QLatin1Char('\n'));
            continue;
        }
        if ((code < 0x20 && code != 0x09 && code != 0x0A) || code == 0x7F) {
            continue;
        }
        if (code == 0x00AD) {
            continue;
        }
        if (code == 0x00A0) {
            result.append(QLatin1Char(' '));
            continue;
        }

        result.append(ch);
    }

    // Pass 2: rejoin hyphenated line breaks, collapse whitespace runs
    QString collapsed;
    collapsed.reserve(result.size());

    int i = 0;
    while (i < result.size()) {
        const QChar ch = result[i];

        if (ch == QLatin1Char('-') && i > 0 && result[i - 1].isLetter()
            && i + 1 < result.size() && result[i + 1] == QLatin1Char('\n')
            && i + 2 < result.size() && result[i + 2].isLower()) {
            i += 2;
            continue;
        }

        if (ch == QLatin1Char('\n')) {
            while (!collapsed.isEmpty() && collapsed.back() == QLatin1Char(' ')) {
                collapsed.chop(1);
            }
            int count = 0;
            while (i < result.size()
                   && (result[i] == QLatin1Char('\n') || isHorizontalSpace(result[i]))) {
                if (result[i] == QLatin1Char('\n')) {
                    ++count;
                }
                ++i;
            }
            const int emitCount = qMin(count, 2);
            for (int j = 0; j < emitCount; ++j) {
                collapsed.append(QLatin1Char('\n'));
            }
        } else if (isHorizontalSpace(ch)) {
            while (i < result.size() && isHorizontalSpace(result[i])) {
                ++i;
            }
            collapsed.append(QLatin1Char(' '));
        } else {
            collapsed.append(ch);
            ++i;
        }
    }

    return collapsed.trimmed();
}

} // namespace pc
