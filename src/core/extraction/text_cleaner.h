#pragma once

#include <QString>

namespace pc {

// TextCleaner — normalizes raw page text before chunking and keyword indexing.
//
// Operations performed:
// 1. Strip ASCII control characters (0x00-0x08, 0x0B, 0x0C, 0x0E-0x1F, 0x7F) except tab and newline
// 2. Normalize line endings: \r\n and \r to \n; form feed ends a line
// 3. Map no-break space and soft hyphen (U+00A0, U+00AD) to space / nothing
// 4. Rejoin words hyphenated across a line break ("infor-\nmation" -> "information")
// 5. Collapse runs of 3+ newlines to 2 newlines (preserve paragraph breaks)
// 6. Collapse runs of 2+ spaces/tabs to single space, drop trailing spaces on a line
// 7. Trim leading/trailing whitespace
class TextCleaner {
public:
    static QString clean(const QString& raw);
};

} // namespace pc
