#include "core/indexing/text_tokenizer.h"

namespace pc {

namespace {

// Code point at `i` and its width in UTF-16 units. An unpaired surrogate is
// returned as itself and classifies as neither letter nor mark.
char32_t codePointAt(const QString& text, int i, int* width)
{
    const QChar ch = text[i];
    if (ch.isHighSurrogate() && i + 1 < text.size() && text[i + 1].isLowSurrogate()) {
        *width = 2;
        return QChar::surrogateToUcs4(ch, text[i + 1]);
    }
    *width = 1;
    return ch.unicode();
}

bool startsToken(char32_t ucs4)
{
    return QChar::isLetterOrNumber(ucs4);
}

bool continuesToken(char32_t ucs4)
{
    return QChar::isLetterOrNumber(ucs4) || QChar::isMark(ucs4);
}

} // namespace

std::vector<TextToken> TextTokenizer::tokenize(const QString& text)
{
    std::vector<TextToken> tokens;
    const int n = static_cast<int>(text.size());

    int i = 0;
    int width = 1;
    while (i < n) {
        // A leading combining mark has nothing to attach to.
        if (!startsToken(codePointAt(text, i, &width))) {
            i += width;
            continue;
        }
        const int start = i;
        while (i < n && continuesToken(codePointAt(text, i, &width))) {
            i += width;
        }
        TextToken token;
        token.start = start;
        token.end = i;
        token.term = text.mid(start, i - start).toCaseFolded();
        tokens.push_back(std::move(token));
    }
    return tokens;
}

QStringList TextTokenizer::terms(const QString& text)
{
    QStringList out;
    const std::vector<TextToken> tokens = tokenize(text);
    out.reserve(static_cast<int>(tokens.size()));
    for (const TextToken& token : tokens) {
        out.append(token.term);
    }
    return out;
}

int TextTokenizer::countTokens(const QString& text)
{
    const int n = static_cast<int>(text.size());
    int count = 0;
    bool inToken = false;
    int width = 1;
    for (int i = 0; i < n; i += width) {
        const char32_t ucs4 = codePointAt(text, i, &width);
        if (inToken) {
            inToken = continuesToken(ucs4);
        } else if (startsToken(ucs4)) {
            inToken = true;
            ++count;
        }
    }
    return count;
}

} // namespace pc
