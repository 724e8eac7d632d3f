#include "core/similarity/text_tokenizer.h"

namespace folio {

namespace {

bool isWordCharacter(QChar ch)
{
    return ch.isLetterOrNumber() || ch == QLatin1Char('_');
}

} // namespace

QStringList TextTokenizer::tokenize(const QString& text)
{
    QStringList tokens;
    QString current;
    current.reserve(32);

    auto flush = [&]() {
        if (current.size() >= kMinTokenLength) {
            tokens.append(current);
        }
        current.clear();
    };

    const QString lowered = text.toLower();
    for (const QChar ch : lowered) {
        if (isWordCharacter(ch)) {
            current.append(ch);
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

} // namespace folio
