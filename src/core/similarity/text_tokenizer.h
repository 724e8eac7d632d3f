#pragma once

#include <QString>
#include <QStringList>

namespace folio {

class TextTokenizer {
public:
    // Lower-cases, turns punctuation into separators and keeps tokens longer
    // than two characters, in document order (duplicates preserved).
    static QStringList tokenize(const QString& text);

    static constexpr int kMinTokenLength = 3;
};

} // namespace folio
