#include "core/shared/errors.h"

namespace folio {

QString errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:               return QStringLiteral("none");
    case ErrorKind::Validation:         return QStringLiteral("validation");
    case ErrorKind::NotFound:           return QStringLiteral("not_found");
    case ErrorKind::NumericInstability: return QStringLiteral("numeric_instability");
    case ErrorKind::AttributionConflict: return QStringLiteral("attribution_conflict");
    case ErrorKind::Storage:            return QStringLiteral("storage");
    }
    return QStringLiteral("none");
}

void ErrorInfo::clear()
{
    kind = ErrorKind::None;
    code.clear();
    message.clear();
}

bool fail(ErrorInfo* errorOut, ErrorKind kind, const QString& code, const QString& message)
{
    if (errorOut) {
        errorOut->kind = kind;
        errorOut->code = code;
        errorOut->message = message.isEmpty() ? code : message;
    }
    return false;
}

} // namespace folio
