#pragma once

#include <QString>

namespace folio {

// Error taxonomy shared by the recorder, attribution batch, selector and
// service layer. Public operations report failures through an optional
// ErrorInfo* out-parameter and a bool / std::optional return.
enum class ErrorKind {
    None,
    Validation,
    NotFound,
    NumericInstability,
    AttributionConflict,
    Storage,
};

QString errorKindToString(ErrorKind kind);

struct ErrorInfo {
    ErrorKind kind = ErrorKind::None;
    QString code;     // stable snake_case identifier, e.g. "rating_out_of_range"
    QString message;

    bool isError() const { return kind != ErrorKind::None; }
    void clear();
};

// Writes into errorOut when non-null; returns false so call sites can
// `return fail(...)`.
bool fail(ErrorInfo* errorOut, ErrorKind kind, const QString& code,
          const QString& message = QString());

} // namespace folio
