#include "core/shared/types.h"

namespace folio {

QString Identity::modelScope() const
{
    return userId.isEmpty() ? QString::fromLatin1(kAnonymousScope) : userId;
}

QString actionTypeToString(ActionType type)
{
    switch (type) {
    case ActionType::Click:  return QStringLiteral("click");
    case ActionType::Save:   return QStringLiteral("save");
    case ActionType::Unsave: return QStringLiteral("unsave");
    case ActionType::Rate:   return QStringLiteral("rate");
    }
    return QStringLiteral("click");
}

std::optional<ActionType> actionTypeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("click"))  return ActionType::Click;
    if (lower == QLatin1String("save"))   return ActionType::Save;
    if (lower == QLatin1String("unsave")) return ActionType::Unsave;
    if (lower == QLatin1String("rate"))   return ActionType::Rate;
    return std::nullopt;
}

QString indexableText(const CatalogBook& book)
{
    QStringList parts;
    for (const QString& part : {book.title, book.author, book.text}) {
        if (!part.trimmed().isEmpty()) {
            parts.append(part.trimmed());
        }
    }
    return parts.join(QLatin1Char(' '));
}

} // namespace folio
