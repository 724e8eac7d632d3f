#include "core/feedback/reward_recorder.h"
#include "core/store/reward_store.h"
#include "core/shared/logging.h"

#include <cmath>

namespace folio {

namespace {

constexpr int kMaxIdLength = 256;
constexpr double kMinRating = 1.0;
constexpr double kMaxRating = 5.0;

bool validateIdentity(const Identity& identity, ErrorInfo* errorOut)
{
    if (!identity.isValid()) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("identity_required"),
                    QStringLiteral("A user id or session id is required"));
    }
    if (identity.userId.size() > kMaxIdLength || identity.sessionId.size() > kMaxIdLength) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("identity_too_long"));
    }
    return true;
}

bool validateBookId(const QString& bookId, ErrorInfo* errorOut)
{
    if (bookId.trimmed().isEmpty()) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("book_id_required"));
    }
    if (bookId.size() > kMaxIdLength) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("book_id_too_long"));
    }
    return true;
}

} // namespace

RewardRecorder::RewardRecorder(RewardStore& store)
    : m_store(store)
{
}

bool RewardRecorder::validateImpression(const ImpressionRecord& impression, ErrorInfo* errorOut)
{
    if (!validateIdentity(impression.identity, errorOut)
        || !validateBookId(impression.bookId, errorOut)) {
        return false;
    }
    if (impression.armId.isEmpty()) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("arm_id_required"));
    }
    if (impression.contextVector.size() != kContextDim) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("context_dimension_mismatch"),
                    QStringLiteral("Context snapshot must have %1 features").arg(kContextDim));
    }
    if (impression.rank < 0 || !std::isfinite(impression.score)) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("invalid_rank_or_score"));
    }
    return true;
}

bool RewardRecorder::validateAction(const Identity& identity, const QString& bookId,
                                    const QString& actionType,
                                    const std::optional<double>& actionValue,
                                    ErrorInfo* errorOut)
{
    if (!validateIdentity(identity, errorOut) || !validateBookId(bookId, errorOut)) {
        return false;
    }
    const std::optional<ActionType> type = actionTypeFromString(actionType);
    if (!type.has_value()) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("unknown_action_type"),
                    QStringLiteral("Unknown action type '%1'").arg(actionType));
    }
    if (*type == ActionType::Rate) {
        if (!actionValue.has_value() || !std::isfinite(*actionValue)
            || *actionValue < kMinRating || *actionValue > kMaxRating) {
            return fail(errorOut, ErrorKind::Validation, QStringLiteral("rating_out_of_range"),
                        QStringLiteral("Ratings must be between 1 and 5"));
        }
    } else if (actionValue.has_value() && !std::isfinite(*actionValue)) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("action_value_not_finite"));
    }
    return true;
}

std::optional<int64_t> RewardRecorder::recordImpression(const Identity& identity,
                                                        const QString& bookId,
                                                        const ContextVector& contextVector,
                                                        const QString& armId,
                                                        int rank,
                                                        double score,
                                                        const QJsonObject& metadata,
                                                        ErrorInfo* errorOut,
                                                        qint64 createdAtMs)
{
    ImpressionRecord impression;
    impression.identity = identity;
    impression.bookId = bookId;
    impression.contextVector = contextVector;
    impression.armId = armId;
    impression.rank = rank;
    impression.score = score;
    impression.metadata = metadata;
    impression.createdAtMs = createdAtMs > 0 ? createdAtMs : QDateTime::currentMSecsSinceEpoch();

    if (!validateImpression(impression, errorOut)) {
        return std::nullopt;
    }
    return m_store.insertImpression(impression, errorOut);
}

std::optional<QVector<int64_t>> RewardRecorder::recordImpressions(
    QVector<ImpressionRecord> impressions, ErrorInfo* errorOut)
{
    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    for (ImpressionRecord& impression : impressions) {
        if (impression.createdAtMs <= 0) {
            impression.createdAtMs = nowMs;
        }
        if (!validateImpression(impression, errorOut)) {
            return std::nullopt;
        }
    }
    return m_store.insertImpressions(impressions, errorOut);
}

std::optional<int64_t> RewardRecorder::recordAction(const Identity& identity,
                                                    const QString& bookId,
                                                    const QString& actionType,
                                                    std::optional<double> actionValue,
                                                    const QDateTime& timestamp,
                                                    ErrorInfo* errorOut)
{
    if (!validateAction(identity, bookId, actionType, actionValue, errorOut)) {
        LOG_DEBUG(folioReward, "Rejected %s action on %s: %s", qUtf8Printable(actionType),
                  qUtf8Printable(bookId), errorOut ? qUtf8Printable(errorOut->code) : "invalid");
        return std::nullopt;
    }

    ActionRecord action;
    action.identity = identity;
    action.bookId = bookId;
    action.actionType = *actionTypeFromString(actionType);
    action.actionValue = actionValue;
    action.createdAtMs = timestamp.isValid() ? timestamp.toMSecsSinceEpoch()
                                             : QDateTime::currentMSecsSinceEpoch();

    const std::optional<int64_t> id = m_store.insertAction(action, errorOut);
    if (id.has_value()) {
        LOG_DEBUG(folioReward, "Recorded %s on %s (action %lld)", qUtf8Printable(actionType),
                  qUtf8Printable(bookId), static_cast<long long>(*id));
    }
    return id;
}

} // namespace folio
