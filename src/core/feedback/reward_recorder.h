#pragma once

#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>

#include <cstdint>
#include <optional>

namespace folio {

class RewardStore;

// RewardRecorder -- validated, durable writes of impressions and actions.
//
// Recording never touches arm models; learning happens later in the
// attribution batch. Invalid input is rejected with a Validation error and
// nothing is written.
class RewardRecorder {
public:
    explicit RewardRecorder(RewardStore& store);

    std::optional<int64_t> recordImpression(const Identity& identity,
                                            const QString& bookId,
                                            const ContextVector& contextVector,
                                            const QString& armId,
                                            int rank,
                                            double score,
                                            const QJsonObject& metadata,
                                            ErrorInfo* errorOut = nullptr,
                                            qint64 createdAtMs = 0);

    // One page of impressions, written all-or-nothing.
    std::optional<QVector<int64_t>> recordImpressions(QVector<ImpressionRecord> impressions,
                                                      ErrorInfo* errorOut = nullptr);

    // actionType is one of click / save / unsave / rate. Multiple actions on
    // the same book are all kept. An invalid timestamp means "now".
    std::optional<int64_t> recordAction(const Identity& identity,
                                        const QString& bookId,
                                        const QString& actionType,
                                        std::optional<double> actionValue,
                                        const QDateTime& timestamp,
                                        ErrorInfo* errorOut = nullptr);

    static bool validateImpression(const ImpressionRecord& impression, ErrorInfo* errorOut);
    static bool validateAction(const Identity& identity, const QString& bookId,
                               const QString& actionType, const std::optional<double>& actionValue,
                               ErrorInfo* errorOut);

private:
    RewardStore& m_store;
};

} // namespace folio
