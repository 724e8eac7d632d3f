#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QVector>

namespace folio {

struct StrategyInput {
    ContextAttributes context;
    ContextVector contextVector;
    Identity identity;
    QVector<BookCandidate> candidates;
    int limit = 10;
};

// One selectable arm. rank() orders the candidates for the given context,
// returning at most input.limit books sorted by score descending (ties by
// ascending bookId) with 1-based ranks. Implementations must be safe to call
// from several threads at once.
class RecommendationStrategy {
public:
    virtual ~RecommendationStrategy() = default;

    virtual QString armId() const = 0;
    virtual QVector<RankedBook> rank(const StrategyInput& input) const = 0;
};

} // namespace folio
