#pragma once

#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>
#include <QVector>

namespace folio {

struct ContextSimilarity {
    QString context1;
    QString context2;
    double similarity = 0.0;
    QString explanation;
};

// ContextEncoder -- maps situational attributes onto the fixed 44-D feature
// vector consumed by the bandit.
//
// encode() is pure: it never reads the wall clock, so identical input always
// produces a bit-identical vector. Unknown or missing categorical values land
// in the reserved unknown bucket (an all-zero block) and are counted in the
// last slot of the user block.
class ContextEncoder {
public:
    static ContextVector encode(const ContextAttributes& context, bool hasUserAccount);

    // Rejects malformed input (over-long values, control characters).
    static bool validate(const ContextAttributes& context, ErrorInfo* errorOut = nullptr);

    // "mood|situation|goal|timeOfDay", with "none" for missing parts.
    static QString signature(const ContextAttributes& context);

    static double cosine(const ContextVector& a, const ContextVector& b);
    static ContextSimilarity contextSimilarity(const ContextAttributes& a,
                                               const ContextAttributes& b);

    static QString timeOfDayForHour(int hour);
    static ContextAttributes smartDefaults(const QString& timeOfDay, bool weekend);

    // Raw (unnormalised) categorical blocks; empty vector when unknown.
    static QVector<double> moodBlock(const QString& mood);
    static QVector<double> situationBlock(const QString& situation);
    static QVector<double> goalBlock(const QString& goal);

    static QStringList knownMoods();
    static QStringList knownSituations();
    static QStringList knownGoals();
};

} // namespace folio
