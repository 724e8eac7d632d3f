#pragma once

#include <QString>
#include <QStringList>

namespace folio {

struct Settings {
    // Database
    QString dbPath;

    // LinUCB
    double alpha = 0.1;                    // exploration coefficient
    int minInteractionsForActive = 5;
    int maxCachedScopes = 256;             // scopes whose arm models stay in memory
    QStringList arms = {
        QStringLiteral("semantic_similarity"),
        QStringLiteral("contextual_mood"),
        QStringLiteral("trending_popular"),
        QStringLiteral("collaborative_filtering"),
        QStringLiteral("personalized_mix"),
        QStringLiteral("contextual_basic"),
    };

    // Attribution
    double attributionWindowHours = 168.0; // last touch within 7 days
    double decayLambdaPerHour = 1.0 / 48.0;
    double batchWindowHours = 168.0;       // how far back a batch looks for actions

    // Reward points
    double clickPoints = 1.0;
    double savePoints = 3.0;
    double unsavePoints = -3.0;

    // Statistics
    int minSamplesForBest = 5;
    double confidenceZ = 1.96;

    // Similarity / ranking
    double similarityThreshold = 0.05;
    int recommendationLimit = 10;
};

} // namespace folio
