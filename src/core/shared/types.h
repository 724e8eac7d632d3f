#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <cstdint>
#include <optional>

namespace folio {

// Feature layout of the context vector (mood | situation | goal | temporal | user).
constexpr int kMoodDim = 8;
constexpr int kSituationDim = 8;
constexpr int kGoalDim = 8;
constexpr int kTemporalDim = 12;
constexpr int kUserDim = 8;
constexpr int kContextDim = kMoodDim + kSituationDim + kGoalDim + kTemporalDim + kUserDim;

// Model scope used when no user id is known.
constexpr const char* kAnonymousScope = "anonymous";

using ContextVector = QVector<double>;

// Who performed or was shown something. At least one of the two ids is set.
struct Identity {
    QString userId;
    QString sessionId;

    bool isValid() const { return !userId.isEmpty() || !sessionId.isEmpty(); }
    // Arm models are kept per user; anonymous sessions share one scope.
    QString modelScope() const;
};

enum class ActionType {
    Click,
    Save,
    Unsave,
    Rate,
};

QString actionTypeToString(ActionType type);
std::optional<ActionType> actionTypeFromString(const QString& str);

struct UserFeatures {
    double fictionPreference = 0.5;
    double nonfictionPreference = 0.5;
    double mixedPreference = 0.5;
    double engagementLevel = 0.5;
    double diversityScore = 0.5;
};

// Raw situational input from the caller.
struct ContextAttributes {
    QString mood;
    QString situation;
    QString goal;
    QString timeOfDay;        // morning | afternoon | evening | night
    QDateTime referenceTime;  // optional; drives calendar features when valid
    std::optional<UserFeatures> userFeatures;
};

struct ImpressionRecord {
    int64_t id = 0;
    Identity identity;
    QString bookId;
    ContextVector contextVector;
    QString armId;
    int rank = 0;
    double score = 0.0;
    QJsonObject metadata;
    qint64 createdAtMs = 0;
    std::optional<double> reward;
    double saveCredit = 0.0;
    std::optional<qint64> attributedAtMs;
};

struct ActionRecord {
    int64_t id = 0;
    Identity identity;
    QString bookId;
    ActionType actionType = ActionType::Click;
    std::optional<double> actionValue;
    qint64 createdAtMs = 0;
    std::optional<int64_t> attributedImpressionId;
    std::optional<double> attributedReward;
};

// One attributed reward waiting to be applied to an arm model.
struct RewardEvent {
    int64_t id = 0;
    int64_t impressionId = 0;
    int64_t actionId = 0;
    QString scope;
    QString armId;
    double reward = 0.0;
    ContextVector contextVector;
};

struct BookCandidate {
    QString bookId;
    QString title;
    QString author;
    QString text;
    QStringList tags;      // moods, themes, best-for situations
    double popularity = 0.0;
};

struct RankedBook {
    QString bookId;
    double score = 0.0;
    int rank = 0;
    int64_t impressionId = 0;
};

struct CatalogBook {
    QString bookId;
    QString title;
    QString author;
    QString text;
    qint64 updatedAtMs = 0;
};

// Text used to index a catalog book: title, author and descriptive text.
QString indexableText(const CatalogBook& book);

} // namespace folio
