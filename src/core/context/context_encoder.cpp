#include "core/context/context_encoder.h"
#include "core/shared/logging.h"

#include <QDate>
#include <QTime>

#include <cmath>

namespace folio {

namespace {

constexpr int kMaxValueLength = 64;
constexpr double kTwoPi = 6.283185307179586;

struct BlockMapping {
    const char* key;
    double values[8];
};

constexpr BlockMapping kMoodMappings[] = {
    {"motivated",     {1.0, 0.8, 0.6, 0.2, 0.0, 0.0, 0.0, 0.0}},
    {"curious",       {0.6, 1.0, 0.4, 0.8, 0.2, 0.0, 0.0, 0.0}},
    {"relaxed",       {0.0, 0.2, 0.0, 0.0, 1.0, 0.8, 0.6, 0.2}},
    {"adventurous",   {0.8, 0.6, 1.0, 0.4, 0.0, 0.0, 0.0, 0.0}},
    {"nostalgic",     {0.2, 0.4, 0.0, 0.6, 0.8, 0.6, 1.0, 0.4}},
    {"focused",       {0.8, 0.9, 0.4, 0.6, 0.0, 0.0, 0.0, 0.0}},
    {"excited",       {0.9, 0.7, 0.8, 0.3, 0.0, 0.0, 0.0, 0.0}},
    {"contemplative", {0.2, 0.8, 0.0, 0.4, 0.6, 0.4, 0.8, 0.6}},
    {"energetic",     {0.9, 0.6, 0.7, 0.4, 0.0, 0.0, 0.0, 0.0}},
    {"peaceful",      {0.0, 0.1, 0.0, 0.0, 0.9, 0.8, 0.7, 0.3}},
    {"inspired",      {0.7, 0.9, 0.5, 0.8, 0.2, 0.0, 0.0, 0.0}},
    {"thoughtful",    {0.3, 0.7, 0.2, 0.5, 0.4, 0.3, 0.6, 0.4}},
};

constexpr BlockMapping kSituationMappings[] = {
    {"commuting",   {1.0, 0.0, 0.6, 0.4, 0.0, 0.0, 0.0, 0.0}},
    {"before_bed",  {0.0, 0.0, 0.0, 0.0, 1.0, 0.8, 0.0, 0.0}},
    {"weekend",     {0.0, 1.0, 0.0, 0.0, 0.6, 0.4, 0.8, 0.0}},
    {"lunch_break", {0.6, 0.0, 0.8, 0.6, 0.2, 0.0, 0.0, 0.0}},
    {"traveling",   {0.8, 0.2, 0.4, 0.6, 0.0, 0.0, 0.0, 0.0}},
    {"studying",    {0.2, 0.0, 0.2, 0.0, 0.0, 0.0, 0.0, 1.0}},
    {"break_time",  {0.4, 0.6, 0.6, 0.4, 0.4, 0.2, 0.6, 0.0}},
    {"waiting",     {0.6, 0.2, 0.4, 0.8, 0.2, 0.0, 0.0, 0.0}},
    {"vacation",    {0.2, 0.8, 0.2, 0.2, 0.8, 0.6, 0.9, 0.0}},
    {"work_day",    {0.4, 0.0, 0.6, 0.2, 0.0, 0.0, 0.0, 0.6}},
    {"evening",     {0.0, 0.4, 0.0, 0.0, 0.6, 1.0, 0.4, 0.0}},
    {"morning",     {0.6, 0.2, 0.4, 0.8, 0.0, 0.0, 0.0, 0.4}},
};

constexpr BlockMapping kGoalMappings[] = {
    {"entertainment",    {1.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0}},
    {"learning",         {0.0, 1.0, 0.8, 0.6, 0.0, 0.0, 0.0, 0.0}},
    {"professional",     {0.0, 0.8, 1.0, 0.4, 0.0, 0.0, 0.0, 0.0}},
    {"inspiration",      {0.4, 0.6, 0.2, 1.0, 0.0, 0.0, 0.0, 0.0}},
    {"relaxation",       {0.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0}},
    {"perspective",      {0.2, 0.8, 0.4, 0.8, 0.0, 1.0, 0.0, 0.0}},
    {"skill_building",   {0.0, 0.9, 0.8, 0.4, 0.0, 0.0, 0.0, 0.0}},
    {"escape",           {0.8, 0.0, 0.0, 0.2, 0.8, 0.0, 0.0, 0.0}},
    {"self_improvement", {0.2, 0.7, 0.6, 0.8, 0.0, 0.4, 0.0, 0.0}},
    {"creativity",       {0.4, 0.5, 0.0, 0.9, 0.0, 0.6, 0.0, 0.0}},
    {"productivity",     {0.0, 0.6, 0.9, 0.6, 0.0, 0.0, 0.0, 0.0}},
    {"mindfulness",      {0.0, 0.2, 0.0, 0.4, 0.9, 0.8, 0.0, 0.0}},
};

const char* const kTimesOfDay[] = {"morning", "afternoon", "evening", "night"};
constexpr int kCanonicalHours[] = {9, 14, 19, 23};

QString normalizeKey(const QString& value)
{
    return value.trimmed().toLower();
}

template <size_t N>
const BlockMapping* findMapping(const BlockMapping (&table)[N], const QString& key)
{
    const QString normalized = normalizeKey(key);
    if (normalized.isEmpty()) {
        return nullptr;
    }
    for (const BlockMapping& mapping : table) {
        if (normalized == QLatin1String(mapping.key)) {
            return &mapping;
        }
    }
    return nullptr;
}

template <size_t N>
QVector<double> blockFor(const BlockMapping (&table)[N], const QString& key)
{
    const BlockMapping* mapping = findMapping(table, key);
    if (!mapping) {
        return {};
    }
    QVector<double> block;
    block.reserve(8);
    for (double v : mapping->values) {
        block.append(v);
    }
    return block;
}

template <size_t N>
QStringList keysOf(const BlockMapping (&table)[N])
{
    QStringList keys;
    for (const BlockMapping& mapping : table) {
        keys.append(QString::fromLatin1(mapping.key));
    }
    return keys;
}

// Index into kTimesOfDay, or -1 when unknown.
int timeOfDayIndex(const QString& timeOfDay)
{
    const QString normalized = normalizeKey(timeOfDay);
    for (int i = 0; i < 4; ++i) {
        if (normalized == QLatin1String(kTimesOfDay[i])) {
            return i;
        }
    }
    return -1;
}

// Writes the block at offset. Returns false when the value was unknown.
template <size_t N>
bool writeBlock(ContextVector& vec, int offset, const BlockMapping (&table)[N], const QString& key)
{
    const BlockMapping* mapping = findMapping(table, key);
    if (!mapping) {
        return false;
    }
    for (int i = 0; i < 8; ++i) {
        vec[offset + i] = mapping->values[i];
    }
    return true;
}

bool hasControlCharacter(const QString& value)
{
    for (const QChar ch : value) {
        if (ch.category() == QChar::Other_Control) {
            return true;
        }
    }
    return false;
}

} // namespace

ContextVector ContextEncoder::encode(const ContextAttributes& context, bool hasUserAccount)
{
    ContextVector vec(kContextDim, 0.0);
    int unknownCount = 0;

    constexpr int moodOffset = 0;
    constexpr int situationOffset = moodOffset + kMoodDim;
    constexpr int goalOffset = situationOffset + kSituationDim;
    constexpr int temporalOffset = goalOffset + kGoalDim;
    constexpr int userOffset = temporalOffset + kTemporalDim;

    if (!writeBlock(vec, moodOffset, kMoodMappings, context.mood)) {
        ++unknownCount;
    }
    if (!writeBlock(vec, situationOffset, kSituationMappings, context.situation)) {
        ++unknownCount;
    }
    if (!writeBlock(vec, goalOffset, kGoalMappings, context.goal)) {
        ++unknownCount;
    }

    // Temporal block:
    //   [0,1] hour sin/cos   [2,3] day-of-week sin/cos   [4..7] time-of-day one-hot
    //   [8] weekend          [9] season                  [10] hour/24   [11] day/7
    int todIndex = timeOfDayIndex(context.timeOfDay);
    if (context.referenceTime.isValid()) {
        const int hour = context.referenceTime.time().hour();
        const int day = context.referenceTime.date().dayOfWeek() % 7; // Sunday = 0
        const int month = context.referenceTime.date().month() - 1;
        if (todIndex < 0 && normalizeKey(context.timeOfDay).isEmpty()) {
            todIndex = timeOfDayIndex(timeOfDayForHour(hour));
        }

        vec[temporalOffset + 0] = std::sin(kTwoPi * hour / 24.0);
        vec[temporalOffset + 1] = std::cos(kTwoPi * hour / 24.0);
        vec[temporalOffset + 2] = std::sin(kTwoPi * day / 7.0);
        vec[temporalOffset + 3] = std::cos(kTwoPi * day / 7.0);
        vec[temporalOffset + 8] = (day == 0 || day == 6) ? 1.0 : 0.0;
        vec[temporalOffset + 9] = std::sin(kTwoPi * month / 12.0);
        vec[temporalOffset + 10] = hour / 24.0;
        vec[temporalOffset + 11] = day / 7.0;
    } else if (todIndex >= 0) {
        const int hour = kCanonicalHours[todIndex];
        vec[temporalOffset + 0] = std::sin(kTwoPi * hour / 24.0);
        vec[temporalOffset + 1] = std::cos(kTwoPi * hour / 24.0);
        vec[temporalOffset + 10] = hour / 24.0;
    }

    if (todIndex >= 0) {
        vec[temporalOffset + 4 + todIndex] = 1.0;
    } else {
        ++unknownCount;
    }

    const UserFeatures features = context.userFeatures.value_or(UserFeatures());
    vec[userOffset + 0] = features.fictionPreference;
    vec[userOffset + 1] = features.nonfictionPreference;
    vec[userOffset + 2] = features.mixedPreference;
    vec[userOffset + 3] = features.engagementLevel;
    vec[userOffset + 4] = features.diversityScore;
    vec[userOffset + 5] = context.userFeatures.has_value() ? 0.0 : 1.0; // new-user bonus
    vec[userOffset + 6] = hasUserAccount ? 1.0 : 0.0;
    vec[userOffset + 7] = unknownCount / 4.0;

    double norm = 0.0;
    for (double v : vec) {
        norm += v * v;
    }
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (double& v : vec) {
            v /= norm;
        }
    }
    return vec;
}

bool ContextEncoder::validate(const ContextAttributes& context, ErrorInfo* errorOut)
{
    const QString fields[] = {context.mood, context.situation, context.goal, context.timeOfDay};
    for (const QString& field : fields) {
        if (field.size() > kMaxValueLength) {
            return fail(errorOut, ErrorKind::Validation, QStringLiteral("context_value_too_long"),
                        QStringLiteral("Context value exceeds %1 characters").arg(kMaxValueLength));
        }
        if (hasControlCharacter(field)) {
            return fail(errorOut, ErrorKind::Validation,
                        QStringLiteral("context_control_character"),
                        QStringLiteral("Context value contains control characters"));
        }
    }

    if (context.userFeatures.has_value()) {
        const UserFeatures& f = *context.userFeatures;
        const double values[] = {f.fictionPreference, f.nonfictionPreference, f.mixedPreference,
                                 f.engagementLevel, f.diversityScore};
        for (double v : values) {
            if (!std::isfinite(v)) {
                return fail(errorOut, ErrorKind::Validation,
                            QStringLiteral("user_feature_not_finite"),
                            QStringLiteral("User feature values must be finite"));
            }
        }
    }

    if (errorOut) {
        errorOut->clear();
    }
    return true;
}

QString ContextEncoder::signature(const ContextAttributes& context)
{
    auto part = [](const QString& value) {
        const QString normalized = normalizeKey(value);
        return normalized.isEmpty() ? QStringLiteral("none") : normalized;
    };
    return QStringList{part(context.mood), part(context.situation), part(context.goal),
                       part(context.timeOfDay)}
        .join(QLatin1Char('|'));
}

double ContextEncoder::cosine(const ContextVector& a, const ContextVector& b)
{
    if (a.size() != b.size() || a.isEmpty()) {
        return 0.0;
    }
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (int i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
        normA += a[i] * a[i];
        normB += b[i] * b[i];
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

ContextSimilarity ContextEncoder::contextSimilarity(const ContextAttributes& a,
                                                    const ContextAttributes& b)
{
    ContextSimilarity result;
    result.context1 = signature(a);
    result.context2 = signature(b);
    result.similarity = cosine(encode(a, false), encode(b, false));

    QStringList shared;
    const QString moodA = normalizeKey(a.mood);
    const QString situationA = normalizeKey(a.situation);
    const QString goalA = normalizeKey(a.goal);
    if (!moodA.isEmpty() && moodA == normalizeKey(b.mood)) {
        shared.append(QStringLiteral("same mood (%1)").arg(moodA));
    }
    if (!situationA.isEmpty() && situationA == normalizeKey(b.situation)) {
        shared.append(QStringLiteral("same situation (%1)").arg(situationA));
    }
    if (!goalA.isEmpty() && goalA == normalizeKey(b.goal)) {
        shared.append(QStringLiteral("same goal (%1)").arg(goalA));
    }

    const QString details = shared.join(QStringLiteral(", "));
    if (result.similarity > 0.8) {
        result.explanation = QStringLiteral("Very similar contexts: ") + details;
    } else if (result.similarity > 0.6) {
        result.explanation = QStringLiteral("Similar contexts: ") + details;
    } else if (result.similarity > 0.4) {
        result.explanation = QStringLiteral("Somewhat similar contexts: ") + details;
    } else {
        result.explanation = QStringLiteral("Different contexts");
    }
    return result;
}

QString ContextEncoder::timeOfDayForHour(int hour)
{
    if (hour >= 5 && hour < 12) {
        return QStringLiteral("morning");
    }
    if (hour >= 12 && hour < 17) {
        return QStringLiteral("afternoon");
    }
    if (hour >= 17 && hour < 21) {
        return QStringLiteral("evening");
    }
    return QStringLiteral("night");
}

ContextAttributes ContextEncoder::smartDefaults(const QString& timeOfDay, bool weekend)
{
    ContextAttributes context;
    context.timeOfDay = normalizeKey(timeOfDay);

    switch (timeOfDayIndex(timeOfDay)) {
    case 0:
        context.mood = QStringLiteral("motivated");
        context.situation = weekend ? QStringLiteral("weekend") : QStringLiteral("commuting");
        context.goal = QStringLiteral("learning");
        break;
    case 1:
        context.mood = QStringLiteral("curious");
        context.situation = weekend ? QStringLiteral("weekend") : QStringLiteral("lunch_break");
        context.goal = QStringLiteral("entertainment");
        break;
    case 2:
        context.mood = QStringLiteral("relaxed");
        context.situation = weekend ? QStringLiteral("weekend") : QStringLiteral("evening");
        context.goal = QStringLiteral("escape");
        break;
    case 3:
        context.mood = QStringLiteral("peaceful");
        context.situation = QStringLiteral("before_bed");
        context.goal = QStringLiteral("relaxation");
        break;
    default:
        LOG_DEBUG(folioCore, "No smart defaults for time of day '%s'", qUtf8Printable(timeOfDay));
        break;
    }
    return context;
}

QVector<double> ContextEncoder::moodBlock(const QString& mood)
{
    return blockFor(kMoodMappings, mood);
}

QVector<double> ContextEncoder::situationBlock(const QString& situation)
{
    return blockFor(kSituationMappings, situation);
}

QVector<double> ContextEncoder::goalBlock(const QString& goal)
{
    return blockFor(kGoalMappings, goal);
}

QStringList ContextEncoder::knownMoods()
{
    return keysOf(kMoodMappings);
}

QStringList ContextEncoder::knownSituations()
{
    return keysOf(kSituationMappings);
}

QStringList ContextEncoder::knownGoals()
{
    return keysOf(kGoalMappings);
}

} // namespace folio
