#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(folioCore)
Q_DECLARE_LOGGING_CATEGORY(folioStore)
Q_DECLARE_LOGGING_CATEGORY(folioBandit)
Q_DECLARE_LOGGING_CATEGORY(folioReward)
Q_DECLARE_LOGGING_CATEGORY(folioSimilarity)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
