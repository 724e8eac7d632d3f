#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(folioCore, "folio.core")
Q_LOGGING_CATEGORY(folioStore, "folio.store")
Q_LOGGING_CATEGORY(folioBandit, "folio.bandit")
Q_LOGGING_CATEGORY(folioReward, "folio.reward")
Q_LOGGING_CATEGORY(folioSimilarity, "folio.similarity")
