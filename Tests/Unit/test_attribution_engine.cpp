#include <QtTest/QtTest>
#include <QSemaphore>
#include <QTemporaryDir>
#include "core/bandit/arm_registry.h"
#include "core/bandit/model_updater.h"
#include "core/feedback/attribution_engine.h"
#include "core/store/reward_store.h"

#include <sqlite3.h>

#include <cmath>
#include <memory>
#include <thread>

namespace {

constexpr qint64 kHourMs = 3600LL * 1000LL;
constexpr qint64 kDayMs = 24 * kHourMs;
constexpr qint64 kT0 = 1700000000000LL;
constexpr double kTolerance = 1e-9;

bool execOnFile(const QString& dbPath, const char* sql)
{
    sqlite3* db = nullptr;
    bool ok = sqlite3_open(dbPath.toUtf8().constData(), &db) == SQLITE_OK;
    if (ok) {
        sqlite3_busy_timeout(db, 5000);
        ok = sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK;
    }
    sqlite3_close(db);
    return ok;
}

} // namespace

class TestAttributionEngine : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testDecayWeights();
    void testUnsaveNeverExceedsSaveCredit();
    void testWindowBoundaryIsInclusive();
    void testLastTouchWins();
    void testRerunDoesNotDoubleCount();
    void testClickSaveUnsaveSequence();
    void testUnsaveWithoutSaveQueuesNothing();
    void testSessionImpressionsUseAnonymousScope();
    void testMalformedActionCountsAsError();
    void testActionsOutsideBatchWindowAreSkipped();
    void testStopFromAnotherThreadInterruptsBatch();
    void testInterruptedBatchResumesFromCheckpoint();
    void testVanishedImpressionCountsAsError();

private:
    int64_t addImpression(const QString& userId, const QString& sessionId, const QString& bookId,
                          qint64 createdAtMs,
                          const QString& armId = QStringLiteral("contextual_mood"));
    int64_t addAction(const QString& userId, const QString& sessionId, const QString& bookId,
                      folio::ActionType type, qint64 createdAtMs,
                      std::optional<double> value = std::nullopt);
    folio::AttributionSummary runBatch(qint64 nowMs);
    int attributedCount(const QString& userId);
    int64_t interactionsOf(const QString& scope, const QString& armId);

    std::unique_ptr<QTemporaryDir> m_dir;
    std::optional<folio::RewardStore> m_store;
    std::unique_ptr<folio::ArmRegistry> m_registry;
    std::unique_ptr<folio::ModelUpdater> m_updater;
    std::unique_ptr<folio::AttributionEngine> m_engine;
};

void TestAttributionEngine::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = folio::RewardStore::open(m_dir->path() + "/folio.db");
    QVERIFY(m_store.has_value());
    m_registry = std::make_unique<folio::ArmRegistry>(&*m_store, folio::defaultArmIds());
    m_updater = std::make_unique<folio::ModelUpdater>(*m_registry, &*m_store);
    m_engine = std::make_unique<folio::AttributionEngine>(*m_store, folio::RewardPolicy(),
                                                          m_updater.get());
}

void TestAttributionEngine::cleanup()
{
    m_engine.reset();
    m_updater.reset();
    m_registry.reset();
    m_store.reset();
    m_dir.reset();
}

int64_t TestAttributionEngine::addImpression(const QString& userId, const QString& sessionId,
                                             const QString& bookId, qint64 createdAtMs,
                                             const QString& armId)
{
    folio::ImpressionRecord impression;
    impression.identity.userId = userId;
    impression.identity.sessionId = sessionId;
    impression.bookId = bookId;
    impression.contextVector = folio::ContextVector(folio::kContextDim, 0.0);
    impression.contextVector[1] = 1.0;
    impression.armId = armId;
    impression.rank = 1;
    impression.createdAtMs = createdAtMs;
    return m_store->insertImpression(impression).value_or(0);
}

int64_t TestAttributionEngine::addAction(const QString& userId, const QString& sessionId,
                                         const QString& bookId, folio::ActionType type,
                                         qint64 createdAtMs, std::optional<double> value)
{
    folio::ActionRecord action;
    action.identity.userId = userId;
    action.identity.sessionId = sessionId;
    action.bookId = bookId;
    action.actionType = type;
    action.actionValue = value;
    action.createdAtMs = createdAtMs;
    return m_store->insertAction(action).value_or(0);
}

folio::AttributionSummary TestAttributionEngine::runBatch(qint64 nowMs)
{
    return m_engine->attributeRewards(30 * 24.0, nowMs);
}

int TestAttributionEngine::attributedCount(const QString& userId)
{
    int count = 0;
    for (const folio::ActionRecord& action :
         m_store->actionsFor(folio::Identity{userId, QString()}, 0, kT0 + 30 * kDayMs)) {
        if (action.attributedImpressionId.has_value()) {
            ++count;
        }
    }
    return count;
}

int64_t TestAttributionEngine::interactionsOf(const QString& scope, const QString& armId)
{
    const std::optional<folio::ArmSnapshot> arm = m_registry->snapshotArm(scope, armId);
    return arm.has_value() ? arm->interactionCount : -1;
}

void TestAttributionEngine::testDecayWeights()
{
    const folio::RewardPolicy policy;
    QCOMPARE(policy.decayWeight(0), 1.0);
    QVERIFY(std::abs(policy.decayWeight(48 * kHourMs) - std::exp(-1.0)) < kTolerance);
    QCOMPARE(policy.decayWeight(-kHourMs), 1.0);
    QCOMPARE(policy.windowMs(), 7 * kDayMs);

    QCOMPARE(policy.points(folio::ActionType::Click, std::nullopt), 1.0);
    QCOMPARE(policy.points(folio::ActionType::Save, std::nullopt), 3.0);
    QCOMPARE(policy.points(folio::ActionType::Unsave, std::nullopt), -3.0);
    QCOMPARE(policy.points(folio::ActionType::Rate, 4.0), 4.0);
}

void TestAttributionEngine::testUnsaveNeverExceedsSaveCredit()
{
    const folio::RewardPolicy policy;
    folio::ActionRecord unsave;
    unsave.actionType = folio::ActionType::Unsave;

    folio::RewardContribution result = policy.contribution(unsave, 1.25, 0);
    QCOMPARE(result.reward, -1.25);
    QCOMPARE(result.saveCreditDelta, -1.25);

    result = policy.contribution(unsave, 3.0, 48 * kHourMs);
    QVERIFY(std::abs(result.reward + 3.0 * std::exp(-1.0)) < kTolerance);

    result = policy.contribution(unsave, 0.0, 0);
    QCOMPARE(result.reward, 0.0);
}

void TestAttributionEngine::testWindowBoundaryIsInclusive()
{
    addImpression(QStringLiteral("u1"), QString(), QStringLiteral("edge"), kT0);
    addImpression(QStringLiteral("u1"), QString(), QStringLiteral("late"), kT0);
    const int64_t onEdge = addAction(QStringLiteral("u1"), QString(), QStringLiteral("edge"),
                                     folio::ActionType::Click, kT0 + 7 * kDayMs);
    const int64_t tooLate = addAction(QStringLiteral("u1"), QString(), QStringLiteral("late"),
                                      folio::ActionType::Click, kT0 + 7 * kDayMs + 1);

    const folio::AttributionSummary summary = runBatch(kT0 + 8 * kDayMs);
    QCOMPARE(summary.processed, 2);
    QCOMPARE(summary.updated, 1);
    QCOMPARE(summary.unmatched, 1);
    QCOMPARE(summary.errors, 0);

    const folio::ActionRecord edge = *m_store->getAction(onEdge);
    QVERIFY(edge.attributedImpressionId.has_value());
    QVERIFY(std::abs(edge.attributedReward.value_or(0.0) - std::exp(-3.5)) < kTolerance);
    QVERIFY(!m_store->getAction(tooLate)->attributedImpressionId.has_value());
}

void TestAttributionEngine::testLastTouchWins()
{
    addImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"), kT0,
                  QStringLiteral("semantic_similarity"));
    const int64_t latest = addImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"),
                                         kT0 + kHourMs, QStringLiteral("trending_popular"));
    const int64_t actionId = addAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"),
                                       folio::ActionType::Save, kT0 + 2 * kHourMs);

    const folio::AttributionSummary summary = runBatch(kT0 + kDayMs);
    QCOMPARE(summary.updated, 1);
    QCOMPARE(m_store->getAction(actionId)->attributedImpressionId.value_or(0), latest);

    QCOMPARE(m_registry->snapshotArm(QStringLiteral("u1"), QStringLiteral("trending_popular"))
                 ->interactionCount,
             static_cast<int64_t>(1));
    QCOMPARE(m_registry->snapshotArm(QStringLiteral("u1"), QStringLiteral("semantic_similarity"))
                 ->interactionCount,
             static_cast<int64_t>(0));
}

void TestAttributionEngine::testRerunDoesNotDoubleCount()
{
    const int64_t impressionId =
        addImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"), kT0);
    addAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"), folio::ActionType::Click,
              kT0 + kHourMs);
    addAction(QStringLiteral("u1"), QString(), QStringLiteral("nothing"), folio::ActionType::Click,
              kT0 + kHourMs);

    const folio::AttributionSummary first = runBatch(kT0 + kDayMs);
    QCOMPARE(first.updated, 1);
    QCOMPARE(first.modelUpdates.applied, 1);
    const double rewardAfterFirst = m_store->getImpression(impressionId)->reward.value_or(0.0);

    const folio::AttributionSummary second = runBatch(kT0 + kDayMs);
    QCOMPARE(second.updated, 0);
    QCOMPARE(second.unmatched, 1);
    QCOMPARE(second.modelUpdates.applied, 0);
    QCOMPARE(m_store->getImpression(impressionId)->reward.value_or(0.0), rewardAfterFirst);
    QCOMPARE(m_registry->snapshotArm(QStringLiteral("u1"), QStringLiteral("contextual_mood"))
                 ->interactionCount,
             static_cast<int64_t>(1));

    // Attributing the same action directly is rejected as a conflict.
    const QVector<folio::ActionRecord> actions =
        m_store->actionsFor(folio::Identity{QStringLiteral("u1"), QString()}, 0, kT0 + kDayMs);
    for (const folio::ActionRecord& action : actions) {
        if (action.bookId == QStringLiteral("b1")) {
            folio::ErrorInfo error;
            QVERIFY(!m_engine->attributeAction(action, kT0 + kDayMs, &error));
            QCOMPARE(error.kind, folio::ErrorKind::AttributionConflict);
        }
    }
}

void TestAttributionEngine::testClickSaveUnsaveSequence()
{
    const int64_t impressionId =
        addImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"), kT0);
    addAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"), folio::ActionType::Click,
              kT0 + kHourMs);
    addAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"), folio::ActionType::Save,
              kT0 + 2 * kHourMs);
    addAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"), folio::ActionType::Unsave,
              kT0 + 3 * kHourMs);

    const folio::AttributionSummary summary = runBatch(kT0 + kDayMs);
    QCOMPARE(summary.updated, 3);

    const double lambda = 1.0 / 48.0;
    const double click = std::exp(-lambda * 1.0);
    const double save = 3.0 * std::exp(-lambda * 2.0);
    const double unsave = 3.0 * std::exp(-lambda * 3.0);

    const folio::ImpressionRecord impression = *m_store->getImpression(impressionId);
    QVERIFY(std::abs(impression.reward.value_or(0.0) - (click + save - unsave)) < kTolerance);
    QVERIFY(std::abs(impression.saveCredit - (save - unsave)) < kTolerance);
    QVERIFY(impression.reward.value_or(-1.0) >= 0.0);

    const std::optional<folio::ArmSnapshot> arm =
        m_registry->snapshotArm(QStringLiteral("u1"), QStringLiteral("contextual_mood"));
    QCOMPARE(arm->interactionCount, static_cast<int64_t>(3));
    QVERIFY(std::abs(arm->cumulativeReward - (click + save - unsave)) < kTolerance);
}

void TestAttributionEngine::testUnsaveWithoutSaveQueuesNothing()
{
    const int64_t impressionId =
        addImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"), kT0);
    const int64_t actionId = addAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"),
                                       folio::ActionType::Unsave, kT0 + kHourMs);

    const folio::AttributionSummary summary = runBatch(kT0 + kDayMs);
    QCOMPARE(summary.updated, 1);
    QCOMPARE(summary.modelUpdates.applied, 0);
    QCOMPARE(m_store->getAction(actionId)->attributedImpressionId.value_or(0), impressionId);
    QCOMPARE(m_store->getImpression(impressionId)->reward.value_or(0.0), 0.0);
}

void TestAttributionEngine::testSessionImpressionsUseAnonymousScope()
{
    addImpression(QString(), QStringLiteral("s1"), QStringLiteral("b1"), kT0);
    addAction(QString(), QStringLiteral("s1"), QStringLiteral("b1"), folio::ActionType::Click,
              kT0 + kHourMs);
    addAction(QString(), QStringLiteral("s2"), QStringLiteral("b1"), folio::ActionType::Click,
              kT0 + kHourMs);

    const folio::AttributionSummary summary = runBatch(kT0 + kDayMs);
    QCOMPARE(summary.updated, 1);
    QCOMPARE(summary.unmatched, 1);
    QCOMPARE(m_registry->snapshotArm(QString::fromLatin1(folio::kAnonymousScope),
                                     QStringLiteral("contextual_mood"))
                 ->interactionCount,
             static_cast<int64_t>(1));
}

void TestAttributionEngine::testMalformedActionCountsAsError()
{
    addImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"), kT0);
    // A rating without a value bypasses the recorder's validation.
    addAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"), folio::ActionType::Rate,
              kT0 + kHourMs);
    addAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"), folio::ActionType::Rate,
              kT0 + 2 * kHourMs, 5.0);

    const folio::AttributionSummary summary = runBatch(kT0 + kDayMs);
    QCOMPARE(summary.processed, 2);
    QCOMPARE(summary.errors, 1);
    QCOMPARE(summary.updated, 1);
    QVERIFY(!summary.interrupted);
    QVERIFY(summary.checkpointMs >= kT0 + 2 * kHourMs);
    QCOMPARE(m_store->getSetting(QStringLiteral("attribution_checkpoint_ms")).value_or(QString()),
             QString::number(summary.checkpointMs));
}

void TestAttributionEngine::testActionsOutsideBatchWindowAreSkipped()
{
    addImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"), kT0);
    addAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"), folio::ActionType::Click,
              kT0 + kHourMs);

    const folio::AttributionSummary summary =
        m_engine->attributeRewards(1.0, kT0 + 3 * kDayMs);
    QCOMPARE(summary.processed, 0);
    QCOMPARE(summary.updated, 0);

    const QJsonObject json = summary.toJson();
    QCOMPARE(json.value(QStringLiteral("processed")).toInt(), 0);
    QVERIFY(json.contains(QStringLiteral("modelUpdates")));
}

void TestAttributionEngine::testStopFromAnotherThreadInterruptsBatch()
{
    // More actions than one page, all attributable.
    constexpr int kActions = 700;
    constexpr int kStopAfter = 600;
    for (int i = 0; i < kActions; ++i) {
        const QString bookId = QStringLiteral("b%1").arg(i);
        addImpression(QStringLiteral("u1"), QString(), bookId, kT0 + i);
        addAction(QStringLiteral("u1"), QString(), bookId, folio::ActionType::Click,
                  kT0 + kHourMs + i);
    }

    QSemaphore reached;
    QSemaphore stopped;
    m_engine->setProgressCallback([&](const folio::AttributionSummary& progress) {
        if (progress.processed == kStopAfter) {
            reached.release();
            stopped.tryAcquire(1, 30000);
        }
    });
    std::thread stopper([&]() {
        if (reached.tryAcquire(1, 30000)) {
            m_engine->requestStop();
        }
        stopped.release();
    });

    const folio::AttributionSummary first = runBatch(kT0 + kDayMs);
    stopper.join();
    m_engine->setProgressCallback(nullptr);

    QVERIFY(first.interrupted);
    QVERIFY(!m_engine->isRunning());
    QCOMPARE(first.processed, kStopAfter);
    QCOMPARE(first.updated, kStopAfter);
    QCOMPARE(first.errors, 0);
    QCOMPARE(first.modelUpdates.applied, 0);
    QCOMPARE(attributedCount(QStringLiteral("u1")), kStopAfter);
    QCOMPARE(m_store->pendingRewardEventCount(), kStopAfter);
    QCOMPARE(interactionsOf(QStringLiteral("u1"), QStringLiteral("contextual_mood")),
             static_cast<int64_t>(0));

    const folio::AttributionSummary second = runBatch(kT0 + kDayMs);
    QVERIFY(!second.interrupted);
    QVERIFY(second.resumed);
    QCOMPARE(second.processed, kActions - kStopAfter);
    QCOMPARE(second.updated, kActions - kStopAfter);
    QCOMPARE(second.modelUpdates.applied, kActions);
    QCOMPARE(second.modelUpdates.conflicts, 0);
    QCOMPARE(attributedCount(QStringLiteral("u1")), kActions);
    QCOMPARE(m_store->pendingRewardEventCount(), 0);
    QCOMPARE(interactionsOf(QStringLiteral("u1"), QStringLiteral("contextual_mood")),
             static_cast<int64_t>(kActions));

    const folio::AttributionSummary third = runBatch(kT0 + kDayMs);
    QCOMPARE(third.processed, 0);
    QCOMPARE(third.modelUpdates.applied, 0);
    QCOMPARE(interactionsOf(QStringLiteral("u1"), QStringLiteral("contextual_mood")),
             static_cast<int64_t>(kActions));
}

void TestAttributionEngine::testInterruptedBatchResumesFromCheckpoint()
{
    for (int i = 0; i < 10; ++i) {
        addAction(QStringLiteral("u1"), QString(), QStringLiteral("orphan%1").arg(i),
                  folio::ActionType::Click, kT0 + kHourMs + i * 1000);
    }
    // Pairs of matched actions share a created_at, so the cursor needs the id.
    QVector<int64_t> matched;
    for (int i = 0; i < 6; ++i) {
        const QString bookId = QStringLiteral("m%1").arg(i);
        addImpression(QStringLiteral("u1"), QString(), bookId, kT0);
        matched.append(addAction(QStringLiteral("u1"), QString(), bookId, folio::ActionType::Click,
                                 kT0 + 2 * kHourMs + (i / 2) * 1000));
    }

    m_engine->setProgressCallback([this](const folio::AttributionSummary& progress) {
        if (progress.processed == 13) {
            m_engine->requestStop();
        }
    });
    const folio::AttributionSummary first = runBatch(kT0 + kDayMs);
    m_engine->setProgressCallback(nullptr);

    QVERIFY(first.interrupted);
    QVERIFY(!first.resumed);
    QCOMPARE(first.processed, 13);
    QCOMPARE(first.unmatched, 10);
    QCOMPARE(first.updated, 3);
    QCOMPARE(m_store->getSetting(QStringLiteral("attribution_resume_pending")).value_or(QString()),
             QStringLiteral("1"));
    QCOMPARE(m_store->getSetting(QStringLiteral("attribution_checkpoint_id")).value_or(QString()),
             QString::number(matched[2]));
    QCOMPARE(m_store->getSetting(QStringLiteral("attribution_checkpoint_ms")).value_or(QString()),
             QString::number(kT0 + 2 * kHourMs + 1000));

    // Continues after matched[2]: its tie partner is processed, the orphans are not.
    const folio::AttributionSummary second = runBatch(kT0 + kDayMs);
    QVERIFY(second.resumed);
    QVERIFY(!second.interrupted);
    QCOMPARE(second.processed, 3);
    QCOMPARE(second.updated, 3);
    QCOMPARE(second.unmatched, 0);
    QCOMPARE(second.modelUpdates.applied, 6);
    for (int64_t actionId : matched) {
        QVERIFY(m_store->getAction(actionId)->attributedImpressionId.has_value());
    }
    QCOMPARE(m_store->getSetting(QStringLiteral("attribution_resume_pending")).value_or(QString()),
             QStringLiteral("0"));

    // A finished run leaves nothing to resume; the next one scans the whole window.
    const folio::AttributionSummary third = runBatch(kT0 + kDayMs);
    QVERIFY(!third.resumed);
    QCOMPARE(third.processed, 10);
    QCOMPARE(third.unmatched, 10);
    QCOMPARE(third.updated, 0);
}

void TestAttributionEngine::testVanishedImpressionCountsAsError()
{
    addImpression(QStringLiteral("u1"), QString(), QStringLiteral("vanishing"), kT0);
    const int64_t actionId = addAction(QStringLiteral("u1"), QString(), QStringLiteral("vanishing"),
                                       folio::ActionType::Click, kT0 + kHourMs);
    addAction(QStringLiteral("u1"), QString(), QStringLiteral("nothing"), folio::ActionType::Click,
              kT0 + kHourMs);

    // The impression is found by the lookup but its reward update touches no row.
    QVERIFY(execOnFile(m_dir->path() + "/folio.db", R"(
        CREATE TRIGGER skip_vanishing_reward BEFORE UPDATE OF reward ON impressions
        WHEN OLD.book_id = 'vanishing'
        BEGIN SELECT RAISE(IGNORE); END;
    )"));

    const folio::AttributionSummary summary = runBatch(kT0 + kDayMs);
    QCOMPARE(summary.processed, 2);
    QCOMPARE(summary.updated, 0);
    QCOMPARE(summary.unmatched, 1);
    QCOMPARE(summary.errors, 1);
    QVERIFY(!m_store->getAction(actionId)->attributedImpressionId.has_value());
    QCOMPARE(m_store->pendingRewardEventCount(), 0);

    folio::ErrorInfo error;
    QVERIFY(!m_engine->attributeAction(*m_store->getAction(actionId), kT0 + kDayMs, &error));
    QCOMPARE(error.kind, folio::ErrorKind::NotFound);
    QCOMPARE(error.code, QStringLiteral("impression_not_found"));
}

QTEST_MAIN(TestAttributionEngine)
#include "test_attribution_engine.moc"
