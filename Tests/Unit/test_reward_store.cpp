#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <sqlite3.h>
#include "core/store/reward_store.h"

namespace {

constexpr qint64 kHourMs = 3600LL * 1000LL;

folio::ImpressionRecord makeImpression(const QString& userId, const QString& sessionId,
                                       const QString& bookId, qint64 createdAtMs,
                                       const QString& armId = QStringLiteral("contextual_mood"))
{
    folio::ImpressionRecord impression;
    impression.identity.userId = userId;
    impression.identity.sessionId = sessionId;
    impression.bookId = bookId;
    impression.contextVector = folio::ContextVector(folio::kContextDim, 0.0);
    impression.contextVector[0] = 1.0;
    impression.armId = armId;
    impression.rank = 1;
    impression.score = 0.5;
    impression.createdAtMs = createdAtMs;
    return impression;
}

folio::ActionRecord makeAction(const QString& userId, const QString& sessionId,
                               const QString& bookId, folio::ActionType type, qint64 createdAtMs)
{
    folio::ActionRecord action;
    action.identity.userId = userId;
    action.identity.sessionId = sessionId;
    action.bookId = bookId;
    action.actionType = type;
    action.createdAtMs = createdAtMs;
    return action;
}

QString pragmaValue(const QString& dbPath, const char* sql)
{
    sqlite3* db = nullptr;
    QString value;
    if (sqlite3_open(dbPath.toUtf8().constData(), &db) == SQLITE_OK) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            value = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
        }
        sqlite3_finalize(stmt);
    }
    sqlite3_close(db);
    return value;
}

} // namespace

class TestRewardStore : public QObject {
    Q_OBJECT

private slots:
    void testOpenCreatesDatabase();
    void testWalModeAndSchemaVersion();
    void testImpressionRoundTrip();
    void testInsertImpressionsReturnsIdsInOrder();
    void testFindAttributionCandidateWindowAndLastTouch();
    void testCommitAttributionIsIdempotent();
    void testZeroContributionQueuesNoEvent();
    void testUnattributedActionCursorPaging();
    void testArmRoundTripAndDelete();
    void testSaveArmAndMarkAppliedRejectsReplay();
    void testMergeIdentitiesMovesSessionRows();
    void testSaveAndCoSaveCounts();
    void testBooksAndSettings();
};

void TestRewardStore::testOpenCreatesDatabase()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString dbPath = dir.path() + "/folio.db";

    auto store = folio::RewardStore::open(dbPath);
    QVERIFY(store.has_value());
    QVERIFY(QFile::exists(dbPath));
    QCOMPARE(store->impressionCount(), 0);
    QCOMPARE(store->actionCount(), 0);
    QCOMPARE(store->pendingRewardEventCount(), 0);
}

void TestRewardStore::testWalModeAndSchemaVersion()
{
    QTemporaryDir dir;
    const QString dbPath = dir.path() + "/folio.db";
    {
        auto store = folio::RewardStore::open(dbPath);
        QVERIFY(store.has_value());
        QCOMPARE(store->getSetting(QStringLiteral("schema_version")).value_or(QString()),
                 QStringLiteral("2"));
    }
    QCOMPARE(pragmaValue(dbPath, "PRAGMA journal_mode"), QStringLiteral("wal"));

    // Reopening an existing database keeps its data.
    auto reopened = folio::RewardStore::open(dbPath);
    QVERIFY(reopened.has_value());
    QCOMPARE(reopened->getSetting(QStringLiteral("schema_version")).value_or(QString()),
             QStringLiteral("2"));
}

void TestRewardStore::testImpressionRoundTrip()
{
    QTemporaryDir dir;
    auto store = folio::RewardStore::open(dir.path() + "/folio.db");
    QVERIFY(store.has_value());

    folio::ImpressionRecord impression =
        makeImpression(QStringLiteral("u1"), QStringLiteral("s1"), QStringLiteral("b1"), 5000);
    QJsonObject metadata;
    metadata[QStringLiteral("ucbScore")] = 0.42;
    impression.metadata = metadata;

    const std::optional<int64_t> id = store->insertImpression(impression);
    QVERIFY(id.has_value());

    const std::optional<folio::ImpressionRecord> loaded = store->getImpression(*id);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->identity.userId, QStringLiteral("u1"));
    QCOMPARE(loaded->identity.sessionId, QStringLiteral("s1"));
    QCOMPARE(loaded->bookId, QStringLiteral("b1"));
    QCOMPARE(loaded->contextVector, impression.contextVector);
    QCOMPARE(loaded->armId, QStringLiteral("contextual_mood"));
    QCOMPARE(loaded->createdAtMs, static_cast<qint64>(5000));
    QCOMPARE(loaded->metadata.value(QStringLiteral("ucbScore")).toDouble(), 0.42);
    QVERIFY(!loaded->reward.has_value());
    QCOMPARE(loaded->saveCredit, 0.0);

    QVERIFY(!store->getImpression(*id + 100).has_value());

    folio::Identity bySession;
    bySession.sessionId = QStringLiteral("s1");
    QCOMPARE(store->impressionsFor(bySession, 0, 10000).size(), 1);
    QCOMPARE(store->impressionsFor(bySession, 6000, 10000).size(), 0);
}

void TestRewardStore::testInsertImpressionsReturnsIdsInOrder()
{
    QTemporaryDir dir;
    auto store = folio::RewardStore::open(dir.path() + "/folio.db");
    QVERIFY(store.has_value());

    QVector<folio::ImpressionRecord> page;
    for (int i = 0; i < 5; ++i) {
        folio::ImpressionRecord impression = makeImpression(
            QString(), QStringLiteral("s1"), QStringLiteral("b%1").arg(i), 1000);
        impression.rank = i + 1;
        page.append(impression);
    }
    const std::optional<QVector<int64_t>> ids = store->insertImpressions(page);
    QVERIFY(ids.has_value());
    QCOMPARE(ids->size(), 5);
    for (int i = 1; i < ids->size(); ++i) {
        QVERIFY(ids->at(i) > ids->at(i - 1));
    }
    QCOMPARE(store->getImpression(ids->at(3))->bookId, QStringLiteral("b3"));
    QCOMPARE(store->impressionCount(), 5);
}

void TestRewardStore::testFindAttributionCandidateWindowAndLastTouch()
{
    QTemporaryDir dir;
    auto store = folio::RewardStore::open(dir.path() + "/folio.db");
    QVERIFY(store.has_value());

    const qint64 windowMs = 168 * kHourMs;
    const qint64 t0 = 1000000;
    const int64_t older = *store->insertImpression(
        makeImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"), t0));
    const int64_t newer = *store->insertImpression(
        makeImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"), t0 + kHourMs));
    QVERIFY(store->insertImpression(
        makeImpression(QStringLiteral("u2"), QString(), QStringLiteral("b1"), t0 + 2 * kHourMs)));

    folio::Identity user;
    user.userId = QStringLiteral("u1");

    std::optional<folio::ImpressionRecord> candidate =
        store->findAttributionCandidate(user, QStringLiteral("b1"), t0 + 3 * kHourMs, windowMs);
    QVERIFY(candidate.has_value());
    QCOMPARE(candidate->id, newer);

    // Between the two impressions only the older one precedes the action.
    candidate = store->findAttributionCandidate(user, QStringLiteral("b1"), t0 + 10, windowMs);
    QCOMPARE(candidate->id, older);

    // Inclusive upper bound on the newer impression.
    candidate = store->findAttributionCandidate(user, QStringLiteral("b1"),
                                                t0 + kHourMs + windowMs, windowMs);
    QVERIFY(candidate.has_value());
    QCOMPARE(candidate->id, newer);
    QVERIFY(!store->findAttributionCandidate(user, QStringLiteral("b1"),
                                             t0 + kHourMs + windowMs + 1, windowMs)
                 .has_value());

    QVERIFY(!store->findAttributionCandidate(user, QStringLiteral("b1"), t0 - 1, windowMs)
                 .has_value());
    QVERIFY(!store->findAttributionCandidate(user, QStringLiteral("other"), t0 + 10, windowMs)
                 .has_value());
}

void TestRewardStore::testCommitAttributionIsIdempotent()
{
    QTemporaryDir dir;
    auto store = folio::RewardStore::open(dir.path() + "/folio.db");
    QVERIFY(store.has_value());

    const int64_t impressionId = *store->insertImpression(
        makeImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"), 1000));
    const int64_t actionId = *store->insertAction(
        makeAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"),
                   folio::ActionType::Save, 2000));

    folio::RewardStore::AttributionWrite write;
    write.actionId = actionId;
    write.impressionId = impressionId;
    write.contribution = 2.5;
    write.saveCreditDelta = 2.5;
    write.scope = QStringLiteral("u1");
    write.armId = QStringLiteral("contextual_mood");
    write.attributedAtMs = 3000;

    folio::ErrorInfo error;
    const std::optional<int64_t> eventId = store->commitAttribution(write, &error);
    QVERIFY(eventId.has_value());
    QVERIFY(*eventId > 0);

    QVERIFY(!store->commitAttribution(write, &error).has_value());
    QCOMPARE(error.kind, folio::ErrorKind::AttributionConflict);

    const folio::ImpressionRecord impression = *store->getImpression(impressionId);
    QCOMPARE(impression.reward.value_or(0.0), 2.5);
    QCOMPARE(impression.saveCredit, 2.5);
    QCOMPARE(impression.attributedAtMs.value_or(0), static_cast<qint64>(3000));

    const folio::ActionRecord action = *store->getAction(actionId);
    QCOMPARE(action.attributedImpressionId.value_or(0), impressionId);
    QCOMPARE(action.attributedReward.value_or(0.0), 2.5);
    QCOMPARE(store->pendingRewardEventCount(), 1);

    const QVector<folio::RewardEvent> events = store->pendingRewardEvents(10);
    QCOMPARE(events.size(), 1);
    QCOMPARE(events.first().scope, QStringLiteral("u1"));
    QCOMPARE(events.first().contextVector.size(), folio::kContextDim);
}

void TestRewardStore::testZeroContributionQueuesNoEvent()
{
    QTemporaryDir dir;
    auto store = folio::RewardStore::open(dir.path() + "/folio.db");
    QVERIFY(store.has_value());

    const int64_t impressionId = *store->insertImpression(
        makeImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"), 1000));
    const int64_t actionId = *store->insertAction(
        makeAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"),
                   folio::ActionType::Unsave, 2000));

    folio::RewardStore::AttributionWrite write;
    write.actionId = actionId;
    write.impressionId = impressionId;
    write.scope = QStringLiteral("u1");
    write.armId = QStringLiteral("contextual_mood");
    write.attributedAtMs = 3000;
    write.queueRewardEvent = false;

    const std::optional<int64_t> eventId = store->commitAttribution(write);
    QVERIFY(eventId.has_value());
    QCOMPARE(*eventId, static_cast<int64_t>(0));
    QCOMPARE(store->pendingRewardEventCount(), 0);
    QVERIFY(store->getAction(actionId)->attributedImpressionId.has_value());
}

void TestRewardStore::testUnattributedActionCursorPaging()
{
    QTemporaryDir dir;
    auto store = folio::RewardStore::open(dir.path() + "/folio.db");
    QVERIFY(store.has_value());

    for (int i = 0; i < 5; ++i) {
        QVERIFY(store->insertAction(makeAction(QStringLiteral("u1"), QString(),
                                               QStringLiteral("b%1").arg(i),
                                               folio::ActionType::Click, 1000 + (i / 2))));
    }
    QVERIFY(store->insertAction(makeAction(QStringLiteral("u1"), QString(), QStringLiteral("old"),
                                           folio::ActionType::Click, 10)));

    QVector<folio::ActionRecord> page = store->unattributedActionsSince(1000, 1000, 0, 2);
    QCOMPARE(page.size(), 2);
    QStringList seen;
    while (!page.isEmpty()) {
        for (const folio::ActionRecord& action : page) {
            seen.append(action.bookId);
        }
        const folio::ActionRecord& last = page.last();
        page = store->unattributedActionsSince(1000, last.createdAtMs, last.id, 2);
    }
    QCOMPARE(seen, QStringList({QStringLiteral("b0"), QStringLiteral("b1"), QStringLiteral("b2"),
                                QStringLiteral("b3"), QStringLiteral("b4")}));
}

void TestRewardStore::testArmRoundTripAndDelete()
{
    QTemporaryDir dir;
    auto store = folio::RewardStore::open(dir.path() + "/folio.db");
    QVERIFY(store.has_value());

    folio::RewardStore::ArmRow row;
    row.scope = QStringLiteral("u1");
    row.armId = QStringLiteral("trending_popular");
    row.dimension = 2;
    row.aMatrix = {2.0, 0.5, 0.5, 3.0};
    row.bVector = {1.0, -1.0};
    row.interactionCount = 4;
    row.cumulativeReward = 3.5;
    row.cumulativeSquaredReward = 6.25;
    row.updatedAtMs = 777;
    QVERIFY(store->saveArm(row));

    std::optional<folio::RewardStore::ArmRow> loaded =
        store->loadArm(QStringLiteral("u1"), QStringLiteral("trending_popular"));
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->aMatrix, row.aMatrix);
    QCOMPARE(loaded->bVector, row.bVector);
    QCOMPARE(loaded->interactionCount, static_cast<int64_t>(4));
    QCOMPARE(loaded->cumulativeSquaredReward, 6.25);
    QVERIFY(!loaded->degraded);

    row.interactionCount = 5;
    row.degraded = true;
    QVERIFY(store->saveArm(row));
    loaded = store->loadArm(QStringLiteral("u1"), QStringLiteral("trending_popular"));
    QCOMPARE(loaded->interactionCount, static_cast<int64_t>(5));
    QVERIFY(loaded->degraded);

    row.scope = QStringLiteral("u2");
    QVERIFY(store->saveArm(row));
    QCOMPARE(store->armScopes(), QStringList({QStringLiteral("u1"), QStringLiteral("u2")}));
    QCOMPARE(store->loadArms(QStringLiteral("u1")).size(), 1);

    QVERIFY(store->deleteArms(QStringLiteral("u1")));
    QVERIFY(!store->loadArm(QStringLiteral("u1"), QStringLiteral("trending_popular")).has_value());
    QVERIFY(store->loadArm(QStringLiteral("u2"), QStringLiteral("trending_popular")).has_value());

    QVERIFY(store->deleteArms(QString()));
    QVERIFY(store->armScopes().isEmpty());
}

void TestRewardStore::testSaveArmAndMarkAppliedRejectsReplay()
{
    QTemporaryDir dir;
    auto store = folio::RewardStore::open(dir.path() + "/folio.db");
    QVERIFY(store.has_value());

    const int64_t impressionId = *store->insertImpression(
        makeImpression(QStringLiteral("u1"), QString(), QStringLiteral("b1"), 1000));
    const int64_t actionId = *store->insertAction(
        makeAction(QStringLiteral("u1"), QString(), QStringLiteral("b1"),
                   folio::ActionType::Click, 2000));
    folio::RewardStore::AttributionWrite write;
    write.actionId = actionId;
    write.impressionId = impressionId;
    write.contribution = 1.0;
    write.scope = QStringLiteral("u1");
    write.armId = QStringLiteral("contextual_mood");
    write.attributedAtMs = 3000;
    const int64_t eventId = store->commitAttribution(write).value_or(0);
    QVERIFY(eventId > 0);

    folio::RewardStore::ArmRow row;
    row.scope = QStringLiteral("u1");
    row.armId = QStringLiteral("contextual_mood");
    row.dimension = 1;
    row.aMatrix = {2.0};
    row.bVector = {1.0};
    row.interactionCount = 1;

    folio::ErrorInfo error;
    QVERIFY(store->saveArmAndMarkApplied(row, eventId, 4000, &error));
    QCOMPARE(store->pendingRewardEventCount(), 0);

    row.interactionCount = 2;
    QVERIFY(!store->saveArmAndMarkApplied(row, eventId, 5000, &error));
    QCOMPARE(error.kind, folio::ErrorKind::AttributionConflict);
    QCOMPARE(store->loadArm(QStringLiteral("u1"), QStringLiteral("contextual_mood"))
                 ->interactionCount,
             static_cast<int64_t>(1));
}

void TestRewardStore::testMergeIdentitiesMovesSessionRows()
{
    QTemporaryDir dir;
    auto store = folio::RewardStore::open(dir.path() + "/folio.db");
    QVERIFY(store.has_value());

    const int64_t impressionId = *store->insertImpression(
        makeImpression(QString(), QStringLiteral("s1"), QStringLiteral("b1"), 1000));
    QVERIFY(store->insertImpression(
        makeImpression(QString(), QStringLiteral("s2"), QStringLiteral("b1"), 1000)));
    const int64_t actionId = *store->insertAction(
        makeAction(QString(), QStringLiteral("s1"), QStringLiteral("b1"),
                   folio::ActionType::Click, 2000));

    folio::RewardStore::AttributionWrite write;
    write.actionId = actionId;
    write.impressionId = impressionId;
    write.contribution = 1.0;
    write.scope = QStringLiteral("anonymous");
    write.armId = QStringLiteral("contextual_mood");
    write.attributedAtMs = 3000;
    QVERIFY(store->commitAttribution(write).value_or(0) > 0);

    folio::ErrorInfo error;
    const std::optional<folio::RewardStore::MergeCounts> counts =
        store->mergeIdentities(QStringLiteral("s1"), QStringLiteral("u1"), &error);
    QVERIFY(counts.has_value());
    QCOMPARE(counts->impressions, 1);
    QCOMPARE(counts->actions, 1);
    QCOMPARE(counts->rewardEvents, 1);

    folio::Identity user;
    user.userId = QStringLiteral("u1");
    QCOMPARE(store->impressionsFor(user, 0, 10000).size(), 1);
    QCOMPARE(store->actionsFor(user, 0, 10000).size(), 1);
    QCOMPARE(store->pendingRewardEvents(10).first().scope, QStringLiteral("u1"));

    // Nothing left to merge.
    const std::optional<folio::RewardStore::MergeCounts> again =
        store->mergeIdentities(QStringLiteral("s1"), QStringLiteral("u1"), &error);
    QVERIFY(again.has_value());
    QCOMPARE(again->impressions, 0);
}

void TestRewardStore::testSaveAndCoSaveCounts()
{
    QTemporaryDir dir;
    auto store = folio::RewardStore::open(dir.path() + "/folio.db");
    QVERIFY(store.has_value());

    auto save = [&](const QString& user, const QString& book) {
        return store->insertAction(makeAction(user, QString(), book, folio::ActionType::Save, 1000))
            .has_value();
    };
    QVERIFY(save(QStringLiteral("me"), QStringLiteral("dune")));
    QVERIFY(save(QStringLiteral("peer1"), QStringLiteral("dune")));
    QVERIFY(save(QStringLiteral("peer1"), QStringLiteral("foundation")));
    QVERIFY(save(QStringLiteral("peer2"), QStringLiteral("dune")));
    QVERIFY(save(QStringLiteral("peer2"), QStringLiteral("foundation")));
    QVERIFY(save(QStringLiteral("peer2"), QStringLiteral("hyperion")));
    QVERIFY(save(QStringLiteral("stranger"), QStringLiteral("walden")));

    const QHash<QString, int> saves = store->saveCounts();
    QCOMPARE(saves.value(QStringLiteral("dune")), 3);
    QCOMPARE(saves.value(QStringLiteral("walden")), 1);

    folio::Identity me;
    me.userId = QStringLiteral("me");
    const QHash<QString, int> coSaves = store->coSaveCounts(me);
    QCOMPARE(coSaves.value(QStringLiteral("foundation")), 2);
    QCOMPARE(coSaves.value(QStringLiteral("hyperion")), 1);
    QVERIFY(!coSaves.contains(QStringLiteral("dune")));
    QVERIFY(!coSaves.contains(QStringLiteral("walden")));
}

void TestRewardStore::testBooksAndSettings()
{
    QTemporaryDir dir;
    auto store = folio::RewardStore::open(dir.path() + "/folio.db");
    QVERIFY(store.has_value());

    folio::CatalogBook book;
    book.bookId = QStringLiteral("b1");
    book.title = QStringLiteral("Dune");
    book.text = QStringLiteral("Desert planet");
    book.updatedAtMs = 100;
    QVERIFY(store->upsertBook(book));
    book.bookId = QStringLiteral("b2");
    book.updatedAtMs = 200;
    QVERIFY(store->upsertBook(book));
    book.bookId = QStringLiteral("b1");
    book.title = QStringLiteral("Dune Messiah");
    book.updatedAtMs = 300;
    QVERIFY(store->upsertBook(book));

    const QVector<folio::CatalogBook> books = store->books();
    QCOMPARE(books.size(), 2);
    QCOMPARE(books.first().title, QStringLiteral("Dune Messiah"));
    QCOMPARE(store->booksChangedSince(250).size(), 1);

    folio::ErrorInfo error;
    book.bookId.clear();
    QVERIFY(!store->upsertBook(book, &error));
    QCOMPARE(error.kind, folio::ErrorKind::Validation);

    QVERIFY(!store->getSetting(QStringLiteral("nonexistent")).has_value());
    QVERIFY(store->setSetting(QStringLiteral("attribution_checkpoint_ms"), QStringLiteral("42")));
    QCOMPARE(store->getSetting(QStringLiteral("attribution_checkpoint_ms")).value_or(QString()),
             QStringLiteral("42"));
}

QTEST_MAIN(TestRewardStore)
#include "test_reward_store.moc"
