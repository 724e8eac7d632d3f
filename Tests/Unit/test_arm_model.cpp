#include <QtTest/QtTest>

#include "core/bandit/arm_model.h"

#include <cmath>
#include <random>

namespace {

Eigen::VectorXd unitVector(int dim, int index)
{
    Eigen::VectorXd x = Eigen::VectorXd::Zero(dim);
    x(index) = 1.0;
    return x;
}

} // namespace

class TestArmModel : public QObject {
    Q_OBJECT

private slots:
    void testColdStart();
    void testSingleUpdateMatchesClosedForm();
    void testStaysSymmetricPositiveDefiniteUnderRandomUpdates();
    void testRejectsMismatchedAndNonFiniteInput();
    void testSingularMatrixDegradesAndRecovers();
    void testResetRestoresIdentity();
    void testSnapshotLifecycle();
};

void TestArmModel::testColdStart()
{
    folio::ArmModel model(QStringLiteral("semantic_similarity"));
    QCOMPARE(model.dimension(), folio::kContextDim);
    QVERIFY(model.a().isIdentity());
    QVERIFY(model.theta().isZero());
    QCOMPARE(model.interactionCount(), static_cast<int64_t>(0));
    QVERIFY(!model.isDegraded());

    std::mt19937 rng(7);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    Eigen::VectorXd x(folio::kContextDim);
    for (int i = 0; i < x.size(); ++i) {
        x(i) = dist(rng);
    }

    QCOMPARE(model.predict(x), 0.0);
    QVERIFY(std::abs(model.confidenceBonus(x) - x.norm()) < 1e-12);
}

void TestArmModel::testSingleUpdateMatchesClosedForm()
{
    folio::ArmModel model(QStringLiteral("arm"), 3);
    Eigen::VectorXd x(3);
    x << 1.0, 0.0, 0.0;

    folio::ErrorInfo error;
    QVERIFY(model.update(x, 2.0, &error));
    QVERIFY(!error.isError());

    // A = diag(2, 1, 1), b = (2, 0, 0) => theta = (1, 0, 0)
    QVERIFY(std::abs(model.a()(0, 0) - 2.0) < 1e-12);
    QVERIFY(std::abs(model.theta()(0) - 1.0) < 1e-12);
    QVERIFY(std::abs(model.predict(x) - 1.0) < 1e-12);
    QVERIFY(std::abs(model.confidenceBonus(x) - std::sqrt(0.5)) < 1e-12);
    QCOMPARE(model.interactionCount(), static_cast<int64_t>(1));
    QCOMPARE(model.cumulativeReward(), 2.0);
    QCOMPARE(model.cumulativeSquaredReward(), 4.0);
}

void TestArmModel::testStaysSymmetricPositiveDefiniteUnderRandomUpdates()
{
    std::mt19937 rng(12345);
    std::uniform_real_distribution<double> feature(-1.0, 1.0);
    std::uniform_real_distribution<double> reward(-3.0, 3.0);

    folio::ArmModel model(QStringLiteral("arm"));
    for (int step = 0; step < 300; ++step) {
        Eigen::VectorXd x(folio::kContextDim);
        for (int i = 0; i < x.size(); ++i) {
            x(i) = feature(rng);
        }
        x.normalize();
        QVERIFY(model.update(x, reward(rng)));
    }

    const Eigen::MatrixXd& a = model.a();
    QVERIFY((a - a.transpose()).cwiseAbs().maxCoeff() < 1e-12);

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(a);
    QVERIFY(solver.info() == Eigen::Success);
    QVERIFY(solver.eigenvalues().minCoeff() >= 1.0 - 1e-9);

    const Eigen::MatrixXd identity = a * model.aInverse();
    QVERIFY((identity - Eigen::MatrixXd::Identity(a.rows(), a.cols())).cwiseAbs().maxCoeff() < 1e-8);
    QVERIFY(!model.isDegraded());
}

void TestArmModel::testRejectsMismatchedAndNonFiniteInput()
{
    folio::ArmModel model(QStringLiteral("arm"), 4);
    folio::ErrorInfo error;

    QVERIFY(!model.update(Eigen::VectorXd::Ones(3), 1.0, &error));
    QCOMPARE(error.kind, folio::ErrorKind::Validation);
    QCOMPARE(error.code, QStringLiteral("context_dimension_mismatch"));

    QVERIFY(!model.update(Eigen::VectorXd::Ones(4), std::nan(""), &error));
    QCOMPARE(error.code, QStringLiteral("non_finite_update"));

    QCOMPARE(model.interactionCount(), static_cast<int64_t>(0));
    QVERIFY(model.a().isIdentity());
}

void TestArmModel::testSingularMatrixDegradesAndRecovers()
{
    const int dim = 3;
    folio::ArmModel model(QStringLiteral("arm"), dim);

    Eigen::MatrixXd singular = Eigen::MatrixXd::Identity(dim, dim);
    singular(2, 2) = 0.0;
    folio::ErrorInfo error;
    QVERIFY(!model.restore(singular, Eigen::VectorXd::Zero(dim), 4, 2.0, 1.0, 1000, &error));
    QCOMPARE(error.kind, folio::ErrorKind::NumericInstability);
    QVERIFY(model.isDegraded());
    QVERIFY(model.aInverse().allFinite());
    QVERIFY(model.snapshot(QStringLiteral("anonymous")).degraded);

    // x with a component on the null direction makes A positive-definite again.
    QVERIFY(model.update(unitVector(dim, 2), 1.0, &error));
    QVERIFY(!model.isDegraded());
    QCOMPARE(model.interactionCount(), static_cast<int64_t>(5));
}

void TestArmModel::testResetRestoresIdentity()
{
    folio::ArmModel model(QStringLiteral("arm"), 4);
    QVERIFY(model.update(unitVector(4, 1), 3.0));
    QVERIFY(model.update(unitVector(4, 2), -1.0));
    model.reset();

    QVERIFY(model.a().isIdentity());
    QVERIFY(model.b().isZero());
    QVERIFY(model.theta().isZero());
    QCOMPARE(model.interactionCount(), static_cast<int64_t>(0));
    QCOMPARE(model.cumulativeReward(), 0.0);
}

void TestArmModel::testSnapshotLifecycle()
{
    folio::ArmModel model(QStringLiteral("arm"), 2);
    QCOMPARE(model.snapshot(QStringLiteral("u1")).lifecycle(3), folio::ArmLifecycle::Uninitialized);

    QVERIFY(model.update(unitVector(2, 0), 1.0));
    folio::ArmSnapshot snap = model.snapshot(QStringLiteral("u1"));
    QCOMPARE(snap.lifecycle(3), folio::ArmLifecycle::Warm);
    QCOMPARE(snap.scope, QStringLiteral("u1"));
    QCOMPARE(snap.armId, QStringLiteral("arm"));

    QVERIFY(model.update(unitVector(2, 1), 1.0));
    QVERIFY(model.update(unitVector(2, 0), 1.0));
    snap = model.snapshot(QStringLiteral("u1"));
    QCOMPARE(snap.lifecycle(3), folio::ArmLifecycle::Active);
    QCOMPARE(folio::armLifecycleToString(snap.lifecycle(3)), QStringLiteral("active"));
}

QTEST_MAIN(TestArmModel)
#include "test_arm_model.moc"
