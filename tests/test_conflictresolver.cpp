/**
 * @file test_conflictresolver.cpp
 * @brief Unit tests for ConflictResolver
 *
 * Tests contact diffing, the merge strategies and explicit resolutions.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include "sync/conflictresolver.h"

using namespace Unison;

class TestConflictResolver : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    // ========== Set Helper Tests ==========
    void testUnionOfKeepsOrder();
    void testUnionOfDeduplicates();
    void testSameSet();

    // ========== Diff Tests ==========
    void testDiffIdentical();
    void testDiffIgnoresArrayOrder();
    void testDiffReportsAllFields();

    // ========== Resolve Tests ==========
    void testResolveUnchanged();
    void testPreferDeviceTakesScalars();
    void testPreferDeviceIgnoresEmptyScalars();
    void testPreferLocalKeepsScalars();
    void testArraysAlwaysUnioned();
    void testPreferLocalArraysOnlyUnchanged();
    void testKeepBothDefersScalarConflict();
    void testKeepBothMergesArrayOnlyDifference();

    // ========== Resolution Tests ==========
    void testApplyKeepLocal();
    void testApplyKeepDevice();
    void testApplyMerge();

private:
    Contact localContact() const;
    RemoteContact remoteContact() const;
};

void TestConflictResolver::initTestCase()
{
    qDebug() << "Starting ConflictResolver tests";
}

Contact TestConflictResolver::localContact() const
{
    Contact contact;
    contact.id = "c1";
    contact.firstName = "Jon";
    contact.lastName = "Smith";
    contact.phoneNumbers = {"111", "222"};
    contact.emailAddresses = {"jon@home.example"};
    contact.favorite = true;
    contact.displayName = contact.composeDisplayName();
    return contact;
}

RemoteContact TestConflictResolver::remoteContact() const
{
    RemoteContact remote;
    remote.id = "c1";
    remote.firstName = "Jon";
    remote.lastName = "Smith";
    remote.phoneNumbers = {"222", "111"};
    remote.emailAddresses = {"jon@home.example"};
    return remote;
}

// ========== Set Helper Tests ==========

void TestConflictResolver::testUnionOfKeepsOrder()
{
    QStringList result = ConflictResolver::unionOf({"a", "b"}, {"c", "a", "d"});
    QCOMPARE(result, QStringList({"a", "b", "c", "d"}));
}

void TestConflictResolver::testUnionOfDeduplicates()
{
    QStringList result = ConflictResolver::unionOf({"x", "x"}, {"x"});
    QCOMPARE(result, QStringList({"x"}));
    QVERIFY(ConflictResolver::unionOf({}, {}).isEmpty());
}

void TestConflictResolver::testSameSet()
{
    QVERIFY(ConflictResolver::sameSet({"1", "2"}, {"2", "1"}));
    QVERIFY(ConflictResolver::sameSet({"1", "1"}, {"1"}));
    QVERIFY(!ConflictResolver::sameSet({"1"}, {"1", "2"}));
}

// ========== Diff Tests ==========

void TestConflictResolver::testDiffIdentical()
{
    QVERIFY(ConflictResolver::diff(localContact(), remoteContact()).isEmpty());
}

void TestConflictResolver::testDiffIgnoresArrayOrder()
{
    RemoteContact remote = remoteContact();
    remote.emailAddresses = {"jon@home.example", "jon@home.example"};
    QVERIFY(ConflictResolver::diff(localContact(), remote).isEmpty());
}

void TestConflictResolver::testDiffReportsAllFields()
{
    RemoteContact remote;
    remote.firstName = "John";
    remote.lastName = "Smythe";
    remote.phoneNumbers = {"333"};
    remote.emailAddresses = {"john@work.example"};

    QStringList fields = ConflictResolver::diff(localContact(), remote);
    QCOMPARE(fields, QStringList({ConflictResolver::FieldFirstName,
                                  ConflictResolver::FieldLastName,
                                  ConflictResolver::FieldPhoneNumbers,
                                  ConflictResolver::FieldEmailAddresses}));
}

// ========== Resolve Tests ==========

void TestConflictResolver::testResolveUnchanged()
{
    ResolveOutcome outcome = ConflictResolver::resolve(localContact(), remoteContact(),
                                                       MergeStrategy::PreferDevice);
    QCOMPARE(outcome.action, ResolveOutcome::Unchanged);
    QVERIFY(outcome.fields.isEmpty());
}

void TestConflictResolver::testPreferDeviceTakesScalars()
{
    RemoteContact remote = remoteContact();
    remote.firstName = "Jonathan";

    ResolveOutcome outcome = ConflictResolver::resolve(localContact(), remote,
                                                       MergeStrategy::PreferDevice);
    QCOMPARE(outcome.action, ResolveOutcome::Merged);
    QCOMPARE(outcome.fields, QStringList({ConflictResolver::FieldFirstName}));
    QCOMPARE(outcome.merged.firstName, QString("Jonathan"));
    QCOMPARE(outcome.merged.displayName, QString("Jonathan Smith"));
    // Local-only state survives
    QVERIFY(outcome.merged.favorite);
    QCOMPARE(outcome.merged.id, QString("c1"));
}

void TestConflictResolver::testPreferDeviceIgnoresEmptyScalars()
{
    RemoteContact remote = remoteContact();
    remote.firstName = "Jonny";
    remote.lastName.clear();

    ResolveOutcome outcome = ConflictResolver::resolve(localContact(), remote,
                                                       MergeStrategy::PreferDevice);
    QCOMPARE(outcome.action, ResolveOutcome::Merged);
    QCOMPARE(outcome.merged.firstName, QString("Jonny"));
    QCOMPARE(outcome.merged.lastName, QString("Smith"));
}

void TestConflictResolver::testPreferLocalKeepsScalars()
{
    RemoteContact remote = remoteContact();
    remote.lastName = "Smythe";
    remote.phoneNumbers << "333";

    ResolveOutcome outcome = ConflictResolver::resolve(localContact(), remote,
                                                       MergeStrategy::PreferLocal);
    QCOMPARE(outcome.action, ResolveOutcome::Merged);
    QCOMPARE(outcome.merged.lastName, QString("Smith"));
    QCOMPARE(outcome.merged.phoneNumbers, QStringList({"111", "222", "333"}));
}

void TestConflictResolver::testArraysAlwaysUnioned()
{
    RemoteContact remote = remoteContact();
    remote.phoneNumbers = {"999"};
    remote.emailAddresses = {"jon@work.example"};

    ResolveOutcome outcome = ConflictResolver::resolve(localContact(), remote,
                                                       MergeStrategy::PreferDevice);
    QCOMPARE(outcome.action, ResolveOutcome::Merged);
    // Nothing present on either side is lost
    QCOMPARE(outcome.merged.phoneNumbers, QStringList({"111", "222", "999"}));
    QCOMPARE(outcome.merged.emailAddresses,
             QStringList({"jon@home.example", "jon@work.example"}));
}

void TestConflictResolver::testPreferLocalArraysOnlyUnchanged()
{
    // Remote holds a subset: the union equals local, nothing to write
    RemoteContact remote = remoteContact();
    remote.lastName = "Other";
    remote.phoneNumbers = {"111"};

    ResolveOutcome outcome = ConflictResolver::resolve(localContact(), remote,
                                                       MergeStrategy::PreferLocal);
    QCOMPARE(outcome.action, ResolveOutcome::Unchanged);
    QVERIFY(outcome.fields.contains(ConflictResolver::FieldPhoneNumbers));
}

void TestConflictResolver::testKeepBothDefersScalarConflict()
{
    RemoteContact remote = remoteContact();
    remote.firstName = "Johnny";
    remote.phoneNumbers << "444";

    Contact local = localContact();
    ResolveOutcome outcome = ConflictResolver::resolve(local, remote,
                                                       MergeStrategy::KeepBoth, "phone-1");
    QCOMPARE(outcome.action, ResolveOutcome::Deferred);

    const ConflictRecord &conflict = outcome.conflict;
    QVERIFY(!conflict.id.isEmpty());
    QVERIFY(conflict.isOpen());
    QCOMPARE(conflict.localId, QString("c1"));
    QCOMPARE(conflict.deviceId, QString("phone-1"));
    QCOMPARE(conflict.localSnapshot.firstName, QString("Jon"));
    QCOMPARE(conflict.remoteSnapshot.firstName, QString("Johnny"));
    QCOMPARE(conflict.fields, QStringList({ConflictResolver::FieldFirstName,
                                           ConflictResolver::FieldPhoneNumbers}));
    QVERIFY(conflict.createdAt.isValid());
}

void TestConflictResolver::testKeepBothMergesArrayOnlyDifference()
{
    RemoteContact remote = remoteContact();
    remote.emailAddresses << "jon@work.example";

    ResolveOutcome outcome = ConflictResolver::resolve(localContact(), remote,
                                                       MergeStrategy::KeepBoth);
    QCOMPARE(outcome.action, ResolveOutcome::Merged);
    QCOMPARE(outcome.merged.emailAddresses.size(), 2);
}

// ========== Resolution Tests ==========

void TestConflictResolver::testApplyKeepLocal()
{
    RemoteContact remote = remoteContact();
    remote.firstName = "Johnny";
    ConflictRecord conflict = ConflictResolver::resolve(localContact(), remote,
                                                        MergeStrategy::KeepBoth).conflict;

    Contact result = ConflictResolver::applyResolution(conflict, localContact(),
                                                       ConflictResolution::KeepLocal);
    QCOMPARE(result.firstName, QString("Jon"));
    QCOMPARE(result.phoneNumbers, localContact().phoneNumbers);
}

void TestConflictResolver::testApplyKeepDevice()
{
    RemoteContact remote = remoteContact();
    remote.firstName = "Johnny";
    remote.phoneNumbers = {"555"};
    ConflictRecord conflict = ConflictResolver::resolve(localContact(), remote,
                                                        MergeStrategy::KeepBoth).conflict;

    Contact result = ConflictResolver::applyResolution(conflict, localContact(),
                                                       ConflictResolution::KeepDevice);
    QCOMPARE(result.id, QString("c1"));
    QCOMPARE(result.firstName, QString("Johnny"));
    QCOMPARE(result.phoneNumbers, QStringList({"555"}));
    QCOMPARE(result.displayName, QString("Johnny Smith"));
    QVERIFY(result.favorite);
}

void TestConflictResolver::testApplyMerge()
{
    RemoteContact remote = remoteContact();
    remote.firstName = "Johnny";
    remote.phoneNumbers = {"555"};
    ConflictRecord conflict = ConflictResolver::resolve(localContact(), remote,
                                                        MergeStrategy::KeepBoth).conflict;

    Contact result = ConflictResolver::applyResolution(conflict, localContact(),
                                                       ConflictResolution::Merge);
    QCOMPARE(result.firstName, QString("Johnny"));
    QCOMPARE(result.phoneNumbers, QStringList({"111", "222", "555"}));
}

QTEST_MAIN(TestConflictResolver)
#include "test_conflictresolver.moc"
