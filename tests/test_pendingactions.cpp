#include <QtTest>

#include "termxfer/PendingActions.hpp"

using namespace termxfer;

class TestPendingActions : public QObject
{
    Q_OBJECT

private:
    static PendingAction makeDir(std::uint64_t chain, const std::string& path,
                                 PendingAction::Then then = PendingAction::Then::EnterDirectory)
    {
        PendingAction a;
        a.chain = chain;
        a.kind = PendingAction::Kind::MakeDirectoryThen;
        a.then = then;
        a.side = Side::Remote;
        a.path = path;
        return a;
    }

    static PendingAction await(std::uint64_t chain)
    {
        PendingAction a;
        a.chain = chain;
        a.kind = PendingAction::Kind::AwaitConflictResolutionThen;
        a.then = PendingAction::Then::ExecuteQueue;
        return a;
    }

private slots:
    void testChainsAreNumberedUniquely()
    {
        PendingActionQueue q;
        const auto a = q.newChain();
        const auto b = q.newChain();
        QVERIFY(a != b);
        QVERIFY(q.empty());
    }

    void testFifoWithinChain()
    {
        PendingActionQueue q;
        const auto chain = q.newChain();
        q.push(makeDir(chain, "/a"));
        q.push(makeDir(chain, "/a/b"));
        q.push(makeDir(chain, "/a/b/c"));

        auto always = [](const PendingAction&) { return true; };
        QCOMPARE(q.popReady(always)->path, std::string("/a"));
        QCOMPARE(q.popReady(always)->path, std::string("/a/b"));
        QCOMPARE(q.popReady(always)->path, std::string("/a/b/c"));
        QVERIFY(!q.popReady(always));
    }

    void testOnlyHeadOfChainIsEligible()
    {
        PendingActionQueue q;
        const auto chain = q.newChain();
        q.push(makeDir(chain, "/first"));
        q.push(makeDir(chain, "/second"));

        // The second action would be ready but must wait behind the first
        auto onlySecond = [](const PendingAction& a) { return a.path == "/second"; };
        QVERIFY(!q.popReady(onlySecond));
        QCOMPARE(q.size(), std::size_t(2));
    }

    void testIndependentChainsDoNotBlockEachOther()
    {
        PendingActionQueue q;
        const auto blocked = q.newChain();
        const auto open = q.newChain();
        q.push(await(blocked));
        q.push(makeDir(open, "/tmp/x"));

        auto noAwait = [](const PendingAction& a) {
            return a.kind != PendingAction::Kind::AwaitConflictResolutionThen;
        };
        auto popped = q.popReady(noAwait);
        QVERIFY(popped);
        QCOMPARE(popped->chain, open);
        QCOMPARE(q.size(), std::size_t(1));
        QCOMPARE(q.head(blocked)->kind, PendingAction::Kind::AwaitConflictResolutionThen);
    }

    void testDropChainLeavesOthers()
    {
        PendingActionQueue q;
        const auto failing = q.newChain();
        const auto other = q.newChain();
        q.push(makeDir(failing, "/a"));
        q.push(makeDir(other, "/b"));
        q.push(makeDir(failing, "/a/c"));

        QCOMPARE(q.dropChain(failing), std::size_t(2));
        QCOMPARE(q.size(), std::size_t(1));
        QVERIFY(q.head(failing) == nullptr);
        QCOMPARE(q.head(other)->path, std::string("/b"));
        QCOMPARE(q.dropChain(failing), std::size_t(0));
    }

    void testConfirmHead()
    {
        PendingActionQueue q;
        const auto chain = q.newChain();
        q.push(makeDir(chain, "/a"));
        q.push(makeDir(chain, "/a/b"));

        auto confirmed = [](const PendingAction& a) { return a.confirmed; };
        QVERIFY(!q.popReady(confirmed));
        QVERIFY(q.confirmHead(chain));
        QCOMPARE(q.popReady(confirmed)->path, std::string("/a"));
        // Confirmation applies to the head only
        QVERIFY(!q.popReady(confirmed));
        QVERIFY(!q.confirmHead(q.newChain()));
    }

    void testKindNames()
    {
        QCOMPARE(QString(pendingActionKindName(PendingAction::Kind::MakeDirectoryThen)), QString("make-directory"));
        QCOMPARE(QString(pendingActionKindName(PendingAction::Kind::AwaitConflictResolutionThen)),
                 QString("await-conflict-resolution"));
    }
};

QTEST_GUILESS_MAIN(TestPendingActions)
#include "test_pendingactions.moc"
