#include <QtTest>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>

#include "termxfer/FsWatcher.hpp"

using namespace termxfer;
using namespace std::chrono;

class TestFsWatcher : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir = nullptr;

    std::string path(const QString& name) const
    {
        return QDir(tempDir->path()).filePath(name).toStdString();
    }

    void writeFile(const QString& name, const QByteArray& data)
    {
        QFile f(QDir(tempDir->path()).filePath(name));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(data);
        f.close();
    }

    static bool drain(FsWatcher& w, std::vector<FsChange>& all)
    {
        std::string err;
        w.poll(all, err);
        return !all.empty();
    }

    static const FsChange* find(const std::vector<FsChange>& changes, const std::string& local)
    {
        for (const auto& c : changes) {
            if (c.local == local) return &c;
        }
        return nullptr;
    }

private slots:
    void init()
    {
        tempDir = new QTemporaryDir();
        QVERIFY(tempDir->isValid());
        QDir(tempDir->path()).mkpath("a");
        QDir(tempDir->path()).mkpath("b");
        QDir(tempDir->path()).mkpath("c");
    }

    void cleanup()
    {
        delete tempDir;
        tempDir = nullptr;
    }

    void testRegistrationErrors()
    {
        std::string err;
        auto w = FsWatcher::init(milliseconds(50), 2, err);
        QVERIFY2(w, err.c_str());

        QCOMPARE(w->watch(path("a"), "/remote/a", err), WatcherError::None);
        QCOMPARE(w->watch(path("a"), "/remote/a", err), WatcherError::AlreadyWatched);
        QCOMPARE(w->watch(path("missing"), "/remote/missing", err), WatcherError::NotFound);
        QCOMPARE(w->watch(path("b"), "/remote/b", err), WatcherError::None);
        QCOMPARE(w->watch(path("c"), "/remote/c", err), WatcherError::CapacityExceeded);
        QVERIFY(!err.empty());
        QCOMPARE(w->watchedPaths().size(), std::size_t(2));

        QCOMPARE(w->unwatch(path("c"), err), WatcherError::NotWatched);
        QCOMPARE(w->unwatch(path("a"), err), WatcherError::None);
        QVERIFY(!w->isWatched(path("a")));
        QCOMPARE(w->watch(path("c"), "/remote/c", err), WatcherError::None);
        QCOMPARE(w->capacity(), std::size_t(2));
    }

    void testWatchedPathsAreSorted()
    {
        std::string err;
        auto w = FsWatcher::init(milliseconds(50), 8, err);
        QVERIFY(w);
        QCOMPARE(w->watch(path("b"), "/r/b", err), WatcherError::None);
        QCOMPARE(w->watch(path("a"), "/r/a", err), WatcherError::None);
        const auto paths = w->watchedPaths();
        QCOMPARE(paths[0].first, path("a"));
        QCOMPARE(paths[0].second, std::string("/r/a"));
        QCOMPARE(paths[1].first, path("b"));
    }

    void testCreatedFileMapsToRemote()
    {
        std::string err;
        auto w = FsWatcher::init(milliseconds(50), 4, err);
        QVERIFY(w);
        QCOMPARE(w->watch(path("a"), "/srv/site", err), WatcherError::None);

        QDir(tempDir->path()).mkpath("a/img");
        QTest::qWait(100);
        writeFile("a/img/logo.png", "png");

        std::vector<FsChange> changes;
        QTRY_VERIFY_WITH_TIMEOUT(drain(*w, changes) && find(changes, path("a/img/logo.png")), 5000);
        const FsChange* c = find(changes, path("a/img/logo.png"));
        QCOMPARE(c->remote, std::string("/srv/site/img/logo.png"));
        QCOMPARE(c->kind, FsChange::Kind::Created);
    }

    void testModificationOfExistingFile()
    {
        writeFile("a/index.html", "v1");
        std::string err;
        auto w = FsWatcher::init(milliseconds(50), 4, err);
        QVERIFY(w);
        QCOMPARE(w->watch(path("a"), "/srv", err), WatcherError::None);

        writeFile("a/index.html", "v2");
        std::vector<FsChange> changes;
        QTRY_VERIFY_WITH_TIMEOUT(drain(*w, changes) && find(changes, path("a/index.html")), 5000);
        QCOMPARE(find(changes, path("a/index.html"))->kind, FsChange::Kind::Modified);
        QCOMPARE(find(changes, path("a/index.html"))->remote, std::string("/srv/index.html"));
    }

    void testCreateThenRemoveCancels()
    {
        std::string err;
        auto w = FsWatcher::init(milliseconds(500), 4, err);
        QVERIFY(w);
        QCOMPARE(w->watch(path("a"), "/srv", err), WatcherError::None);

        writeFile("a/tmp.swp", "x");
        QVERIFY(QFile::remove(QDir(tempDir->path()).filePath("a/tmp.swp")));
        writeFile("a/marker", "m");

        std::vector<FsChange> changes;
        QTRY_VERIFY_WITH_TIMEOUT(drain(*w, changes) && find(changes, path("a/marker")), 5000);
        QVERIFY(find(changes, path("a/tmp.swp")) == nullptr);
    }

    void testUnwatchedTreeIsSilent()
    {
        std::string err;
        auto w = FsWatcher::init(milliseconds(20), 4, err);
        QVERIFY(w);
        QCOMPARE(w->watch(path("a"), "/srv", err), WatcherError::None);
        QCOMPARE(w->unwatch(path("a"), err), WatcherError::None);

        writeFile("a/late.txt", "x");
        QTest::qWait(200);
        std::vector<FsChange> changes;
        QVERIFY(w->poll(changes, err));
        QVERIFY(changes.empty());
    }

    void testStopIsIdempotent()
    {
        std::string err;
        auto w = FsWatcher::init(milliseconds(20), 4, err);
        QVERIFY(w);
        w->stop();
        w->stop();
        QCOMPARE(w->watch(path("a"), "/srv", err), WatcherError::InitFailed);
    }
};

QTEST_GUILESS_MAIN(TestFsWatcher)
#include "test_fswatcher.moc"
