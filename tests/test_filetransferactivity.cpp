#include <QtTest>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <functional>

#include "termxfer/FileTransferActivity.hpp"
#include "termxfer/MemoryClient.hpp"
#include "mocks/FakeTerminal.hpp"

using namespace termxfer;
using Key = KeyEvent::Key;

class TestFileTransferActivity : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir = nullptr;
    FakeTerminal *term = nullptr;
    MemoryClient *mem = nullptr; // owned by the activity
    std::unique_ptr<FileTransferActivity> activity;

    Config testConfig() const
    {
        Config cfg;
        cfg.reconnect.maxAttempts = 3;
        cfg.reconnect.initialDelay = std::chrono::milliseconds(1);
        cfg.reconnect.maxDelay = std::chrono::milliseconds(4);
        cfg.watcherDelay = std::chrono::milliseconds(50);
        return cfg;
    }

    std::string localDir() const { return tempDir->path().toStdString(); }

    void create(std::unique_ptr<MemoryClient> client, const Config& cfg)
    {
        mem = client.get();
        activity = std::make_unique<FileTransferActivity>(std::move(client), cfg);
        Context ctx;
        ctx.terminal = term;
        ctx.params.protocol = Protocol::Memory;
        ctx.params.local_dir = localDir();
        activity->onCreate(std::move(ctx));
    }

    void createConnected()
    {
        auto client = std::make_unique<MemoryClient>("/home/demo");
        create(std::move(client), testConfig());
        activity->onDraw();
    }

    void writeLocal(const QString& name, const QByteArray& data)
    {
        QFile f(QDir(tempDir->path()).filePath(name));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(data);
        f.close();
    }

    void selectLocal(const std::string& name)
    {
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::ReloadDir));
        auto idx = activity->browser().local().indexOf(name);
        QVERIFY(idx.has_value());
        activity->browser().local().setCursor(*idx);
    }

    bool drawUntil(const std::function<bool()>& done, int rounds = 200)
    {
        for (int i = 0; i < rounds; ++i) {
            if (done()) return true;
            activity->onDraw();
            QTest::qWait(2);
        }
        return done();
    }

    void selectRemote(const std::string& name)
    {
        if (activity->browser().side() != Side::Remote)
            activity->dispatch(UiMsg{UiMsg::Kind::ChangeTransferWindow});
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::ReloadDir));
        auto idx = activity->browser().remote().indexOf(name);
        QVERIFY(idx.has_value());
        activity->browser().remote().setCursor(*idx);
    }

    QString localFile(const QString& name) const { return QDir(tempDir->path()).filePath(name); }

    QByteArray readLocal(const QString& name) const
    {
        QFile f(localFile(name));
        if (!f.open(QIODevice::ReadOnly)) return {};
        return f.readAll();
    }

    bool mounted(Id id) const { return activity->viewState().mounted(id); }

    bool logContains(const std::string& text) const
    {
        for (const auto& r : activity->logRing().records()) {
            if (r.message.find(text) != std::string::npos) return true;
        }
        return false;
    }

private slots:
    void init()
    {
        tempDir = new QTemporaryDir();
        QVERIFY(tempDir->isValid());
        term = new FakeTerminal();
    }

    void cleanup()
    {
        if (activity) activity->onDestroy();
        activity.reset();
        mem = nullptr;
        delete term;
        term = nullptr;
        delete tempDir;
        tempDir = nullptr;
    }

    void testLifecycle()
    {
        create(std::make_unique<MemoryClient>("/home/demo"), testConfig());
        QVERIFY(term->raw);
        QCOMPARE(term->rawEnables, 1);
        QVERIFY(term->clears >= 1);
        QCOMPARE(activity->browser().local().wrkdir(), localDir());
        QCOMPARE(activity->connection().state(), ConnectionState::Disconnected);

        activity->onDraw();
        QVERIFY(activity->connection().isConnected());
        QCOMPARE(activity->browser().remote().wrkdir(), std::string("/home/demo"));
        QCOMPARE(activity->browser().anchor(Side::Remote).value(), std::string("/home/demo"));
        QVERIFY(!mounted(Id::WaitPopup));
        QVERIFY(term->renders > 0);
        QVERIFY(!activity->willUmount());
        QVERIFY(logContains("Established connection"));

        const std::string cacheDir = activity->tempCache()->path();
        QVERIFY(QDir(QString::fromStdString(cacheDir)).exists());
        auto ctx = activity->onDestroy();
        QVERIFY(ctx.has_value());
        QCOMPARE(ctx->terminal, static_cast<Terminal *>(term));
        QVERIFY(!term->raw);
        QVERIFY(!activity->tempCache()->isOpen());
        QVERIFY(!QDir(QString::fromStdString(cacheDir)).exists());
        QVERIFY(!mem->isConnected());
        activity.reset();
    }

    void testListingFailureKeepsPane()
    {
        createConnected();
        mem->addDirectory("/home/demo/private");
        activity->dispatch(UiMsg{UiMsg::Kind::ChangeTransferWindow});
        QCOMPARE(activity->browser().side(), Side::Remote);
        const std::size_t before = activity->browser().remote().count();

        mem->failNextList("Permission denied");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::GoTo, "private"));
        QCOMPARE(activity->browser().remote().wrkdir(), std::string("/home/demo"));
        QCOMPARE(activity->browser().remote().count(), before);
        QVERIFY(mounted(Id::ErrorPopup));
        QCOMPARE(activity->logRing().records().front().level, LogLevel::Error);
        QVERIFY(activity->connection().isConnected());

        term->pushKey(Key::Enter);
        activity->onDraw();
        QVERIFY(!mounted(Id::ErrorPopup));

        // A failed reload is a warning and keeps the snapshot
        mem->failNextList("Connection reset");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::ReloadDir));
        QCOMPARE(activity->logRing().records().front().level, LogLevel::Warn);
        QCOMPARE(activity->browser().remote().count(), before);
        QVERIFY(!mounted(Id::ErrorPopup));

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::GoTo, "private"));
        QCOMPARE(activity->browser().remote().wrkdir(), std::string("/home/demo/private"));
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::GoToPreviousDirectory));
        QCOMPARE(activity->browser().remote().wrkdir(), std::string("/home/demo"));
    }

    void testUploadSelection()
    {
        createConnected();
        writeLocal("hello.txt", "Hello World");
        selectLocal("hello.txt");

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::TransferFile));
        QVERIFY(activity->isExecuting());
        QVERIFY(mounted(Id::ProgressBar));

        QVERIFY(drawUntil([this] { return !activity->isExecuting(); }));
        QCOMPARE(mem->fileData("/home/demo/hello.txt").value(), std::string("Hello World"));
        QVERIFY(!mounted(Id::ProgressBar));
        QVERIFY(logContains("Transfer completed: 1 files, 11 bytes"));
        QVERIFY(activity->browser().remote().indexOf("hello.txt").has_value());
    }

    void testDownloadMarkedEntries()
    {
        createConnected();
        mem->addFile("/home/demo/a.txt", "aaa");
        mem->addFile("/home/demo/b.txt", "bbb");
        mem->addFile("/home/demo/c.txt", "ccc");
        activity->dispatch(UiMsg{UiMsg::Kind::ChangeTransferWindow});
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::ReloadDir));
        FileExplorer& remote = activity->browser().remote();
        remote.toggleMark(*remote.indexOf("a.txt"));
        remote.toggleMark(*remote.indexOf("c.txt"));

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::TransferFile));
        QVERIFY(drawUntil([this] { return !activity->isExecuting(); }));
        QVERIFY(QFile::exists(QDir(tempDir->path()).filePath("a.txt")));
        QVERIFY(!QFile::exists(QDir(tempDir->path()).filePath("b.txt")));
        QVERIFY(QFile::exists(QDir(tempDir->path()).filePath("c.txt")));
        QCOMPARE(remote.markedCount(), std::size_t(0));
    }

    void testConflictWaitsForDecision()
    {
        createConnected();
        mem->addFile("/home/demo/hello.txt", "old");
        writeLocal("hello.txt", "new");
        selectLocal("hello.txt");

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::TransferFile));
        QVERIFY(mounted(Id::ReplacePopup));
        QVERIFY(!activity->isExecuting());
        QCOMPARE(activity->pendingActions().size(), std::size_t(1));

        // Tab shows the list of files to replace, Tab again goes back
        term->pushKey(Key::Tab);
        activity->onDraw();
        QVERIFY(mounted(Id::ReplacingFilesListPopup));
        term->pushKey(Key::Tab);
        activity->onDraw();
        QVERIFY(!mounted(Id::ReplacingFilesListPopup));
        QCOMPARE(mem->fileData("/home/demo/hello.txt").value(), std::string("old"));

        // First button replaces
        term->pushKey(Key::Enter);
        activity->onDraw();
        QVERIFY(!mounted(Id::ReplacePopup));
        QVERIFY(activity->pendingActions().empty());
        QVERIFY(drawUntil([this] { return !activity->isExecuting(); }));
        QCOMPARE(mem->fileData("/home/demo/hello.txt").value(), std::string("new"));
    }

    void testConflictAbortKeepsDestination()
    {
        createConnected();
        mem->addFile("/home/demo/hello.txt", "old");
        writeLocal("hello.txt", "new");
        selectLocal("hello.txt");

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::TransferFile));
        term->pushKey(Key::Esc);
        activity->onDraw();
        QVERIFY(!mounted(Id::ReplacePopup));
        QVERIFY(activity->pendingActions().empty());
        QVERIFY(!activity->isExecuting());
        QCOMPARE(mem->fileData("/home/demo/hello.txt").value(), std::string("old"));
        QVERIFY(mounted(Id::ErrorPopup));
        term->pushKey(Key::Enter);
        activity->onDraw();
        QVERIFY(!mounted(Id::ErrorPopup));

        // The aborted run does not block the next transfer
        writeLocal("second.txt", "second");
        selectLocal("second.txt");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::TransferFile));
        QVERIFY(activity->isExecuting());
        QVERIFY(drawUntil([this] { return !activity->isExecuting(); }));
        QCOMPARE(mem->fileData("/home/demo/second.txt").value(), std::string("second"));
        QCOMPARE(mem->fileData("/home/demo/hello.txt").value(), std::string("old"));
        QVERIFY(!activity->queue().isAborted());
    }

    void testSeveralConflictsListedFirst()
    {
        createConnected();
        mem->addFile("/home/demo/a.txt", "old-a");
        mem->addFile("/home/demo/b.txt", "old-b");
        writeLocal("a.txt", "new-a");
        writeLocal("b.txt", "new-b");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::ReloadDir));
        FileExplorer& local = activity->browser().local();
        local.toggleMark(*local.indexOf("a.txt"));
        local.toggleMark(*local.indexOf("b.txt"));

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::TransferFile));
        QVERIFY(mounted(Id::ReplacePopup));
        QVERIFY(mounted(Id::ReplacingFilesListPopup));
        QCOMPARE(activity->viewState().top()->id, Id::ReplacingFilesListPopup);
        QCOMPARE(activity->viewState().get(Id::ReplacingFilesListPopup)->options.size(), std::size_t(2));

        term->pushKey(Key::Tab);
        activity->onDraw();
        QVERIFY(!mounted(Id::ReplacingFilesListPopup));
        QCOMPARE(activity->viewState().top()->id, Id::ReplacePopup);

        // Replace all
        term->pushKey(Key::Right);
        activity->onDraw();
        term->pushKey(Key::Enter);
        activity->onDraw();
        QVERIFY(!mounted(Id::ReplacePopup));
        QVERIFY(drawUntil([this] { return !activity->isExecuting(); }));
        QCOMPARE(mem->fileData("/home/demo/a.txt").value(), std::string("new-a"));
        QCOMPARE(mem->fileData("/home/demo/b.txt").value(), std::string("new-b"));
    }

    void testSyncBrowsingFollowsExistingDirectory()
    {
        QDir(tempDir->path()).mkpath("docs");
        createConnected();
        mem->addDirectory("/home/demo/docs");

        activity->dispatch(UiMsg{UiMsg::Kind::ToggleSyncBrowsing});
        QVERIFY(activity->browser().syncBrowsing());
        QVERIFY(!activity->viewState().anyMounted());

        selectLocal("docs");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::EnterDirectory));
        QCOMPARE(activity->browser().local().wrkdir(), localDir() + "/docs");
        QCOMPARE(activity->browser().remote().wrkdir(), std::string("/home/demo/docs"));
        QVERIFY(!activity->viewState().anyMounted());

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::GoToParentDirectory));
        QCOMPARE(activity->browser().remote().wrkdir(), std::string("/home/demo"));
    }

    void testSyncBrowsingCreatesMissingDirectory()
    {
        QDir(tempDir->path()).mkpath("src");
        createConnected();
        activity->dispatch(UiMsg{UiMsg::Kind::ToggleSyncBrowsing});

        selectLocal("src");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::EnterDirectory));
        QVERIFY(mounted(Id::SyncBrowsingMkdirPopup));
        QCOMPARE(activity->pendingActions().size(), std::size_t(1));
        QVERIFY(!mem->contains("/home/demo/src"));

        term->pushChar('y');
        activity->onDraw();
        QVERIFY(!mounted(Id::SyncBrowsingMkdirPopup));
        QVERIFY(activity->pendingActions().empty());
        QVERIFY(mem->contains("/home/demo/src"));
        QCOMPARE(activity->browser().remote().wrkdir(), std::string("/home/demo/src"));
        QVERIFY(activity->browser().syncBrowsing());
    }

    void testSyncBrowsingDeclineDisablesIt()
    {
        QDir(tempDir->path()).mkpath("src");
        createConnected();
        activity->dispatch(UiMsg{UiMsg::Kind::ToggleSyncBrowsing});
        selectLocal("src");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::EnterDirectory));
        QVERIFY(mounted(Id::SyncBrowsingMkdirPopup));

        term->pushChar('n');
        activity->onDraw();
        QVERIFY(!mounted(Id::SyncBrowsingMkdirPopup));
        QVERIFY(activity->pendingActions().empty());
        QVERIFY(!activity->browser().syncBrowsing());
        QVERIFY(!mem->contains("/home/demo/src"));
        QCOMPARE(activity->browser().remote().wrkdir(), std::string("/home/demo"));
    }

    void testSyncBrowsingNeedsConnection()
    {
        auto client = std::make_unique<MemoryClient>("/home/demo");
        client->setRefuseConnections(true);
        create(std::move(client), testConfig());
        activity->dispatch(UiMsg{UiMsg::Kind::ToggleSyncBrowsing});
        QVERIFY(!activity->browser().syncBrowsing());
        QVERIFY(mounted(Id::ErrorPopup));
    }

    void testConnectionLossResumesTransfer()
    {
        createConnected();
        mem->setChunkSize(4);
        mem->dropConnectionAfter(5);
        writeLocal("data.bin", "abcdefghijkl");
        selectLocal("data.bin");

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::TransferFile));
        QVERIFY(drawUntil([this] { return !activity->isExecuting(); }));
        QCOMPARE(mem->fileData("/home/demo/data.bin").value(), std::string("abcdefghijkl"));
        QVERIFY(mem->connectCount() >= 2);
        QCOMPARE(activity->connection().connectionCount(), 2);
        QVERIFY(logContains("resuming"));
        QVERIFY(!activity->queue().isPaused());
    }

    void testRetriesThenFatal()
    {
        auto client = std::make_unique<MemoryClient>("/home/demo");
        client->setRefuseConnections(true);
        create(std::move(client), testConfig());

        activity->onDraw();
        QVERIFY(mounted(Id::WaitPopup));
        QVERIFY(drawUntil([this] { return mounted(Id::FatalPopup); }));
        QVERIFY(!mounted(Id::WaitPopup));
        QCOMPARE(activity->connection().state(), ConnectionState::Fatal);
        QCOMPARE(mem->connectCount(), 3);

        term->pushKey(Key::Enter);
        activity->onDraw();
        QCOMPARE(activity->willUmount().value(), ExitReason::Disconnect);
    }

    void testMissingBackendIsFatal()
    {
        activity = std::make_unique<FileTransferActivity>(nullptr, testConfig(), "Host is required");
        Context ctx;
        ctx.terminal = term;
        ctx.params.local_dir = localDir();
        activity->onCreate(std::move(ctx));
        QVERIFY(mounted(Id::FatalPopup));
        QCOMPARE(activity->viewState().get(Id::FatalPopup)->text.front(), std::string("Host is required"));

        activity->onDraw();
        QVERIFY(!activity->willUmount());
        activity->dispatch(UiMsg{UiMsg::Kind::CloseFatalPopup});
        QCOMPARE(activity->willUmount().value(), ExitReason::Disconnect);
    }

    void testQuitByKeys()
    {
        createConnected();
        term->pushChar('q');
        activity->onDraw();
        QVERIFY(mounted(Id::QuitPopup));
        QVERIFY(!activity->willUmount());
        term->pushChar('y');
        activity->onDraw();
        QCOMPARE(activity->willUmount().value(), ExitReason::Quit);
    }

    void testWatchedChangesAreUploaded()
    {
        QDir(tempDir->path()).mkpath("site");
        createConnected();
        mem->addDirectory("/home/demo/site");
        activity->dispatch(UiMsg{UiMsg::Kind::ToggleSyncBrowsing});
        QVERIFY(activity->browser().syncBrowsing());

        selectLocal("site");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::ToggleWatch));
        QVERIFY(activity->watcher()->isWatched(localDir() + "/site"));

        writeLocal("site/new.txt", "fresh");
        QVERIFY(drawUntil([this] { return mem->contains("/home/demo/site/new.txt") && !activity->isExecuting(); },
                          2500));
        QCOMPARE(mem->fileData("/home/demo/site/new.txt").value(), std::string("fresh"));
    }

    void testSortingAndHiddenToggle()
    {
        createConnected();
        writeLocal(".hidden", "h");
        writeLocal("visible", "v");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::ReloadDir));
        QVERIFY(!activity->browser().local().indexOf(".hidden"));

        term->pushChar('a');
        activity->onDraw();
        QVERIFY(activity->browser().local().indexOf(".hidden").has_value());

        UiMsg sort{UiMsg::Kind::ChangeFileSorting};
        sort.sorting = FileSorting::Size;
        activity->dispatch(sort);
        QCOMPARE(activity->browser().local().sorting(), FileSorting::Size);
    }

    void testSearchShowsFoundPane()
    {
        createConnected();
        mem->addFile("/home/demo/docs/a.txt", "a");
        mem->addFile("/home/demo/docs/deep/b.txt", "b");
        mem->addFile("/home/demo/notes.md", "n");
        activity->dispatch(UiMsg{UiMsg::Kind::ChangeTransferWindow});

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::SearchFile, "*.txt"));
        QVERIFY(!mounted(Id::WaitPopup));
        QCOMPARE(activity->browser().tab(), FileExplorerTab::FindRemote);
        FileExplorer *found = activity->browser().found();
        QVERIFY(found);
        QCOMPARE(found->count(), std::size_t(2));
        QVERIFY(found->indexOf("docs/a.txt").has_value());
        auto deep = found->indexOf("docs/deep/b.txt");
        QVERIFY(deep.has_value());
        QVERIFY(logContains("found 2 entries"));

        // Enter on a found file goes to its directory with the cursor on it
        found->setCursor(*deep);
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::EnterDirectory));
        QVERIFY(!activity->browser().found());
        QCOMPARE(activity->browser().tab(), FileExplorerTab::Remote);
        QCOMPARE(activity->browser().remote().wrkdir(), std::string("/home/demo/docs/deep"));
        QCOMPARE(activity->browser().remote().cursorEntry()->name, std::string("b.txt"));
    }

    void testSearchCancelledByAbort()
    {
        createConnected();
        writeLocal("one.txt", "1");
        term->pushKey(Key::Esc);
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::SearchFile, "*.txt"));
        QVERIFY(logContains("Search cancelled"));
        QVERIFY(!activity->browser().found());
        QVERIFY(!mounted(Id::WaitPopup));
        QCOMPARE(activity->browser().tab(), FileExplorerTab::Local);

        // A later search is not cancelled by the earlier abort
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::SearchFile, "*.txt"));
        QVERIFY(activity->browser().found());
        QCOMPARE(activity->browser().found()->count(), std::size_t(1));
    }

    void testKeysTypedDuringSearchAreKept()
    {
        createConnected();
        mem->addFile("/home/demo/docs/a.txt", "a");
        mem->addFile("/home/demo/docs/b.txt", "b");
        activity->dispatch(UiMsg{UiMsg::Kind::ChangeTransferWindow});

        term->pushKey(Key::Down);
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::SearchFile, "*.txt"));
        QVERIFY(term->keys.empty());
        FileExplorer *found = activity->browser().found();
        QVERIFY(found);
        QCOMPARE(found->cursor(), std::size_t(0));

        activity->onDraw();
        QCOMPARE(found->cursor(), std::size_t(1));
    }

    void testDeleteLocalAndRemote()
    {
        createConnected();
        writeLocal("junk.txt", "x");
        selectLocal("junk.txt");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::DeleteFile));
        QVERIFY(!QFile::exists(localFile("junk.txt")));
        QVERIFY(!activity->browser().local().indexOf("junk.txt"));
        QVERIFY(logContains("Removed"));

        mem->addFile("/home/demo/old/x.txt", "x");
        mem->addFile("/home/demo/old/sub/y.txt", "y");
        selectRemote("old");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::DeleteFile));
        QVERIFY(!mem->contains("/home/demo/old"));
        QVERIFY(!mem->contains("/home/demo/old/sub/y.txt"));
        QVERIFY(!activity->browser().remote().indexOf("old"));
    }

    void testMkdirAndNewFile()
    {
        createConnected();
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::Mkdir, "build"));
        QVERIFY(QDir(localFile("build")).exists());
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::NewFile, "notes.txt"));
        QVERIFY(QFile::exists(localFile("notes.txt")));
        QVERIFY(activity->browser().local().indexOf("notes.txt").has_value());

        activity->dispatch(UiMsg{UiMsg::Kind::ChangeTransferWindow});
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::Mkdir, "assets"));
        QVERIFY(mem->contains("/home/demo/assets"));
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::NewFile, "todo.txt"));
        QCOMPARE(mem->fileData("/home/demo/todo.txt").value(), std::string());
        QVERIFY(activity->browser().remote().indexOf("todo.txt").has_value());
        QVERIFY(!mounted(Id::ErrorPopup));

        // An existing remote file is not truncated
        mem->addFile("/home/demo/keep.txt", "data");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::NewFile, "keep.txt"));
        QVERIFY(mounted(Id::ErrorPopup));
        QCOMPARE(mem->fileData("/home/demo/keep.txt").value(), std::string("data"));
    }

    void testRenameLocalAndRemote()
    {
        createConnected();
        writeLocal("draft.txt", "text");
        selectLocal("draft.txt");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::RenameFile, "final.txt"));
        QVERIFY(!QFile::exists(localFile("draft.txt")));
        QCOMPARE(readLocal("final.txt"), QByteArray("text"));

        mem->addFile("/home/demo/report.txt", "r");
        mem->addDirectory("/home/demo/archive");
        selectRemote("report.txt");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::RenameFile, "archive"));
        QVERIFY(!mem->contains("/home/demo/report.txt"));
        QCOMPARE(mem->fileData("/home/demo/archive/report.txt").value(), std::string("r"));
        QVERIFY(logContains("Moved /home/demo/report.txt to /home/demo/archive/report.txt"));
    }

    void testCopyLocalAndRemote()
    {
        createConnected();
        writeLocal("orig.txt", "content");
        selectLocal("orig.txt");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::CopyFileTo, "dup.txt"));
        QCOMPARE(readLocal("orig.txt"), QByteArray("content"));
        QCOMPARE(readLocal("dup.txt"), QByteArray("content"));

        // Without remote exec the copy goes through the temp cache
        mem->addFile("/home/demo/src.txt", "payload");
        selectRemote("src.txt");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::CopyFileTo, "copy.txt"));
        QCOMPARE(mem->fileData("/home/demo/copy.txt").value(), std::string("payload"));
        QCOMPARE(mem->fileData("/home/demo/src.txt").value(), std::string("payload"));
        QVERIFY(logContains("Copied /home/demo/src.txt to /home/demo/copy.txt"));
        QVERIFY(!mounted(Id::ErrorPopup));

        // With exec the server copies
        std::string command;
        mem->setExecHandler([&command](const std::string& cmd) {
            command = cmd;
            return std::string();
        });
        selectRemote("src.txt");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::CopyFileTo, "other.txt"));
        QCOMPARE(command, std::string("cp -rp -- '/home/demo/src.txt' '/home/demo/other.txt'"));
    }

    void testSymlinkLocalAndRemote()
    {
        createConnected();
        writeLocal("target.txt", "t");
        selectLocal("target.txt");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::CreateSymlink, "link.txt"));
        QFileInfo link(localFile("link.txt"));
        QVERIFY(link.isSymLink());
        QCOMPARE(link.symLinkTarget(), QFileInfo(localFile("target.txt")).absoluteFilePath());

        mem->addFile("/home/demo/data.bin", "d");
        selectRemote("data.bin");
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::CreateSymlink, "data.lnk"));
        FileEntry info;
        std::string err;
        QVERIFY(mem->stat("/home/demo/data.lnk", info, err));
        QCOMPARE(info.kind, FileKind::Symlink);
        QVERIFY(logContains("Created symlink /home/demo/data.lnk -> /home/demo/data.bin"));
    }

    void testExecLocalAndRemote()
    {
        createConnected();
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::ExecuteCmd, "echo hello > made.txt; echo done"));
        QCOMPARE(readLocal("made.txt"), QByteArray("hello\n"));
        QVERIFY(logContains("(exitcode: 0)"));
        QVERIFY(logContains("done"));
        QVERIFY(activity->browser().local().indexOf("made.txt").has_value());

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::ExecuteCmd, "exit 3"));
        QVERIFY(mounted(Id::ErrorPopup));
        QCOMPARE(activity->logRing().records().front().level, LogLevel::Error);
        term->pushKey(Key::Enter);
        activity->onDraw();

        std::string command;
        mem->setExecHandler([&command](const std::string& cmd) {
            command = cmd;
            return std::string("Linux\n");
        });
        activity->dispatch(UiMsg{UiMsg::Kind::ChangeTransferWindow});
        activity->dispatch(TransferMsg::make(TransferMsg::Kind::ExecuteCmd, "uname"));
        QCOMPARE(command, std::string("cd '/home/demo' && uname"));
        QCOMPARE(activity->logRing().records().front().message, std::string("Linux"));
    }

    void testEditedRemoteFileIsUploaded()
    {
        Config cfg = testConfig();
        cfg.textEditor = "sh -c 'printf changed > \"$0\"'";
        create(std::make_unique<MemoryClient>("/home/demo"), cfg);
        activity->onDraw();
        mem->addFile("/home/demo/notes.txt", "old");
        selectRemote("notes.txt");

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::OpenTextFile));
        QCOMPARE(mem->fileData("/home/demo/notes.txt").value(), std::string("changed"));
        QVERIFY(logContains("Uploaded changes to /home/demo/notes.txt"));
        QVERIFY(term->raw);
    }

    void testUnchangedRemoteFileIsNotUploaded()
    {
        Config cfg = testConfig();
        cfg.textEditor = "true";
        create(std::make_unique<MemoryClient>("/home/demo"), cfg);
        activity->onDraw();
        mem->addFile("/home/demo/notes.txt", "old");
        selectRemote("notes.txt");
        const std::size_t before = mem->bytesPut();

        activity->dispatch(TransferMsg::make(TransferMsg::Kind::OpenTextFile));
        QVERIFY(logContains("Edited /home/demo/notes.txt"));
        QVERIFY(!logContains("Uploaded changes"));
        QCOMPARE(mem->bytesPut(), before);
        QVERIFY(!mounted(Id::ErrorPopup));
    }
};

QTEST_GUILESS_MAIN(TestFileTransferActivity)
#include "test_filetransferactivity.moc"
