#include <QtTest>

#include "termxfer/Browser.hpp"
#include "termxfer/FileExplorer.hpp"

using namespace termxfer;

namespace {

FileEntry entry(const std::string& name, FileKind kind, std::uint64_t size = 0, std::uint64_t mtime = 0)
{
    FileEntry e;
    e.name = name;
    e.path = "/dir/" + name;
    e.kind = kind;
    e.size = size;
    e.mtime = mtime;
    return e;
}

std::vector<FileEntry> sample()
{
    return {
        entry("zeta.txt", FileKind::File, 10, 300),
        entry("Alpha.txt", FileKind::File, 500, 100),
        entry("src", FileKind::Directory, 0, 50),
        entry(".hidden", FileKind::File, 1, 999),
        entry("beta.bin", FileKind::File, 20, 200),
    };
}

std::vector<std::string> names(const FileExplorer& ex)
{
    std::vector<std::string> out;
    for (std::size_t i = 0; i < ex.count(); ++i) out.push_back(ex.at(i)->name);
    return out;
}

} // namespace

class TestFileExplorer : public QObject
{
    Q_OBJECT

private slots:
    void testNameSortingDirectoriesFirstCaseInsensitive()
    {
        FileExplorer ex(FileSorting::Name, false);
        ex.setFiles(sample());
        const std::vector<std::string> expected{"src", "Alpha.txt", "beta.bin", "zeta.txt"};
        QCOMPARE(names(ex), expected);
    }

    void testModifyTimeAndSizeSorting()
    {
        FileExplorer ex(FileSorting::ModifyTime, false);
        ex.setFiles(sample());
        std::vector<std::string> expected{"src", "zeta.txt", "beta.bin", "Alpha.txt"};
        QCOMPARE(names(ex), expected);

        ex.setSorting(FileSorting::Size);
        expected = {"src", "Alpha.txt", "beta.bin", "zeta.txt"};
        QCOMPARE(names(ex), expected);
    }

    void testHiddenFilesToggle()
    {
        FileExplorer ex(FileSorting::Name, false);
        ex.setFiles(sample());
        QCOMPARE(ex.count(), std::size_t(4));
        QVERIFY(!ex.indexOf(".hidden").has_value());
        ex.toggleHidden();
        QCOMPARE(ex.count(), std::size_t(5));
        QVERIFY(ex.indexOf(".hidden").has_value());
    }

    void testCursorIsClamped()
    {
        FileExplorer ex(FileSorting::Name, false);
        ex.setFiles(sample());
        ex.setCursor(100);
        QCOMPARE(ex.cursor(), std::size_t(3));
        ex.moveCursor(-10);
        QCOMPARE(ex.cursor(), std::size_t(0));

        ex.setCursor(3);
        ex.setFiles({entry("only", FileKind::File)});
        QCOMPARE(ex.cursor(), std::size_t(0));
        ex.setFiles({});
        QVERIFY(ex.cursorEntry() == nullptr);
    }

    void testSelectionPrefersMarks()
    {
        FileExplorer ex(FileSorting::Name, false);
        ex.setFiles(sample());
        ex.setCursor(1);
        auto sel = ex.selection();
        QCOMPARE(sel.size(), std::size_t(1));
        QCOMPARE(sel.front().name, std::string("Alpha.txt"));

        ex.toggleMark(2);
        ex.toggleMark(3);
        sel = ex.selection();
        QCOMPARE(sel.size(), std::size_t(2));
        QCOMPARE(sel[0].name, std::string("beta.bin"));
        QCOMPARE(sel[1].name, std::string("zeta.txt"));

        ex.toggleMark(3);
        QCOMPARE(ex.markedCount(), std::size_t(1));
        ex.markAll();
        QCOMPARE(ex.markedCount(), std::size_t(4));
        ex.clearMarks();
        QCOMPARE(ex.selection().size(), std::size_t(1));
    }

    void testMarksDroppedWhenEntryDisappears()
    {
        FileExplorer ex(FileSorting::Name, false);
        ex.setFiles(sample());
        ex.toggleMark(*ex.indexOf("beta.bin"));
        ex.toggleMark(*ex.indexOf("zeta.txt"));

        auto files = sample();
        files.erase(files.begin()); // zeta.txt
        ex.setFiles(files);
        QCOMPARE(ex.markedCount(), std::size_t(1));
        QVERIFY(ex.isMarked("/dir/beta.bin"));
    }

    void testHistoryIsBounded()
    {
        FileExplorer ex;
        for (int i = 0; i < 20; ++i) ex.pushHistory("/d" + std::to_string(i));
        QCOMPARE(ex.historySize(), FileExplorer::kHistoryCapacity);
        QCOMPARE(ex.popHistory().value(), std::string("/d19"));
        ex.pushHistory("/same");
        ex.pushHistory("/same");
        QCOMPARE(ex.popHistory().value(), std::string("/same"));
        QCOMPARE(ex.popHistory().value(), std::string("/d18"));
    }

    void testBrowserMirrorPath()
    {
        Browser b(FileSorting::Name, false);
        QVERIFY(!b.mirrorPath(Side::Local, "/home/me/work").has_value());

        b.setAnchors("/home/me/work", "/srv/site");
        QCOMPARE(b.mirrorPath(Side::Local, "/home/me/work").value(), std::string("/srv/site"));
        QCOMPARE(b.mirrorPath(Side::Local, "/home/me/work/css").value(), std::string("/srv/site/css"));
        QCOMPARE(b.mirrorPath(Side::Remote, "/srv/site/js/lib").value(), std::string("/home/me/work/js/lib"));
        QVERIFY(!b.mirrorPath(Side::Local, "/home/me").has_value());
    }

    void testBrowserTabs()
    {
        Browser b(FileSorting::Name, false);
        QCOMPARE(b.side(), Side::Local);
        b.changeTab(FileExplorerTab::Remote);
        QCOMPARE(b.side(), Side::Remote);
        QCOMPARE(&b.focused(), &b.remote());

        auto found = std::make_unique<FileExplorer>();
        FileExplorer* raw = found.get();
        b.setFound(Side::Remote, std::move(found));
        QVERIFY(b.inFindMode());
        QCOMPARE(b.side(), Side::Remote);
        QCOMPARE(&b.focused(), raw);

        b.clearFound();
        QVERIFY(!b.inFindMode());
        QCOMPARE(b.tab(), FileExplorerTab::Remote);
        QVERIFY(b.found() == nullptr);
    }
};

QTEST_GUILESS_MAIN(TestFileExplorer)
#include "test_fileexplorer.moc"
