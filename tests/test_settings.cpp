#include <QtTest>
#include <QTemporaryDir>
#include <QSettings>

#include "Settings.hpp"

using namespace termxfer;

class TestSettings : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir = nullptr;

    QString iniPath() const { return tempDir->filePath("termxfer.ini"); }

private slots:
    void init()
    {
        tempDir = new QTemporaryDir();
        QVERIFY(tempDir->isValid());
        qunsetenv("EDITOR");
    }

    void cleanup()
    {
        delete tempDir;
        tempDir = nullptr;
    }

    void testDefaults()
    {
        QSettings s(iniPath(), QSettings::IniFormat);
        const Config c = loadConfig(s);
        QCOMPARE(c.sorting, FileSorting::Name);
        QVERIFY(!c.showHidden);
        QCOMPARE(c.textEditor, std::string("vi"));
        QCOMPARE(c.reconnect.maxAttempts, 5);
        QCOMPARE(c.reconnect.initialDelay, std::chrono::milliseconds(500));
        QCOMPARE(c.knownHostsPolicy, KnownHostsPolicy::Strict);
        QVERIFY(!c.knownHostsPath);
        QCOMPARE(c.theme.explorerRemote, std::string("cyan"));
    }

    void testReadsAllGroups()
    {
        {
            QSettings w(iniPath(), QSettings::IniFormat);
            w.setValue("UI/sorting", "size");
            w.setValue("UI/showHidden", true);
            w.setValue("UI/textEditor", "nano");
            w.setValue("UI/logPanelHeight", 12);
            w.setValue("Watcher/delayMs", 250);
            w.setValue("Watcher/maxPaths", 4);
            w.setValue("Connection/maxAttempts", 0);
            w.setValue("Connection/initialDelayMs", 100);
            w.setValue("Connection/maxDelayMs", 1600);
            w.setValue("Security/knownHostsPolicy", "accept-new");
            w.setValue("Security/knownHostsPath", "/tmp/known_hosts");
            w.setValue("Theme/progressBar", "blue");
            w.sync();
        }
        QSettings s(iniPath(), QSettings::IniFormat);
        const Config c = loadConfig(s);
        QCOMPARE(c.sorting, FileSorting::Size);
        QVERIFY(c.showHidden);
        QCOMPARE(c.textEditor, std::string("nano"));
        QCOMPARE(c.logPanelHeight, 12);
        QCOMPARE(c.watcherDelay, std::chrono::milliseconds(250));
        QCOMPARE(c.maxWatchedPaths, std::size_t(4));
        QCOMPARE(c.reconnect.maxAttempts, 0);
        QCOMPARE(c.reconnect.initialDelay, std::chrono::milliseconds(100));
        QCOMPARE(c.reconnect.maxDelay, std::chrono::milliseconds(1600));
        QCOMPARE(c.knownHostsPolicy, KnownHostsPolicy::AcceptNew);
        QCOMPARE(c.knownHostsPath.value(), std::string("/tmp/known_hosts"));
        QCOMPARE(c.theme.progressBar, std::string("blue"));
    }

    void testInvalidValuesFallBack()
    {
        {
            QSettings w(iniPath(), QSettings::IniFormat);
            w.setValue("UI/sorting", "colour");
            w.setValue("UI/logPanelHeight", -3);
            w.setValue("Watcher/delayMs", "soon");
            w.setValue("Connection/maxAttempts", -1);
            w.setValue("Connection/initialDelayMs", 900);
            w.setValue("Connection/maxDelayMs", 200);
            w.setValue("Security/knownHostsPolicy", "trust-me");
            w.sync();
        }
        QSettings s(iniPath(), QSettings::IniFormat);
        const Config c = loadConfig(s);
        QCOMPARE(c.sorting, FileSorting::Name);
        QCOMPARE(c.logPanelHeight, 8);
        QCOMPARE(c.watcherDelay, std::chrono::milliseconds(5000));
        QCOMPARE(c.reconnect.maxAttempts, 5);
        // The cap never goes below the first delay
        QCOMPARE(c.reconnect.maxDelay, std::chrono::milliseconds(900));
        QCOMPARE(c.knownHostsPolicy, KnownHostsPolicy::Strict);
    }

    void testEditorFromEnvironment()
    {
        qputenv("EDITOR", "emacs");
        QSettings s(iniPath(), QSettings::IniFormat);
        QCOMPARE(loadConfig(s).textEditor, std::string("emacs"));
        qunsetenv("EDITOR");
    }
};

QTEST_GUILESS_MAIN(TestSettings)
#include "test_settings.moc"
