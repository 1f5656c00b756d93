// Settings keys: UI/*, Watcher/*, Connection/*, Security/*, Theme/*.
#include "Settings.hpp"
#include "termxfer/Log.hpp"
#include <QSettings>
#include <QString>
#include <cstdlib>

namespace termxfer {

namespace {

std::string str(QSettings& s, const char* key, const std::string& def) {
    return s.value(key, QString::fromStdString(def)).toString().toStdString();
}

int positive(QSettings& s, const char* key, int def) {
    bool ok = false;
    const int v = s.value(key, def).toInt(&ok);
    if (!ok || v <= 0) {
        LOGW("settings: invalid %s, using %d", key, def);
        return def;
    }
    return v;
}

} // namespace

Config loadConfig(QSettings& s) {
    Config c;

    const std::string sorting = str(s, "UI/sorting", fileSortingName(c.sorting));
    if (auto fs = fileSortingFromName(sorting)) c.sorting = *fs;
    else LOGW("settings: unknown sorting '%s'", sorting.c_str());
    c.showHidden = s.value("UI/showHidden", c.showHidden).toBool();
    c.textEditor = str(s, "UI/textEditor", c.textEditor);
    if (const char* editor = std::getenv("EDITOR"); editor && *editor && !s.contains("UI/textEditor")) {
        c.textEditor = editor;
    }
    c.logPanelHeight = positive(s, "UI/logPanelHeight", c.logPanelHeight);

    c.watcherDelay = std::chrono::milliseconds(positive(s, "Watcher/delayMs", int(c.watcherDelay.count())));
    c.maxWatchedPaths = static_cast<std::size_t>(positive(s, "Watcher/maxPaths", int(c.maxWatchedPaths)));

    // 0 attempts means retry forever
    const int attempts = s.value("Connection/maxAttempts", c.reconnect.maxAttempts).toInt();
    c.reconnect.maxAttempts = attempts < 0 ? c.reconnect.maxAttempts : attempts;
    c.reconnect.initialDelay = std::chrono::milliseconds(
        positive(s, "Connection/initialDelayMs", int(c.reconnect.initialDelay.count())));
    c.reconnect.maxDelay = std::chrono::milliseconds(
        positive(s, "Connection/maxDelayMs", int(c.reconnect.maxDelay.count())));
    if (c.reconnect.maxDelay < c.reconnect.initialDelay) c.reconnect.maxDelay = c.reconnect.initialDelay;

    const std::string policy = str(s, "Security/knownHostsPolicy", "strict");
    if (policy == "strict") c.knownHostsPolicy = KnownHostsPolicy::Strict;
    else if (policy == "accept-new") c.knownHostsPolicy = KnownHostsPolicy::AcceptNew;
    else if (policy == "off") c.knownHostsPolicy = KnownHostsPolicy::Off;
    else LOGW("settings: unknown known hosts policy '%s', using strict", policy.c_str());
    if (s.contains("Security/knownHostsPath")) c.knownHostsPath = str(s, "Security/knownHostsPath", {});

    c.theme.explorerLocal = str(s, "Theme/explorerLocal", c.theme.explorerLocal);
    c.theme.explorerRemote = str(s, "Theme/explorerRemote", c.theme.explorerRemote);
    c.theme.logPanel = str(s, "Theme/logPanel", c.theme.logPanel);
    c.theme.progressBar = str(s, "Theme/progressBar", c.theme.progressBar);
    c.theme.error = str(s, "Theme/error", c.theme.error);
    c.theme.popup = str(s, "Theme/popup", c.theme.popup);
    return c;
}

} // namespace termxfer
