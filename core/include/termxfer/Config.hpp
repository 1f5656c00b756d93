// Read-only configuration handed to the activity. Defaults live here;
// the application fills it from its settings store.
#pragma once
#include "ConnectionManager.hpp"
#include "FileExplorer.hpp"
#include "FileTypes.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace termxfer {

// Colour names understood by the terminal runtime: black, red, green, yellow, blue, magenta, cyan, white
struct Theme {
    std::string explorerLocal = "yellow";
    std::string explorerRemote = "cyan";
    std::string logPanel = "white";
    std::string progressBar = "green";
    std::string error = "red";
    std::string popup = "white";
};

struct Config {
    FileSorting sorting = FileSorting::Name;
    bool showHidden = false;
    std::string textEditor = "vi";
    int logPanelHeight = 8;

    std::chrono::milliseconds watcherDelay{5000};
    std::size_t maxWatchedPaths = 32;

    ReconnectPolicy reconnect;

    KnownHostsPolicy knownHostsPolicy = KnownHostsPolicy::Strict;
    std::optional<std::string> knownHostsPath;

    Theme theme;
};

} // namespace termxfer
