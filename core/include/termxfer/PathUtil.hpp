// POSIX-style path helpers shared by local and remote panes.
// Remote paths are always '/'-separated, so these work on plain strings.
#pragma once
#include <optional>
#include <string>

namespace termxfer {

// Collapse duplicate separators, "." and ".." components. Result is absolute if input is.
std::string normalizePath(const std::string& path);

std::string joinPath(const std::string& dir, const std::string& name);

// Parent directory; "/" for top level entries and for "/" itself.
std::string parentPath(const std::string& path);

std::string baseName(const std::string& path);

// True if path equals root or lies below it.
bool isUnder(const std::string& path, const std::string& root);

// Path of "path" relative to "anchor" ("" when equal); nullopt when not under anchor.
std::optional<std::string> relativePath(const std::string& anchor, const std::string& path);

// Shell glob match on a base name (fnmatch semantics, '*' '?' and '[...]').
bool globMatch(const std::string& pattern, const std::string& name);

// Single-quote s for a POSIX shell command line.
std::string shellQuote(const std::string& s);

// Resolve a user typed path against a working directory.
std::string resolvePath(const std::string& wrkdir, const std::string& input);

} // namespace termxfer
