// Helpers built only on the RemoteClient interface.
#include "termxfer/RemoteClient.hpp"

namespace termxfer {

bool removeRemoteRecursive(RemoteClient& client, const FileEntry& entry, std::string& err) {
    // Symlinks are removed as links, never followed
    if (entry.kind != FileKind::Directory) return client.removeFile(entry.path, err);

    std::vector<FileEntry> children;
    if (!client.list(entry.path, children, err)) return false;
    for (const auto& child : children) {
        if (!removeRemoteRecursive(client, child, err)) return false;
    }
    return client.removeDir(entry.path, err);
}

} // namespace termxfer
