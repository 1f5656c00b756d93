// Basic types shared between the engine, the backends and the terminal front end.
// Kept as plain values so listings can be copied wholesale into panes.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <functional>

namespace termxfer {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires exact match with known_hosts.
    AcceptNew,  // TOFU: accept and save new hosts; reject key changes.
    Off         // No verification (not recommended).
};

enum class FileKind { File, Directory, Symlink };

struct FileEntry {
    std::string   name;      // base name
    std::string   path;      // absolute path
    FileKind      kind = FileKind::File;
    std::string   symlink_target;       // only for Symlink
    bool          symlink_to_dir = false;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX permission bits

    bool isDir() const { return kind == FileKind::Directory || (kind == FileKind::Symlink && symlink_to_dir); }
    bool isHidden() const { return !name.empty() && name[0] == '.'; }
};

// Callback to answer keyboard-interactive prompts.
// Must return true and fill "responses" with one entry per prompt if the user provided input.
// If it returns false, the backend uses a heuristic (username/password) as a fallback.
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Host key confirmation (TOFU) when known_hosts lacks an entry.
    // Return true to accept and save, false to reject.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    // Custom handling for keyboard-interactive (e.g., OTP/2FA). Optional.
    KbdIntPromptsCB keyboard_interactive_cb;
};

enum class Protocol { Sftp, Memory };

// Everything needed to build a backend and start a session.
struct FileTransferParams {
    Protocol protocol = Protocol::Sftp;
    SessionOptions session;
    std::optional<std::string> remote_dir;  // initial remote working directory
    std::optional<std::string> local_dir;   // initial local working directory
};

const char* protocolName(Protocol p);

} // namespace termxfer
