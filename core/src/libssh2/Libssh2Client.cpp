// libssh2 backend: manages TCP socket, SSH session, and SFTP channel.
// Includes keepalive, known_hosts validation, resume support and remote exec.
#include "termxfer/Libssh2Client.hpp"
#include "termxfer/Log.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cstring>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <cstdlib>
#include <cstdio>
#include <sstream>
#include <utility>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace termxfer {

// Global libssh2 initialization (once per process)
static bool g_libssh2_inited = false;

namespace {

// Context for keyboard-interactive: respond with username/password based on the prompt
struct KbdIntCtx {
    const char* user;
    const char* pass;
    const KbdIntPromptsCB* cb; // optional: UI callback for prompts
};

char* dupAnswer(const std::string& a) {
    char* buf = static_cast<char*>(std::malloc(a.size() + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, a.data(), a.size());
    buf[a.size()] = '\0';
    return buf;
}

bool promptAsksForUser(const char* prompt) {
    std::string p(prompt ? prompt : "");
    for (auto& c : p) c = (char)std::tolower((unsigned char)c);
    return p.find("user") != std::string::npos || p.find("name") != std::string::npos;
}

// Keyboard-interactive callback: answer through the UI callback, or fall back to username/password
void kbint_callback(const char* name, int name_len,
                    const char* instruction, int instruction_len,
                    int num_prompts,
                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                    void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    std::vector<std::string> answers;
    bool answered = false;
    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> ptxts;
        ptxts.reserve((size_t)num_prompts);
        for (int i = 0; i < num_prompts; ++i) {
            const char* pt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
            ptxts.emplace_back(pt);
        }
        std::string nm = (name && name_len > 0) ? std::string(name, (size_t)name_len) : std::string();
        std::string ins = (instruction && instruction_len > 0) ? std::string(instruction, (size_t)instruction_len) : std::string();
        answered = (*(ctx->cb))(nm, ins, ptxts, answers) && (int)answers.size() >= num_prompts;
    }
    for (int i = 0; i < num_prompts; ++i) {
        std::string ans;
        if (answered) {
            ans = answers[(size_t)i];
        } else {
            const char* prompt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
            const char* src = promptAsksForUser(prompt) ? ctx->user : ctx->pass;
            ans = src ? src : "";
        }
        responses[i].text = ans.empty() ? nullptr : dupAnswer(ans);
        responses[i].length = responses[i].text ? (unsigned int)ans.size() : 0;
    }
}

FileKind kindFromPermissions(const LIBSSH2_SFTP_ATTRIBUTES& a) {
    if (!(a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)) return FileKind::File;
    switch (a.permissions & LIBSSH2_SFTP_S_IFMT) {
        case LIBSSH2_SFTP_S_IFDIR: return FileKind::Directory;
        case LIBSSH2_SFTP_S_IFLNK: return FileKind::Symlink;
        default: return FileKind::File;
    }
}

void fillFromAttributes(FileEntry& fi, const LIBSSH2_SFTP_ATTRIBUTES& a) {
    fi.kind = kindFromPermissions(a);
    fi.size = (a.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::uint64_t)a.filesize : 0;
    fi.mtime = (a.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? (std::uint64_t)a.mtime : 0;
    fi.mode = (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? (a.permissions & 07777) : 0;
}

std::string joinRemote(const std::string& dir, const std::string& name) {
    if (dir.empty() || dir == "/") return "/" + name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string baseNameOf(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

Libssh2Client::Libssh2Client(SessionOptions opt) : opt_(std::move(opt)) {
    if (!g_libssh2_inited) {
        if (libssh2_init(0) != 0) LOGE("libssh2_init failed");
        g_libssh2_inited = true;
    }
}

Libssh2Client::~Libssh2Client() {
    disconnect();
}

std::string Libssh2Client::description() const {
    std::ostringstream oss;
    oss << "sftp://";
    if (!opt_.username.empty()) oss << opt_.username << '@';
    oss << opt_.host << ':' << opt_.port;
    return oss.str();
}

bool Libssh2Client::ready(std::string& err) const {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    return true;
}

void Libssh2Client::checkTransport() {
    if (!session_) return;
    const int e = libssh2_session_last_errno(session_);
    if (e == LIBSSH2_ERROR_SOCKET_SEND || e == LIBSSH2_ERROR_SOCKET_RECV ||
        e == LIBSSH2_ERROR_SOCKET_DISCONNECT || e == LIBSSH2_ERROR_SOCKET_TIMEOUT ||
        e == LIBSSH2_ERROR_TIMEOUT) {
        LOGW("sftp transport failure (libssh2 errno=%d), dropping session", e);
        disconnect();
    }
}

bool Libssh2Client::tcpConnect(const std::string& host, uint16_t port, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // Keepalive lets a silently dropped peer surface as a socket error
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2Client::verifyHostKey(std::string& err) {
    if (opt_.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt_.known_hosts_path.has_value()) {
        khPath = *opt_.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }
    if (!khLoaded && opt_.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not read the server host key";
        return false;
    }

    int alg = 0;
    std::string algName;
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA; algName = "RSA"; break;
        case LIBSSH2_HOSTKEY_TYPE_DSS: alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS; algName = "DSA"; break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256; algName = "ECDSA-256"; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384; algName = "ECDSA-384"; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521; algName = "ECDSA-521"; break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: alg = LIBSSH2_KNOWNHOST_KEY_ED25519; algName = "ED25519"; break;
#endif
        default: algName = "UNKNOWN"; break;
    }

    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt_.host.c_str(), opt_.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt_.host.c_str(), opt_.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (opt_.known_hosts_policy == KnownHostsPolicy::AcceptNew && check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        std::string fpStr;
        const unsigned char* h = reinterpret_cast<const unsigned char*>(
            libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
        if (h) {
            std::ostringstream oss;
            oss << "SHA256:";
            for (int i = 0; i < 32; ++i) {
                if (i) oss << ':';
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
                oss << b;
            }
            fpStr = oss.str();
        }
        const bool confirmed = opt_.hostkey_confirm_cb &&
                               opt_.hostkey_confirm_cb(opt_.host, opt_.port, algName, fpStr);
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err = "Unknown host: fingerprint not confirmed";
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path is not defined";
            return false;
        }
        const int addrc = libssh2_knownhost_addc(nh, opt_.host.c_str(), nullptr,
                                                 hostkey, keylen, nullptr, 0, typemask_plain, nullptr);
        if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not add host to known_hosts";
            return false;
        }
        libssh2_knownhost_free(nh);
        LOGI("added %s (%s) to %s", opt_.host.c_str(), algName.c_str(), khPath.c_str());
        return true;
    }
    libssh2_knownhost_free(nh);
    // AcceptNew tolerates nothing else than NOTFOUND; Strict fails on anything but a match
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key does not match known_hosts"
              : "Host not found in known_hosts";
    return false;
}

bool Libssh2Client::authenticateWithAgent() {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    bool authed = false;
    if (agent && libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3; // conservative limit
        while (libssh2_agent_get_identity(agent, &identity, prev) == 0 && tries < kMaxAgentTries) {
            prev = identity;
            ++tries;
            int arc = -1;
            for (;;) {
                arc = libssh2_agent_userauth(agent, opt_.username.c_str(), identity);
                if (arc != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (arc == 0) {
                authed = true;
                break;
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

// Authentication order: private key if given, then password (and keyboard-interactive
// when the server offers it), then ssh-agent.
bool Libssh2Client::authenticate(std::string& err) {
    if (opt_.private_key_path.has_value()) {
        const char* passphrase = opt_.private_key_passphrase ? opt_.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_,
                                                     opt_.username.c_str(),
                                                     nullptr,  // public key derived from the private key
                                                     opt_.private_key_path->c_str(),
                                                     passphrase);
        if (rc != 0) {
            err = "Public key authentication failed";
            return false;
        }
        return true;
    }

    std::string authlist;
    auto fetchMethods = [&]() {
        if (!authlist.empty()) return;
        char* methods = libssh2_userauth_list(session_, opt_.username.c_str(), (unsigned)opt_.username.size());
        authlist = methods ? std::string(methods) : std::string();
    };
    auto hasMethod = [&](const char* m) { return authlist.find(m) != std::string::npos; };

    if (opt_.password.has_value()) {
        int rc_pw = -1;
        for (;;) {
            rc_pw = libssh2_userauth_password(session_, opt_.username.c_str(), opt_.password->c_str());
            if (rc_pw != LIBSSH2_ERROR_EAGAIN) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (rc_pw == 0) return true;
        // The rest would cascade-fail on a closed transport
        if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
            rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after the password attempt";
            return false;
        }
        fetchMethods();
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{opt_.username.c_str(), opt_.password->c_str(), &opt_.keyboard_interactive_cb};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            int rc_kbd = -1;
            for (;;) {
                rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt_.username.c_str(), kbint_callback);
                if (rc_kbd != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs) *abs = nullptr;
            if (rc_kbd == 0) return true;
        }
    }

    fetchMethods();
    if (hasMethod("publickey") && authenticateWithAgent()) return true;

    char* emsgPtr = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
    err = "Authentication failed";
    if (!authlist.empty()) err += " (methods: " + authlist + ")";
    if (emsgPtr && emlen > 0) err += ": " + std::string(emsgPtr, (size_t)emlen);
    return false;
}

bool Libssh2Client::connect(std::string& err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (!tcpConnect(opt_.host, opt_.port, err)) return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        disconnect();
        return false;
    }
    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed";
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, 20000); // 20s
#endif
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(err) || !authenticate(err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not initialize SFTP";
        disconnect();
        return false;
    }
    connected_ = true;
    LOGI("connected to %s", description().c_str());
    return true;
}

void Libssh2Client::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2Client::workingDirectory(std::string& out, std::string& err) {
    if (!ready(err)) return false;
    char buf[1024];
    int rc = libssh2_sftp_realpath(sftp_, ".", buf, sizeof(buf));
    if (rc <= 0) {
        checkTransport();
        err = "sftp_realpath failed";
        return false;
    }
    out.assign(buf, (size_t)rc);
    return true;
}

bool Libssh2Client::list(const std::string& remote_path,
                         std::vector<FileEntry>& out,
                         std::string& err) {
    if (!ready(err)) return false;

    const std::string path = remote_path.empty() ? "/" : remote_path;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        checkTransport();
        err = "sftp_opendir failed for: " + path;
        return false;
    }

    std::vector<FileEntry> entries;
    entries.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            FileEntry fi{};
            fi.name = std::string(filename, (size_t)rc);
            if (fi.name == "." || fi.name == "..") continue;
            fi.path = joinRemote(path, fi.name);
            fillFromAttributes(fi, attrs);
            entries.push_back(std::move(fi));
        } else if (rc == 0) {
            break;
        } else {
            libssh2_sftp_closedir(dir);
            checkTransport();
            err = "sftp_readdir failed for: " + path;
            return false;
        }
    }
    libssh2_sftp_closedir(dir);

    // Resolve symlink targets once the directory handle is closed
    for (auto& fi : entries) {
        if (fi.kind != FileKind::Symlink) continue;
        char target[1024];
        int n = libssh2_sftp_readlink(sftp_, fi.path.c_str(), target, sizeof(target));
        if (n > 0) fi.symlink_target.assign(target, (size_t)n);
        LIBSSH2_SFTP_ATTRIBUTES st{};
        if (libssh2_sftp_stat(sftp_, fi.path.c_str(), &st) == 0) {
            fi.symlink_to_dir = (kindFromPermissions(st) == FileKind::Directory);
        }
    }
    out = std::move(entries);
    return true;
}

// Download a remote file to local. Reports progress and supports cooperative cancellation.
bool Libssh2Client::get(const std::string& remote,
                        const std::string& local,
                        std::string& err,
                        ProgressCB progress,
                        CancelCB shouldCancel,
                        bool resume) {
    if (!ready(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        checkTransport();
        err = "Could not stat remote file " + remote;
        return false;
    }
    const std::size_t total = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::size_t)st.filesize : 0;

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        checkTransport();
        err = "Could not open remote file for reading: " + remote;
        return false;
    }

    FILE* lf = nullptr;
    std::size_t offset = 0;
    if (resume) {
        lf = std::fopen(local.c_str(), "ab");
        if (lf) {
            long cur = std::ftell(lf);
            if (cur > 0) offset = (std::size_t)cur;
            if (offset > 0 && offset < total) {
                libssh2_sftp_seek64(rh, (libssh2_uint64_t)offset);
            } else if (offset >= total) {
                // Nothing usable to resume from
                std::fclose(lf);
                lf = nullptr;
                offset = 0;
            }
        }
    }
    if (!lf) lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err = "Could not open local file for writing: " + local;
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = offset;
    bool ok = true;

    while (true) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled by user";
            ok = false;
            break;
        }
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
                err = "Local write failed: " + local;
                ok = false;
                break;
            }
            done += (std::size_t)n;
            if (progress) progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            err = "Remote read failed: " + remote;
            ok = false;
            break;
        }
    }

    if (std::fclose(lf) != 0 && ok) {
        err = "Local write failed: " + local;
        ok = false;
    }
    libssh2_sftp_close(rh);
    if (!ok) checkTransport();
    return ok;
}

// Upload a local file to remote (create/truncate). Reports progress and supports cancellation.
bool Libssh2Client::put(const std::string& local,
                        const std::string& remote,
                        std::string& err,
                        ProgressCB progress,
                        CancelCB shouldCancel,
                        bool resume) {
    if (!ready(err)) return false;

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading: " + local;
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::size_t total = fsz > 0 ? (std::size_t)fsz : 0;

    long startOffset = 0;
    if (resume) {
        LIBSSH2_SFTP_ATTRIBUTES stR{};
        if (libssh2_sftp_stat_ex(sftp_, remote.c_str(), (unsigned)remote.size(), LIBSSH2_SFTP_STAT, &stR) == 0) {
            if (stR.flags & LIBSSH2_SFTP_ATTR_SIZE) startOffset = (long)stR.filesize;
        }
        if ((std::size_t)startOffset >= total) startOffset = 0;
    }
    const bool append = resume && startOffset > 0;
    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | (append ? 0 : LIBSSH2_FXF_TRUNC);
    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        flags, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        checkTransport();
        err = "Could not open remote file for writing: " + remote;
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;

    if (append) {
        libssh2_sftp_seek64(wh, (libssh2_uint64_t)startOffset);
        if (std::fseek(lf, startOffset, SEEK_SET) != 0) {
            err = "Could not seek local file: " + local;
            libssh2_sftp_close(wh);
            std::fclose(lf);
            return false;
        }
        done = (std::size_t)startOffset;
    }

    bool ok = true;
    while (ok) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled by user";
            ok = false;
            break;
        }
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err = "Local read failed: " + local;
                ok = false;
            }
            break; // EOF
        }
        char* p = buf.data();
        size_t remain = n;
        while (remain > 0) {
            ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                err = "Remote write failed: " + remote;
                ok = false;
                break;
            }
            remain -= (size_t)w;
            p += w;
            done += (size_t)w;
        }
        if (ok && progress) progress(done, total);
    }

    libssh2_sftp_close(wh);
    std::fclose(lf);
    if (!ok) checkTransport();
    return ok;
}

// Lightweight existence check using sftp_stat.
bool Libssh2Client::exists(const std::string& remote_path,
                           bool& isDir,
                           std::string& err) {
    isDir = false;
    if (!ready(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_SFTP_STAT, &st);
    if (rc == 0) {
        isDir = (kindFromPermissions(st) == FileKind::Directory);
        return true;
    }

    unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
    if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE || sftp_err == LIBSSH2_FX_FAILURE) {
        err.clear();
        return false; // does not exist
    }
    checkTransport();
    err = "Remote stat failed: " + remote_path;
    return false;
}

bool Libssh2Client::stat(const std::string& remote_path,
                         FileEntry& info,
                         std::string& err) {
    if (!ready(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_SFTP_LSTAT, &st);
    if (rc != 0) {
        unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
        if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE || sftp_err == LIBSSH2_FX_FAILURE) {
            err.clear();
            return false;
        }
        checkTransport();
        err = "Remote stat failed: " + remote_path;
        return false;
    }
    info = FileEntry{};
    info.name = baseNameOf(remote_path);
    info.path = remote_path;
    fillFromAttributes(info, st);
    if (info.kind == FileKind::Symlink) {
        char target[1024];
        int n = libssh2_sftp_readlink(sftp_, remote_path.c_str(), target, sizeof(target));
        if (n > 0) info.symlink_target.assign(target, (size_t)n);
        LIBSSH2_SFTP_ATTRIBUTES tst{};
        if (libssh2_sftp_stat(sftp_, remote_path.c_str(), &tst) == 0)
            info.symlink_to_dir = (kindFromPermissions(tst) == FileKind::Directory);
    }
    return true;
}

bool Libssh2Client::mkdir(const std::string& remote_dir,
                          std::string& err,
                          unsigned int mode) {
    if (!ready(err)) return false;
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode) != 0) {
        checkTransport();
        err = "sftp_mkdir failed: " + remote_dir;
        return false;
    }
    return true;
}

bool Libssh2Client::removeFile(const std::string& remote_path,
                               std::string& err) {
    if (!ready(err)) return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        checkTransport();
        err = "sftp_unlink failed: " + remote_path;
        return false;
    }
    return true;
}

bool Libssh2Client::removeDir(const std::string& remote_dir,
                              std::string& err) {
    if (!ready(err)) return false;
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        checkTransport();
        err = "sftp_rmdir failed (directory not empty?): " + remote_dir;
        return false;
    }
    return true;
}

bool Libssh2Client::rename(const std::string& from,
                           const std::string& to,
                           std::string& err,
                           bool overwrite) {
    if (!ready(err)) return false;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    int rc = libssh2_sftp_rename_ex(
        sftp_,
        from.c_str(), (unsigned)from.size(),
        to.c_str(), (unsigned)to.size(),
        flags);
    if (rc != 0) {
        checkTransport();
        err = "sftp_rename failed: " + from + " -> " + to;
        return false;
    }
    return true;
}

bool Libssh2Client::symlink(const std::string& target,
                            const std::string& link_path,
                            std::string& err) {
    if (!ready(err)) return false;
    // libssh2 takes the link name through a non-const buffer
    std::string link = link_path;
    int rc = libssh2_sftp_symlink_ex(sftp_, target.c_str(), (unsigned)target.size(),
                                     &link[0], (unsigned)link.size(), LIBSSH2_SFTP_SYMLINK);
    if (rc != 0) {
        checkTransport();
        err = "sftp_symlink failed: " + link_path + " -> " + target;
        return false;
    }
    return true;
}

bool Libssh2Client::exec(const std::string& command,
                         std::string& output,
                         std::string& err) {
    if (!ready(err)) return false;
    LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(session_);
    if (!ch) {
        checkTransport();
        err = "Could not open an SSH channel";
        return false;
    }
    if (libssh2_channel_exec(ch, command.c_str()) != 0) {
        libssh2_channel_free(ch);
        checkTransport();
        err = "Could not execute: " + command;
        return false;
    }
    output.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, (size_t)n);
        } else if (n == 0) {
            break;
        } else {
            libssh2_channel_free(ch);
            checkTransport();
            err = "Reading command output failed";
            return false;
        }
    }
    std::string errOut;
    for (;;) {
        ssize_t n = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        if (n <= 0) break;
        errOut.append(buf, (size_t)n);
    }
    libssh2_channel_close(ch);
    libssh2_channel_wait_closed(ch);
    const int status = libssh2_channel_get_exit_status(ch);
    libssh2_channel_free(ch);
    if (status != 0) {
        err = "Command exited with status " + std::to_string(status);
        if (!errOut.empty()) err += ": " + errOut;
        return false;
    }
    return true;
}

} // namespace termxfer
