// Backend selection and address parsing.
#include "termxfer/ClientBuilder.hpp"
#include "termxfer/Libssh2Client.hpp"
#include "termxfer/MemoryClient.hpp"
#include "termxfer/Log.hpp"
#include <cstdlib>

namespace termxfer {

const char* protocolName(Protocol p) {
    switch (p) {
        case Protocol::Sftp: return "sftp";
        case Protocol::Memory: return "memory";
    }
    return "unknown";
}

std::unique_ptr<RemoteClient> buildClient(const FileTransferParams& params, std::string& err) {
    switch (params.protocol) {
        case Protocol::Sftp:
            if (params.session.host.empty()) {
                err = "Host is required";
                return nullptr;
            }
            if (params.session.username.empty()) {
                err = "Username is required";
                return nullptr;
            }
            return std::make_unique<Libssh2Client>(params.session);
        case Protocol::Memory:
            return MemoryClient::withDemoTree();
    }
    err = "Unsupported protocol";
    return nullptr;
}

bool parseRemoteAddress(const std::string& address, FileTransferParams& params, std::string& err) {
    std::string rest = address;
    params.protocol = Protocol::Sftp;
    auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        const std::string proto = rest.substr(0, scheme);
        rest = rest.substr(scheme + 3);
        if (proto == "sftp" || proto == "scp") {
            params.protocol = Protocol::Sftp;
        } else if (proto == "memory") {
            params.protocol = Protocol::Memory;
        } else {
            err = "Unknown protocol: " + proto;
            return false;
        }
    }

    // Remote directory: everything after ":/"
    auto dirPos = rest.find(":/");
    if (dirPos != std::string::npos) {
        params.remote_dir = rest.substr(dirPos + 1);
        rest = rest.substr(0, dirPos);
    }

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        params.session.username = rest.substr(0, at);
        rest = rest.substr(at + 1);
    } else {
        const char* user = std::getenv("USER");
        params.session.username = user ? user : "";
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        const std::string portStr = rest.substr(colon + 1);
        rest = rest.substr(0, colon);
        char* end = nullptr;
        long port = std::strtol(portStr.c_str(), &end, 10);
        if (portStr.empty() || (end && *end) || port <= 0 || port > 65535) {
            err = "Invalid port: " + portStr;
            return false;
        }
        params.session.port = static_cast<std::uint16_t>(port);
    }
    params.session.host = rest;

    if (params.protocol == Protocol::Memory) {
        if (params.session.host.empty()) params.session.host = "localhost";
        return true;
    }
    if (params.session.host.empty()) {
        err = "Missing host in address: " + address;
        return false;
    }
    LOGD("parsed address %s -> %s@%s:%u", address.c_str(), params.session.username.c_str(),
         params.session.host.c_str(), (unsigned)params.session.port);
    return true;
}

} // namespace termxfer
