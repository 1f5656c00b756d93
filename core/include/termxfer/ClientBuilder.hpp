// Backend selection: turns connection parameters into a RemoteClient.
#pragma once
#include "RemoteClient.hpp"
#include <memory>

namespace termxfer {

// Build the backend for params.protocol. Returns nullptr and fills err when none can be built.
std::unique_ptr<RemoteClient> buildClient(const FileTransferParams& params, std::string& err);

// Parse "[protocol://][user@]host[:port][:/remote/dir]" into params.
// The user defaults to $USER, the port to 22.
bool parseRemoteAddress(const std::string& address, FileTransferParams& params, std::string& err);

} // namespace termxfer
