// Activity lifecycle: create, draw once per tick, report when to leave, destroy.
#pragma once
#include "FileTypes.hpp"
#include "Terminal.hpp"
#include <optional>
#include <string>

namespace termxfer {

enum class ExitReason { Quit, Disconnect };

// Everything an activity borrows from its owner. The terminal is not owned.
struct Context {
    Terminal* terminal = nullptr;
    FileTransferParams params;
    std::optional<std::string> error; // construction error to show as fatal
};

class Activity {
public:
    virtual ~Activity() = default;

    virtual void onCreate(Context context) = 0;
    virtual void onDraw() = 0;
    virtual std::optional<ExitReason> willUmount() const = 0;
    // Hand the context back to the owner.
    virtual std::optional<Context> onDestroy() = 0;
};

} // namespace termxfer
