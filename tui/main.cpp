// Application entry point: parse the command line, load settings and run the file
// transfer activity on a QTimer tick until it asks to leave.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTimer>
#include <clocale>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <termios.h>
#include <unistd.h>
#include "NcursesTerminal.hpp"
#include "Settings.hpp"
#include "termxfer/ClientBuilder.hpp"
#include "termxfer/FileTransferActivity.hpp"
#include "termxfer/Log.hpp"

using namespace termxfer;

namespace {

// Read a line from the terminal without echo. Returns false if stdin is not a tty.
bool readPassword(const std::string& prompt, std::string& out) {
    if (!isatty(STDIN_FILENO)) return false;
    termios original{};
    if (tcgetattr(STDIN_FILENO, &original) == -1) return false;
    termios silent = original;
    silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == -1) return false;
    std::cerr << prompt << std::flush;
    const bool ok = static_cast<bool>(std::getline(std::cin, out));
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
    std::cerr << std::endl;
    return ok;
}

} // namespace

int main(int argc, char* argv[]) {
    std::setlocale(LC_ALL, "");
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("TermXfer");
    QCoreApplication::setOrganizationName("TermXfer");
    QCoreApplication::setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Terminal dual-pane file transfer client");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("address", "[protocol://][user@]host[:port][:/remote/dir] (protocols: sftp, memory)");
    parser.addPositionalArgument("local-dir", "Initial local working directory", "[local-dir]");

    QCommandLineOption passwordOption(QStringList() << "P" << "password", "Password for the remote host", "password");
    QCommandLineOption identityOption(QStringList() << "i" << "identity", "Private key file", "file");
    QCommandLineOption ticksOption(QStringList() << "T" << "ticks", "Tick interval in milliseconds (default 10)", "ms", "10");
    QCommandLineOption configOption(QStringList() << "c" << "config", "Read settings from this INI file", "file");
    QCommandLineOption logOption("log", "Write the debug log to this file", "file");
    parser.addOption(passwordOption);
    parser.addOption(identityOption);
    parser.addOption(ticksOption);
    parser.addOption(configOption);
    parser.addOption(logOption);
    parser.process(app);

    if (parser.isSet(logOption)) {
        const std::string path = parser.value(logOption).toStdString();
        if (!setLogFile(path)) {
            std::cerr << "termxfer: cannot open log file " << path << std::endl;
            return 1;
        }
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty() || args.size() > 2) {
        std::cerr << "termxfer: expected an address and an optional local directory" << std::endl;
        parser.showHelp(2);
    }

    std::unique_ptr<QSettings> settings;
    if (parser.isSet(configOption)) {
        settings = std::make_unique<QSettings>(parser.value(configOption), QSettings::IniFormat);
    } else {
        settings = std::make_unique<QSettings>("TermXfer", "TermXfer");
    }
    const Config config = loadConfig(*settings);

    bool ok = false;
    const int ticks = parser.value(ticksOption).toInt(&ok);
    if (!ok || ticks <= 0) {
        std::cerr << "termxfer: invalid tick interval" << std::endl;
        return 2;
    }

    FileTransferParams params;
    std::string err;
    if (!parseRemoteAddress(args.at(0).toStdString(), params, err)) {
        std::cerr << "termxfer: " << err << std::endl;
        return 2;
    }
    if (args.size() > 1) params.local_dir = args.at(1).toStdString();
    params.session.known_hosts_policy = config.knownHostsPolicy;
    params.session.known_hosts_path = config.knownHostsPath;
    if (config.knownHostsPolicy == KnownHostsPolicy::AcceptNew) {
        params.session.hostkey_confirm_cb = [](const std::string& host, std::uint16_t port,
                                               const std::string& alg, const std::string& fp) {
            LOGI("accepting new host key for %s:%u (%s %s)", host.c_str(), unsigned(port), alg.c_str(), fp.c_str());
            return true;
        };
    }
    if (parser.isSet(identityOption)) params.session.private_key_path = parser.value(identityOption).toStdString();
    if (parser.isSet(passwordOption)) {
        params.session.password = parser.value(passwordOption).toStdString();
    } else if (params.protocol == Protocol::Sftp && !params.session.private_key_path) {
        std::string password;
        if (readPassword(params.session.username + "@" + params.session.host + "'s password: ", password) &&
            !password.empty()) {
            params.session.password = password;
        }
    }

    NcursesTerminal terminal;
    auto activity = FileTransferActivity::fromParams(params, config);
    Context context;
    context.terminal = &terminal;
    context.params = params;
    activity->onCreate(std::move(context));

    int exitCode = 0;
    QTimer timer;
    QObject::connect(&timer, &QTimer::timeout, [&]() {
        activity->onDraw();
        const auto reason = activity->willUmount();
        if (!reason) return;
        timer.stop();
        auto ctx = activity->onDestroy();
        if (ctx && ctx->error) {
            std::cerr << "termxfer: " << *ctx->error << std::endl;
            exitCode = 1;
        }
        LOGI("leaving: %s", *reason == ExitReason::Quit ? "quit" : "disconnect");
        QCoreApplication::exit(exitCode);
    });
    timer.start(ticks);
    const int rc = app.exec();
    closeLogFile();
    return rc;
}
