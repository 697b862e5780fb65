#include "mainwindow.h"
#include "hotkeysettings.h"
#include <QApplication>
#include <QDebug>

#ifndef _WIN32
#include <QSocketNotifier>
#include <csignal>
#include <sys/socket.h>
#include <unistd.h>

// SIGINT/SIGTERM -> socket -> QSocketNotifier, so the event loop quits
// normally instead of the process dying inside a signal handler.
static int s_signalFd[2] = {-1, -1};

static void onQuitSignal(int) {
    char c = 1;
    if (::write(s_signalFd[0], &c, 1) < 0)
        _exit(0);
}

static void installQuitOnSignal(QApplication& app) {
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, s_signalFd) != 0) {
        qWarning("Failed to create signal socket pair; Ctrl+C will not quit cleanly");
        return;
    }
    auto* notifier = new QSocketNotifier(s_signalFd[1], QSocketNotifier::Read, &app);
    QObject::connect(notifier, &QSocketNotifier::activated, &app, []() {
        char c;
        if (::read(s_signalFd[1], &c, 1) < 0)
            qWarning("Failed to drain signal socket");
        qDebug() << "ClipBeat: Interrupted, quitting";
        QApplication::quit();
    });

    struct sigaction sa = {};
    sa.sa_handler = onQuitSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}
#endif

// ── Entry point ──

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("ClipBeat");
    app.setOrganizationName("ClipBeat");

#ifndef _WIN32
    installQuitOnSignal(app);
#endif

    clb::MainWindow window(clb::createDefaultHotkeyBackend(),
                           clb::HotkeySettings::defaultPath());
    window.show();

    return app.exec();
}
