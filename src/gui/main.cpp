/**
 * @file main.cpp
 * @brief Qt application entry point for the TransEase console
 *
 * This file contains the main() function that bootstraps the control
 * plane and the console observer.
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTimer>
#include "transease/AppPaths.h"
#include "transease/ControlPlane.h"
#include "transease/Debug.h"
#include "transease/QtUi/ConsoleObserver.h"
#include "transease/QtUi/EventBridge.h"
#include <csignal>
#include <exception>
#include <iostream>

namespace {
    volatile std::sig_atomic_t g_terminateRequested = 0;

    extern "C" void onTerminateSignal(int) {
        g_terminateRequested = 1;
    }
} // anonymous namespace

/**
 * @brief Application entry point
 *
 * Loads (and repairs) the settings, creates the control plane, attaches
 * the console observer and runs the event loop. SIGINT/SIGTERM stop the
 * server without asking.
 */
int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("TransEase");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("TransEase");

    QCommandLineParser parser;
    parser.setApplicationDescription("TransEase file-sharing server console");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(QStringList() << "c" << "config",
                                    "Settings file (default: ./config.json or $TRANSEASE_CONFIG).",
                                    "path");
    QCommandLineOption startOption(QStringList() << "s" << "start",
                                   "Start the server immediately.");
    parser.addOption(configOption);
    parser.addOption(startOption);
    parser.process(app);

    const std::filesystem::path configPath = parser.isSet(configOption)
        ? TransEase::AppPaths::normalize(parser.value(configOption).toStdString())
        : TransEase::AppPaths::configJsonPath();

    std::signal(SIGINT, onTerminateSignal);
    std::signal(SIGTERM, onTerminateSignal);

    try {
        TransEase::ControlPlane control(configPath);
        EventBridge bridge(control.bus());

        QFile output;
        if (!output.open(stdout, QIODevice::WriteOnly)) {
            std::cerr << "Cannot open standard output\n";
            return 1;
        }

        ConsoleObserver console(control, bridge, &output);
        QObject::connect(&console, &ConsoleObserver::quitRequested, &app, &QCoreApplication::quit,
                         Qt::QueuedConnection);
        console.startReadingStdin();

        QTimer signalTimer;
        QObject::connect(&signalTimer, &QTimer::timeout, &app, [&control, &app]() {
            if (g_terminateRequested) {
                LOG_INFO("Termination signal received");
                control.shutdown();
                app.quit();
            }
        });
        signalTimer.start(100);

        if (parser.isSet(startOption)) {
            QTimer::singleShot(0, &app, [&control]() { control.requestStart(); });
        }

        const int rc = app.exec();
        control.shutdown();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "TransEase failed: " << e.what() << "\n";
        return 1;
    }
}
