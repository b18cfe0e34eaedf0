/**
 * @file ConsoleObserver.h
 * @brief Text-console presentation of the control plane
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#ifndef TRANSEASE_QTUI_CONSOLEOBSERVER_H
#define TRANSEASE_QTUI_CONSOLEOBSERVER_H

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTextStream>

class QIODevice;
class QSocketNotifier;
class EventBridge;

namespace TransEase {
class ControlPlane;
}

/**
 * @class ConsoleObserver
 * @brief Prints control-plane events and executes typed commands
 *
 * Commands (one per line):
 * - start, stop, status
 * - config                 print the current settings
 * - set <key> <value>      save one general setting
 * - root <path>            change the shared directory
 * - log                    print the retained log view
 * - quit                   exit; asks [y/N] while the server is running
 * - help
 *
 * The retained log view holds at most LOG_VIEW_MAX_LINES lines and is
 * trimmed to the last LOG_VIEW_KEEP_LINES when it grows past that.
 *
 * Thread Safety: GUI thread only.
 */
class ConsoleObserver : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructor
     * @param control Control plane to drive
     * @param bridge Source of event signals
     * @param output Device the console writes to (must be open for writing)
     * @param parent Parent object
     */
    ConsoleObserver(TransEase::ControlPlane& control,
                    EventBridge& bridge,
                    QIODevice* output,
                    QObject* parent = nullptr);

    ~ConsoleObserver() override;

    /**
     * @brief Start reading commands from standard input
     *
     * End of input requests quit.
     */
    void startReadingStdin();

    /**
     * @brief Execute one command line (also used for quit confirmations)
     */
    void handleLine(const QString& line);

    const QStringList& logView() const { return m_logView; }
    int connectionCount() const { return m_connectionCount; }
    bool isAwaitingQuitConfirmation() const { return m_awaitingQuitConfirmation; }

signals:
    /**
     * @brief The application may exit; the server is stopped
     */
    void quitRequested();

private slots:
    void onStdinReady();
    void onLogReceived(const QString& line);
    void onStatusUpdated(const QString& text);
    void onConnectionCountChanged(int count);
    void onServerStarted();
    void onServerStopped();
    void onErrorOccurred(const QString& message);

private:
    void printHelp();
    void printStatus();
    void printConfig();
    void printLogView();
    void beginQuit();
    void finishQuit(const QString& answer);

    TransEase::ControlPlane& m_control;
    QTextStream m_out;
    QByteArray m_stdinBuffer;       ///< Bytes read from stdin, not yet a full line
    QSocketNotifier* m_stdinNotifier;

    QStringList m_logView;          ///< Retained log lines (bounded)
    int m_connectionCount;
    bool m_awaitingQuitConfirmation;
};

#endif // TRANSEASE_QTUI_CONSOLEOBSERVER_H
