/**
 * @file EventBridge.h
 * @brief Re-emits control-plane events as Qt signals on the GUI thread
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#ifndef TRANSEASE_QTUI_EVENTBRIDGE_H
#define TRANSEASE_QTUI_EVENTBRIDGE_H

#include <QObject>
#include <QString>
#include "transease/Event.h"
#include "transease/EventBus.h"

/**
 * @class EventBridge
 * @brief EventBus subscriber that turns events into queued Qt signals
 *
 * The bus delivers on its own dispatcher thread; every event is handed to
 * the thread this object lives on with Qt::QueuedConnection, so slots
 * connected to these signals never run on a control-plane thread.
 *
 * Signals are emitted in bus order.
 */
class EventBridge : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructor
     * @param bus Event channel to subscribe to (must outlive this object)
     * @param parent Parent object
     */
    explicit EventBridge(TransEase::EventBus& bus, QObject* parent = nullptr);

    /**
     * @brief Destructor
     *
     * Unsubscribes; no signal is queued after it returns.
     */
    ~EventBridge() override;

signals:
    void logReceived(const QString& line);
    void statusUpdated(const QString& text);
    void connectionCountChanged(int count);
    void serverStarted();
    void serverStopped();
    void errorOccurred(const QString& message);

private:
    void dispatch(const TransEase::Event& event);

    TransEase::EventBus& m_bus;
    TransEase::SubscriptionId m_subscription;
};

#endif // TRANSEASE_QTUI_EVENTBRIDGE_H
