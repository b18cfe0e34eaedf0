/**
 * @file EventBridge.cpp
 * @brief Re-emits control-plane events as Qt signals on the GUI thread
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#include "transease/QtUi/EventBridge.h"
#include <QMetaObject>

EventBridge::EventBridge(TransEase::EventBus& bus, QObject* parent)
    : QObject(parent)
    , m_bus(bus)
    , m_subscription(0)
{
    m_subscription = m_bus.subscribe([this](const TransEase::Event& event) {
        // Bus dispatcher thread: hop to our thread. If this object is gone
        // by then Qt discards the call.
        QMetaObject::invokeMethod(this, [this, event]() {
            dispatch(event);
        }, Qt::QueuedConnection);
    });
}

EventBridge::~EventBridge() {
    m_bus.unsubscribe(m_subscription);
}

void EventBridge::dispatch(const TransEase::Event& event) {
    switch (event.type()) {
        case TransEase::EventType::LogLine:
            emit logReceived(QString::fromStdString(event.text()));
            break;
        case TransEase::EventType::Status:
            emit statusUpdated(QString::fromStdString(event.text()));
            break;
        case TransEase::EventType::ConnectionCount:
            emit connectionCountChanged(static_cast<int>(event.count()));
            break;
        case TransEase::EventType::Started:
            emit serverStarted();
            break;
        case TransEase::EventType::Stopped:
            emit serverStopped();
            break;
        case TransEase::EventType::Error:
            emit errorOccurred(QString::fromStdString(event.text()));
            break;
    }
}
