#pragma once

#include <QObject>
#include <QByteArray>
#include "INetworkLayer.h"

class QNetworkAccessManager;

class QtNetworkLayer : public QObject, public INetworkLayer {
    Q_OBJECT
public:
    explicit QtNetworkLayer(QObject* parent = nullptr);

    void request(const QUrl& url, const CancellationTokenPtr& token,
                 int timeoutMs, Callback done) override;

    // Extra header sent with every request (e.g. Authorization)
    void setRawHeader(const QByteArray& name, const QByteArray& value);

private:
    QNetworkAccessManager* m_network;
    QHash<QByteArray, QByteArray> m_headers;

    static const QByteArray USER_AGENT;
};
