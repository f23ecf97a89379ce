#pragma once

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QUrl>
#include <functional>

#include "../core/CancellationRegistry.h"

struct NetworkResponse {
    enum class Outcome {
        Completed,      // an HTTP status was received
        NetworkError,   // connection failure or timeout
        Cancelled       // the request's token was cancelled
    };

    Outcome outcome = Outcome::NetworkError;
    int status = 0;
    QHash<QByteArray, QByteArray> headers;  // names lower-cased
    QByteArray body;
    QString errorString;

    QByteArray header(const QByteArray& name) const
    {
        return headers.value(name.toLower());
    }
};

// Network seam used by the acquisition pipeline.
class INetworkLayer {
public:
    using Callback = std::function<void(const NetworkResponse&)>;

    virtual ~INetworkLayer() = default;

    // `done` is called exactly once and never from inside request().
    // Cancelling `token` while the request is in flight must complete it
    // with Outcome::Cancelled. A timeout reports NetworkError unless the
    // token was cancelled first.
    virtual void request(const QUrl& url, const CancellationTokenPtr& token,
                         int timeoutMs, Callback done) = 0;
};
