#include "QtNetworkLayer.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QDebug>

const QByteArray QtNetworkLayer::USER_AGENT = QByteArrayLiteral("Tessera/1.0");

QtNetworkLayer::QtNetworkLayer(QObject* parent)
    : QObject(parent)
    , m_network(new QNetworkAccessManager(this))
{
}

void QtNetworkLayer::setRawHeader(const QByteArray& name, const QByteArray& value)
{
    if (value.isEmpty())
        m_headers.remove(name);
    else
        m_headers.insert(name, value);
}

void QtNetworkLayer::request(const QUrl& url, const CancellationTokenPtr& token,
                             int timeoutMs, Callback done)
{
    if (token && token->isCancelled()) {
        QTimer::singleShot(0, this, [done]() {
            NetworkResponse response;
            response.outcome = NetworkResponse::Outcome::Cancelled;
            done(response);
        });
        return;
    }

    QNetworkRequest request(url);
    request.setRawHeader("User-Agent", USER_AGENT);
    for (auto it = m_headers.cbegin(); it != m_headers.cend(); ++it)
        request.setRawHeader(it.key(), it.value());
    if (timeoutMs > 0)
        request.setTransferTimeout(timeoutMs);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    QNetworkReply* reply = m_network->get(request);

    // Reply is the context object: the connection dies with the reply
    if (token)
        connect(token.data(), &CancellationToken::cancelled, reply, &QNetworkReply::abort);

    connect(reply, &QNetworkReply::finished, this, [reply, token, done]() {
        reply->deleteLater();

        NetworkResponse response;

        // Cancellation wins over every other outcome, including timeouts
        if (token && token->isCancelled()) {
            response.outcome = NetworkResponse::Outcome::Cancelled;
            done(response);
            return;
        }

        const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (!statusAttr.isValid()) {
            qDebug() << "[Network] Request failed:" << reply->url().toString()
                     << reply->errorString();
            response.outcome = NetworkResponse::Outcome::NetworkError;
            response.errorString = reply->errorString();
            done(response);
            return;
        }

        response.outcome = NetworkResponse::Outcome::Completed;
        response.status = statusAttr.toInt();
        for (const auto& pair : reply->rawHeaderPairs())
            response.headers.insert(pair.first.toLower(), pair.second);
        response.body = reply->readAll();
        if (reply->error() != QNetworkReply::NoError)
            response.errorString = reply->errorString();
        done(response);
    });
}
