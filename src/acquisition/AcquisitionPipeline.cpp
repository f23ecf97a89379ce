#include "AcquisitionPipeline.h"
#include "INetworkLayer.h"
#include "RetryPolicy.h"
#include "../core/Settings.h"

#include <QPointer>
#include <QTimer>
#include <QUrlQuery>
#include <QDebug>
#include <utility>

AcquisitionConfig AcquisitionConfig::fromSettings()
{
    auto* s = Settings::instance();
    AcquisitionConfig c;
    c.concurrency = s->thumbnailConcurrency();
    c.retryBudget = s->thumbnailRetryBudget();
    c.processingDelayMs = s->thumbnailProcessingDelayMs();
    c.rateLimitBaseDelayMs = s->thumbnailRateLimitBaseDelayMs();
    c.maxBackoffMs = s->thumbnailMaxBackoffMs();
    c.requestTimeoutMs = s->thumbnailRequestTimeoutMs();
    c.cacheEntries = s->thumbnailCacheEntries();
    return c;
}

AcquisitionPipeline::AcquisitionPipeline(INetworkLayer* network, CancellationRegistry* registry,
                                         const AcquisitionConfig& config, QObject* parent)
    : QObject(parent)
    , m_network(network)
    , m_registry(registry)
    , m_config(config)
    , m_cache(qMax(0, config.cacheEntries))
{
    m_config.concurrency = qMax(1, m_config.concurrency);
    m_config.retryBudget = qMax(1, m_config.retryBudget);
}

AcquisitionPipeline::~AcquisitionPipeline()
{
    for (const TaskPtr& task : std::as_const(m_tasks))
        QObject::disconnect(task->tokenConnection);
}

// ═══════════════════════════════════════════════════════════════════
//  URL validation
// ═══════════════════════════════════════════════════════════════════

bool AcquisitionPipeline::isValidResourceUrl(const QString& url)
{
    const QString trimmed = url.trimmed();
    if (trimmed.isEmpty()) return false;

    const QUrl parsed(trimmed, QUrl::StrictMode);
    if (!parsed.isValid() || parsed.isRelative()) return false;

    // Template placeholders that leaked into the URL
    auto isPlaceholder = [](const QString& s) {
        return s == QLatin1String("undefined") || s == QLatin1String("null");
    };
    const QStringList segments = parsed.path().split(QLatin1Char('/'), Qt::SkipEmptyParts);
    for (const QString& seg : segments) {
        if (isPlaceholder(seg)) return false;
    }
    const auto items = QUrlQuery(parsed).queryItems(QUrl::FullyDecoded);
    for (const auto& item : items) {
        if (isPlaceholder(item.second)) return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════
//  enqueueVisible: entry point from the visibility observer
// ═══════════════════════════════════════════════════════════════════

void AcquisitionPipeline::enqueueVisible(NodeRef node, const QString& resourceUrl)
{
    if (!isValidResourceUrl(resourceUrl)) {
        qWarning() << "[Acquisition] Invalid resource URL for node" << node << ":" << resourceUrl;
        emit thumbnailFailed(node, FailureKind::Invalid, QStringLiteral("Invalid resource URL"));
        return;
    }

    // Cache keys use the same normalized form the task stores
    const QString url = QUrl(resourceUrl.trimmed()).toString();
    if (QImage* cached = m_cache.object(url)) {
        emit thumbnailReady(node, *cached);
        return;
    }

    if (m_tasks.contains(node)) return;

    TaskPtr task(new AcquisitionTask);
    task->node = node;
    task->resourceUrl = QUrl(url);
    task->delayMs = m_config.rateLimitBaseDelayMs;

    task->token = m_registry->get(m_config.group);
    if (!task->token)
        task->token = m_registry->next(m_config.group);

    QWeakPointer<AcquisitionTask> weak = task;
    task->tokenConnection = connect(task->token.data(), &CancellationToken::cancelled, this,
                                    [this, weak]() {
        if (TaskPtr t = weak.toStrongRef())
            onTokenCancelled(t);
    });

    m_tasks.insert(node, task);
    m_queue.enqueue(task);
    emit taskStateChanged(node, TaskState::Queued);

    dispatch();
}

void AcquisitionPipeline::cancelNode(NodeRef node)
{
    TaskPtr task = m_tasks.value(node);
    if (!task) return;

    task->nodeCancelled = true;
    // An Active task keeps its slot until the response arrives
    if (task->state != TaskState::Active)
        finishCancelled(task);
}

void AcquisitionPipeline::clear()
{
    const auto tasks = m_tasks.values();
    for (const TaskPtr& task : tasks) {
        task->nodeCancelled = true;
        if (task->state != TaskState::Active)
            finishCancelled(task);
    }
    m_queue.clear();
}

int AcquisitionPipeline::queuedCount() const
{
    int n = 0;
    for (const TaskPtr& task : m_tasks) {
        if (isDispatchable(task)) ++n;
    }
    return n;
}

int AcquisitionPipeline::waitingCount() const
{
    int n = 0;
    for (const TaskPtr& task : m_tasks) {
        if (task->state == TaskState::Retrying && task->retryTimer) ++n;
    }
    return n;
}

// ═══════════════════════════════════════════════════════════════════
//  Dispatcher
// ═══════════════════════════════════════════════════════════════════

bool AcquisitionPipeline::isDispatchable(const TaskPtr& task) const
{
    return task->state == TaskState::Queued
        || (task->state == TaskState::Retrying && !task->retryTimer);
}

bool AcquisitionPipeline::isStillWanted(const TaskPtr& task) const
{
    if (task->nodeCancelled) return false;
    if (task->token && task->token->isCancelled()) return false;
    if (m_attached && !m_attached(task->node)) return false;
    return true;
}

void AcquisitionPipeline::dispatch()
{
    if (m_dispatching) return;
    m_dispatching = true;

    while (m_activeCount < m_config.concurrency && !m_queue.isEmpty()) {
        TaskPtr task = m_queue.dequeue();
        // Finalized while it sat in the queue
        if (!isDispatchable(task) || m_tasks.value(task->node) != task)
            continue;
        if (!isStillWanted(task)) {
            finishCancelled(task);
            continue;
        }
        start(task);
    }

    m_dispatching = false;
}

void AcquisitionPipeline::start(const TaskPtr& task)
{
    ++task->attempt;
    ++m_activeCount;
    setState(task, TaskState::Active);

    qDebug() << "[Acquisition] GET" << task->resourceUrl.toString()
             << "attempt" << task->attempt << "/" << m_config.retryBudget
             << "active:" << m_activeCount;

    QPointer<AcquisitionPipeline> guard(this);
    m_network->request(task->resourceUrl, task->token, m_config.requestTimeoutMs,
                       [guard, task](const NetworkResponse& response) {
        if (guard)
            guard->handleResponse(task, response);
    });
}

// ═══════════════════════════════════════════════════════════════════
//  Response handling
// ═══════════════════════════════════════════════════════════════════

void AcquisitionPipeline::handleResponse(const TaskPtr& task, const NetworkResponse& response)
{
    if (task->state != TaskState::Active) return;
    --m_activeCount;

    if (response.outcome == NetworkResponse::Outcome::Cancelled || !isStillWanted(task)) {
        finishCancelled(task);
        dispatch();
        return;
    }

    if (response.outcome == NetworkResponse::Outcome::NetworkError) {
        retryOrExhaust(task, m_config.processingDelayMs,
                       QStringLiteral("Network error: %1").arg(response.errorString));
        dispatch();
        return;
    }

    const int status = response.status;
    if (status == 200) {
        QImage image;
        if (!image.loadFromData(response.body)) {
            finishFailed(task, FailureKind::Invalid, QStringLiteral("Failed to decode image"));
        } else {
            m_cache.insert(task->resourceUrl.toString(), new QImage(image));
            finishSucceeded(task, image);
        }
    } else if (status == 202) {
        // Server is still generating; its placeholder is worth showing meanwhile
        QImage placeholder;
        if (!response.body.isEmpty() && placeholder.loadFromData(response.body))
            emit thumbnailProcessing(task->node, placeholder);
        retryOrExhaust(task, m_config.processingDelayMs, QStringLiteral("Still generating"));
    } else if (status == 429) {
        const std::optional<int> hint = RetryPolicy::parseRetryAfter(response.header("Retry-After"));
        int delay = 0;
        if (hint) {
            delay = m_config.maxBackoffMs > 0 ? qMin(*hint, m_config.maxBackoffMs) : *hint;
        } else {
            // A short server hint must not collapse the backoff below its base
            const int previous = qMax(task->delayMs, m_config.rateLimitBaseDelayMs);
            delay = RetryPolicy::rateLimitBackoffMs(previous, m_config.jitterMs,
                                                    m_config.maxBackoffMs);
        }
        retryOrExhaust(task, delay, QStringLiteral("Rate limited"));
    } else if (status == 500 && response.header("X-Thumb-Status") == "failed") {
        finishFailed(task, FailureKind::Invalid, QStringLiteral("Thumbnail generation failed"));
    } else if (status >= 500 && status <= 599) {
        retryOrExhaust(task, m_config.processingDelayMs,
                       QStringLiteral("Server error %1").arg(status));
    } else {
        finishFailed(task, FailureKind::Invalid, QStringLiteral("Unexpected status %1").arg(status));
    }

    dispatch();
}

void AcquisitionPipeline::retryOrExhaust(const TaskPtr& task, int delayMs, const QString& reason)
{
    if (task->attempt >= m_config.retryBudget) {
        finishFailed(task, FailureKind::Exhausted,
                     QStringLiteral("%1 (gave up after %2 attempts)").arg(reason).arg(task->attempt));
        return;
    }

    task->delayMs = delayMs;
    qDebug() << "[Acquisition]" << reason << "-" << task->resourceUrl.toString()
             << "retry in" << delayMs << "ms";

    task->retryTimer = new QTimer(this);
    task->retryTimer->setSingleShot(true);
    task->retryTimer->setInterval(qMax(0, delayMs));
    QWeakPointer<AcquisitionTask> weak = task;
    connect(task->retryTimer, &QTimer::timeout, this, [this, weak]() {
        if (TaskPtr t = weak.toStrongRef())
            onRetryDue(t);
    });
    setState(task, TaskState::Retrying);
    task->retryTimer->start();
}

void AcquisitionPipeline::onRetryDue(const TaskPtr& task)
{
    if (task->retryTimer) {
        task->retryTimer->deleteLater();
        task->retryTimer = nullptr;
    }
    if (task->state != TaskState::Retrying) return;

    if (!isStillWanted(task)) {
        finishCancelled(task);
        return;
    }

    // Back in line ahead of fresh work; the slot limit still applies
    m_queue.prepend(task);
    dispatch();
}

void AcquisitionPipeline::onTokenCancelled(const TaskPtr& task)
{
    // Active tasks are settled by their (cancelled) response
    if (task->state == TaskState::Queued || task->state == TaskState::Retrying)
        finishCancelled(task);
}

// ═══════════════════════════════════════════════════════════════════
//  Terminal transitions
// ═══════════════════════════════════════════════════════════════════

void AcquisitionPipeline::setState(const TaskPtr& task, TaskState state)
{
    task->state = state;
    emit taskStateChanged(task->node, state);
}

void AcquisitionPipeline::release(const TaskPtr& task)
{
    QObject::disconnect(task->tokenConnection);
    if (task->retryTimer) {
        task->retryTimer->stop();
        task->retryTimer->deleteLater();
        task->retryTimer = nullptr;
    }
    if (m_tasks.value(task->node) == task)
        m_tasks.remove(task->node);
}

void AcquisitionPipeline::finishSucceeded(const TaskPtr& task, const QImage& image)
{
    release(task);
    setState(task, TaskState::Succeeded);
    emit thumbnailReady(task->node, image);
}

void AcquisitionPipeline::finishFailed(const TaskPtr& task, FailureKind kind, const QString& reason)
{
    release(task);
    qWarning() << "[Acquisition] Failed:" << task->resourceUrl.toString() << reason;
    setState(task, TaskState::Failed);
    emit thumbnailFailed(task->node, kind, reason);
}

void AcquisitionPipeline::finishCancelled(const TaskPtr& task)
{
    if (task->state == TaskState::Cancelled) return;
    release(task);
    qDebug() << "[Acquisition] Cancelled:" << task->resourceUrl.toString();
    setState(task, TaskState::Cancelled);
}
