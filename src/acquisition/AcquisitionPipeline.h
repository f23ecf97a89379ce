#pragma once

#include <QObject>
#include <QCache>
#include <QHash>
#include <QImage>
#include <QQueue>
#include <QSharedPointer>
#include <QUrl>
#include <functional>

#include "../core/CancellationRegistry.h"
#include "../core/MediaItem.h"

class INetworkLayer;
class QTimer;
struct NetworkResponse;

struct AcquisitionConfig {
    int concurrency = 6;
    int retryBudget = 10;              // requests per task, including the first
    int processingDelayMs = 2000;      // 202 poll interval, also network-error retry
    int rateLimitBaseDelayMs = 1000;   // first "previous delay" for 429 backoff
    int maxBackoffMs = 60000;
    int jitterMs = 1000;
    int requestTimeoutMs = 15000;
    int cacheEntries = 200;
    QString group = QStringLiteral("thumb");

    static AcquisitionConfig fromSettings();
};

// Bounded-concurrency thumbnail fetcher.
//
// Tasks are dispatched FIFO while fewer than `concurrency` are Active.
// A 202 means the server is still generating the thumbnail and is polled
// at a fixed interval; 429 backs off exponentially (or as the server asks);
// network errors and 5xx retry at the fixed interval. Every request counts
// against the task's retry budget. Cancellation, by group token or per
// node, is silent: it never reaches thumbnailFailed().
class AcquisitionPipeline : public QObject {
    Q_OBJECT
public:
    enum class TaskState { Queued, Active, Retrying, Succeeded, Failed, Cancelled };
    Q_ENUM(TaskState)

    enum class FailureKind {
        Exhausted,  // retry budget consumed
        Invalid     // bad URL, unexpected status, undecodable body, server-declared failure
    };
    Q_ENUM(FailureKind)

    using AttachmentCheck = std::function<bool(NodeRef)>;

    AcquisitionPipeline(INetworkLayer* network, CancellationRegistry* registry,
                        const AcquisitionConfig& config = AcquisitionConfig(),
                        QObject* parent = nullptr);
    ~AcquisitionPipeline() override;

    // Asked before every transition to Active, Succeeded or Failed
    void setAttachmentCheck(AttachmentCheck check) { m_attached = std::move(check); }

    void enqueueVisible(NodeRef node, const QString& resourceUrl);
    void cancelNode(NodeRef node);
    void clear();

    int activeCount() const { return m_activeCount; }
    int queuedCount() const;
    int waitingCount() const;
    bool hasTask(NodeRef node) const { return m_tasks.contains(node); }
    const AcquisitionConfig& config() const { return m_config; }

    static bool isValidResourceUrl(const QString& url);

signals:
    void taskStateChanged(NodeRef node, AcquisitionPipeline::TaskState state);
    void thumbnailReady(NodeRef node, const QImage& image);
    void thumbnailProcessing(NodeRef node, const QImage& placeholder);
    void thumbnailFailed(NodeRef node, AcquisitionPipeline::FailureKind kind,
                         const QString& reason);

private:
    struct AcquisitionTask {
        NodeRef node = 0;
        QUrl resourceUrl;
        int attempt = 0;        // requests issued so far
        int delayMs = 0;        // last scheduled delay
        TaskState state = TaskState::Queued;
        bool nodeCancelled = false;
        CancellationTokenPtr token;
        QMetaObject::Connection tokenConnection;
        QTimer* retryTimer = nullptr;
    };
    using TaskPtr = QSharedPointer<AcquisitionTask>;

    void dispatch();
    void start(const TaskPtr& task);
    void handleResponse(const TaskPtr& task, const NetworkResponse& response);
    void retryOrExhaust(const TaskPtr& task, int delayMs, const QString& reason);
    void onRetryDue(const TaskPtr& task);
    void onTokenCancelled(const TaskPtr& task);

    bool isStillWanted(const TaskPtr& task) const;
    bool isDispatchable(const TaskPtr& task) const;
    void setState(const TaskPtr& task, TaskState state);
    void release(const TaskPtr& task);
    void finishSucceeded(const TaskPtr& task, const QImage& image);
    void finishFailed(const TaskPtr& task, FailureKind kind, const QString& reason);
    void finishCancelled(const TaskPtr& task);

    INetworkLayer* m_network = nullptr;
    CancellationRegistry* m_registry = nullptr;
    AcquisitionConfig m_config;
    AttachmentCheck m_attached;

    QQueue<TaskPtr> m_queue;
    QHash<NodeRef, TaskPtr> m_tasks;    // every non-terminal task
    int m_activeCount = 0;
    bool m_dispatching = false;

    QCache<QString, QImage> m_cache;
};
