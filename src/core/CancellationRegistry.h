#pragma once

#include <QObject>
#include <QHash>
#include <QSharedPointer>
#include <QString>
#include <QStringList>

// A cancellable handle. Observable as live or cancelled; cancellation is
// one-way and emits cancelled() exactly once.
class CancellationToken : public QObject {
    Q_OBJECT
public:
    explicit CancellationToken(const QString& group, QObject* parent = nullptr);

    bool isCancelled() const { return m_cancelled; }
    QString group() const { return m_group; }

    void cancel();

signals:
    void cancelled();

private:
    QString m_group;
    bool m_cancelled = false;
};

using CancellationTokenPtr = QSharedPointer<CancellationToken>;

// Maps a named group (page, search, scroll, thumb, modal) to a single live
// token. Issuing next() for a group cancels the token it replaces.
//
// Holders of a token must re-check isCancelled() after every suspension
// point before touching shared state, and treat cancellation as a silent
// stop rather than an error.
class CancellationRegistry {
public:
    CancellationRegistry() = default;

    CancellationTokenPtr next(const QString& group);
    CancellationTokenPtr get(const QString& group) const;
    void abort(const QString& group);
    void abortMany(const QStringList& groups);

    bool contains(const QString& group) const { return m_groups.contains(group); }

private:
    QHash<QString, CancellationTokenPtr> m_groups;
};
