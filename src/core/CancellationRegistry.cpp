#include "CancellationRegistry.h"

#include <QDebug>

// ═══════════════════════════════════════════════════════════════════
//  CancellationToken
// ═══════════════════════════════════════════════════════════════════

CancellationToken::CancellationToken(const QString& group, QObject* parent)
    : QObject(parent)
    , m_group(group)
{
}

void CancellationToken::cancel()
{
    if (m_cancelled) return;
    m_cancelled = true;
    emit cancelled();
}

// ═══════════════════════════════════════════════════════════════════
//  CancellationRegistry
// ═══════════════════════════════════════════════════════════════════

CancellationTokenPtr CancellationRegistry::next(const QString& group)
{
    abort(group);
    CancellationTokenPtr token(new CancellationToken(group));
    m_groups.insert(group, token);
    return token;
}

CancellationTokenPtr CancellationRegistry::get(const QString& group) const
{
    return m_groups.value(group);
}

void CancellationRegistry::abort(const QString& group)
{
    // Detach from the map before cancelling: slots connected to cancelled()
    // may call next() for the same group.
    CancellationTokenPtr token = m_groups.take(group);
    if (!token) return;
    qDebug() << "[Cancel] Aborting group" << group;
    token->cancel();
}

void CancellationRegistry::abortMany(const QStringList& groups)
{
    for (const QString& g : groups)
        abort(g);
}
