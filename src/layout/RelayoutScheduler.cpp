#include "RelayoutScheduler.h"

RelayoutScheduler::RelayoutScheduler(int intervalMs, QObject* parent)
    : QObject(parent)
{
    m_timer.setSingleShot(true);
    m_timer.setInterval(qMax(0, intervalMs));
    connect(&m_timer, &QTimer::timeout, this, &RelayoutScheduler::relayoutDue);
}

void RelayoutScheduler::request()
{
    // Already scheduled: this request rides along with the pending one
    if (m_timer.isActive()) return;
    m_timer.start();
}

void RelayoutScheduler::cancel()
{
    m_timer.stop();
}
