#pragma once

#include <QObject>
#include <QTimer>

// Coalesces "relayout requested" signals raised anywhere in the grid
// (thumbnail loaded, card resized, mode switch) into a single deferred
// relayoutDue() per interval.
class RelayoutScheduler : public QObject {
    Q_OBJECT
public:
    explicit RelayoutScheduler(int intervalMs = 80, QObject* parent = nullptr);

    bool isPending() const { return m_timer.isActive(); }
    int interval() const { return m_timer.interval(); }

public slots:
    void request();
    void cancel();

signals:
    void relayoutDue();

private:
    QTimer m_timer;
};
