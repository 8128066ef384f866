#pragma once

#include <QList>
#include <QObject>
#include <QString>
#include <QTimer>
#include <functional>

namespace svr {

/// Runs named steps one after another with a fixed pause after each.
/// There is no feedback from the device; a step is done once its action
/// has been dispatched.
class AutomationSequence : public QObject {
    Q_OBJECT
public:
    struct Step {
        QString name;
        std::function<void()> action;
        int delayAfterMs = 0;
    };

    explicit AutomationSequence(QObject* parent = nullptr);

    void addStep(const QString& name, std::function<void()> action, int delayAfterMs = 0);
    int stepCount() const { return steps_.size(); }

    void start();
    void cancel();
    bool isRunning() const { return running_; }

signals:
    void stepExecuted(int index, const QString& name);
    void finished();
    void cancelled();

private:
    void runStep();

    QList<Step> steps_;
    QTimer timer_;
    int next_ = 0;
    bool running_ = false;
};

} // namespace svr
