#include "AutomationSequence.hpp"

namespace svr {

AutomationSequence::AutomationSequence(QObject* parent)
    : QObject(parent)
{
    timer_.setSingleShot(true);
    connect(&timer_, &QTimer::timeout, this, &AutomationSequence::runStep);
}

void AutomationSequence::addStep(const QString& name, std::function<void()> action, int delayAfterMs)
{
    steps_.append(Step{name, std::move(action), delayAfterMs});
}

void AutomationSequence::start()
{
    if (running_)
        return;
    running_ = true;
    next_ = 0;
    runStep();
}

void AutomationSequence::cancel()
{
    if (!running_)
        return;
    timer_.stop();
    running_ = false;
    emit cancelled();
}

void AutomationSequence::runStep()
{
    if (!running_)
        return;

    if (next_ >= steps_.size()) {
        running_ = false;
        emit finished();
        return;
    }

    const int index = next_++;
    const Step& step = steps_.at(index);
    if (step.action)
        step.action();
    emit stepExecuted(index, step.name);

    // An action may have cancelled us
    if (!running_)
        return;

    if (next_ >= steps_.size()) {
        running_ = false;
        emit finished();
        return;
    }
    timer_.start(step.delayAfterMs);
}

} // namespace svr
