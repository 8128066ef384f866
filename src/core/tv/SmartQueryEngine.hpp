#pragma once

#include <QObject>
#include <QPointer>

#include "AutomationSequence.hpp"
#include "TvSettings.hpp"
#include "TvTypes.hpp"

namespace svr {

class CommandChannel;
class ConnectionManager;
class IVideoSearchClient;

/// "Play X on Y": deep-links straight into the app when it can, otherwise
/// drives the TV's universal search with timed key presses and picks the
/// first result.
///
/// Once the channel is open the result is always success; the automation
/// path has no way to observe what the TV actually did.
class SmartQueryEngine : public QObject {
    Q_OBJECT
public:
    SmartQueryEngine(ConnectionManager* connection, CommandChannel* commands,
                     IVideoSearchClient* videoSearch, const SmartSearchSettings& settings,
                     QObject* parent = nullptr);

    void smartSearch(const QString& query, SmartSearchCallback done);

    /// Stops a running on-screen automation. The pending smartSearch still
    /// reports, with the steps that were dispatched.
    void cancel();
    bool isAutomationRunning() const { return sequence_ && sequence_->isRunning(); }

signals:
    void automationStep(const QString& name);

private:
    void runFallback(const SmartSearchResult& partial, SmartSearchCallback done);

    ConnectionManager* connection_;
    CommandChannel* commands_;
    IVideoSearchClient* videoSearch_;
    SmartSearchSettings settings_;
    QPointer<AutomationSequence> sequence_;
};

} // namespace svr
