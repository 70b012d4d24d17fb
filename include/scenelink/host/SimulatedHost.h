#pragma once

#include <scenelink/host/host_interfaces.h>

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace scenelink::host {

/**
 * @brief In-memory host application.
 *
 * Implements every host-facing interface the shim needs and records what the shim did
 * with them. Events are delivered synchronously on the calling thread to a snapshot of
 * the subscribers; a handler removed during delivery is skipped.
 */
class SimulatedHost : public IHostDocumentApi,
                      public IDisabledIndicator,
                      public IProgressSink,
                      public IHostConsole {
public:
    enum class ConsoleLevel { Info, Warning, Error };

    struct ProgressRecord {
        std::string label;
        std::vector<int> steps;
        bool ended{false};
    };

    // Document operations; each fires the matching event.
    void openDocument(std::string path);
    void saveDocument();
    void saveDocumentAs(std::string path);
    void newDocument();
    void exitHost();

    void fire(HostEvent event);
    void setCurrentDocumentPath(std::string path);
    void failSubscriptionsFor(HostEvent event, bool fail = true);

    // IHostDocumentApi
    std::string currentDocumentPath() const override;
    Result<SubscriptionId> subscribe(HostEvent event, HostEventHandler handler) override;
    void unsubscribe(SubscriptionId id) override;

    std::size_t subscriberCount() const;
    std::size_t subscriberCount(HostEvent event) const;
    std::size_t unknownUnsubscribeCount() const;

    // IDisabledIndicator
    void showDisabledIndicator() override;
    void clearDisabledIndicator() override;
    void showInfoMessage(const std::string& text) override;

    bool disabledIndicatorVisible() const;
    int indicatorShowCount() const;
    std::vector<std::string> infoMessages() const;

    // IProgressSink
    void beginProgress(const std::string& label) override;
    void step(int delta) override;
    void endProgress() override;

    std::vector<ProgressRecord> progressHistory() const;
    int endProgressCount() const;

    // IHostConsole
    void displayInfo(const std::string& line) override;
    void displayWarning(const std::string& line) override;
    void displayError(const std::string& line) override;

    std::vector<std::pair<ConsoleLevel, std::string>> consoleLines() const;

private:
    struct Subscriber {
        HostEvent event;
        HostEventHandler handler;
    };

    mutable std::mutex mutex_;
    std::string documentPath_;
    SubscriptionId nextId_{1};
    std::map<SubscriptionId, Subscriber> subscribers_;
    std::set<HostEvent> failing_;
    std::size_t unknownUnsubscribes_{0};

    bool indicatorVisible_{false};
    int indicatorShows_{0};
    std::vector<std::string> infoMessages_;

    std::vector<ProgressRecord> progress_;
    int endProgressCalls_{0};

    std::vector<std::pair<ConsoleLevel, std::string>> console_;
};

} // namespace scenelink::host
