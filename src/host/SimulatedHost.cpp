#include <scenelink/host/SimulatedHost.h>

namespace scenelink::host {

void SimulatedHost::openDocument(std::string path) {
    setCurrentDocumentPath(std::move(path));
    fire(HostEvent::DocumentOpened);
}

void SimulatedHost::saveDocument() {
    fire(HostEvent::DocumentSaved);
}

void SimulatedHost::saveDocumentAs(std::string path) {
    setCurrentDocumentPath(std::move(path));
    fire(HostEvent::DocumentSaved);
}

void SimulatedHost::newDocument() {
    setCurrentDocumentPath({});
    fire(HostEvent::DocumentCreated);
}

void SimulatedHost::exitHost() {
    fire(HostEvent::HostExiting);
}

void SimulatedHost::fire(HostEvent event) {
    std::vector<SubscriptionId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, sub] : subscribers_) {
            if (sub.event == event)
                ids.push_back(id);
        }
    }
    for (auto id : ids) {
        HostEventHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = subscribers_.find(id);
            if (it == subscribers_.end())
                continue; // removed by an earlier handler
            handler = it->second.handler;
        }
        if (handler)
            handler();
    }
}

void SimulatedHost::setCurrentDocumentPath(std::string path) {
    std::lock_guard<std::mutex> lock(mutex_);
    documentPath_ = std::move(path);
}

void SimulatedHost::failSubscriptionsFor(HostEvent event, bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail)
        failing_.insert(event);
    else
        failing_.erase(event);
}

std::string SimulatedHost::currentDocumentPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return documentPath_;
}

Result<SubscriptionId> SimulatedHost::subscribe(HostEvent event, HostEventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_.count(event)) {
        return Error{ErrorCode::SubscriptionFailed,
                     std::string("host refused callback for ") + hostEventName(event)};
    }
    const auto id = nextId_++;
    subscribers_.emplace(id, Subscriber{event, std::move(handler)});
    return id;
}

void SimulatedHost::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscribers_.erase(id) == 0)
        ++unknownUnsubscribes_;
}

std::size_t SimulatedHost::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

std::size_t SimulatedHost::subscriberCount(HostEvent event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& [id, sub] : subscribers_) {
        if (sub.event == event)
            ++n;
    }
    return n;
}

std::size_t SimulatedHost::unknownUnsubscribeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unknownUnsubscribes_;
}

void SimulatedHost::showDisabledIndicator() {
    std::lock_guard<std::mutex> lock(mutex_);
    indicatorVisible_ = true;
    ++indicatorShows_;
}

void SimulatedHost::clearDisabledIndicator() {
    std::lock_guard<std::mutex> lock(mutex_);
    indicatorVisible_ = false;
}

void SimulatedHost::showInfoMessage(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    infoMessages_.push_back(text);
}

bool SimulatedHost::disabledIndicatorVisible() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return indicatorVisible_;
}

int SimulatedHost::indicatorShowCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return indicatorShows_;
}

std::vector<std::string> SimulatedHost::infoMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return infoMessages_;
}

void SimulatedHost::beginProgress(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_.push_back(ProgressRecord{label, {}, false});
}

void SimulatedHost::step(int delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!progress_.empty())
        progress_.back().steps.push_back(delta);
}

void SimulatedHost::endProgress() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++endProgressCalls_;
    if (!progress_.empty())
        progress_.back().ended = true;
}

std::vector<SimulatedHost::ProgressRecord> SimulatedHost::progressHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

int SimulatedHost::endProgressCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endProgressCalls_;
}

void SimulatedHost::displayInfo(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_.emplace_back(ConsoleLevel::Info, line);
}

void SimulatedHost::displayWarning(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_.emplace_back(ConsoleLevel::Warning, line);
}

void SimulatedHost::displayError(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_.emplace_back(ConsoleLevel::Error, line);
}

std::vector<std::pair<SimulatedHost::ConsoleLevel, std::string>>
SimulatedHost::consoleLines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return console_;
}

} // namespace scenelink::host
