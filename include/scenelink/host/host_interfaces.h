#pragma once

#include <scenelink/core/types.h>

#include <cstdint>
#include <functional>
#include <string>

namespace scenelink::host {

// Host lifecycle notifications the shim reacts to.
enum class HostEvent {
    DocumentOpened,
    DocumentSaved,
    DocumentCreated,
    HostExiting,
};

constexpr const char* hostEventName(HostEvent ev) {
    switch (ev) {
        case HostEvent::DocumentOpened: return "document_opened";
        case HostEvent::DocumentSaved: return "document_saved";
        case HostEvent::DocumentCreated: return "document_created";
        case HostEvent::HostExiting: return "host_exiting";
    }
    return "unknown";
}

// Opaque token returned by the host for one registered handler.
using SubscriptionId = std::uint64_t;

using HostEventHandler = std::function<void()>;

/**
 * @brief Document and event API of the embedding host application.
 *
 * Handlers are invoked on the host's event-delivery thread. A handler may call
 * unsubscribe() for its own id (or any other id) while it is running.
 */
class IHostDocumentApi {
public:
    virtual ~IHostDocumentApi() = default;

    /// Absolute path of the open document; empty for an unsaved new document.
    virtual std::string currentDocumentPath() const = 0;

    virtual Result<SubscriptionId> subscribe(HostEvent event, HostEventHandler handler) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};

/**
 * @brief UI surface shown while the integration is disabled.
 */
class IDisabledIndicator {
public:
    virtual ~IDisabledIndicator() = default;

    virtual void showDisabledIndicator() = 0;
    virtual void clearDisabledIndicator() = 0;
    // Informational text, e.g. why the engine could not be started.
    virtual void showInfoMessage(const std::string& text) = 0;
};

// Host progress bar used by the job queue.
class IProgressSink {
public:
    virtual ~IProgressSink() = default;

    virtual void beginProgress(const std::string& label) = 0;
    virtual void step(int delta) = 0;
    virtual void endProgress() = 0;
};

// Host script console; target of the spdlog host sink.
class IHostConsole {
public:
    virtual ~IHostConsole() = default;

    virtual void displayInfo(const std::string& line) = 0;
    virtual void displayWarning(const std::string& line) = 0;
    virtual void displayError(const std::string& line) = 0;
};

} // namespace scenelink::host
