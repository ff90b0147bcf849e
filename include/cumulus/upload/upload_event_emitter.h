#pragma once

#include <cumulus/upload/upload_event.h>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace cumulus
{
namespace upload
{

using UploadEventObserver = std::function<void(const UploadEvent&)>;
using UploadEventObserverID = std::uint64_t;

class UploadEventEmitter
{
    // Convenience.
    using UploadEventObserverMap = std::map<UploadEventObserverID, UploadEventObserver>;

    // Next available observer ID.
    UploadEventObserverID mNextID = 0u;

    // Who should we notify when an event is emitted?
    UploadEventObserverMap mObservers;

    // Serializes access to mNextID and mObservers.
    std::recursive_mutex mObserversLock;

protected:
    UploadEventEmitter() = default;

    ~UploadEventEmitter() = default;

    // Transmit event to all registered observers.
    void notify(const UploadEvent& event);

public:
    // Notify observer when something happens to the upload.
    UploadEventObserverID addObserver(UploadEventObserver observer);

    // Remove a previously added observer.
    void removeObserver(UploadEventObserverID id);
}; // UploadEventEmitter

} // upload
} // cumulus
