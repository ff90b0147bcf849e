#include <cumulus/upload/upload_event_emitter.h>

namespace cumulus
{
namespace upload
{

UploadEventObserverID UploadEventEmitter::addObserver(UploadEventObserver observer)
{
    // Make sure no one else is modifying our map of observers.
    std::lock_guard<std::recursive_mutex> guard(mObserversLock);

    auto [iterator, _] = mObservers.emplace(mNextID++, std::move(observer));

    return iterator->first;
}

void UploadEventEmitter::notify(const UploadEvent& event)
{
    // Make sure no threads are modifying our map of observers.
    std::lock_guard<std::recursive_mutex> guard(mObserversLock);

    for (auto i = mObservers.begin(); i != mObservers.end();)
    {
        // Just in case the observer removes itself.
        auto j = i++;

        j->second(event);
    }
}

void UploadEventEmitter::removeObserver(UploadEventObserverID id)
{
    std::lock_guard<std::recursive_mutex> guard(mObserversLock);

    mObservers.erase(id);
}

} // upload
} // cumulus
