#include <vector>

#include <gtest/gtest.h>

#include <cumulus/upload/upload_event.h>
#include <cumulus/upload/upload_event_emitter.h>

using namespace cumulus;
using namespace cumulus::upload;

namespace
{

class Emitter
  : public UploadEventEmitter
{
public:
    using UploadEventEmitter::notify;
}; // Emitter

} // anonymous

TEST(UploadEvent, names)
{
    EXPECT_STREQ(toString(UploadEvent(PartUploaded())), "PartUploaded");
    EXPECT_STREQ(toString(UploadEvent(PartFailed())), "PartFailed");
    EXPECT_STREQ(toString(UploadEvent(UploadCompleted())), "UploadCompleted");
    EXPECT_STREQ(toString(UploadEvent(UploadFailed())), "UploadFailed");
    EXPECT_STREQ(toString(UploadEvent(UploadAborted())), "UploadAborted");
    EXPECT_STREQ(toString(UploadEvent(AbortFailed())), "AbortFailed");
}

TEST(UploadEvent, terminal)
{
    EXPECT_FALSE(terminal(PartUploaded()));
    EXPECT_FALSE(terminal(PartFailed()));
    EXPECT_TRUE(terminal(UploadCompleted()));
    EXPECT_TRUE(terminal(UploadFailed()));
    EXPECT_TRUE(terminal(UploadAborted()));
    EXPECT_TRUE(terminal(AbortFailed()));
}

TEST(UploadEventEmitter, notifies_observers)
{
    Emitter emitter;
    std::vector<std::string> first;
    std::vector<std::string> second;

    auto id = emitter.addObserver([&first](const UploadEvent& event) {
        first.emplace_back(toString(event));
    });

    emitter.addObserver([&second](const UploadEvent& event) {
        second.emplace_back(toString(event));
    });

    emitter.notify(PartUploaded());

    emitter.removeObserver(id);

    emitter.notify(UploadAborted());

    EXPECT_EQ(first, std::vector<std::string>({"PartUploaded"}));
    EXPECT_EQ(second, std::vector<std::string>({"PartUploaded", "UploadAborted"}));
}

TEST(UploadEventEmitter, observer_can_remove_itself)
{
    Emitter emitter;
    UploadEventObserverID id = 0;
    auto calls = 0;

    id = emitter.addObserver([&](const UploadEvent&) {
        ++calls;
        emitter.removeObserver(id);
    });

    emitter.notify(PartUploaded());
    emitter.notify(PartUploaded());

    EXPECT_EQ(calls, 1);
}
