#include <cumulus/upload/upload_event.h>

namespace cumulus
{
namespace upload
{
namespace
{

struct EventName
{
    const char* operator()(const PartUploaded&) const { return "PartUploaded"; }
    const char* operator()(const PartFailed&) const { return "PartFailed"; }
    const char* operator()(const UploadCompleted&) const { return "UploadCompleted"; }
    const char* operator()(const UploadFailed&) const { return "UploadFailed"; }
    const char* operator()(const UploadAborted&) const { return "UploadAborted"; }
    const char* operator()(const AbortFailed&) const { return "AbortFailed"; }
}; // EventName

} // anonymous

bool terminal(const UploadEvent& event)
{
    return !std::holds_alternative<PartUploaded>(event)
           && !std::holds_alternative<PartFailed>(event);
}

const char* toString(const UploadEvent& event)
{
    return std::visit(EventName(), event);
}

} // upload
} // cumulus
