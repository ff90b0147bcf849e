#include <cumulus/common/error_or.h>
#include <cumulus/common/logging.h>
#include <cumulus/json.h>
#include <cumulus/upload/logger.h>
#include <cumulus/upload/upload_session.h>

namespace cumulus
{
namespace upload
{

static bool parseEndpoints(JSON& reader, UploadSessionEndpoints& endpoints)
{
    if (!reader.enterobject())
        return false;

    for (auto name = reader.getname(); !name.empty(); name = reader.getname())
    {
        std::string* target = nullptr;

        if (name == "abort")
            target = &endpoints.mAbort;
        else if (name == "commit")
            target = &endpoints.mCommit;
        else if (name == "list_parts")
            target = &endpoints.mListParts;
        else if (name == "log_event")
            target = &endpoints.mLogEvent;
        else if (name == "status")
            target = &endpoints.mStatus;
        else if (name == "upload_part")
            target = &endpoints.mUploadPart;

        auto parsed = target ? reader.storestring(*target) : reader.storeobject();

        if (!parsed)
            return false;
    }

    return reader.leaveobject();
}

common::ErrorOr<UploadSession> UploadSession::fromJSON(const std::string& json)
{
    auto stripped = JSON::stripWhitespace(json);
    JSON reader(stripped);
    UploadSession session;

    if (!reader.enterobject())
        return common::unexpected(API_EARGS);

    for (auto name = reader.getname(); !name.empty(); name = reader.getname())
    {
        bool parsed = true;

        if (name == "id")
            parsed = reader.storestring(session.mID);
        else if (name == "session_expires_at")
            parsed = reader.storestring(session.mExpiresAt);
        else if (name == "part_size")
            session.mPartSize = reader.getint();
        else if (name == "total_parts")
            session.mTotalParts = reader.getint();
        else if (name == "num_parts_processed")
            session.mPartsProcessed = reader.getint();
        else if (name == "session_endpoints")
            parsed = parseEndpoints(reader, session.mEndpoints);
        else
            parsed = reader.storeobject();

        if (!parsed)
            return common::unexpected(API_EARGS);
    }

    if (!reader.leaveobject())
        return common::unexpected(API_EARGS);

    if (session.mID.empty() || session.mPartSize <= 0)
    {
        LogWarningF(logger(),
                    "Session descriptor lacks an ID or a valid part size: %s",
                    stripped.c_str());

        return common::unexpected(API_EARGS);
    }

    return session;
}

} // upload
} // cumulus
