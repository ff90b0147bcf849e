#include <cumulus/common/error_or.h>
#include <cumulus/json.h>
#include <cumulus/upload/file_resource.h>

namespace cumulus
{
namespace upload
{

common::ErrorOr<FileResource> FileResource::fromJSON(JSON& reader)
{
    FileResource file;

    for (auto name = reader.getname(); !name.empty(); name = reader.getname())
    {
        bool parsed = true;

        if (name == "type")
            parsed = reader.storestring(file.mType);
        else if (name == "id")
            parsed = reader.storestring(file.mID);
        else if (name == "etag")
            parsed = reader.storestring(file.mETag);
        else if (name == "name")
            parsed = reader.storestring(file.mName);
        else if (name == "sha1")
            parsed = reader.storestring(file.mSHA1);
        else if (name == "size")
            file.mSize = reader.getint();
        else if (name == "parent" && reader.enterobject())
        {
            // We're only interested in the parent's ID.
            for (auto key = reader.getname(); !key.empty(); key = reader.getname())
            {
                if (key == "id")
                    parsed = reader.storestring(file.mParentID);
                else
                    parsed = reader.storeobject();

                if (!parsed)
                    break;
            }

            parsed = parsed && reader.leaveobject();
        }
        else
            parsed = reader.storeobject();

        if (!parsed)
            return common::unexpected(API_EINTERNAL);
    }

    if (!reader.leaveobject() || file.mID.empty())
        return common::unexpected(API_EINTERNAL);

    return file;
}

} // upload
} // cumulus
