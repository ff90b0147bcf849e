#include <cumulus/upload/upload_state.h>

namespace cumulus
{
namespace upload
{

const char* toString(UploadState state)
{
    switch (state)
    {
#define DEFINE_UPLOAD_STATE_CLAUSE(name) case US_ ## name: return #name;
        DEFINE_UPLOAD_STATES(DEFINE_UPLOAD_STATE_CLAUSE)
#undef DEFINE_UPLOAD_STATE_CLAUSE
    }

    return "UNKNOWN";
}

} // upload
} // cumulus
