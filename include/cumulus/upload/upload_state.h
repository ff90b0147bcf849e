#pragma once

namespace cumulus
{
namespace upload
{

#define DEFINE_UPLOAD_STATES(expander) \
    expander(IDLE) \
    expander(UPLOADING) \
    expander(COMMITTING) \
    expander(COMPLETED) \
    expander(FAILED) \
    expander(ABORTING) \
    expander(ABORTED) \
    expander(ABORT_FAILED)

enum UploadState : unsigned int
{
#define DEFINE_UPLOAD_STATE_ENUMERANT(name) US_ ## name,
    DEFINE_UPLOAD_STATES(DEFINE_UPLOAD_STATE_ENUMERANT)
#undef DEFINE_UPLOAD_STATE_ENUMERANT
}; // UploadState

const char* toString(UploadState state);

} // upload
} // cumulus
