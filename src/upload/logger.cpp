#include <cumulus/upload/logger.h>

namespace cumulus
{
namespace upload
{

common::SubsystemLogger& logger()
{
    static common::SubsystemLogger logger("Upload");

    return logger;
}

} // upload
} // cumulus
