#include <cumulus/http/logger.h>

namespace cumulus
{
namespace http
{

common::SubsystemLogger& logger()
{
    static common::SubsystemLogger logger("HTTP");

    return logger;
}

} // http
} // cumulus
