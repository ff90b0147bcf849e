#pragma once

namespace cumulus
{
namespace common
{

class Logger;
class SubsystemLogger;

} // common
} // cumulus
