#pragma once

namespace cumulus
{

enum LogLevel : int;

} // cumulus
