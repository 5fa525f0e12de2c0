#pragma once

// Header for making actual log statements such as hini::log::info and so on work.

#include <oxen/log.hpp>

namespace hini
{
  namespace log = oxen::log;
}
