#ifndef HINI_HPP
#define HINI_HPP

#include <hini/config/ini.hpp>

#define HINI_VERSION_MAJOR 0
#define HINI_VERSION_MINOR 1
#define HINI_VERSION_PATCH 0

#endif
