#pragma once

// Everything needed to read, query and write hini documents.

#include "errors.hpp"
#include "format.hpp"
#include "reader.hpp"
#include "section.hpp"
#include "siphon.hpp"
#include "token.hpp"
