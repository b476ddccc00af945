#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. ephem_core/types/chunk.hpp),
// users can simply do `#include "ephem_core/types.hpp"`.
//
#include "ephem_core/types/content_kind.hpp"
#include "ephem_core/types/chunk.hpp"
