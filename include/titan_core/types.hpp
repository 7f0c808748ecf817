#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. titan_core/types/chunk.hpp),
// users can simply do `#include "titan_core/types.hpp"`.
//
#include "titan_core/types/chunk.hpp"
#include "titan_core/types/query.hpp"
#include "titan_core/types/question.hpp"
