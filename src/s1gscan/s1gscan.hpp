#pragma once

// result and address types
#include "engine/result.hpp"
#include "engine/types.hpp"

// signatures and matching
#include "engine/pattern.hpp"
#include "engine/pattern_matcher.hpp"

// target memory and scanning
#include "engine/memory_access.hpp"
#include "engine/platform/process_memory.hpp"
#include "engine/scanner.hpp"
#include "engine/snapshot.hpp"

// utilities
#include "utils/file_utils.hpp"
#include "utils/hex_utils.hpp"
