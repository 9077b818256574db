#pragma once

#include "slabrc/api/status.hpp"
#include "slabrc/api/version.hpp"
#include "slabrc/json/i_json.hpp"
#include "slabrc/log/log_manager.hpp"
#include "slabrc/log/log_types.hpp"
#include "slabrc/memory/i_global_allocator.hpp"
#include "slabrc/memory/iallocator.hpp"
#include "slabrc/memory/slab.hpp"
#include "slabrc/memory/slab_errors.hpp"
#include "slabrc/memory/slab_options.hpp"
#include "slabrc/memory/weighted_handle.hpp"
