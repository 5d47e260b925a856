#pragma once

#include "boundary.hpp"
#include "config.hpp"
#include "coverage.hpp"
#include "errors.hpp"
#include "fit.hpp"
#include "pipeline.hpp"
#include "projection.hpp"
#include "region.hpp"
#include "spatial_filter.hpp"
#include "track_reader.hpp"
#include "types.hpp"
#include "writer.hpp"

namespace tc = trackcover;
