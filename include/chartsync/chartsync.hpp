#pragma once
#include "Error.hpp"
#include "SongTimeline.hpp"
#include "Util/TickMath.hpp"
#include "Sync/TempoMap.hpp"
#include "Sync/TimeSigUtils.hpp"
#ifndef CHARTSYNC_WITHOUT_JSON_DEPENDENCY
#include "IO/TimelineConfigIO.hpp"
#include "IO/SnapshotIO.hpp"
#endif
