#pragma once
#ifndef CHARTSYNC_WITHOUT_JSON_DEPENDENCY
#include "chartsync/SongTimeline.hpp"
#include <ostream>

namespace chartsync
{
	// Writes the typed views of a refreshed timeline as JSON for inspection
	// Derived values (assigned time of tempo markers) are included
	ErrorType SaveTimelineSnapshot(std::ostream& stream, const SongTimeline& timeline);

	ErrorType SaveTimelineSnapshot(const std::string& filePath, const SongTimeline& timeline);
}
#endif
