#include "chartsync/Event/EventEntry.hpp"

const char *chartsync::GetVenueEventTypeName(VenueEventType type)
{
	switch (type)
	{
	case VenueEventType::kLighting:
		return "lighting";
	case VenueEventType::kPostProcessing:
		return "post_processing";
	case VenueEventType::kPerformer:
		return "performer";
	case VenueEventType::kCamera:
		return "camera";
	case VenueEventType::kStage:
		return "stage";
	case VenueEventType::kOther:
	default:
		return "other";
	}
}
