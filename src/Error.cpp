#include "chartsync/Error.hpp"

const char *chartsync::GetErrorString(chartsync::ErrorType errorType)
{
	switch (errorType)
	{
	case chartsync::ErrorType::None:
		return "";
	case chartsync::ErrorType::EntryNotFound:
		return "Entry not found";
	case chartsync::ErrorType::AnchorNotRemovable:
		return "Entry at tick 0 cannot be removed";
	case chartsync::ErrorType::InvalidResolution:
		return "Invalid resolution";
	case chartsync::ErrorType::GeneralIOError:
		return "IO error";
	case chartsync::ErrorType::FileNotFound:
		return "File not found";
	case chartsync::ErrorType::CouldNotOpenInputFileStream:
		return "Could not open input file stream";
	case chartsync::ErrorType::CouldNotOpenOutputFileStream:
		return "Could not open output file stream";
	case chartsync::ErrorType::ConfigParseError:
		return "Config parse error";
	default:
		return "Unknown error";
	}
}
