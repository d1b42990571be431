#pragma once

namespace chartsync
{
	enum class ErrorType : int
	{
		None = 0,

		EntryNotFound = 100,
		AnchorNotRemovable = 101,
		InvalidResolution = 102,

		GeneralIOError = 10000,
		FileNotFound = 10001,
		CouldNotOpenInputFileStream = 10002,
		CouldNotOpenOutputFileStream = 10003,

		ConfigParseError = 20001,

		UnknownError = 90000,
	};

	[[nodiscard]]
	const char *GetErrorString(ErrorType errorType);
}
