#ifndef CHARTSYNC_WITHOUT_JSON_DEPENDENCY
#include "chartsync/IO/TimelineConfigIO.hpp"
#include "chartsync/Util/TickMath.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>

namespace
{
	using namespace chartsync;

	template<typename T>
	std::optional<T> GetOptional(const nlohmann::json& j, const std::string& key)
	{
		if (j.contains(key) && !j[key].is_null())
		{
			return j[key].get<T>();
		}
		return std::nullopt;
	}

	std::optional<double> GetPositiveNumber(const nlohmann::json& j, const std::string& key, std::vector<std::string>& warnings)
	{
		if (!j.contains(key) || j[key].is_null())
		{
			return std::nullopt;
		}

		if (!j[key].is_number())
		{
			warnings.push_back("Invalid " + key + ": must be a number");
			return std::nullopt;
		}

		const double value = j[key].get<double>();
		if (!std::isfinite(value) || value <= 0.0)
		{
			warnings.push_back("Invalid " + key + ": must be positive");
			return std::nullopt;
		}

		return value;
	}

	void ParseTimeSig(const nlohmann::json& j, TimelineConfig& config, std::vector<std::string>& warnings)
	{
		if (!j.is_array() || j.size() != 2 || !j[0].is_number_unsigned() || !j[1].is_number_unsigned())
		{
			warnings.push_back("Invalid time_sig: must be [numerator, denominator]");
			return;
		}

		const auto numerator = j[0].get<std::uint32_t>();
		const auto denominator = j[1].get<std::uint32_t>();
		if (numerator == 0 || denominator == 0)
		{
			warnings.push_back("Invalid time_sig: numerator and denominator must be positive");
			return;
		}

		config.timeSigNumerator = numerator;
		config.timeSigDenominator = denominator;
	}

	TimelineConfig ParseTimelineConfig(const nlohmann::json& j, std::vector<std::string>& warnings)
	{
		TimelineConfig config;

		if (const auto name = GetOptional<std::string>(j, "name"))
		{
			config.name = *name;
		}

		if (const auto resolution = GetPositiveNumber(j, "resolution", warnings))
		{
			config.resolution = *resolution;
		}

		if (const auto bpm = GetPositiveNumber(j, "bpm", warnings))
		{
			const std::uint32_t bpmMilli = BPMToBPMMilli(*bpm);
			if (bpmMilli == 0)
			{
				warnings.push_back("Invalid bpm: too small");
			}
			else
			{
				config.initialBPMMilli = bpmMilli;
			}
		}

		if (j.contains("time_sig"))
		{
			ParseTimeSig(j["time_sig"], config, warnings);
		}

		if (j.contains("offset"))
		{
			if (j["offset"].is_number())
			{
				config.offsetSec = j["offset"].get<double>();
			}
			else
			{
				warnings.push_back("Invalid offset: must be a number");
			}
		}

		if (const auto hopoThreshold = GetPositiveNumber(j, "hopo_threshold", warnings))
		{
			config.hopoThreshold = *hopoThreshold;
		}

		if (const auto manualLength = GetPositiveNumber(j, "manual_length", warnings))
		{
			config.manualLengthSec = *manualLength;
		}

		return config;
	}
}

chartsync::TimelineConfigResult chartsync::LoadTimelineConfig(std::istream& stream)
{
	TimelineConfigResult result;

	if (!stream.good())
	{
		result.error = ErrorType::GeneralIOError;
		return result;
	}

	try
	{
		nlohmann::json j;
		stream >> j;

		if (!j.is_object())
		{
			result.error = ErrorType::ConfigParseError;
			result.warnings.push_back("Config root must be an object");
			return result;
		}

		result.config = ParseTimelineConfig(j, result.warnings);
		result.error = ErrorType::None;
	}
	catch (const nlohmann::json::parse_error& e)
	{
		result.error = ErrorType::ConfigParseError;
		result.warnings.push_back("JSON parse error: " + std::string(e.what()));
	}
	catch (const nlohmann::json::type_error& e)
	{
		result.error = ErrorType::ConfigParseError;
		result.warnings.push_back("JSON type error: " + std::string(e.what()));
	}
	catch (const nlohmann::json::out_of_range& e)
	{
		result.error = ErrorType::ConfigParseError;
		result.warnings.push_back("JSON value out of range: " + std::string(e.what()));
	}

	return result;
}

chartsync::TimelineConfigResult chartsync::LoadTimelineConfig(const std::string& filePath)
{
	std::ifstream ifs(filePath);
	if (!ifs.good())
	{
		TimelineConfigResult result;
		result.error = ErrorType::CouldNotOpenInputFileStream;
		return result;
	}
	return chartsync::LoadTimelineConfig(ifs);
}
#endif
