#include "model/outing.hpp"

#include <array>
#include <utility>

namespace bullpen {

static constexpr std::array<std::pair<EventType, std::string_view>, 4> EVENT_NAMES = {{
        {EventType::Bullpen, "Bullpen"},
        {EventType::Game, "Game"},
        {EventType::External, "External"},
        {EventType::Practice, "Practice"},
}};

std::string_view toString(const EventType type) {
	for (const auto& [value, name]: EVENT_NAMES) {
		if (value == type) {
			return name;
		}
	}
	return "Unknown";
}

std::optional<EventType> parseEventType(std::string_view name) {
	for (const auto& [value, known]: EVENT_NAMES) {
		if (known == name) {
			return value;
		}
	}
	return std::nullopt;
}

std::optional<double> strikePercentage(const Outing& outing) {
	if (!outing.strikes.has_value() || outing.pitchCount <= 0) {
		return std::nullopt;
	}
	return static_cast<double>(*outing.strikes) / static_cast<double>(outing.pitchCount) * 100.0;
}

std::optional<double> recordedVelocity(const Outing& outing) {
	if (!outing.maxVelo.has_value() || !(*outing.maxVelo > 0.0)) {
		return std::nullopt;
	}
	return outing.maxVelo;
}

} // namespace bullpen
