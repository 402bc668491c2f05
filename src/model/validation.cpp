#include "model/validation.hpp"

#include <cctype>
#include <cmath>
#include <string_view>

namespace bullpen {

static std::string_view trimmed(std::string_view text) {
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
		text.remove_prefix(1);
	}
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
		text.remove_suffix(1);
	}
	return text;
}

std::optional<std::string> validateOuting(const Outing& outing, const ValidationLimits& limits) {
	const std::string_view name = trimmed(outing.pitcherName);
	if (name.empty()) {
		return "Pitcher is required";
	}
	if (name.size() > limits.maxNameLength) {
		return "Name too long";
	}
	if (outing.pitchCount < 0) {
		return "Pitch count cannot be negative";
	}
	if (outing.pitchCount > limits.maxPitchCount) {
		return "Pitch count seems unrealistic";
	}
	if (outing.strikes.has_value()) {
		if (*outing.strikes < 0) {
			return "Strikes cannot be negative";
		}
		if (*outing.strikes > outing.pitchCount) {
			return "Strikes cannot exceed pitch count";
		}
	}
	if (outing.maxVelo.has_value()) {
		if (!std::isfinite(*outing.maxVelo) || *outing.maxVelo <= 0.0) {
			return "Velocity must be positive";
		}
		if (*outing.maxVelo > limits.maxVelocity) {
			return "Velocity seems unrealistic";
		}
	}
	if (outing.notes.size() > limits.maxNotesLength) {
		return "Notes must be less than " + std::to_string(limits.maxNotesLength) + " characters";
	}
	if (outing.focus.size() > limits.maxFocusLength) {
		return "Focus must be less than " + std::to_string(limits.maxFocusLength) + " characters";
	}
	return std::nullopt;
}

std::optional<std::string> validatePitchEvent(const PitchEvent& event, const ValidationLimits& limits) {
	if (event.pitchNumber() < 1) {
		return "Pitch number must start at 1";
	}
	if (event.pitchType() < limits.minPitchType || event.pitchType() > limits.maxPitchType) {
		return "Unknown pitch type " + std::to_string(event.pitchType());
	}
	if (!std::isfinite(event.xLocation()) || !std::isfinite(event.yLocation())) {
		return "Pitch location is not a number";
	}
	return std::nullopt;
}

std::optional<std::string> validateWeeklyLimit(int maxWeeklyPitches, const ValidationLimits& limits) {
	if (maxWeeklyPitches < limits.minWeeklyPitches) {
		return "Must be at least " + std::to_string(limits.minWeeklyPitches);
	}
	if (maxWeeklyPitches > limits.maxWeeklyPitches) {
		return "Maximum is " + std::to_string(limits.maxWeeklyPitches) + " pitches";
	}
	return std::nullopt;
}

} // namespace bullpen
