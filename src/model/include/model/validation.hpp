#pragma once

#include "model/outing.hpp"
#include "model/pitchEvent.hpp"

#include <cstddef>
#include <optional>
#include <string>

// Input checks for records handed over by the storage layer.
// Every check returns the first problem found as a user facing message, or nothing if the record is fine.
namespace bullpen {

struct ValidationLimits {
	std::size_t maxNameLength{100u};
	int maxPitchCount{300};
	double maxVelocity{120.0};
	std::size_t maxNotesLength{2000u};
	std::size_t maxFocusLength{200u};
	int minPitchType{1};
	int maxPitchType{5};
	int minWeeklyPitches{1};
	int maxWeeklyPitches{500};
};

std::optional<std::string> validateOuting(const Outing& outing, const ValidationLimits& limits = ValidationLimits{});
std::optional<std::string> validatePitchEvent(const PitchEvent& event, const ValidationLimits& limits = ValidationLimits{});
std::optional<std::string> validateWeeklyLimit(int maxWeeklyPitches, const ValidationLimits& limits = ValidationLimits{});

} // namespace bullpen
