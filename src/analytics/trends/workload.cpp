#include "analytics/trends/workload.hpp"

#include "analytics/trends/rollup.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace bullpen::analytics::trends {

std::string_view toString(PulseLevel level) {
	switch (level) {
	case PulseLevel::Normal: return "normal";
	case PulseLevel::Warning: return "warning";
	case PulseLevel::Caution: return "caution";
	case PulseLevel::Danger: return "danger";
	}
	return "normal";
}

PulseLevel pulseLevel(int sevenDayPitches, int maxWeeklyPitches) {
	if (maxWeeklyPitches <= 0) {
		return sevenDayPitches > 0 ? PulseLevel::Danger : PulseLevel::Normal;
	}

	const double percent = static_cast<double>(sevenDayPitches) / maxWeeklyPitches * 100.0;
	if (percent >= 100.0) {
		return PulseLevel::Danger;
	}
	if (percent >= 90.0) {
		return PulseLevel::Caution;
	}
	if (percent >= 75.0) {
		return PulseLevel::Warning;
	}
	return PulseLevel::Normal;
}

std::string pulseLabel(PulseLevel level, int sevenDayPitches, int maxWeeklyPitches) {
	const long percent = maxWeeklyPitches > 0 ? std::lround(static_cast<double>(sevenDayPitches) / maxWeeklyPitches * 100.0) : 0;

	switch (level) {
	case PulseLevel::Danger: return "Over limit (" + std::to_string(percent) + "%)";
	case PulseLevel::Caution: return "Near limit (" + std::to_string(percent) + "%)";
	case PulseLevel::Warning: return "Approaching limit (" + std::to_string(percent) + "%)";
	case PulseLevel::Normal: break;
	}
	return std::to_string(sevenDayPitches) + " / " + std::to_string(maxWeeklyPitches);
}

PitcherSnapshot pitcherSnapshot(const std::string& pitcherName, const std::vector<Outing>& outings, Date today, int maxWeeklyPitches) {
	PitcherSnapshot snapshot{};
	snapshot.pitcherName = pitcherName;

	std::vector<Outing> own;
	std::copy_if(outings.begin(), outings.end(), std::back_inserter(own), [&pitcherName](const Outing& o) { return o.pitcherName == pitcherName; });
	snapshot.outingCount = static_cast<int>(own.size());
	if (own.empty()) {
		return snapshot;
	}

	const WindowStats recent = rollup(own, trailingWindow(today, PULSE_WINDOW_DAYS));
	snapshot.sevenDayPulse    = recent.totalPitches;
	snapshot.pulse            = pulseLevel(recent.totalPitches, maxWeeklyPitches);
	snapshot.strikePercentage = recent.strikePercentage;
	snapshot.maxVelocity      = recent.maxVelocity ? recent.maxVelocity : rollup(own).maxVelocity;

	// Newest first. Stable so outings of the same day keep their input order.
	std::stable_sort(own.begin(), own.end(), [](const Outing& a, const Outing& b) { return a.date > b.date; });

	const Outing& last      = own.front();
	snapshot.lastOuting     = last.date;
	snapshot.lastPitchCount = last.pitchCount;
	snapshot.notes          = last.notes;

	const auto withFocus = std::find_if(own.begin(), own.end(), [](const Outing& o) { return !o.focus.empty(); });
	if (withFocus != own.end()) {
		snapshot.focus = withFocus->focus;
	}
	const auto withCoachNotes = std::find_if(own.begin(), own.end(), [](const Outing& o) { return !o.coachNotes.empty(); });
	if (withCoachNotes != own.end()) {
		snapshot.coachNotes = withCoachNotes->coachNotes;
	}

	return snapshot;
}

} // namespace bullpen::analytics::trends
