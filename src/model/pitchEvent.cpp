#include "model/pitchEvent.hpp"

#include "analytics/core/strikeZone.hpp"

#include <utility>

namespace bullpen {

PitchEvent::PitchEvent(std::string outingId, std::string pitcherId, int pitchNumber, int pitchType, double x, double y, bool isStrike,
                       Timestamp createdAt)
    : m_outingId(std::move(outingId)), m_pitcherId(std::move(pitcherId)), m_pitchNumber(pitchNumber), m_pitchType(pitchType), m_x(x), m_y(y),
      m_isStrike(isStrike), m_createdAt(createdAt) {
}

PitchEvent PitchEvent::record(std::string outingId, std::string pitcherId, int pitchNumber, int pitchType, double xLocation, double yLocation,
                              Timestamp createdAt) {
	const bool strike = analytics::core::isStrike(xLocation, yLocation);
	return {std::move(outingId), std::move(pitcherId), pitchNumber, pitchType, xLocation, yLocation, strike, createdAt};
}

PitchEvent PitchEvent::restore(std::string outingId, std::string pitcherId, int pitchNumber, int pitchType, double xLocation, double yLocation,
                               bool isStrike, Timestamp createdAt) {
	return {std::move(outingId), std::move(pitcherId), pitchNumber, pitchType, xLocation, yLocation, isStrike, createdAt};
}

std::vector<cv::Point2d> pitchLocations(const std::vector<PitchEvent>& events) {
	std::vector<cv::Point2d> points;
	points.reserve(events.size());
	for (const PitchEvent& event: events) {
		points.emplace_back(event.xLocation(), event.yLocation());
	}
	return points;
}

} // namespace bullpen
