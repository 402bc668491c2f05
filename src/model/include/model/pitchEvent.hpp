#pragma once

#include "model/calendar.hpp"

#include <opencv2/core/types.hpp>

#include <string>
#include <vector>

namespace bullpen {

/*! One charted pitch of an outing.
 *  The strike flag is a snapshot: it is classified once when the pitch is recorded and stored with the event.
 *  Events loaded from storage keep the stored flag, so a later change of the zone constants never reclassifies history.
 *  There are no setters. Events are only created by record() or restore().
 */
class PitchEvent {
public:
	//! Record a newly charted pitch. Classifies the location against the current strike zone.
	static PitchEvent record(std::string outingId, std::string pitcherId, int pitchNumber, int pitchType, double xLocation, double yLocation,
	                         Timestamp createdAt);

	//! Rebuild an event from storage. The strike flag is taken as stored.
	static PitchEvent restore(std::string outingId, std::string pitcherId, int pitchNumber, int pitchType, double xLocation, double yLocation,
	                          bool isStrike, Timestamp createdAt);

	const std::string& outingId() const { return m_outingId; }
	const std::string& pitcherId() const { return m_pitcherId; }
	int pitchNumber() const { return m_pitchNumber; }
	int pitchType() const { return m_pitchType; }
	double xLocation() const { return m_x; }
	double yLocation() const { return m_y; }
	bool isStrike() const { return m_isStrike; }
	Timestamp createdAt() const { return m_createdAt; }

	//! Pitch type 1 is the primary fastball. Every other type counts as off-speed.
	bool isFastball() const { return m_pitchType == FASTBALL_TYPE; }

	static constexpr int FASTBALL_TYPE = 1;

private:
	PitchEvent(std::string outingId, std::string pitcherId, int pitchNumber, int pitchType, double x, double y, bool isStrike, Timestamp createdAt);

private:
	std::string m_outingId;  //!< Outing that produced the pitch.
	std::string m_pitcherId; //!< Pitcher that threw the pitch.
	int m_pitchNumber;       //!< Sequence number within the outing (>= 1).
	int m_pitchType;         //!< Pitcher defined category (1-5).
	double m_x;              //!< Normalised horizontal plate crossing [-1, 1], left to right.
	double m_y;              //!< Normalised vertical plate crossing [-1, 1], bottom to top.
	bool m_isStrike;         //!< Classification frozen at creation.
	Timestamp m_createdAt;
};

//! Plate crossing locations of the events, in input order.
std::vector<cv::Point2d> pitchLocations(const std::vector<PitchEvent>& events);

} // namespace bullpen
