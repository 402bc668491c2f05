#include "sessionLoader.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

namespace bullpen {

static std::vector<std::string> splitRow(const std::string& line) {
	std::vector<std::string> fields;
	std::stringstream stream(line);
	std::string field;
	while (std::getline(stream, field, ',')) {
		fields.push_back(field);
	}
	return fields;
}

//! Whole field as an integer. Throws std::invalid_argument on trailing characters.
static int parseInt(const std::string& field) {
	std::size_t pos = 0;
	const int value = std::stoi(field, &pos);
	if (pos != field.size()) {
		throw std::invalid_argument("not an integer: '" + field + "'");
	}
	return value;
}

//! Whole field as a number. Throws std::invalid_argument on trailing characters.
static double parseDouble(const std::string& field) {
	std::size_t pos    = 0;
	const double value = std::stod(field, &pos);
	if (pos != field.size()) {
		throw std::invalid_argument("not a number: '" + field + "'");
	}
	return value;
}

//! One outing per outing id. Counts come from the events, so the strike count is always tracked.
static std::vector<Outing> outingsFromEvents(const std::vector<PitchEvent>& events, Date day) {
	std::map<std::string, Outing> byId;
	for (const PitchEvent& event: events) {
		auto it = byId.find(event.outingId());
		if (it == byId.end()) {
			Outing outing{};
			outing.id          = event.outingId();
			outing.pitcherName = event.pitcherId();
			outing.date        = day;
			outing.strikes     = 0;
			it                 = byId.emplace(event.outingId(), outing).first;
		}
		++it->second.pitchCount;
		if (event.isStrike()) {
			++*it->second.strikes;
		}
	}

	std::vector<Outing> outings;
	for (auto& [id, outing]: byId) {
		outings.push_back(std::move(outing));
	}
	return outings;
}

std::optional<Session> loadSessionCsv(const std::filesystem::path& path, Date day) {
	std::ifstream file(path);
	if (!file.is_open()) {
		std::cerr << "[Error] Failed to open pitch file: " << path << "\n";
		return std::nullopt;
	}

	const Timestamp createdAt = day;

	Session session{};
	std::string line;
	int lineNumber = 0;
	while (std::getline(file, line)) {
		++lineNumber;
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (line.empty() || (lineNumber == 1 && line.rfind("outing_id", 0) == 0)) {
			continue;
		}

		const std::vector<std::string> fields = splitRow(line);
		if (fields.size() != 5u) {
			std::cerr << "[Error] " << path << ":" << lineNumber << ": expected 5 fields, got " << fields.size() << "\n";
			return std::nullopt;
		}

		try {
			const int pitchNumber = parseInt(fields[1]);
			const int pitchType   = parseInt(fields[2]);
			const double x        = parseDouble(fields[3]);
			const double y        = parseDouble(fields[4]);
			session.events.push_back(PitchEvent::record(fields[0], "tuner", pitchNumber, pitchType, x, y, createdAt));
		} catch (const std::exception& e) {
			std::cerr << "[Error] " << path << ":" << lineNumber << ": " << e.what() << "\n";
			return std::nullopt;
		}
	}

	session.outings = outingsFromEvents(session.events, day);
	return session;
}

Session syntheticSession(Date day) {
	cv::RNG rng(0x5eed);

	Session session{};
	const Timestamp createdAt = day;
	for (int outing = 0; outing < 3; ++outing) {
		const std::string outingId = "bullpen-" + std::to_string(outing + 1);
		for (int pitch = 1; pitch <= 40; ++pitch) {
			// Fastballs (type 1) are aimed low and away, everything else at the knees.
			const int type       = pitch % 4 == 0 ? 2 + pitch % 3 : 1;
			const double targetX = type == 1 ? 0.25 : -0.05;
			const double targetY = type == 1 ? -0.3 : -0.35;
			const double spread  = 0.12 + 0.04 * outing;
			const double x       = std::clamp(targetX + rng.gaussian(spread), -1.0, 1.0);
			const double y       = std::clamp(targetY + rng.gaussian(spread), -1.0, 1.0);
			session.events.push_back(PitchEvent::record(outingId, "tuner", pitch, type, x, y, createdAt));
		}
	}

	session.outings = outingsFromEvents(session.events, day);
	for (std::size_t i = 0; i < session.outings.size(); ++i) {
		session.outings[i].date    = day - std::chrono::days{14 * static_cast<int>(session.outings.size() - 1 - i)};
		session.outings[i].maxVelo = 52.0 + static_cast<double>(i);
	}
	return session;
}

} // namespace bullpen
