#include "model/pitchTypes.hpp"

#include <utility>

namespace bullpen {

static const std::map<int, std::string>& defaultLabels() {
	static const std::map<int, std::string> DEFAULTS = {
	        {1, "FB"},
	        {2, "CB"},
	        {3, "CH"},
	        {4, "SL"},
	        {5, "CT"},
	};
	return DEFAULTS;
}

PitchTypeLabels::PitchTypeLabels() : m_labels(defaultLabels()) {
}

void PitchTypeLabels::set(int pitchType, std::string label) {
	if (label.empty()) {
		const auto it = defaultLabels().find(pitchType);
		if (it != defaultLabels().end()) {
			m_labels[pitchType] = it->second;
		} else {
			m_labels.erase(pitchType);
		}
		return;
	}
	m_labels[pitchType] = std::move(label);
}

std::string PitchTypeLabels::label(int pitchType) const {
	const auto it = m_labels.find(pitchType);
	if (it != m_labels.end()) {
		return it->second;
	}
	return "P" + std::to_string(pitchType);
}

} // namespace bullpen
