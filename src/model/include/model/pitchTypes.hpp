#pragma once

#include <map>
#include <string>

namespace bullpen {

//! Display labels for the pitcher defined pitch type categories.
//! Only used for labelling. Scoring treats type 1 as the fastball and every other type as off-speed.
class PitchTypeLabels {
public:
	//! Default table: 1 FB, 2 CB, 3 CH, 4 SL, 5 CT.
	PitchTypeLabels();

	//! Override the label of a single type. Empty labels restore the default.
	void set(int pitchType, std::string label);

	//! Label of a type. Unknown types are shown as "P<n>".
	std::string label(int pitchType) const;

	const std::map<int, std::string>& entries() const { return m_labels; }

private:
	std::map<int, std::string> m_labels;
};

} // namespace bullpen
