#include "analytics/badges/badgeDefinitions.hpp"

#include <algorithm>

namespace bullpen::analytics {

std::string_view toString(BadgeCategory category) {
	switch (category) {
	case BadgeCategory::Accuracy: return "accuracy";
	case BadgeCategory::Command: return "command";
	case BadgeCategory::Velocity: return "velocity";
	case BadgeCategory::Consistency: return "consistency";
	case BadgeCategory::Dominance: return "dominance";
	}
	return "accuracy";
}

const std::vector<BadgeDefinition>& badgeDefinitions() {
	static const std::vector<BadgeDefinition> DEFINITIONS{
	        {"zone-master", "Zone Master", "Overall accuracy gold standard", "≥ 65% Strike %", BadgeCategory::Accuracy},
	        {"sniper-status", "Sniper Status", "Corner command specialist", "≥ 5 shadow zone pitches in one session", BadgeCategory::Command},
	        {"bridge-builder", "Bridge Builder", "Off-speed consistency", "≥ 50% strike rate on off-speed", BadgeCategory::Accuracy},
	        {"down-away", "Down & Away", "Low zone command", "≥ 5 pitches in bottom 1/3", BadgeCategory::Command},
	        {"velocity-jump", "Velocity Jump", "Growth over time", "+2 MPH vs. 30-day avg", BadgeCategory::Velocity},
	        {"terminator", "The Terminator", "Dominant session performance", "≥ 70% strikes in 30+ pitch session", BadgeCategory::Dominance},
	        {"power-precision", "Power & Precision", "The dual threat", "Top 25% velo + ≥ 60% strikes", BadgeCategory::Dominance},
	        {"stratosphere", "The Stratosphere", "High heat command", "≥ 4 fastballs in top 1/3 zone", BadgeCategory::Command},
	        {"repeatable-motion", "Repeatable Motion", "Consistency across sessions", "3+ outings within 5% strike rate", BadgeCategory::Consistency},
	        {"early-count-killer", "Early Count Killer", "Zone aggression", "≥ 60% zone rate in a session", BadgeCategory::Dominance},
	};
	return DEFINITIONS;
}

const BadgeDefinition* findBadge(std::string_view id) {
	const auto& definitions = badgeDefinitions();
	const auto it           = std::find_if(definitions.begin(), definitions.end(), [id](const BadgeDefinition& d) { return d.id == id; });
	return it == definitions.end() ? nullptr : &*it;
}

} // namespace bullpen::analytics
