#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bullpen::analytics {

enum class BadgeCategory { Accuracy, Command, Velocity, Consistency, Dominance };

std::string_view toString(BadgeCategory category);

//! Static description of an achievement. The ten definitions never change at runtime.
struct BadgeDefinition {
	std::string id;          //!< Stable key, e.g. "zone-master".
	std::string name;        //!< Display name.
	std::string description; //!< One line summary.
	std::string metric;      //!< Human readable target, e.g. "≥ 65% Strike %".
	BadgeCategory category;
};

//! All definitions in evaluation order.
const std::vector<BadgeDefinition>& badgeDefinitions();

//! Definition with the given id, nullptr if unknown.
const BadgeDefinition* findBadge(std::string_view id);

} // namespace bullpen::analytics
