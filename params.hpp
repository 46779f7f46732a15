#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace honeypot {

using json = nlohmann::json;

struct EngineParams {
	float scamThreshold{40.0f};
	float escalationBonus{10.0f};

	// Score needed to enter VERIFYING, SUSPICIOUS, COOPERATIVE, EXTRACTING.
	float verifyingScore{15.0f};
	float suspiciousScore{35.0f};
	float cooperativeScore{60.0f};
	float extractingScore{100.0f};
	// Minimum turn index for the same transitions.
	int verifyingTurn{2};
	int suspiciousTurn{3};
	int cooperativeTurn{5};
	int extractingTurn{7};

	float temperature{0.6f};
	uint32_t seed{0xC0FFEEu};
	int tacticRepeatLimit{1};
	int tacticPoolMinTurn{2};

	int minTurns{8};
	int minQuestions{5};
	int minInvestigative{3};
	int minRedFlags{5};
	int minElicitation{5};
	int probeStartTurn{4};

	int reportMinTurns{8};
	int reportMinDurationSec{0};

	int maxMessageChars{4000};
	bool rankerEnabled{true};
	bool greetingSuppression{true};
	bool enableDiagnostics{false};

	json toJson() const;
	// Applies a partial patch. Invalid values leave the current value in place
	// and are reported through error.
	bool applyParams(const json &patch, std::string *error = nullptr);
};

} // namespace honeypot
