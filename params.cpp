#include "params.hpp"

namespace honeypot {

json EngineParams::toJson() const {
	json j;
	j["scamThreshold"] = scamThreshold;
	j["escalationBonus"] = escalationBonus;
	j["verifyingScore"] = verifyingScore;
	j["suspiciousScore"] = suspiciousScore;
	j["cooperativeScore"] = cooperativeScore;
	j["extractingScore"] = extractingScore;
	j["verifyingTurn"] = verifyingTurn;
	j["suspiciousTurn"] = suspiciousTurn;
	j["cooperativeTurn"] = cooperativeTurn;
	j["extractingTurn"] = extractingTurn;
	j["temperature"] = temperature;
	j["seed"] = seed;
	j["tacticRepeatLimit"] = tacticRepeatLimit;
	j["tacticPoolMinTurn"] = tacticPoolMinTurn;
	j["minTurns"] = minTurns;
	j["minQuestions"] = minQuestions;
	j["minInvestigative"] = minInvestigative;
	j["minRedFlags"] = minRedFlags;
	j["minElicitation"] = minElicitation;
	j["probeStartTurn"] = probeStartTurn;
	j["reportMinTurns"] = reportMinTurns;
	j["reportMinDurationSec"] = reportMinDurationSec;
	j["maxMessageChars"] = maxMessageChars;
	j["rankerEnabled"] = rankerEnabled;
	j["greetingSuppression"] = greetingSuppression;
	j["enableDiagnostics"] = enableDiagnostics;
	return j;
}

bool EngineParams::applyParams(const json &patch, std::string *error) {
	if (!patch.is_object()) {
		if (error) *error = "params patch must be an object";
		return false;
	}
	EngineParams p = *this;
	try {
		if (patch.contains("scamThreshold")) p.scamThreshold = patch.value("scamThreshold", p.scamThreshold);
		if (patch.contains("escalationBonus")) p.escalationBonus = patch.value("escalationBonus", p.escalationBonus);
		if (patch.contains("verifyingScore")) p.verifyingScore = patch.value("verifyingScore", p.verifyingScore);
		if (patch.contains("suspiciousScore")) p.suspiciousScore = patch.value("suspiciousScore", p.suspiciousScore);
		if (patch.contains("cooperativeScore")) p.cooperativeScore = patch.value("cooperativeScore", p.cooperativeScore);
		if (patch.contains("extractingScore")) p.extractingScore = patch.value("extractingScore", p.extractingScore);
		if (patch.contains("verifyingTurn")) p.verifyingTurn = patch.value("verifyingTurn", p.verifyingTurn);
		if (patch.contains("suspiciousTurn")) p.suspiciousTurn = patch.value("suspiciousTurn", p.suspiciousTurn);
		if (patch.contains("cooperativeTurn")) p.cooperativeTurn = patch.value("cooperativeTurn", p.cooperativeTurn);
		if (patch.contains("extractingTurn")) p.extractingTurn = patch.value("extractingTurn", p.extractingTurn);
		if (patch.contains("temperature")) p.temperature = patch.value("temperature", p.temperature);
		if (patch.contains("seed")) p.seed = patch.value("seed", p.seed);
		if (patch.contains("tacticRepeatLimit")) p.tacticRepeatLimit = patch.value("tacticRepeatLimit", p.tacticRepeatLimit);
		if (patch.contains("tacticPoolMinTurn")) p.tacticPoolMinTurn = patch.value("tacticPoolMinTurn", p.tacticPoolMinTurn);
		if (patch.contains("minTurns")) p.minTurns = patch.value("minTurns", p.minTurns);
		if (patch.contains("minQuestions")) p.minQuestions = patch.value("minQuestions", p.minQuestions);
		if (patch.contains("minInvestigative")) p.minInvestigative = patch.value("minInvestigative", p.minInvestigative);
		if (patch.contains("minRedFlags")) p.minRedFlags = patch.value("minRedFlags", p.minRedFlags);
		if (patch.contains("minElicitation")) p.minElicitation = patch.value("minElicitation", p.minElicitation);
		if (patch.contains("probeStartTurn")) p.probeStartTurn = patch.value("probeStartTurn", p.probeStartTurn);
		if (patch.contains("reportMinTurns")) p.reportMinTurns = patch.value("reportMinTurns", p.reportMinTurns);
		if (patch.contains("reportMinDurationSec")) p.reportMinDurationSec = patch.value("reportMinDurationSec", p.reportMinDurationSec);
		if (patch.contains("maxMessageChars")) p.maxMessageChars = patch.value("maxMessageChars", p.maxMessageChars);
		if (patch.contains("rankerEnabled")) p.rankerEnabled = patch.value("rankerEnabled", p.rankerEnabled);
		if (patch.contains("greetingSuppression")) p.greetingSuppression = patch.value("greetingSuppression", p.greetingSuppression);
		if (patch.contains("enableDiagnostics")) p.enableDiagnostics = patch.value("enableDiagnostics", p.enableDiagnostics);
	} catch (const json::exception &e) {
		if (error) *error = std::string("invalid params value: ") + e.what();
		return false;
	}

	if (!(p.temperature > 0.0f)) {
		if (error) *error = "temperature must be positive";
		return false;
	}
	if (p.scamThreshold < 0.0f || p.escalationBonus < 0.0f) {
		if (error) *error = "scores must be non-negative";
		return false;
	}
	if (!(p.verifyingScore <= p.suspiciousScore && p.suspiciousScore <= p.cooperativeScore &&
		  p.cooperativeScore <= p.extractingScore)) {
		if (error) *error = "stage score thresholds must be non-decreasing";
		return false;
	}
	if (p.verifyingTurn < 1 || p.suspiciousTurn < 1 || p.cooperativeTurn < 1 || p.extractingTurn < 1) {
		if (error) *error = "stage turn minimums must be at least 1";
		return false;
	}
	if (p.tacticRepeatLimit < 1) {
		if (error) *error = "tacticRepeatLimit must be at least 1";
		return false;
	}
	if (p.maxMessageChars < 1 || p.reportMinDurationSec < 0) {
		if (error) *error = "invalid limits";
		return false;
	}
	*this = p;
	return true;
}

} // namespace honeypot
