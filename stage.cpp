#include "stage.hpp"

#include <iostream>

namespace honeypot {

float StageController::gateScore(Stage target, const EngineParams &params) {
	switch (target) {
	case Stage::Verifying: return params.verifyingScore;
	case Stage::Suspicious: return params.suspiciousScore;
	case Stage::Cooperative: return params.cooperativeScore;
	case Stage::Extracting: return params.extractingScore;
	case Stage::Confused: return 0.0f;
	}
	return 0.0f;
}

int StageController::gateTurn(Stage target, const EngineParams &params) {
	switch (target) {
	case Stage::Verifying: return params.verifyingTurn;
	case Stage::Suspicious: return params.suspiciousTurn;
	case Stage::Cooperative: return params.cooperativeTurn;
	case Stage::Extracting: return params.extractingTurn;
	case Stage::Confused: return 0;
	}
	return 0;
}

Stage StageController::evaluate(const SessionState &state, const EngineParams &params) const {
	if (state.stage == Stage::Extracting) return state.stage;
	Stage next = (Stage)(stageNumber(state.stage) + 1);
	if (state.cumulativeRiskScore >= gateScore(next, params) && state.turnIndex >= gateTurn(next, params)) {
		return next;
	}
	return state.stage;
}

bool StageController::applyStage(SessionState &state, Stage proposed) const {
	if (stageNumber(proposed) < stageNumber(state.stage)) {
		std::cerr << "[Engine] session " << state.sessionId << " stage regression " << stageName(state.stage)
				  << " -> " << stageName(proposed) << " ignored" << std::endl;
		return false;
	}
	if (proposed == state.stage) return false;
	state.stage = proposed;
	return true;
}

PoolBuild StageController::filterUsed(SessionState &state, const std::vector<const CandidateResponse *> &pool) const {
	PoolBuild out;
	for (const auto *c : pool) {
		if (!state.usedResponseIds.count(c->id)) out.candidates.push_back(c);
	}
	if (!out.candidates.empty() || pool.empty()) return out;
	for (const auto *c : pool) out.resetCount += state.usedResponseIds.erase(c->id);
	out.reset = true;
	out.candidates = pool;
	return out;
}

PoolBuild StageController::assemblePool(SessionState &state, const ResponseCatalog &catalog, const std::string &tactic,
										const EngineParams &params) const {
	auto pool = catalog.stagePool(state.stage);
	if (!tactic.empty() && state.turnIndex >= params.tacticPoolMinTurn) {
		auto extra = catalog.tacticPool(tactic);
		pool.insert(pool.end(), extra.begin(), extra.end());
	}
	return filterUsed(state, pool);
}

PoolBuild StageController::assembleEmptyInputPool(SessionState &state, const ResponseCatalog &catalog) const {
	return filterUsed(state, catalog.emptyInputPool());
}

std::string StageController::demotedTactic(const SessionState &state, const EngineParams &params) const {
	if (state.tacticTag.empty()) return "";
	return state.tacticStreak >= params.tacticRepeatLimit ? state.tacticTag : "";
}

void StageController::recordSelection(SessionState &state, const CandidateResponse &chosen) const {
	if (!chosen.probe) state.usedResponseIds.insert(chosen.id);
	if (chosen.tactic.empty()) {
		state.tacticTag.clear();
		state.tacticStreak = 0;
	} else if (chosen.tactic == state.tacticTag) {
		state.tacticStreak++;
	} else {
		state.tacticTag = chosen.tactic;
		state.tacticStreak = 1;
	}
	state.lastTheme = chosen.theme;
}

} // namespace honeypot
