#include "engine.hpp"

#include <iostream>
#include <random>
#include <stdexcept>

#include "util.hpp"

namespace honeypot {

json TurnResult::toJson() const {
	json j{
		{"reply", reply},
		{"responseId", responseId},
		{"scamConfirmed", scamConfirmed},
		{"readyToReport", readyToReport},
		{"probe", probe},
		{"degraded", degraded},
		{"poolReset", poolReset},
		{"stage", stageName(stage)},
		{"riskScore", riskScore},
		{"scoreDelta", scoreDelta},
		{"tactic", tactic},
		{"matchedCategories", matchedCategories},
	};
	if (!intents.empty()) {
		json probs = json::object();
		for (int i = 0; i < kIntents && i < (int)intents.size(); i++) probs[kIntentNames[i]] = intents[(size_t)i];
		j["intents"] = probs;
	}
	return j;
}

EngagementEngine::EngagementEngine(const EngineParams &params, std::shared_ptr<EntityExtractor> extractor)
	: params_(params), catalog_(ranker_.encoder()), extractor_(std::move(extractor)) {
	if (!extractor_) extractor_ = std::make_shared<RegexEntityExtractor>();
}

EngineParams EngagementEngine::params() const {
	std::lock_guard<std::mutex> lock(paramsMu_);
	return params_;
}

bool EngagementEngine::applyParams(const json &patch, std::string *error) {
	std::lock_guard<std::mutex> lock(paramsMu_);
	return params_.applyParams(patch, error);
}

bool EngagementEngine::readyToReport(const SessionState &state) const {
	return quality_.readyToReport(state, params(), nowEpochMs());
}

void EngagementEngine::resetHiddenStateIfInvalid(SessionState &state) const {
	if ((int)state.hiddenState.size() == kStateDim) return;
	std::cerr << "[Ranker] session " << state.sessionId << " hidden state width " << state.hiddenState.size()
			  << " reset to " << kStateDim << std::endl;
	state.hiddenState.assign((size_t)kStateDim, 0.0f);
}

// Byte clipping can split a multi-byte character, so the result is repaired
// after the cut.
static std::string clipMessage(const std::string &text, int maxChars) {
	if (maxChars > 0 && (int)text.size() > maxChars) return sanitizeUtf8(text.substr(0, (size_t)maxChars));
	return sanitizeUtf8(text);
}

void EngagementEngine::replayHistory(SessionState &state, const std::vector<std::string> &scammerMessages) const {
	const EngineParams p = params();
	for (const auto &raw : scammerMessages) {
		const std::string text = clipMessage(raw, p.maxMessageChars);
		if (trimCopy(text).empty()) continue;
		try {
			const bool firstTurn = state.turnIndex == 0 && state.messagesExchanged == 0;
			auto turn = risk_.scoreMessage(text, firstTurn, p);
			risk_.applyTurn(state, turn, p);
			state.intel.merge(extractor_->extract(text));
			state.messagesExchanged++;
		} catch (const std::exception &e) {
			std::cerr << "[Engine] history replay skipped a message for session " << state.sessionId << ": " << e.what() << std::endl;
		}
	}
}

TurnResult EngagementEngine::processTurn(SessionState &state, const std::string &messageText) const {
	const EngineParams p = params();
	try {
		return runTurn(state, messageText, p);
	} catch (const std::exception &e) {
		std::cerr << "[Engine] turn failed for session " << state.sessionId << ": " << e.what() << std::endl;
	}
	TurnResult r;
	const auto pool = catalog_.stagePool(Stage::Confused);
	r.reply = pool.empty() ? std::string("Sorry, who is this?") : pool[(size_t)state.turnIndex % pool.size()]->text;
	r.degraded = true;
	r.stage = state.stage;
	r.riskScore = state.cumulativeRiskScore;
	r.scamConfirmed = state.scamConfirmed;
	return r;
}

TurnResult EngagementEngine::runTurn(SessionState &state, const std::string &messageText, const EngineParams &p) const {
	TurnResult r;
	const std::string text = clipMessage(messageText, p.maxMessageChars);
	const bool firstTurn = state.turnIndex == 0 && state.messagesExchanged == 0;
	const bool emptyInput = trimCopy(text).empty();

	state.turnIndex++;
	state.quality.turns++;
	state.messagesExchanged++;
	resetHiddenStateIfInvalid(state);

	std::mt19937 rng(p.seed ^ hashStrSimple(state.sessionId) ^ ((uint32_t)state.turnIndex * 0x9E3779B9u));

	if (emptyInput) {
		auto build = stages_.assembleEmptyInputPool(state, catalog_);
		auto ranked = ResponseRanker::uniform(build.candidates, "");
		const CandidateResponse *chosen = build.candidates[ResponseRanker::sample(ranked, rng)];
		stages_.recordSelection(state, *chosen);
		quality_.recordReply(state.quality, chosen->text, chosen->themeClass, false);
		state.messagesExchanged++;
		r.reply = chosen->text;
		r.responseId = chosen->id;
		r.poolReset = build.reset;
		r.stage = state.stage;
		r.riskScore = state.cumulativeRiskScore;
		r.scamConfirmed = state.scamConfirmed;
		r.readyToReport = quality_.readyToReport(state, p, nowEpochMs());
		return r;
	}

	auto turn = risk_.scoreMessage(text, firstTurn, p);
	risk_.applyTurn(state, turn, p);
	state.intel.merge(extractor_->extract(text));

	const std::string tactic = ResponseCatalog::detectTactic(text, turn.dominantCategory());
	if (!tactic.empty()) state.tacticsObserved.insert(tactic);

	const Stage before = state.stage;
	stages_.applyStage(state, stages_.evaluate(state, p));
	if (state.stage != before) {
		std::cerr << "[Engine] session " << state.sessionId << " stage " << stageName(before) << " -> "
				  << stageName(state.stage) << " at turn " << state.turnIndex << std::endl;
	}

	auto build = stages_.assemblePool(state, catalog_, tactic, p);
	if (build.reset) {
		std::cerr << "[Engine] session " << state.sessionId << " pool exhausted at " << stageName(state.stage)
				  << ", released " << build.resetCount << " used id(s)" << std::endl;
	}
	auto pool = build.candidates;

	ProbePlan plan = quality_.planProbe(state, p);
	CandidateResponse probe;
	if (plan.active) {
		probe = QualityTracker::toCandidate(plan, state.turnIndex);
		probe.embedding = ranker_.encoder().encode(probe.text);
		pool.push_back(&probe);
	}

	RankContext ctx;
	ctx.stage = state.stage;
	ctx.tactic = tactic;
	ctx.lastTheme = state.lastTheme;
	ctx.riskScore = state.cumulativeRiskScore;
	ctx.demotedTactic = stages_.demotedTactic(state, p);
	ctx.temperature = p.temperature;

	std::vector<RankedChoice> ranked;
	if (p.rankerEnabled) {
		try {
			TurnAnalysis analysis = ranker_.analyze(text, state.hiddenState);
			ranked = ranker_.rank(analysis, pool, ctx);
			state.hiddenState = analysis.newState;
			r.intents = analysis.intents;
		} catch (const std::exception &e) {
			std::cerr << "[Ranker] session " << state.sessionId << " falling back to uniform choice: " << e.what() << std::endl;
			ranked.clear();
		}
	}
	if (ranked.empty()) {
		ranked = ResponseRanker::uniform(pool, ctx.demotedTactic);
		r.degraded = true;
	}

	const std::string chosenId = ranked[ResponseRanker::sample(ranked, rng)].responseId;
	const CandidateResponse *chosen = nullptr;
	for (const auto *c : pool) {
		if (c->id == chosenId) chosen = c;
	}
	if (!chosen) throw std::runtime_error("sampled response id not in pool: " + chosenId);

	if (chosen->probe) state.quality = plan.after;
	quality_.recordReply(state.quality, chosen->text, chosen->themeClass, chosen->probe);
	stages_.recordSelection(state, *chosen);
	state.messagesExchanged++;

	r.reply = chosen->text;
	r.responseId = chosen->id;
	r.probe = chosen->probe;
	r.poolReset = build.reset;
	r.stage = state.stage;
	r.riskScore = state.cumulativeRiskScore;
	r.scoreDelta = turn.delta;
	r.tactic = tactic;
	r.matchedCategories.assign(turn.categories.begin(), turn.categories.end());
	r.scamConfirmed = state.scamConfirmed;
	r.readyToReport = quality_.readyToReport(state, p, nowEpochMs());

	if (p.enableDiagnostics) {
		std::cerr << "[Engine] session " << state.sessionId << " turn " << state.turnIndex << " delta " << turn.delta
				  << " score " << state.cumulativeRiskScore << " stage " << stageName(state.stage) << " tactic "
				  << (tactic.empty() ? "-" : tactic) << " reply " << chosen->id << (r.degraded ? " (uniform)" : "")
				  << std::endl;
	}
	return r;
}

} // namespace honeypot
