#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "extractor.hpp"
#include "params.hpp"
#include "quality.hpp"
#include "ranker.hpp"
#include "risk.hpp"
#include "session.hpp"
#include "stage.hpp"

namespace honeypot {

struct TurnResult {
	std::string reply;
	std::string responseId;
	bool scamConfirmed{false};
	bool readyToReport{false};
	bool probe{false};
	bool degraded{false};
	bool poolReset{false};
	Stage stage{Stage::Confused};
	float riskScore{0.0f};
	float scoreDelta{0.0f};
	std::string tactic;
	std::vector<std::string> matchedCategories;
	std::vector<float> intents;

	json toJson() const;
};

class EngagementEngine {
public:
	explicit EngagementEngine(const EngineParams &params = EngineParams{},
							  std::shared_ptr<EntityExtractor> extractor = nullptr);

	// Advances the session by one scammer message and picks the persona reply.
	// Never throws; every call yields a reply.
	TurnResult processTurn(SessionState &state, const std::string &messageText) const;

	// Scores and extracts earlier scammer messages of a fresh session without
	// replying or advancing the turn index.
	void replayHistory(SessionState &state, const std::vector<std::string> &scammerMessages) const;

	bool readyToReport(const SessionState &state) const;

	EngineParams params() const;
	bool applyParams(const json &patch, std::string *error = nullptr);

	const RiskScorer &riskScorer() const { return risk_; }
	const ResponseRanker &ranker() const { return ranker_; }
	const ResponseCatalog &catalog() const { return catalog_; }
	const QualityTracker &qualityTracker() const { return quality_; }

private:
	TurnResult runTurn(SessionState &state, const std::string &text, const EngineParams &p) const;
	void resetHiddenStateIfInvalid(SessionState &state) const;

	mutable std::mutex paramsMu_;
	EngineParams params_;
	RiskScorer risk_;
	ResponseRanker ranker_;
	ResponseCatalog catalog_;
	QualityTracker quality_;
	StageController stages_;
	std::shared_ptr<EntityExtractor> extractor_;
};

} // namespace honeypot
