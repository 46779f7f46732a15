#pragma once

#include <random>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "neural.hpp"

namespace honeypot {

struct TurnAnalysis {
	std::vector<float> encoded;
	std::vector<float> attended;
	std::vector<float> newState;
	std::vector<float> intents;

	int topIntent() const;
	std::string topIntentName() const { return kIntentNames[topIntent()]; }
};

struct RankContext {
	Stage stage{Stage::Confused};
	std::string tactic;
	std::string lastTheme;
	float riskScore{0.0f};
	// Candidates carrying this tactic tag are ranked below every other
	// candidate and left out of sampling while an alternative exists.
	std::string demotedTactic;
	float temperature{0.6f};
};

struct RankedChoice {
	std::string responseId;
	float rawScore{0.0f};
	float probability{0.0f};
};

// encode -> attend -> recur -> classify -> score -> sample.
class ResponseRanker {
public:
	ResponseRanker();

	const TextEncoder &encoder() const { return encoder_; }

	// Throws std::runtime_error when the numeric pipeline produces non-finite
	// values or the hidden state has the wrong width.
	TurnAnalysis analyze(const std::string &text, const std::vector<float> &hidden) const;

	// Returns choices sorted by descending score with sampling probabilities.
	std::vector<RankedChoice> rank(const TurnAnalysis &analysis,
								   const std::vector<const CandidateResponse *> &pool,
								   const RankContext &ctx) const;

	// Equal probability over the eligible candidates.
	static std::vector<RankedChoice> uniform(const std::vector<const CandidateResponse *> &pool,
											 const std::string &demotedTactic);
	static size_t sample(const std::vector<RankedChoice> &ranked, std::mt19937 &rng);

	static std::vector<float> handFeatures(const CandidateResponse &c, const RankContext &ctx);
	static float contextBonus(const CandidateResponse &c, const RankContext &ctx, const std::string &topIntent);
	static float stageBonus(Stage stage, ThemeClass themeClass);

private:
	TextEncoder encoder_;
	HeadAttention attention_;
	FeedForward ffn_;
	ConversationGru gru_;
	IntentClassifier intents_;
	EngagementScorer scorer_;
};

} // namespace honeypot
