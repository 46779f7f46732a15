#pragma once

#include <regex>
#include <set>
#include <string>
#include <vector>

#include "params.hpp"
#include "session.hpp"

namespace honeypot {

struct SignalMatch {
	std::string layer;
	int weight{0};
	std::string category;
};

struct TurnRisk {
	std::vector<SignalMatch> matches;
	std::set<std::string> categories;
	float escalationBonus{0.0f};
	float delta{0.0f};
	bool greetingSuppressed{false};

	// Category of the heaviest match, empty when nothing matched.
	std::string dominantCategory() const;
	bool has(const std::string &category) const { return categories.count(category) > 0; }
};

struct RiskRule {
	std::regex re;
	int weight{0};
	std::string category;
};

struct RiskLayer {
	std::string name;
	bool core{true};
	std::vector<RiskRule> rules;
};

class RiskScorer {
public:
	RiskScorer();

	// Scores one message in isolation. Only the heaviest rule of each layer
	// counts; the escalation bonus is added when two or more distinct
	// categories match.
	TurnRisk scoreMessage(const std::string &text, bool firstTurn, const EngineParams &params) const;

	// Folds a scored turn into the session: cumulative score, triggered
	// categories, the one-way scam latch and the scam type.
	void applyTurn(SessionState &state, const TurnRisk &turn, const EngineParams &params) const;

	bool isPureGreeting(const std::string &text) const;
	const std::vector<RiskLayer> &layers() const { return layers_; }

	static float confidence(float cumulative, float threshold);
	static std::string riskLevel(float cumulative, float threshold);
	static std::string classifyScamType(const std::set<std::string> &categories);

private:
	std::vector<RiskLayer> layers_;
	std::vector<std::regex> greetings_;
};

} // namespace honeypot
