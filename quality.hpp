#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "params.hpp"
#include "session.hpp"

namespace honeypot {

// A probe reply and the quality metrics the session will hold once the probe
// has been sent.
struct ProbePlan {
	bool active{false};
	bool compound{false};
	std::string text;
	std::vector<std::string> parts;
	QualityMetrics after;
};

class QualityTracker {
public:
	// Number of the four non-turn counters that are below target.
	int shortCounters(const QualityMetrics &q, const EngineParams &params) const;
	bool thresholdsMet(const QualityMetrics &q, const EngineParams &params) const;
	json missing(const QualityMetrics &q, const EngineParams &params) const;

	// Plans a probe for this turn, or returns an inactive plan when no probe
	// is needed yet. Does not modify the session.
	ProbePlan planProbe(const SessionState &state, const EngineParams &params) const;

	// Counts a distinct question and the reply theme toward the counters.
	void recordReply(QualityMetrics &q, const std::string &reply, ThemeClass themeClass, bool probe) const;

	bool readyToReport(const SessionState &state, const EngineParams &params, int64_t nowMs) const;

	static std::string redFlagKey(const std::string &category);
	static std::vector<std::string> filterByIntel(const std::vector<std::string> &templates, const Intelligence &intel);
	static CandidateResponse toCandidate(const ProbePlan &plan, int turnIndex);
};

} // namespace honeypot
