#pragma once

#include <string>
#include <vector>

#include "catalog.hpp"
#include "params.hpp"
#include "session.hpp"

namespace honeypot {

struct PoolBuild {
	std::vector<const CandidateResponse *> candidates;
	bool reset{false};
	size_t resetCount{0};
};

// Forward-only stage machine plus the anti-repetition bookkeeping around the
// candidate pool.
class StageController {
public:
	// Stage the session should be in after this turn: at most one step past
	// the current one, and only when both the score and turn gates are met.
	Stage evaluate(const SessionState &state, const EngineParams &params) const;

	// Moves the session to proposed. A proposed regression is ignored and
	// logged; the stage is never lowered.
	bool applyStage(SessionState &state, Stage proposed) const;

	// Stage pool plus the tactic pool (from the configured turn on), minus
	// replies already used. When nothing is left the used ids of exactly
	// these pools are released and the full pool is returned.
	PoolBuild assemblePool(SessionState &state, const ResponseCatalog &catalog, const std::string &tactic,
						   const EngineParams &params) const;
	PoolBuild assembleEmptyInputPool(SessionState &state, const ResponseCatalog &catalog) const;

	// Tactic tag to keep out of this turn's sampling, or empty.
	std::string demotedTactic(const SessionState &state, const EngineParams &params) const;

	void recordSelection(SessionState &state, const CandidateResponse &chosen) const;

	static float gateScore(Stage target, const EngineParams &params);
	static int gateTurn(Stage target, const EngineParams &params);

private:
	PoolBuild filterUsed(SessionState &state, const std::vector<const CandidateResponse *> &pool) const;
};

} // namespace honeypot
