#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "extractor.hpp"

namespace honeypot {

using json = nlohmann::json;

constexpr int kStateDim = 64;

enum class Stage : int {
	Confused = 1,
	Verifying = 2,
	Suspicious = 3,
	Cooperative = 4,
	Extracting = 5,
};

const char *stageName(Stage s);
inline int stageNumber(Stage s) { return (int)s; }

struct QualityMetrics {
	int turns{0};
	int questionsAsked{0};
	std::set<uint32_t> askedQuestionHashes;
	int investigativeProbes{0};
	std::set<std::string> redFlags;
	int elicitationAttempts{0};

	// Round-robin positions for the probe template families.
	bool cursorsSeeded{false};
	size_t investigativeCursor{0};
	size_t elicitationCursor{0};
	size_t redFlagCursor{0};
	size_t connectorCursor{0};
	std::map<std::string, size_t> redFlagVariant;

	json toJson() const;
};

struct SessionState {
	std::string sessionId;
	float cumulativeRiskScore{0.0f};
	Stage stage{Stage::Confused};
	int turnIndex{0};
	int64_t createdAtMs{0};
	int64_t lastActivityMs{0};

	std::vector<float> hiddenState = std::vector<float>((size_t)kStateDim, 0.0f);
	std::set<std::string> usedResponseIds;
	std::string tacticTag;
	int tacticStreak{0};
	std::string lastTheme;

	QualityMetrics quality;

	bool scamConfirmed{false};
	std::string scamType{"unknown"};
	std::set<std::string> triggeredSignals;
	std::map<std::string, int> signalCounts;
	std::set<std::string> tacticsObserved;
	Intelligence intel;
	int messagesExchanged{0};
	bool finalized{false};

	json toJson() const;
};

// In-memory session table. Each session carries its own mutex so that
// mutations of one session id are serialised while distinct ids proceed
// in parallel.
class SessionStore {
public:
	explicit SessionStore(int64_t idleMs = 3600ll * 1000ll);

	// Runs fn with exclusive access to the session, creating it on first use.
	// fresh is true when the record was created by this call.
	void withSession(const std::string &sessionId, const std::function<void(SessionState &, bool fresh)> &fn);

	bool snapshot(const std::string &sessionId, json &out, std::string *error = nullptr) const;

	// Atomic check-and-set of the finalization flag. Returns true only for the
	// first caller. Must not be called from inside withSession for the same id.
	bool markFinalized(const std::string &sessionId);

	// Same check-and-set on a state already held through withSession.
	static bool markFinalized(SessionState &state);

	size_t evictIdle(int64_t nowMs);
	size_t size() const;
	int64_t idleMs() const { return idleMs_; }

private:
	struct Entry {
		std::mutex mu;
		SessionState state;
	};

	int64_t idleMs_{3600ll * 1000ll};
	mutable std::mutex mu_;
	std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;

	std::shared_ptr<Entry> find(const std::string &sessionId) const;
};

} // namespace honeypot
