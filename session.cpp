#include "session.hpp"

#include <cmath>
#include <iostream>

#include "util.hpp"

namespace honeypot {

const char *stageName(Stage s) {
	switch (s) {
	case Stage::Confused: return "CONFUSED";
	case Stage::Verifying: return "VERIFYING";
	case Stage::Suspicious: return "SUSPICIOUS";
	case Stage::Cooperative: return "COOPERATIVE";
	case Stage::Extracting: return "EXTRACTING";
	}
	return "CONFUSED";
}

json QualityMetrics::toJson() const {
	return json{
		{"turns", turns},
		{"questionsAsked", questionsAsked},
		{"investigativeProbes", investigativeProbes},
		{"redFlagAcks", (int)redFlags.size()},
		{"redFlags", redFlags},
		{"elicitationAttempts", elicitationAttempts},
	};
}

json SessionState::toJson() const {
	json j;
	j["sessionId"] = sessionId;
	j["cumulativeRiskScore"] = cumulativeRiskScore;
	j["stage"] = stageName(stage);
	j["stageNumber"] = stageNumber(stage);
	j["turnIndex"] = turnIndex;
	j["createdAt"] = createdAtMs;
	j["lastActivity"] = lastActivityMs;
	j["usedResponseIds"] = usedResponseIds;
	j["tactic"] = json{{"tag", tacticTag}, {"streak", tacticStreak}};
	j["lastTheme"] = lastTheme;
	j["quality"] = quality.toJson();
	j["scamConfirmed"] = scamConfirmed;
	j["scamType"] = scamType;
	j["triggeredSignals"] = triggeredSignals;
	j["signalCounts"] = signalCounts;
	j["tacticsObserved"] = tacticsObserved;
	j["intelligence"] = intel.toJson();
	j["messagesExchanged"] = messagesExchanged;
	j["finalized"] = finalized;
	double norm = 0.0;
	for (float v : hiddenState) norm += (double)v * v;
	j["hiddenStateNorm"] = std::sqrt(norm);
	return j;
}

SessionStore::SessionStore(int64_t idleMs) : idleMs_(idleMs) {}

std::shared_ptr<SessionStore::Entry> SessionStore::find(const std::string &sessionId) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = sessions_.find(sessionId);
	if (it == sessions_.end()) return nullptr;
	return it->second;
}

void SessionStore::withSession(const std::string &sessionId, const std::function<void(SessionState &, bool fresh)> &fn) {
	std::shared_ptr<Entry> entry;
	bool fresh = false;
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto it = sessions_.find(sessionId);
		if (it == sessions_.end()) {
			entry = std::make_shared<Entry>();
			entry->state.sessionId = sessionId;
			entry->state.createdAtMs = nowEpochMs();
			entry->state.lastActivityMs = entry->state.createdAtMs;
			sessions_[sessionId] = entry;
			fresh = true;
		} else {
			entry = it->second;
		}
	}
	std::lock_guard<std::mutex> lock(entry->mu);
	entry->state.lastActivityMs = nowEpochMs();
	fn(entry->state, fresh);
}

bool SessionStore::snapshot(const std::string &sessionId, json &out, std::string *error) const {
	auto entry = find(sessionId);
	if (!entry) {
		if (error) *error = "session not found";
		return false;
	}
	std::lock_guard<std::mutex> lock(entry->mu);
	out = entry->state.toJson();
	return true;
}

bool SessionStore::markFinalized(const std::string &sessionId) {
	auto entry = find(sessionId);
	if (!entry) return false;
	std::lock_guard<std::mutex> lock(entry->mu);
	return markFinalized(entry->state);
}

bool SessionStore::markFinalized(SessionState &state) {
	if (state.finalized) return false;
	state.finalized = true;
	return true;
}

size_t SessionStore::evictIdle(int64_t nowMs) {
	size_t removed = 0;
	std::lock_guard<std::mutex> lock(mu_);
	for (auto it = sessions_.begin(); it != sessions_.end();) {
		auto &entry = it->second;
		std::unique_lock<std::mutex> entryLock(entry->mu, std::try_to_lock);
		if (!entryLock.owns_lock()) {
			++it;
			continue;
		}
		if (nowMs - entry->state.lastActivityMs > idleMs_) {
			entryLock.unlock();
			it = sessions_.erase(it);
			removed++;
		} else {
			++it;
		}
	}
	if (removed > 0) {
		std::cerr << "[Sessions] evicted " << removed << " idle session(s), " << sessions_.size() << " remaining" << std::endl;
	}
	return removed;
}

size_t SessionStore::size() const {
	std::lock_guard<std::mutex> lock(mu_);
	return sessions_.size();
}

} // namespace honeypot
