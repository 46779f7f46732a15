#include "ranker.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <stdexcept>

#include "util.hpp"

namespace honeypot {

int TurnAnalysis::topIntent() const {
	if (intents.empty()) return kIntents - 1;
	return (int)(std::max_element(intents.begin(), intents.end()) - intents.begin());
}

ResponseRanker::ResponseRanker() : ffn_(kEmbedDim, kEmbedDim * 2, 0xFF0001u), intents_(encoder_) {}

TurnAnalysis ResponseRanker::analyze(const std::string &text, const std::vector<float> &hidden) const {
	if ((int)hidden.size() != kStateDim) throw std::runtime_error("hidden state has wrong width");
	TurnAnalysis a;
	a.encoded = encoder_.encode(text);
	a.attended = ffn_.forward(attention_.forward(a.encoded));
	a.newState = gru_.step(a.attended, hidden);
	a.intents = intents_.classify(a.attended, a.newState, a.encoded, text);
	if (!allFinite(a.attended) || !allFinite(a.newState) || !allFinite(a.intents)) {
		throw std::runtime_error("non-finite activation in turn analysis");
	}
	return a;
}

static const std::set<std::string> kProbeWords = {
	"phone", "number", "contact", "employee", "email", "name",
	"department", "reference", "callback", "details", "supervisor",
};
static const std::vector<std::string> kPersonaWords = {
	"confused", "scared", "worried", "nervous", "senior", "health",
	"medicine", "glasses", "don't understand", "blood pressure",
};
static const std::vector<std::string> kStallTokens = {
	"hold on", "wait", "one minute", "let me", "checking",
	"battery", "restart", "network", "can you repeat", "one moment",
};
static const std::set<std::string> kComplyWords = {
	"okay", "alright", "cooperate", "believe", "trust", "ready",
	"proceed", "fine", "understand", "convince",
};

static float capped(double v) { return (float)std::min(1.0, v); }

static std::string stripPunct(const std::string &w) {
	size_t b = 0, e = w.size();
	while (b < e && std::ispunct((unsigned char)w[b])) b++;
	while (e > b && std::ispunct((unsigned char)w[e - 1])) e--;
	return w.substr(b, e - b);
}

std::vector<float> ResponseRanker::handFeatures(const CandidateResponse &c, const RankContext &ctx) {
	std::vector<float> f((size_t)kHandFeatures, 0.0f);
	const std::string lowered = toLowerAscii(c.text);
	auto words = splitWords(lowered);
	for (auto &w : words) w = stripPunct(w);
	std::set<std::string> unique(words.begin(), words.end());
	const size_t wc = words.size();

	if (c.stageAffinity == 0) f[0] = 0.5f;
	else if (c.stageAffinity == stageNumber(ctx.stage)) f[0] = 1.0f;
	f[1] = (!c.tactic.empty() && c.tactic == ctx.tactic) ? 1.0f : 0.0f;
	f[2] = (c.theme != ctx.lastTheme) ? 1.0f : 0.0f;
	f[3] = (wc >= 12 && wc <= 30) ? 1.0f : ((wc >= 8 && wc <= 35) ? 0.7f : 0.3f);
	f[4] = c.text.find('?') != std::string::npos ? 1.0f : 0.0f;

	int probe = 0, comply = 0, persona = 0, stall = 0;
	for (const auto &w : unique) {
		if (kProbeWords.count(w)) probe++;
		if (kComplyWords.count(w)) comply++;
	}
	for (const auto &p : kPersonaWords) {
		if (lowered.find(p) != std::string::npos) persona++;
	}
	for (const auto &s : kStallTokens) {
		if (lowered.find(s) != std::string::npos) stall++;
	}
	f[5] = capped(probe / 3.0);
	f[6] = capped(persona / 2.0);
	f[7] = capped(stall / 2.0);
	f[8] = capped(comply / 2.0);
	f[9] = (float)unique.size() / (float)std::max<size_t>(1, wc);
	return f;
}

float ResponseRanker::contextBonus(const CandidateResponse &c, const RankContext &ctx, const std::string &topIntent) {
	const std::string lowered = toLowerAscii(c.text);
	const int stage = stageNumber(ctx.stage);
	float bonus = 0.0f;
	if (stage <= 2) {
		if (c.text.find('?') != std::string::npos) bonus += 0.08f;
		if (containsAny(lowered, {"who", "verify", "identify", "introduce"})) bonus += 0.06f;
	} else if (stage <= 4) {
		if (containsAny(lowered, {"phone number", "contact", "employee id"})) bonus += 0.10f;
		if (containsAny(lowered, {"okay", "cooperate", "understand"})) bonus += 0.06f;
	} else {
		if (containsAny(lowered, {"upi", "account number", "ifsc", "bank"})) bonus += 0.12f;
		if (containsAny(lowered, {"phone number", "email", "contact"})) bonus += 0.08f;
	}

	if (topIntent == "otp_request" && lowered.find("otp") != std::string::npos) {
		bonus += 0.10f;
	} else if (topIntent == "legal_threat" && containsAny(lowered, {"scared", "arrest", "please", "cooperate"})) {
		bonus += 0.10f;
	} else if (topIntent == "payment_request" && containsAny(lowered, {"transfer", "upi", "account", "amount"})) {
		bonus += 0.10f;
	} else if (topIntent == "courier" && containsAny(lowered, {"parcel", "tracking", "customs"})) {
		bonus += 0.08f;
	}

	if (ctx.riskScore > 60.0f && containsAny(lowered, {"phone", "number", "name", "contact", "details"})) {
		bonus += 0.06f;
	}
	return bonus;
}

float ResponseRanker::stageBonus(Stage stage, ThemeClass themeClass) {
	const int s = stageNumber(stage);
	if (s <= 2 && themeClass == ThemeClass::Confusion) return 0.15f;
	if (s >= 3 && s <= 4 && themeClass == ThemeClass::Probing) return 0.15f;
	if (s >= 5 && themeClass == ThemeClass::Extraction) return 0.15f;
	return 0.0f;
}

// Marks which candidates may be sampled: a probe wins outright, otherwise
// the demoted tactic is excluded while something else is available.
static std::vector<bool> eligibility(const std::vector<const CandidateResponse *> &pool, const std::string &demotedTactic) {
	std::vector<bool> ok(pool.size(), true);
	bool hasProbe = std::any_of(pool.begin(), pool.end(), [](const CandidateResponse *c) { return c->probe; });
	if (hasProbe) {
		for (size_t i = 0; i < pool.size(); i++) ok[i] = pool[i]->probe;
		return ok;
	}
	if (demotedTactic.empty()) return ok;
	bool alternative = std::any_of(pool.begin(), pool.end(),
								   [&](const CandidateResponse *c) { return c->tactic != demotedTactic; });
	if (!alternative) return ok;
	for (size_t i = 0; i < pool.size(); i++) ok[i] = pool[i]->tactic != demotedTactic;
	return ok;
}

std::vector<RankedChoice> ResponseRanker::rank(const TurnAnalysis &analysis,
											   const std::vector<const CandidateResponse *> &pool,
											   const RankContext &ctx) const {
	std::vector<RankedChoice> out;
	if (pool.empty()) return out;
	const std::string topIntent = analysis.topIntentName();
	const auto ok = eligibility(pool, ctx.demotedTactic);

	std::vector<float> scores(pool.size(), 0.0f);
	for (size_t i = 0; i < pool.size(); i++) {
		const CandidateResponse &c = *pool[i];
		const std::vector<float> emb = c.embedding.empty() ? encoder_.encode(c.text) : c.embedding;
		std::vector<float> features;
		features.reserve((size_t)kScorerInput);
		features.insert(features.end(), analysis.attended.begin(), analysis.attended.end());
		features.insert(features.end(), emb.begin(), emb.end());
		features.insert(features.end(), analysis.newState.begin(), analysis.newState.end());
		features.insert(features.end(), analysis.intents.begin(), analysis.intents.end());
		auto hand = handFeatures(c, ctx);
		features.insert(features.end(), hand.begin(), hand.end());
		if ((int)features.size() != kScorerInput) throw std::runtime_error("scorer feature width mismatch");

		float s = scorer_.score(features) + contextBonus(c, ctx, topIntent) + stageBonus(ctx.stage, c.themeClass);
		if (!std::isfinite(s)) throw std::runtime_error("non-finite candidate score");
		scores[i] = std::max(0.0f, std::min(1.0f, s));
	}

	float bestEligible = 0.0f;
	for (size_t i = 0; i < pool.size(); i++) {
		if (ok[i]) bestEligible = std::max(bestEligible, scores[i]);
	}
	std::vector<float> logits;
	std::vector<size_t> eligibleIdx;
	const float temp = ctx.temperature > 0.0f ? ctx.temperature : 0.6f;
	for (size_t i = 0; i < pool.size(); i++) {
		if (!ok[i]) {
			scores[i] = std::min(scores[i], bestEligible - 1e-3f);
			continue;
		}
		logits.push_back((float)(std::log((double)scores[i] + 1e-9) / temp));
		eligibleIdx.push_back(i);
	}
	auto probs = softmax(logits);

	out.resize(pool.size());
	for (size_t i = 0; i < pool.size(); i++) {
		out[i].responseId = pool[i]->id;
		out[i].rawScore = scores[i];
	}
	for (size_t k = 0; k < eligibleIdx.size(); k++) out[eligibleIdx[k]].probability = probs[k];
	std::stable_sort(out.begin(), out.end(), [](const RankedChoice &a, const RankedChoice &b) { return a.rawScore > b.rawScore; });
	return out;
}

std::vector<RankedChoice> ResponseRanker::uniform(const std::vector<const CandidateResponse *> &pool,
												  const std::string &demotedTactic) {
	std::vector<RankedChoice> out(pool.size());
	const auto ok = eligibility(pool, demotedTactic);
	const auto n = std::count(ok.begin(), ok.end(), true);
	for (size_t i = 0; i < pool.size(); i++) {
		out[i].responseId = pool[i]->id;
		out[i].probability = (ok[i] && n > 0) ? 1.0f / (float)n : 0.0f;
	}
	return out;
}

size_t ResponseRanker::sample(const std::vector<RankedChoice> &ranked, std::mt19937 &rng) {
	if (ranked.empty()) throw std::invalid_argument("cannot sample from an empty pool");
	std::vector<double> weights;
	weights.reserve(ranked.size());
	double total = 0.0;
	for (const auto &r : ranked) {
		weights.push_back(r.probability > 0.0f ? (double)r.probability : 0.0);
		total += weights.back();
	}
	if (total <= 0.0) return 0;
	std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
	return dist(rng);
}

} // namespace honeypot
