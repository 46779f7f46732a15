#include "neural.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "util.hpp"

namespace honeypot {

const char *const kIntentNames[kIntents] = {
	"urgency", "authority", "otp_request", "payment_request", "suspension",
	"prize_lure", "suspicious_url", "emotional", "legal_threat", "courier",
	"tech_support", "job_fraud", "investment", "identity_theft", "neutral",
};

const std::vector<std::string> &intentKeywords(int intent) {
	static const std::vector<std::vector<std::string>> table = {
		{"urgent", "immediately", "hurry", "right now", "last chance", "final notice", "expiring", "deadline", "limited time", "act now"},
		{"rbi", "police", "cbi", "income tax", "government", "officer", "commissioner", "cyber cell", "court order", "ministry"},
		{"otp", "one time password", "verification code", "share the code", "cvv", "atm pin", "mpin", "upi pin", "read the otp"},
		{"send money", "transfer", "pay now", "processing fee", "upi", "paytm", "neft", "bank transfer", "security deposit"},
		{"account blocked", "suspended", "deactivated", "frozen", "kyc update", "compromised", "unauthorized access", "locked"},
		{"congratulations", "won", "prize", "lottery", "cashback", "reward", "lucky draw", "jackpot", "selected for", "free gift"},
		{"click here", "bit.ly", "download app", "install", "link", "anydesk", "teamviewer", "screen share", "remote access"},
		{"scared", "afraid", "danger", "shame", "your family", "trust me", "confidential", "no choice", "save yourself"},
		{"arrest", "warrant", "fir", "jail", "legal action", "money laundering", "digital arrest", "criminal case"},
		{"parcel", "courier", "customs", "drugs found", "contraband", "fedex", "shipment", "tracking number", "seized"},
		{"virus detected", "computer hacked", "anydesk", "remote access", "screen sharing", "tech support", "malware", "microsoft"},
		{"work from home", "online job", "earn daily", "part time job", "telegram group", "training fee", "product review"},
		{"guaranteed returns", "double your money", "crypto", "bitcoin", "stock tip", "trading", "mutual fund", "demat account"},
		{"aadhaar number", "pan card", "voter id", "passport number", "selfie with id", "share your aadhaar", "date of birth"},
		{"hello", "hi", "good morning", "how are you", "thank you", "namaste", "okay", "yes", "no", "please"},
	};
	if (intent < 0 || intent >= (int)table.size()) throw std::out_of_range("intent index");
	return table[(size_t)intent];
}

Linear::Linear(int in, int out, uint32_t seed) : w(out, in), b((size_t)out, 0.0f) {
	Rng32 rng(seed);
	double bound = std::sqrt(6.0 / (double)std::max(1, in));
	for (auto &v : w.data) v = (float)((rng.next() * 2.0 - 1.0) * bound);
}

std::vector<float> Linear::forward(const std::vector<float> &x) const {
	if ((int)x.size() != w.cols) throw std::invalid_argument("linear input size mismatch");
	std::vector<float> out((size_t)w.rows, 0.0f);
	for (int r = 0; r < w.rows; r++) {
		double acc = 0.0;
		for (int c = 0; c < w.cols; c++) acc += w(r, c) * x[(size_t)c];
		acc += b[(size_t)r];
		out[(size_t)r] = (float)acc;
	}
	return out;
}

LayerNorm::LayerNorm(int d) : gamma((size_t)d, 1.0f), beta((size_t)d, 0.0f) {}

std::vector<float> LayerNorm::forward(const std::vector<float> &x) const {
	double mean = 0.0;
	for (auto v : x) mean += v;
	mean /= std::max<size_t>(1, x.size());
	double var = 0.0;
	for (auto v : x) { double d = v - mean; var += d * d; }
	var /= std::max<size_t>(1, x.size());
	double denom = 1.0 / std::sqrt(var + eps);
	std::vector<float> out(x.size(), 0.0f);
	for (size_t i = 0; i < x.size(); i++) {
		out[i] = (float)(((x[i] - mean) * denom) * gamma[i] + beta[i]);
	}
	return out;
}

FeedForward::FeedForward(int dModel, int dFF, uint32_t seed)
	: w1(dModel, dFF, seed), w2(dFF, dModel, seed + 1u), ln(dModel) {}

std::vector<float> FeedForward::forward(const std::vector<float> &x) const {
	auto h = w1.forward(x);
	for (auto &v : h) v = geluFn(v);
	auto y = w2.forward(h);
	for (size_t i = 0; i < y.size(); i++) y[i] += x[i];
	return ln.forward(y);
}

float geluFn(float x) {
	return 0.5f * x * (1.0f + std::tanh(std::sqrt(2.0f / 3.1415926f) * (x + 0.044715f * x * x * x)));
}

float sigmoidFn(float x) {
	x = std::max(-15.0f, std::min(15.0f, x));
	return 1.0f / (1.0f + std::exp(-x));
}

std::vector<float> softmax(const std::vector<float> &x) {
	float maxv = -1e30f;
	for (float v : x) maxv = std::max(maxv, v);
	double sum = 0.0;
	std::vector<float> out(x.size(), 0.0f);
	for (size_t i = 0; i < x.size(); i++) {
		double v = std::exp((double)x[i] - maxv);
		out[i] = (float)v;
		sum += v;
	}
	if (sum <= 0) return out;
	for (auto &v : out) v = (float)(v / sum);
	return out;
}

float l2norm(const std::vector<float> &v) {
	double s = 0.0;
	for (float x : v) s += (double)x * x;
	return (float)std::sqrt(s);
}

float cosineSim(const std::vector<float> &a, const std::vector<float> &b) {
	float na = l2norm(a);
	float nb = l2norm(b);
	if (na < 1e-9f || nb < 1e-9f) return 0.0f;
	double dot = 0.0;
	for (size_t i = 0; i < std::min(a.size(), b.size()); i++) dot += (double)a[i] * b[i];
	return (float)(dot / ((double)na * nb));
}

bool allFinite(const std::vector<float> &v) {
	return std::all_of(v.begin(), v.end(), [](float x) { return std::isfinite(x); });
}

static void normalizeInPlace(std::vector<float> &v) {
	float n = l2norm(v);
	if (n <= 1e-9f) return;
	for (auto &x : v) x /= n;
}

static void addHashed(std::vector<float> &vec, const std::string &feature, uint32_t idxSeed, uint32_t signSeed) {
	size_t idx = fnv1a(feature, idxSeed) % vec.size();
	float sign = (fnv1a(feature, signSeed) & 1u) == 0 ? 1.0f : -1.0f;
	vec[idx] += sign;
}

TextEncoder::TextEncoder() : proj_(kEmbedDim, kEmbedDim, 0xE0C0D3u) {}

std::vector<float> TextEncoder::hashFeatures(const std::string &text) const {
	const size_t half = (size_t)kEmbedDim / 2;
	std::vector<float> charVec(half, 0.0f);
	std::vector<float> wordVec(half, 0.0f);

	const std::string lowered = toLowerAscii(trimCopy(text));
	const std::string padded = " " + lowered + " ";
	for (size_t i = 0; i + 3 <= padded.size(); i++) {
		addHashed(charVec, padded.substr(i, 3), 0xC3A5u, 0xB7E1u);
	}
	auto words = splitWords(lowered);
	for (const auto &w : words) addHashed(wordVec, w, 0xA1B2u, 0xD4F5u);
	for (size_t i = 0; i + 1 < words.size(); i++) {
		addHashed(wordVec, words[i] + "_" + words[i + 1], 0xA1B2u, 0xD4F5u);
	}
	normalizeInPlace(charVec);
	normalizeInPlace(wordVec);

	std::vector<float> out;
	out.reserve((size_t)kEmbedDim);
	out.insert(out.end(), charVec.begin(), charVec.end());
	out.insert(out.end(), wordVec.begin(), wordVec.end());
	return out;
}

std::vector<float> TextEncoder::encode(const std::string &text) const {
	auto y = proj_.forward(hashFeatures(text));
	for (auto &v : y) v = std::max(0.0f, v);
	return y;
}

HeadAttention::HeadAttention()
	: wq_(kHeadDim, kHeadDim, 0xA7701u),
	  wk_(kHeadDim, kHeadDim, 0xA7702u),
	  wv_(kHeadDim, kHeadDim, 0xA7703u),
	  wo_(kEmbedDim, kEmbedDim, 0xA7704u),
	  ln_(kEmbedDim) {}

std::vector<float> HeadAttention::forward(const std::vector<float> &x) const {
	if ((int)x.size() != kEmbedDim) throw std::invalid_argument("attention input size mismatch");
	std::vector<std::vector<float>> q((size_t)kHeads), k((size_t)kHeads), v((size_t)kHeads);
	for (int h = 0; h < kHeads; h++) {
		std::vector<float> slice(x.begin() + h * kHeadDim, x.begin() + (h + 1) * kHeadDim);
		q[(size_t)h] = wq_.forward(slice);
		k[(size_t)h] = wk_.forward(slice);
		v[(size_t)h] = wv_.forward(slice);
	}
	std::vector<float> merged((size_t)kEmbedDim, 0.0f);
	for (int t = 0; t < kHeads; t++) {
		std::vector<float> scores((size_t)kHeads, 0.0f);
		for (int s = 0; s < kHeads; s++) {
			double acc = 0.0;
			for (int i = 0; i < kHeadDim; i++) acc += q[(size_t)t][(size_t)i] * k[(size_t)s][(size_t)i];
			scores[(size_t)s] = (float)(acc / std::sqrt((double)kHeadDim));
		}
		auto probs = softmax(scores);
		for (int s = 0; s < kHeads; s++) {
			for (int i = 0; i < kHeadDim; i++) {
				merged[(size_t)(t * kHeadDim + i)] += probs[(size_t)s] * v[(size_t)s][(size_t)i];
			}
		}
	}
	auto out = wo_.forward(merged);
	for (size_t i = 0; i < out.size(); i++) out[i] += x[i];
	return ln_.forward(out);
}

ConversationGru::ConversationGru()
	: wz_(kStateDim + kEmbedDim, kStateDim, 0x6A0001u),
	  wr_(kStateDim + kEmbedDim, kStateDim, 0x6A0002u),
	  wh_(kStateDim + kEmbedDim, kStateDim, 0x6A0003u) {}

std::vector<float> ConversationGru::step(const std::vector<float> &x, const std::vector<float> &h) const {
	if ((int)h.size() != kStateDim) throw std::invalid_argument("hidden state size mismatch");
	std::vector<float> combined(h);
	combined.insert(combined.end(), x.begin(), x.end());
	auto z = wz_.forward(combined);
	auto r = wr_.forward(combined);
	for (auto &v : z) v = sigmoidFn(v);
	for (auto &v : r) v = sigmoidFn(v);

	std::vector<float> gated((size_t)kStateDim, 0.0f);
	for (size_t i = 0; i < gated.size(); i++) gated[i] = r[i] * h[i];
	gated.insert(gated.end(), x.begin(), x.end());
	auto cand = wh_.forward(gated);

	std::vector<float> next((size_t)kStateDim, 0.0f);
	for (size_t i = 0; i < next.size(); i++) {
		next[i] = (1.0f - z[i]) * h[i] + z[i] * std::tanh(cand[i]);
	}
	return next;
}

IntentClassifier::IntentClassifier(const TextEncoder &encoder)
	: l1_(kEmbedDim + kStateDim, 96, 0x1C0001u),
	  l2_(96, 48, 0x1C0002u),
	  l3_(48, kIntents, 0x1C0003u) {
	anchors_.assign((size_t)kIntents, std::vector<float>((size_t)kEmbedDim, 0.0f));
	for (int i = 0; i < kIntents; i++) {
		const auto &kws = intentKeywords(i);
		if (kws.empty()) continue;
		auto &anchor = anchors_[(size_t)i];
		for (const auto &kw : kws) {
			auto e = encoder.encode(kw);
			for (size_t d = 0; d < anchor.size(); d++) anchor[d] += e[d];
		}
		for (auto &v : anchor) v /= (float)kws.size();
		normalizeInPlace(anchor);
	}
}

std::vector<float> IntentClassifier::keywordOverlap(const std::string &text) {
	std::vector<float> scores((size_t)kIntents, 0.0f);
	const std::string lowered = toLowerAscii(text);
	double total = 0.0;
	if (!trimCopy(lowered).empty()) {
		for (int i = 0; i < kIntents; i++) {
			int hits = 0;
			for (const auto &kw : intentKeywords(i)) {
				if (lowered.find(kw) != std::string::npos) hits++;
			}
			scores[(size_t)i] = (float)hits;
			total += hits;
		}
	}
	if (total <= 0.0) {
		std::fill(scores.begin(), scores.end(), 0.0f);
		scores[(size_t)kIntents - 1] = 1.0f;
		return scores;
	}
	for (auto &v : scores) v = (float)(v / total);
	return scores;
}

std::vector<float> IntentClassifier::classify(const std::vector<float> &attended,
											  const std::vector<float> &state,
											  const std::vector<float> &encoded,
											  const std::string &rawText) const {
	std::vector<float> features(attended);
	features.insert(features.end(), state.begin(), state.end());
	auto h1 = l1_.forward(features);
	for (auto &v : h1) v = geluFn(v);
	auto h2 = l2_.forward(h1);
	for (auto &v : h2) v = geluFn(v);
	auto fcProbs = softmax(l3_.forward(h2));

	std::vector<float> sims((size_t)kIntents, 0.0f);
	for (int i = 0; i < kIntents; i++) sims[(size_t)i] = cosineSim(anchors_[(size_t)i], encoded) / 0.25f;
	auto anchorProbs = softmax(sims);

	auto kwProbs = keywordOverlap(rawText);

	std::vector<float> out((size_t)kIntents, 0.0f);
	double sum = 0.0;
	for (size_t i = 0; i < out.size(); i++) {
		out[i] = 0.35f * fcProbs[i] + 0.30f * anchorProbs[i] + 0.35f * kwProbs[i];
		sum += out[i];
	}
	if (sum > 0.0) {
		for (auto &v : out) v = (float)(v / sum);
	}
	return out;
}

EngagementScorer::EngagementScorer()
	: l1_(kScorerInput, 128, 0x5C0001u),
	  l2_(128, 64, 0x5C0002u),
	  l3_(64, 1, 0x5C0003u) {}

float EngagementScorer::score(const std::vector<float> &features) const {
	auto h1 = l1_.forward(features);
	for (auto &v : h1) v = std::max(0.0f, v);
	auto h2 = l2_.forward(h1);
	for (auto &v : h2) v = std::max(0.0f, v);
	return sigmoidFn(l3_.forward(h2)[0]);
}

} // namespace honeypot
