#include <doctest/doctest.h>

#include <cmath>
#include <numeric>

#include "neural.hpp"

using namespace honeypot;

static float sum(const std::vector<float> &v) {
	return std::accumulate(v.begin(), v.end(), 0.0f);
}

TEST_CASE("encoder output is deterministic across instances") {
	TextEncoder a;
	TextEncoder b;
	auto x = a.encode("Your KYC is pending, share the OTP");
	auto y = b.encode("Your KYC is pending, share the OTP");
	REQUIRE((int)x.size() == kEmbedDim);
	CHECK(x == y);
	for (float v : x) CHECK(v >= 0.0f);
	CHECK(a.encode("completely different text") != x);
}

TEST_CASE("hash features are two normalised halves") {
	TextEncoder enc;
	auto h = enc.hashFeatures("send the money now");
	REQUIRE(h.size() == 128);
	std::vector<float> first(h.begin(), h.begin() + 64);
	std::vector<float> second(h.begin() + 64, h.end());
	CHECK(l2norm(first) == doctest::Approx(1.0).epsilon(1e-4));
	CHECK(l2norm(second) == doctest::Approx(1.0).epsilon(1e-4));
}

TEST_CASE("attention and GRU keep their widths") {
	TextEncoder enc;
	HeadAttention attn;
	ConversationGru gru;
	auto x = attn.forward(enc.encode("police case registered"));
	CHECK((int)x.size() == kEmbedDim);
	CHECK(allFinite(x));
	std::vector<float> h((size_t)kStateDim, 0.0f);
	auto h1 = gru.step(x, h);
	CHECK((int)h1.size() == kStateDim);
	CHECK(gru.step(x, h) == h1);
	for (float v : h1) CHECK(std::abs(v) <= 1.0f);
	CHECK_THROWS(gru.step(x, std::vector<float>(3, 0.0f)));
	CHECK_THROWS(attn.forward(std::vector<float>(10, 0.0f)));
}

TEST_CASE("intent distribution sums to one") {
	TextEncoder enc;
	IntentClassifier cls(enc);
	HeadAttention attn;
	auto e = enc.encode("Share the OTP immediately");
	auto x = attn.forward(e);
	std::vector<float> h((size_t)kStateDim, 0.0f);
	auto probs = cls.classify(x, h, e, "Share the OTP immediately");
	REQUIRE((int)probs.size() == kIntents);
	CHECK(sum(probs) == doctest::Approx(1.0).epsilon(1e-4));
	for (float p : probs) CHECK(p >= 0.0f);
}

TEST_CASE("keyword overlap falls back to neutral") {
	auto none = IntentClassifier::keywordOverlap("the weather is nice");
	CHECK(none[(size_t)kIntents - 1] == doctest::Approx(1.0));
	auto otp = IntentClassifier::keywordOverlap("tell me the otp");
	CHECK(otp[2] > 0.0f);
	CHECK(sum(otp) == doctest::Approx(1.0).epsilon(1e-4));
}

TEST_CASE("numeric helpers") {
	CHECK(sigmoidFn(0.0f) == doctest::Approx(0.5));
	CHECK(sigmoidFn(1000.0f) < 1.0f);
	auto s = softmax({1.0f, 2.0f, 3.0f});
	CHECK(sum(s) == doctest::Approx(1.0));
	CHECK(s[2] > s[1]);
	CHECK(cosineSim({1.0f, 0.0f}, {1.0f, 0.0f}) == doctest::Approx(1.0));
	CHECK(cosineSim({1.0f, 0.0f}, {0.0f, 1.0f}) == doctest::Approx(0.0));
	CHECK_THROWS(Linear(3, 2, 1u).forward({1.0f}));
}

TEST_CASE("scorer output stays in (0,1)") {
	EngagementScorer scorer;
	std::vector<float> f((size_t)kScorerInput, 0.1f);
	float s = scorer.score(f);
	CHECK(s > 0.0f);
	CHECK(s < 1.0f);
	CHECK(kScorerInput == 345);
}
