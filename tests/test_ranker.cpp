#include <doctest/doctest.h>

#include <random>

#include "ranker.hpp"

using namespace honeypot;

static std::vector<float> zeros() {
	return std::vector<float>((size_t)kStateDim, 0.0f);
}

TEST_CASE("analysis is deterministic and rejects a bad hidden state") {
	ResponseRanker a;
	ResponseRanker b;
	auto x = a.analyze("Your parcel has drugs, customs will arrest you", zeros());
	auto y = b.analyze("Your parcel has drugs, customs will arrest you", zeros());
	CHECK(x.newState == y.newState);
	CHECK(x.intents == y.intents);
	CHECK(x.topIntent() == y.topIntent());
	CHECK_THROWS_AS(a.analyze("hi", std::vector<float>(5, 0.0f)), std::runtime_error);
}

TEST_CASE("ranking yields a probability distribution over the pool") {
	ResponseRanker ranker;
	ResponseCatalog catalog(ranker.encoder());
	auto pool = catalog.stagePool(Stage::Verifying);
	REQUIRE_FALSE(pool.empty());
	auto analysis = ranker.analyze("I am calling from your bank", zeros());
	RankContext ctx;
	ctx.stage = Stage::Verifying;
	auto ranked = ranker.rank(analysis, pool, ctx);
	REQUIRE(ranked.size() == pool.size());
	float total = 0.0f;
	for (size_t i = 0; i < ranked.size(); i++) {
		total += ranked[i].probability;
		if (i) CHECK(ranked[i - 1].rawScore >= ranked[i].rawScore);
	}
	CHECK(total == doctest::Approx(1.0).epsilon(1e-3));
}

TEST_CASE("a demoted tactic is left out while alternatives exist") {
	ResponseRanker ranker;
	ResponseCatalog catalog(ranker.encoder());
	auto pool = catalog.stagePool(Stage::Suspicious);
	auto otp = catalog.tacticPool("otp_request");
	REQUIRE_FALSE(otp.empty());
	pool.insert(pool.end(), otp.begin(), otp.end());
	auto analysis = ranker.analyze("Share the OTP now", zeros());
	RankContext ctx;
	ctx.stage = Stage::Suspicious;
	ctx.tactic = "otp_request";
	ctx.demotedTactic = "otp_request";
	auto ranked = ranker.rank(analysis, pool, ctx);
	for (const auto &r : ranked) {
		const auto *c = catalog.find(r.responseId);
		REQUIRE(c != nullptr);
		if (c->tactic == "otp_request") CHECK(r.probability == doctest::Approx(0.0));
	}
	// Demoted candidates sort below the best eligible one.
	CHECK(catalog.find(ranked.front().responseId)->tactic != "otp_request");

	auto onlyOtp = ResponseRanker::uniform(otp, "otp_request");
	for (const auto &r : onlyOtp) CHECK(r.probability > 0.0f);
}

TEST_CASE("a probe candidate wins outright") {
	ResponseRanker ranker;
	ResponseCatalog catalog(ranker.encoder());
	auto pool = catalog.stagePool(Stage::Cooperative);
	CandidateResponse probe;
	probe.id = "probe-5";
	probe.text = "What is your employee ID?";
	probe.probe = true;
	probe.themeClass = ThemeClass::Probing;
	probe.embedding = ranker.encoder().encode(probe.text);
	pool.push_back(&probe);
	auto ranked = ranker.rank(ranker.analyze("pay now", zeros()), pool, RankContext{});
	std::mt19937 rng(7);
	CHECK(ranked[ResponseRanker::sample(ranked, rng)].responseId == "probe-5");
}

TEST_CASE("sampling is reproducible under a fixed seed") {
	ResponseRanker ranker;
	ResponseCatalog catalog(ranker.encoder());
	auto pool = catalog.stagePool(Stage::Confused);
	auto ranked = ResponseRanker::uniform(pool, "");
	std::mt19937 a(42);
	std::mt19937 b(42);
	for (int i = 0; i < 20; i++) CHECK(ResponseRanker::sample(ranked, a) == ResponseRanker::sample(ranked, b));
	std::vector<RankedChoice> empty;
	CHECK_THROWS(ResponseRanker::sample(empty, a));
}

TEST_CASE("stage bonus favours the theme of the stage") {
	CHECK(ResponseRanker::stageBonus(Stage::Confused, ThemeClass::Confusion) > 0.0f);
	CHECK(ResponseRanker::stageBonus(Stage::Extracting, ThemeClass::Extraction) > 0.0f);
	CHECK(ResponseRanker::stageBonus(Stage::Confused, ThemeClass::Extraction) == doctest::Approx(0.0));
}
