#include <doctest/doctest.h>

#include <chrono>
#include <string>
#include <vector>

#include "engine.hpp"

using namespace honeypot;

static SessionState freshSession(const std::string &id) {
	SessionState s;
	s.sessionId = id;
	s.createdAtMs = 0;
	return s;
}

TEST_CASE("first turn authority and OTP pressure stays CONFUSED") {
	EngagementEngine engine;
	SessionState s = freshSession("scenario-rbi");
	auto r = engine.processTurn(s, "This is RBI. Your account will be blocked. Share OTP immediately.");
	CHECK(r.scoreDelta == doctest::Approx(103.0));
	CHECK(r.scamConfirmed);
	CHECK(r.stage == Stage::Confused);
	CHECK(r.responseId.rfind("s1-", 0) == 0);
	CHECK_FALSE(r.probe);
	CHECK_FALSE(r.reply.empty());
	CHECK(s.turnIndex == 1);
	CHECK(s.messagesExchanged == 2);
	CHECK(s.tacticsObserved.count("otp_request") == 1);
}

TEST_CASE("ten payment-app turns reach EXTRACTING and become ready to report") {
	EngagementEngine engine;
	EngineParams p = engine.params();
	SessionState s = freshSession("scenario-upi");
	const std::string msg = "Send it to my UPI helpdesk.refund@ybl or call 9876543210";
	float lastScore = 0.0f;
	int lastStage = 1;
	int confirmedAt = 0;
	int readyAt = 0;
	for (int turn = 1; turn <= 10; turn++) {
		auto r = engine.processTurn(s, msg);
		CHECK(r.riskScore >= lastScore);
		CHECK(stageNumber(r.stage) >= lastStage);
		lastScore = r.riskScore;
		lastStage = stageNumber(r.stage);
		if (r.scamConfirmed && !confirmedAt) confirmedAt = turn;
		if (r.readyToReport && !readyAt) readyAt = turn;
	}
	CHECK(confirmedAt >= 2);
	CHECK(confirmedAt <= 3);
	CHECK(s.stage == Stage::Extracting);
	CHECK(readyAt >= 8);
	CHECK(readyAt <= 10);
	CHECK(s.quality.turns >= p.minTurns);
	CHECK(s.quality.questionsAsked >= p.minQuestions);
	CHECK(s.quality.investigativeProbes >= p.minInvestigative);
	CHECK((int)s.quality.redFlags.size() >= p.minRedFlags);
	CHECK(s.quality.elicitationAttempts >= p.minElicitation);
	CHECK(engine.readyToReport(s));
	CHECK(s.intel.upiIds.size() == 1);
	CHECK(s.intel.phoneNumbers.size() == 1);
	CHECK(s.scamType == "upi_fraud");
}

TEST_CASE("an exhausted stage pool resets and still answers") {
	EngagementEngine engine;
	SessionState s = freshSession("scenario-exhausted");
	for (const auto *c : engine.catalog().stagePool(Stage::Confused)) s.usedResponseIds.insert(c->id);
	auto r = engine.processTurn(s, "ok");
	CHECK(r.poolReset);
	CHECK_FALSE(r.reply.empty());
	CHECK(r.responseId.rfind("s1-", 0) == 0);
	CHECK(s.usedResponseIds.size() == 1);
}

TEST_CASE("identical sessions evolve identically") {
	EngagementEngine a;
	EngagementEngine b;
	SessionState sa = freshSession("det");
	SessionState sb = freshSession("det");
	const std::vector<std::string> script = {
		"Hello sir", "I am calling from the cyber police", "Your parcel has drugs, customs seized it",
		"Pay the clearance fee of Rs 5000 now", "Share the OTP you received", "Why are you delaying? Send money",
	};
	for (const auto &m : script) {
		auto ra = a.processTurn(sa, m);
		auto rb = b.processTurn(sb, m);
		CHECK(ra.responseId == rb.responseId);
		CHECK(ra.riskScore == rb.riskScore);
		CHECK(ra.intents == rb.intents);
		CHECK(sa.hiddenState == sb.hiddenState);
	}
}

TEST_CASE("consecutive replies never share a tactic tag") {
	EngagementEngine engine;
	SessionState s = freshSession("tactics");
	std::string previous;
	const std::vector<std::string> script = {
		"Share the OTP now", "Tell me the OTP quickly", "What is the OTP?", "OTP fast or account blocked",
		"Give OTP", "I need the OTP", "OTP please", "Send OTP immediately",
	};
	for (const auto &m : script) {
		auto r = engine.processTurn(s, m);
		const auto *c = engine.catalog().find(r.responseId);
		std::string tactic = c ? c->tactic : "";
		if (!tactic.empty() && !previous.empty()) CHECK(tactic != previous);
		previous = tactic;
	}
}

TEST_CASE("empty input draws from the neutral pool without scoring") {
	EngagementEngine engine;
	SessionState s = freshSession("empty");
	auto r = engine.processTurn(s, "   ");
	CHECK(r.responseId.rfind("empty", 0) == 0);
	CHECK(r.riskScore == doctest::Approx(0.0));
	CHECK(s.turnIndex == 1);
}

TEST_CASE("a bad hidden state is repaired and a disabled ranker degrades to uniform") {
	EngagementEngine engine;
	SessionState s = freshSession("repair");
	s.hiddenState = {1.0f, 2.0f, 3.0f};
	auto r = engine.processTurn(s, "Your KYC is pending");
	CHECK_FALSE(r.reply.empty());
	CHECK((int)s.hiddenState.size() == kStateDim);
	CHECK_FALSE(r.degraded);

	REQUIRE(engine.applyParams(json{{"rankerEnabled", false}}));
	auto r2 = engine.processTurn(s, "Your KYC is pending");
	CHECK(r2.degraded);
	CHECK_FALSE(r2.reply.empty());
}

TEST_CASE("history replay scores earlier scammer messages without advancing turns") {
	EngagementEngine engine;
	SessionState s = freshSession("history");
	engine.replayHistory(s, {"This is SBI, your account will be blocked", "", "Call 9876543210"});
	CHECK(s.turnIndex == 0);
	CHECK(s.messagesExchanged == 2);
	CHECK(s.cumulativeRiskScore > 0.0f);
	CHECK(s.intel.phoneNumbers.size() == 1);
}

TEST_CASE("long messages are clipped, not rejected") {
	EngagementEngine engine;
	SessionState s = freshSession("long");
	auto r = engine.processTurn(s, std::string(20000, 'a'));
	CHECK_FALSE(r.reply.empty());
	CHECK_FALSE(r.degraded);
}

TEST_CASE("a maximum-length single token turn stays cheap") {
	EngagementEngine engine;
	SessionState s = freshSession("long-token");
	const std::string text = "http://" + std::string((size_t)engine.params().maxMessageChars - 7, 'a');
	auto start = std::chrono::steady_clock::now();
	auto r = engine.processTurn(s, text);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
	CHECK_FALSE(r.reply.empty());
	CHECK_FALSE(r.degraded);
	CHECK(r.scoreDelta > 0.0f);
	CHECK(ms < 2000);
}

TEST_CASE("raw high bytes never reach the session snapshot") {
	EngagementEngine engine;
	SessionState s = freshSession("bytes");
	engine.processTurn(s, "Verify at http://sbi-kyc.xyz/\xff\xfe now");
	engine.processTurn(s, std::string(engine.params().maxMessageChars - 1, 'x') + "\xc3\xa9");
	CHECK(s.intel.phishingLinks.size() >= 1);
	CHECK_NOTHROW(s.toJson().dump());
}
