#include <doctest/doctest.h>

#include "stage.hpp"

using namespace honeypot;

TEST_CASE("stage advance needs both the score and the turn gate") {
	StageController sc;
	EngineParams p;
	SessionState s;
	s.cumulativeRiskScore = 103.0f;
	s.turnIndex = 1;
	CHECK(sc.evaluate(s, p) == Stage::Confused);
	s.turnIndex = 2;
	CHECK(sc.evaluate(s, p) == Stage::Verifying);
	s.cumulativeRiskScore = 10.0f;
	CHECK(sc.evaluate(s, p) == Stage::Confused);
}

TEST_CASE("at most one step per evaluation") {
	StageController sc;
	EngineParams p;
	SessionState s;
	s.cumulativeRiskScore = 500.0f;
	s.turnIndex = 20;
	for (int expected = 2; expected <= 5; expected++) {
		Stage next = sc.evaluate(s, p);
		CHECK(stageNumber(next) == expected);
		sc.applyStage(s, next);
	}
	CHECK(sc.evaluate(s, p) == Stage::Extracting);
}

TEST_CASE("stage never regresses") {
	StageController sc;
	SessionState s;
	s.stage = Stage::Cooperative;
	CHECK_FALSE(sc.applyStage(s, Stage::Verifying));
	CHECK(s.stage == Stage::Cooperative);
}

TEST_CASE("tactic pool joins from the configured turn") {
	StageController sc;
	EngineParams p;
	TextEncoder enc;
	ResponseCatalog catalog(enc);
	SessionState s;
	s.turnIndex = 1;
	auto early = sc.assemblePool(s, catalog, "otp_request", p);
	for (const auto *c : early.candidates) CHECK(c->tactic.empty());
	s.turnIndex = 2;
	auto later = sc.assemblePool(s, catalog, "otp_request", p);
	CHECK(later.candidates.size() == catalog.stagePool(Stage::Confused).size() + catalog.tacticPool("otp_request").size());
}

TEST_CASE("an exhausted pool resets only its own ids") {
	StageController sc;
	EngineParams p;
	TextEncoder enc;
	ResponseCatalog catalog(enc);
	SessionState s;
	for (const auto *c : catalog.stagePool(Stage::Confused)) s.usedResponseIds.insert(c->id);
	s.usedResponseIds.insert("s5-01");
	auto build = sc.assemblePool(s, catalog, "", p);
	CHECK(build.reset);
	CHECK(build.resetCount == catalog.stagePool(Stage::Confused).size());
	CHECK(build.candidates.size() == catalog.stagePool(Stage::Confused).size());
	CHECK(s.usedResponseIds.count("s5-01") == 1);
	CHECK(s.usedResponseIds.size() == 1);
}

TEST_CASE("used ids are filtered without a reset") {
	StageController sc;
	EngineParams p;
	TextEncoder enc;
	ResponseCatalog catalog(enc);
	SessionState s;
	auto pool = catalog.stagePool(Stage::Confused);
	sc.recordSelection(s, *pool[0]);
	auto build = sc.assemblePool(s, catalog, "", p);
	CHECK_FALSE(build.reset);
	CHECK(build.candidates.size() == pool.size() - 1);
	for (const auto *c : build.candidates) CHECK(c->id != pool[0]->id);
}

TEST_CASE("tactic streak demotes after the repeat limit") {
	StageController sc;
	EngineParams p;
	TextEncoder enc;
	ResponseCatalog catalog(enc);
	SessionState s;
	CHECK(sc.demotedTactic(s, p).empty());
	sc.recordSelection(s, *catalog.tacticPool("threat")[0]);
	CHECK(s.tacticStreak == 1);
	CHECK(sc.demotedTactic(s, p) == "threat");
	sc.recordSelection(s, *catalog.stagePool(Stage::Confused)[0]);
	CHECK(s.tacticStreak == 0);
	CHECK(sc.demotedTactic(s, p).empty());
	CHECK(s.lastTheme == "confusion");
}
