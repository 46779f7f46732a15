#include <doctest/doctest.h>

#include "quality.hpp"

using namespace honeypot;

static SessionState sessionAt(int turn, Stage stage) {
	SessionState s;
	s.sessionId = "quality-session";
	s.turnIndex = turn;
	s.quality.turns = turn;
	s.stage = stage;
	return s;
}

TEST_CASE("no probe before the probe start turn") {
	QualityTracker qt;
	EngineParams p;
	auto plan = qt.planProbe(sessionAt(3, Stage::Suspicious), p);
	CHECK_FALSE(plan.active);
}

TEST_CASE("compound probe when several counters are short") {
	QualityTracker qt;
	EngineParams p;
	SessionState s = sessionAt(4, Stage::Suspicious);
	s.triggeredSignals = {"upi_specific"};
	auto plan = qt.planProbe(s, p);
	REQUIRE(plan.active);
	CHECK(plan.compound);
	REQUIRE(plan.parts.size() == 3);
	CHECK(plan.parts[0] == "red_flag:payment_request");
	CHECK(plan.parts[1] == "investigative");
	CHECK(plan.parts[2] == "elicitation");
	CHECK(plan.after.redFlags.count("payment_request") == 1);
	CHECK(plan.after.investigativeProbes == 1);
	CHECK(plan.after.elicitationAttempts == 1);
	// The session itself is untouched until the probe is chosen.
	CHECK(s.quality.redFlags.empty());
	CHECK(s.quality.investigativeProbes == 0);
}

TEST_CASE("elicitation waits for the VERIFYING stage") {
	QualityTracker qt;
	EngineParams p;
	auto plan = qt.planProbe(sessionAt(5, Stage::Confused), p);
	REQUIRE(plan.active);
	for (const auto &part : plan.parts) CHECK(part != "elicitation");
}

TEST_CASE("single probe follows red flag, elicitation, investigative priority") {
	QualityTracker qt;
	EngineParams p;
	SessionState s = sessionAt(6, Stage::Cooperative);
	s.quality.questionsAsked = 5;
	s.quality.investigativeProbes = 3;
	s.quality.elicitationAttempts = 4;
	s.quality.redFlags = {"urgency", "fees", "phishing", "impersonation", "courier"};
	auto plan = qt.planProbe(s, p);
	REQUIRE(plan.active);
	CHECK_FALSE(plan.compound);
	REQUIRE(plan.parts.size() == 1);
	CHECK(plan.parts[0] == "elicitation");
	CHECK(plan.text.find('?') != std::string::npos);
}

TEST_CASE("compound parts are joined with a connector and lower-cased") {
	QualityTracker qt;
	EngineParams p;
	auto plan = qt.planProbe(sessionAt(4, Stage::Verifying), p);
	REQUIRE(plan.parts.size() >= 2);
	bool joined = false;
	for (const char *c : {" Also, ", " And one more thing, ", " By the way, ", " While we are on this, ", " Oh and also, ", " Before I forget, "}) {
		auto pos = plan.text.find(c);
		if (pos == std::string::npos) continue;
		joined = true;
		char next = plan.text[pos + std::string(c).size()];
		CHECK_FALSE((next >= 'A' && next <= 'Z' && next != 'I'));
	}
	CHECK(joined);
}

TEST_CASE("intel filtering drops templates asking for what is already known") {
	Intelligence intel;
	intel.upiIds = {"someone@ybl"};
	std::vector<std::string> templates = {"What is your UPI ID?", "What is your employee ID?"};
	auto kept = QualityTracker::filterByIntel(templates, intel);
	REQUIRE(kept.size() == 1);
	CHECK(kept[0] == "What is your employee ID?");
	auto all = QualityTracker::filterByIntel({"What is your UPI ID?"}, intel);
	CHECK(all.size() == 1);
}

TEST_CASE("recordReply counts distinct questions and themed replies") {
	QualityTracker qt;
	QualityMetrics q;
	qt.recordReply(q, "Who is this?", ThemeClass::Confusion, false);
	qt.recordReply(q, "Who is this?", ThemeClass::Confusion, false);
	CHECK(q.questionsAsked == 1);
	qt.recordReply(q, "Which branch are you from?", ThemeClass::Probing, false);
	CHECK(q.investigativeProbes == 1);
	qt.recordReply(q, "Tell me the account again.", ThemeClass::Extraction, false);
	CHECK(q.elicitationAttempts == 1);
	qt.recordReply(q, "What is your ID?", ThemeClass::Probing, true);
	CHECK(q.investigativeProbes == 1);
	CHECK(q.questionsAsked == 3);
}

TEST_CASE("readiness needs confirmation, every counter and the minimum turns") {
	QualityTracker qt;
	EngineParams p;
	SessionState s = sessionAt(8, Stage::Extracting);
	s.createdAtMs = 0;
	s.quality.questionsAsked = 5;
	s.quality.investigativeProbes = 3;
	s.quality.elicitationAttempts = 5;
	s.quality.redFlags = {"a", "b", "c", "d", "e"};
	CHECK_FALSE(qt.readyToReport(s, p, 1000));
	s.scamConfirmed = true;
	CHECK(qt.readyToReport(s, p, 1000));
	CHECK(qt.missing(s.quality, p).empty());
	s.quality.elicitationAttempts = 4;
	CHECK_FALSE(qt.readyToReport(s, p, 1000));
	CHECK(qt.missing(s.quality, p)["elicitation"] == 1);
}

TEST_CASE("red flag keys map risk categories") {
	CHECK(QualityTracker::redFlagKey("account_suspension") == "suspension");
	CHECK(QualityTracker::redFlagKey("upi_specific") == "payment_request");
	CHECK(QualityTracker::redFlagKey("digital_arrest") == "legal_threat");
}
