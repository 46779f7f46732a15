#include <doctest/doctest.h>

#include <atomic>
#include <memory>
#include <stdexcept>

#include "report.hpp"

using namespace honeypot;

namespace {

class ScriptedSender : public ReportSender {
public:
	explicit ScriptedSender(int failures) : failures_(failures) {}
	DeliveryResult post(const std::string &, const std::string &body, int) override {
		calls++;
		lastBody = body;
		DeliveryResult r;
		if (calls <= failures_) {
			r.status = 503;
			r.error = "http status 503";
			return r;
		}
		r.ok = true;
		r.status = 200;
		return r;
	}
	std::atomic<int> calls{0};
	std::string lastBody;

private:
	int failures_{0};
};

class ThrowingSender : public ReportSender {
public:
	DeliveryResult post(const std::string &, const std::string &, int) override {
		calls++;
		throw std::runtime_error("transport exploded");
	}
	std::atomic<int> calls{0};
};

SessionState reportedSession() {
	SessionState s;
	s.sessionId = "report-1";
	s.createdAtMs = 1000;
	s.cumulativeRiskScore = 112.0f;
	s.scamConfirmed = true;
	s.scamType = "upi_fraud";
	s.stage = Stage::Extracting;
	s.messagesExchanged = 20;
	s.triggeredSignals = {"upi_specific", "payment_request"};
	s.tacticsObserved = {"payment_lure"};
	s.intel.upiIds = {"helpdesk.refund@ybl"};
	s.intel.phoneNumbers = {"+919876543210"};
	return s;
}

} // namespace

TEST_CASE("agent notes summarise the engagement") {
	SessionState s = reportedSession();
	auto notes = buildAgentNotes(s, 61000);
	CHECK(notes == "Classification: Upi Fraud | Detected signals: payment_request, upi_specific | Messages exchanged: 20"
				   " | Engagement duration: 60s | Extracted intelligence: 1 phoneNumbers, 1 upiIds"
				   " | Scammer tactics observed: payment_lure | Agent engagement reached stage 5/5");
	SessionState empty;
	empty.createdAtMs = 0;
	CHECK(buildAgentNotes(empty, 0).find("No concrete identifiers extracted") != std::string::npos);
}

TEST_CASE("final payload carries real metrics") {
	SessionState s = reportedSession();
	auto j = buildReportPayload(s, 61000, 40.0f);
	CHECK(j["sessionId"] == "report-1");
	CHECK(j["scamDetected"] == true);
	CHECK(j["totalMessagesExchanged"] == 20);
	CHECK(j["engagementMetrics"]["engagementDurationSeconds"] == 60);
	CHECK(j["extractedIntelligence"]["upiIds"][0] == "helpdesk.refund@ybl");
	CHECK(j["extractedIntelligence"].contains("suspiciousKeywords"));
	double confidence = j["confidenceLevel"].get<double>();
	CHECK(confidence > 0.7);
	CHECK(confidence <= 0.99);
}

TEST_CASE("delivery retries until the callback accepts") {
	auto sender = std::make_shared<ScriptedSender>(2);
	ReportDispatcher dispatcher(sender, "http://127.0.0.1:9/callback", 3, 1000, 0);
	auto result = dispatcher.deliver("report-1", json{{"sessionId", "report-1"}});
	CHECK(result.ok);
	CHECK(result.attempts == 3);
	CHECK(sender->calls.load() == 3);
	CHECK(dispatcher.delivered() == 1);
	CHECK(json::parse(sender->lastBody)["sessionId"] == "report-1");
}

TEST_CASE("delivery gives up after the configured attempts") {
	auto sender = std::make_shared<ScriptedSender>(10);
	ReportDispatcher dispatcher(sender, "http://127.0.0.1:9/callback", 2, 1000, 0);
	auto result = dispatcher.deliver("report-2", json::object());
	CHECK_FALSE(result.ok);
	CHECK(result.attempts == 2);
	CHECK(dispatcher.failed() == 1);
}

TEST_CASE("queued reports drain before the worker stops") {
	auto sender = std::make_shared<ScriptedSender>(0);
	ReportDispatcher dispatcher(sender, "http://127.0.0.1:9/callback", 1, 1000, 0);
	dispatcher.start();
	CHECK(dispatcher.enqueue("a", json::object()));
	CHECK(dispatcher.enqueue("b", json::object()));
	dispatcher.stop();
	CHECK(dispatcher.delivered() == 2);

	ReportDispatcher unconfigured(sender, "", 1, 1000, 0);
	CHECK_FALSE(unconfigured.enqueue("c", json::object()));
}

TEST_CASE("payloads with malformed UTF-8 are still delivered") {
	SessionState s = reportedSession();
	s.intel.phishingLinks = {"http://sbi-kyc.xyz/\xff\xfe"};
	auto payload = buildReportPayload(s, 61000, 40.0f);

	auto sender = std::make_shared<ScriptedSender>(0);
	ReportDispatcher dispatcher(sender, "http://127.0.0.1:9/callback", 1, 1000, 0);
	auto result = dispatcher.deliver("report-utf8", payload);
	CHECK(result.ok);
	json sent;
	REQUIRE_NOTHROW(sent = json::parse(sender->lastBody));
	CHECK(sent["extractedIntelligence"]["phishingLinks"][0].get<std::string>().rfind("http://sbi-kyc.xyz/", 0) == 0);

	dispatcher.start();
	CHECK(dispatcher.enqueue("report-utf8", payload));
	dispatcher.stop();
	CHECK(dispatcher.delivered() == 2);
}

TEST_CASE("a throwing sender does not take down the worker") {
	auto sender = std::make_shared<ThrowingSender>();
	ReportDispatcher dispatcher(sender, "http://127.0.0.1:9/callback", 1, 1000, 0);
	dispatcher.start();
	CHECK(dispatcher.enqueue("a", json::object()));
	CHECK(dispatcher.enqueue("b", json::object()));
	dispatcher.stop();
	CHECK(sender->calls.load() == 2);
	CHECK(dispatcher.failed() == 2);
	CHECK(dispatcher.delivered() == 0);
}
