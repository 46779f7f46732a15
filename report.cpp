#include "report.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <vector>

#include <curl/curl.h>

#include "risk.hpp"

namespace honeypot {

static std::string titleCase(const std::string &s) {
	std::string out;
	bool upper = true;
	for (char c : s) {
		if (c == '_' || c == ' ') {
			out.push_back(' ');
			upper = true;
			continue;
		}
		out.push_back(upper ? (char)std::toupper((unsigned char)c) : c);
		upper = false;
	}
	return out;
}

template <typename Container>
static std::string joinSorted(const Container &items) {
	std::vector<std::string> v(items.begin(), items.end());
	std::sort(v.begin(), v.end());
	std::string out;
	for (size_t i = 0; i < v.size(); i++) {
		if (i) out += ", ";
		out += v[i];
	}
	return out;
}

std::string buildAgentNotes(const SessionState &state, int64_t nowMs) {
	std::ostringstream ss;
	ss << "Classification: " << titleCase(state.scamType);
	ss << " | Detected signals: " << (state.triggeredSignals.empty() ? "none" : joinSorted(state.triggeredSignals));
	ss << " | Messages exchanged: " << state.messagesExchanged;
	ss << " | Engagement duration: " << std::max<int64_t>(0, (nowMs - state.createdAtMs) / 1000) << "s";

	const Intelligence &in = state.intel;
	std::vector<std::pair<size_t, const char *>> counts = {
		{in.phoneNumbers.size(), "phoneNumbers"},
		{in.upiIds.size(), "upiIds"},
		{in.bankAccounts.size(), "bankAccounts"},
		{in.phishingLinks.size(), "URLs"},
		{in.emailAddresses.size(), "Emails"},
		{in.ifscCodes.size(), "ifscCodes"},
		{in.caseIds.size(), "caseIds"},
		{in.policyNumbers.size(), "policyNumbers"},
		{in.orderNumbers.size(), "orderNumbers"},
	};
	std::string intel;
	for (const auto &c : counts) {
		if (c.first == 0) continue;
		if (!intel.empty()) intel += ", ";
		intel += std::to_string(c.first) + " " + c.second;
	}
	ss << " | Extracted intelligence: " << (intel.empty() ? "No concrete identifiers extracted" : intel);
	ss << " | Scammer tactics observed: " << (state.tacticsObserved.empty() ? "none" : joinSorted(state.tacticsObserved));
	ss << " | Agent engagement reached stage " << stageNumber(state.stage) << "/5";
	return ss.str();
}

json buildReportPayload(const SessionState &state, int64_t nowMs, float scamThreshold) {
	const Intelligence &in = state.intel;
	const int64_t durationSec = std::max<int64_t>(0, (nowMs - state.createdAtMs) / 1000);
	float confidence = RiskScorer::confidence(state.cumulativeRiskScore, scamThreshold) / 100.0f;
	return json{
		{"sessionId", state.sessionId},
		{"scamDetected", state.scamConfirmed},
		{"scamType", state.scamType},
		{"confidenceLevel", std::round(confidence * 100.0f) / 100.0f},
		{"totalMessagesExchanged", state.messagesExchanged},
		{"extractedIntelligence", {
			{"phoneNumbers", in.phoneNumbers},
			{"bankAccounts", in.bankAccounts},
			{"upiIds", in.upiIds},
			{"phishingLinks", in.phishingLinks},
			{"emailAddresses", in.emailAddresses},
			{"caseIds", in.caseIds},
			{"policyNumbers", in.policyNumbers},
			{"orderNumbers", in.orderNumbers},
			{"suspiciousKeywords", in.suspiciousKeywords},
		}},
		{"engagementMetrics", {
			{"totalMessagesExchanged", state.messagesExchanged},
			{"engagementDurationSeconds", durationSec},
		}},
		{"agentNotes", buildAgentNotes(state, nowMs)},
	};
}

// Keeps the first few KB of the response body for error logging.
static size_t curlWriteCb(char *ptr, size_t size, size_t nmemb, void *userdata) {
	auto *out = reinterpret_cast<std::string *>(userdata);
	size_t total = size * nmemb;
	if (out->size() < 4096) out->append(ptr, std::min(total, 4096 - out->size()));
	return total;
}

CurlReportSender::CurlReportSender() {
	curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlReportSender::~CurlReportSender() {
	curl_global_cleanup();
}

DeliveryResult CurlReportSender::post(const std::string &url, const std::string &body, int timeoutMs) {
	DeliveryResult res;
	CURL *curl = curl_easy_init();
	if (!curl) {
		res.error = "curl_easy_init failed";
		return res;
	}
	std::string sink;
	struct curl_slist *headers = nullptr;
	headers = curl_slist_append(headers, "Content-Type: application/json");
	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)timeoutMs);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_USERAGENT, "honeypot-report/1.0");
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCb);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
	CURLcode rc = curl_easy_perform(curl);
	if (rc != CURLE_OK) {
		res.error = curl_easy_strerror(rc);
	} else {
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &res.status);
		res.ok = res.status >= 200 && res.status < 300;
		if (!res.ok) res.error = "http status " + std::to_string(res.status) + (sink.empty() ? "" : ": " + sink.substr(0, 200));
	}
	curl_slist_free_all(headers);
	curl_easy_cleanup(curl);
	return res;
}

ReportDispatcher::ReportDispatcher(std::shared_ptr<ReportSender> sender, std::string url, int maxAttempts, int timeoutMs, int backoffMs)
	: sender_(std::move(sender)), url_(std::move(url)), maxAttempts_(std::max(1, maxAttempts)),
	  timeoutMs_(std::max(1, timeoutMs)), backoffMs_(std::max(0, backoffMs)) {}

ReportDispatcher::~ReportDispatcher() {
	stop();
}

void ReportDispatcher::start() {
	if (running_) return;
	running_ = true;
	worker_ = std::thread([this]() {
		while (true) {
			std::pair<std::string, json> job;
			{
				std::unique_lock<std::mutex> lock(mu_);
				cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
				if (queue_.empty()) return;
				job = std::move(queue_.front());
				queue_.pop_front();
			}
			try {
				deliver(job.first, job.second);
			} catch (const std::exception &e) {
				failed_++;
				std::cerr << "[Report] session " << job.first << " dropped: " << e.what() << std::endl;
			}
		}
	});
}

void ReportDispatcher::stop() {
	{
		std::lock_guard<std::mutex> lock(mu_);
		running_ = false;
	}
	cv_.notify_all();
	if (worker_.joinable()) worker_.join();
}

bool ReportDispatcher::enqueue(const std::string &sessionId, json payload) {
	if (url_.empty()) {
		std::cerr << "[Report] no callback url configured, report for " << sessionId << " dropped" << std::endl;
		return false;
	}
	{
		std::lock_guard<std::mutex> lock(mu_);
		queue_.emplace_back(sessionId, std::move(payload));
	}
	cv_.notify_one();
	return true;
}

DeliveryResult ReportDispatcher::deliver(const std::string &sessionId, const json &payload) {
	DeliveryResult last;
	if (url_.empty() || !sender_) {
		last.error = "report delivery not configured";
		return last;
	}
	const std::string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);
	int waitMs = backoffMs_;
	for (int attempt = 1; attempt <= maxAttempts_; attempt++) {
		last = sender_->post(url_, body, timeoutMs_);
		last.attempts = attempt;
		if (last.ok) {
			delivered_++;
			std::cerr << "[Report] session " << sessionId << " delivered (status " << last.status << ", attempt " << attempt << ")" << std::endl;
			return last;
		}
		std::cerr << "[Report] session " << sessionId << " attempt " << attempt << "/" << maxAttempts_ << " failed: " << last.error << std::endl;
		if (attempt < maxAttempts_ && waitMs > 0) {
			std::this_thread::sleep_for(std::chrono::milliseconds(waitMs));
			waitMs *= 2;
		}
	}
	failed_++;
	return last;
}

} // namespace honeypot
