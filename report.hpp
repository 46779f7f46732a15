#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

#include "session.hpp"

namespace honeypot {

using json = nlohmann::json;

std::string buildAgentNotes(const SessionState &state, int64_t nowMs);
json buildReportPayload(const SessionState &state, int64_t nowMs, float scamThreshold);

struct DeliveryResult {
	bool ok{false};
	long status{0};
	int attempts{0};
	std::string error;
};

class ReportSender {
public:
	virtual ~ReportSender() = default;
	// One POST of a JSON body. Implementations report transport failures
	// through the result rather than by throwing.
	virtual DeliveryResult post(const std::string &url, const std::string &body, int timeoutMs) = 0;
};

class CurlReportSender : public ReportSender {
public:
	CurlReportSender();
	~CurlReportSender() override;
	DeliveryResult post(const std::string &url, const std::string &body, int timeoutMs) override;
};

// Delivers final session reports on a background thread, retrying with a
// doubling back-off.
class ReportDispatcher {
public:
	ReportDispatcher(std::shared_ptr<ReportSender> sender, std::string url, int maxAttempts, int timeoutMs, int backoffMs = 500);
	~ReportDispatcher();

	void start();
	void stop();
	bool running() const { return running_; }

	// Queues a payload; false when no callback URL is configured.
	bool enqueue(const std::string &sessionId, json payload);

	// Synchronous delivery with retries.
	DeliveryResult deliver(const std::string &sessionId, const json &payload);

	int delivered() const { return delivered_; }
	int failed() const { return failed_; }

private:
	std::shared_ptr<ReportSender> sender_;
	std::string url_;
	int maxAttempts_{3};
	int timeoutMs_{10000};
	int backoffMs_{500};

	std::atomic<bool> running_{false};
	std::atomic<int> delivered_{0};
	std::atomic<int> failed_{0};
	std::mutex mu_;
	std::condition_variable cv_;
	std::deque<std::pair<std::string, json>> queue_;
	std::thread worker_;
};

} // namespace honeypot
