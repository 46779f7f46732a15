#include <doctest/doctest.h>

#include <algorithm>
#include <chrono>
#include <string>

#include "extractor.hpp"
#include "util.hpp"

using namespace honeypot;

static bool has(const std::vector<std::string> &v, const std::string &x) {
	return std::find(v.begin(), v.end(), x) != v.end();
}

TEST_CASE("phone numbers are canonicalised to +91 form") {
	RegexEntityExtractor ex;
	auto intel = ex.extract("Call 9876543210 or +91 98765 43210 or 09123456789 now");
	CHECK(has(intel.phoneNumbers, "+919876543210"));
	CHECK(has(intel.phoneNumbers, "+919123456789"));
	CHECK(intel.phoneNumbers.size() == 2);
	CHECK(RegexEntityExtractor::canonicalPhone("91-98765-43210") == "+919876543210");
}

TEST_CASE("UPI ids and e-mail addresses are kept apart") {
	RegexEntityExtractor ex;
	auto intel = ex.extract("Send it to my UPI helpdesk.refund@ybl and mail fraud.dept@example.com");
	CHECK(has(intel.upiIds, "helpdesk.refund@ybl"));
	CHECK(has(intel.emailAddresses, "fraud.dept@example.com"));
	CHECK_FALSE(has(intel.emailAddresses, "helpdesk.refund@ybl"));
	CHECK_FALSE(has(intel.upiIds, "fraud.dept@example.com"));
}

TEST_CASE("links are lower-cased and lose trailing punctuation") {
	RegexEntityExtractor ex;
	auto intel = ex.extract("Verify at HTTPS://Secure-KYC-Update.xyz/login/ immediately.");
	REQUIRE_FALSE(intel.phishingLinks.empty());
	CHECK(intel.phishingLinks[0] == "https://secure-kyc-update.xyz/login");
}

TEST_CASE("bank accounts and IFSC codes next to keywords") {
	RegexEntityExtractor ex;
	auto intel = ex.extract("Transfer to account number 123456789012, IFSC SBIN0001234.");
	CHECK(has(intel.bankAccounts, "123456789012"));
	CHECK(has(intel.ifscCodes, "SBIN0001234"));
}

TEST_CASE("merge deduplicates and reports additions") {
	RegexEntityExtractor ex;
	Intelligence total;
	CHECK(total.empty());
	CHECK(total.merge(ex.extract("call 9876543210")));
	CHECK_FALSE(total.merge(ex.extract("again 9876543210")));
	CHECK(total.phoneNumbers.size() == 1);
	CHECK(ex.extract("   ").empty());
}

TEST_CASE("extracted values are valid UTF-8") {
	RegexEntityExtractor ex;
	auto intel = ex.extract("Verify at http://sbi-kyc.xyz/\xff\xfe now");
	REQUIRE(intel.phishingLinks.size() == 1);
	CHECK(intel.phishingLinks[0] == "http://sbi-kyc.xyz/\xef\xbf\xbd\xef\xbf\xbd");
	CHECK_NOTHROW(intel.toJson().dump());

	CHECK(sanitizeUtf8("caf\xc3\xa9 \xe2\x82\xb9500") == "caf\xc3\xa9 \xe2\x82\xb9500");
	CHECK(sanitizeUtf8("a\xc3") == "a\xef\xbf\xbd");
	CHECK(sanitizeUtf8("\xed\xa0\x80") == "\xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd");
}

TEST_CASE("a single very long token is scanned quickly") {
	RegexEntityExtractor ex;
	const std::string text = "http://" + std::string(3993, 'a');
	auto start = std::chrono::steady_clock::now();
	auto intel = ex.extract(text);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
	CHECK(intel.phishingLinks.size() == 1);
	CHECK(ms < 1500);
}
