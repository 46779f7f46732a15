#include "extractor.hpp"

#include <algorithm>
#include <cctype>

#include "util.hpp"

namespace honeypot {

static bool pushUnique(std::vector<std::string> &list, const std::string &raw) {
	if (raw.empty()) return false;
	const std::string value = sanitizeUtf8(raw);
	if (std::find(list.begin(), list.end(), value) != list.end()) return false;
	list.push_back(value);
	return true;
}

static bool mergeList(std::vector<std::string> &dst, const std::vector<std::string> &src) {
	bool added = false;
	for (const auto &v : src) added = pushUnique(dst, v) || added;
	return added;
}

bool Intelligence::merge(const Intelligence &other) {
	bool added = false;
	added = mergeList(phoneNumbers, other.phoneNumbers) || added;
	added = mergeList(bankAccounts, other.bankAccounts) || added;
	added = mergeList(upiIds, other.upiIds) || added;
	added = mergeList(phishingLinks, other.phishingLinks) || added;
	added = mergeList(emailAddresses, other.emailAddresses) || added;
	added = mergeList(ifscCodes, other.ifscCodes) || added;
	added = mergeList(caseIds, other.caseIds) || added;
	added = mergeList(policyNumbers, other.policyNumbers) || added;
	added = mergeList(orderNumbers, other.orderNumbers) || added;
	added = mergeList(suspiciousKeywords, other.suspiciousKeywords) || added;
	return added;
}

bool Intelligence::empty() const {
	return phoneNumbers.empty() && bankAccounts.empty() && upiIds.empty() && phishingLinks.empty() &&
		   emailAddresses.empty() && ifscCodes.empty() && caseIds.empty() && policyNumbers.empty() &&
		   orderNumbers.empty() && suspiciousKeywords.empty();
}

json Intelligence::toJson() const {
	return json{
		{"phoneNumbers", phoneNumbers},
		{"bankAccounts", bankAccounts},
		{"upiIds", upiIds},
		{"phishingLinks", phishingLinks},
		{"emailAddresses", emailAddresses},
		{"ifscCodes", ifscCodes},
		{"caseIds", caseIds},
		{"policyNumbers", policyNumbers},
		{"orderNumbers", orderNumbers},
		{"suspiciousKeywords", suspiciousKeywords},
	};
}

static std::string upperAscii(const std::string &s) {
	std::string out = s;
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return (char)std::toupper(c); });
	return out;
}

static std::string digitsOnly(const std::string &s) {
	std::string out;
	for (unsigned char c : s) {
		if (std::isdigit(c)) out.push_back((char)c);
	}
	return out;
}

static bool hasDigit(const std::string &s) {
	return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

static std::string stripLinkTail(std::string link) {
	while (!link.empty()) {
		char c = link.back();
		if (c == '/' || c == '.' || c == ',' || c == ')' || c == ';' || c == '!' || c == '?' || c == '\'' || c == '"') {
			link.pop_back();
		} else {
			break;
		}
	}
	return link;
}

RegexEntityExtractor::RegexEntityExtractor() {
	const auto flags = std::regex::ECMAScript | std::regex::icase;
	phone_ = std::regex(R"((^|[^\d+])((?:\+91|91|0)?[\s\-]?[6-9]\d{4}[\s\-]?\d{5})(?!\d))", flags);
	tollFree_ = std::regex(R"((^|[^\d])(18[06]0[\s\-]?\d{3}[\s\-]?\d{4,5})(?!\d))", flags);
	account_ = {
		std::regex(R"((?:account|a/c|acct|acc)\s*(?:no|number|num|#)?[\s:.#\-]*(\d[\d\s\-]{7,22}\d))", flags),
		std::regex(R"((?:transfer\s*to|deposit\s*to|send\s*to|credit\s*to|beneficiary|payee)\s*(?:account|a/c)?\s*(?:no|number)?[\s:.#\-]*(\d{9,18}))", flags),
	};
	upi_ = std::regex(R"(([a-z0-9][\w.\-]{1,63}@[a-z][a-z0-9]{1,30})\b(?![.\-][a-z0-9]))", flags);
	email_ = std::regex(R"([a-z0-9._%+\-]{1,64}@[a-z0-9\-]{1,63}(?:\.[a-z0-9\-]{1,63}){0,4}\.[a-z]{2,24})", flags);
	link_ = {
		std::regex(R"(https?://[^\s<>"{}|\\^`\[\]]+)", flags),
		std::regex(R"(\b(?:bit\.ly|tinyurl\.com|goo\.gl|rb\.gy|is\.gd|cutt\.ly|shorturl\.at|ow\.ly|tiny\.cc|rebrand\.ly)/[a-z0-9\-_]+)", flags),
		std::regex(R"(\b(?:wa\.me/[0-9]+|t\.me/[a-z0-9_]+))", flags),
		std::regex(R"(\b[a-z0-9\-]{4,63}\.(?:xyz|top|online|site|work|click|live|club|icu|buzz|loan|win)(?:/[^\s]*)?)", flags),
	};
	ifsc_ = std::regex(R"(\b[A-Z]{4}0[A-Z0-9]{6}\b)");
	caseId_ = {
		std::regex(R"(\b(?:case|complaint|ticket|fir|ref|reference)\b\s*(?:id|no|number|#)?\s*(?:is)?[\s:.#\-]*([A-Z0-9][A-Z0-9\-/]{2,20}))", flags),
		std::regex(R"(\b((?:FRD|CBI|FIR|NCB|ED|CYBER|ITR|DRI|REFUND)-[A-Z0-9\-]{3,25})\b)", flags),
	};
	policy_ = {
		std::regex(R"(\b(?:policy|insurance)\b\s*(?:no|number|id|#)?\s*(?:is)?[\s:.#\-]*([A-Z0-9][A-Z0-9\-]{3,20}))", flags),
		std::regex(R"(\b((?:POL|INS|POLICY)-?[A-Z0-9\-]{4,20})\b)", flags),
	};
	order_ = std::regex(R"(\b(?:order|txn|transaction|tracking|consignment)\b\s*(?:id|no|number|ref|#)?\s*(?:is)?[\s:.#\-]*([A-Z0-9][A-Z0-9\-]{3,20}))", flags);
	keywords_ = {
		"urgent", "immediately", "otp", "blocked", "suspended", "kyc", "verify", "arrest", "warrant",
		"digital arrest", "legal action", "penalty", "refund", "lottery", "prize", "cashback", "processing fee",
		"customs", "parcel", "anydesk", "teamviewer", "remote access", "guaranteed returns", "work from home",
		"aadhaar", "pan card", "account number", "upi pin", "cvv", "click here", "police", "cbi",
	};
	upiHandles_ = {
		"paytm", "ybl", "oksbi", "okaxis", "okicici", "okhdfcbank", "upi", "phonepe", "gpay", "ibl", "axl", "apl",
		"freecharge", "airtel", "jio", "kotak", "sbi", "hdfc", "icici", "pnb", "bob", "barodapay", "aubank",
		"fakebank", "fakeupi", "axisbank", "yesbank", "idfcbank", "indus", "federal", "rbl", "unionbank",
	};
}

std::string RegexEntityExtractor::canonicalPhone(const std::string &raw) {
	std::string d = digitsOnly(raw);
	if (d.size() == 12 && d.compare(0, 2, "91") == 0) d = d.substr(2);
	else if (d.size() == 11 && d[0] == '0') d = d.substr(1);
	if (d.size() == 10 && d[0] >= '6' && d[0] <= '9') return "+91" + d;
	return d;
}

Intelligence RegexEntityExtractor::extract(const std::string &raw) const {
	Intelligence out;
	const std::string text = sanitizeUtf8(raw);
	if (trimCopy(text).empty()) return out;
	const std::string lower = toLowerAscii(text);
	const std::string upper = upperAscii(text);

	for (auto it = std::sregex_iterator(text.begin(), text.end(), phone_); it != std::sregex_iterator(); ++it) {
		pushUnique(out.phoneNumbers, canonicalPhone((*it)[2].str()));
	}
	for (auto it = std::sregex_iterator(text.begin(), text.end(), tollFree_); it != std::sregex_iterator(); ++it) {
		pushUnique(out.phoneNumbers, digitsOnly((*it)[2].str()));
	}

	for (const auto &re : account_) {
		for (auto it = std::sregex_iterator(lower.begin(), lower.end(), re); it != std::sregex_iterator(); ++it) {
			std::string acct = digitsOnly((*it)[1].str());
			if (acct.size() < 9 || acct.size() > 18) continue;
			if (std::find(out.phoneNumbers.begin(), out.phoneNumbers.end(), canonicalPhone(acct)) != out.phoneNumbers.end()) continue;
			pushUnique(out.bankAccounts, acct);
		}
	}

	for (auto it = std::sregex_iterator(lower.begin(), lower.end(), upi_); it != std::sregex_iterator(); ++it) {
		std::string id = (*it)[1].str();
		auto at = id.find('@');
		std::string handle = id.substr(at + 1);
		bool known = std::find(upiHandles_.begin(), upiHandles_.end(), handle) != upiHandles_.end();
		size_t pos = (size_t)it->position(0);
		bool keyed = lower.rfind("upi", pos) != std::string::npos && pos - lower.rfind("upi", pos) < 24;
		if (known || keyed) pushUnique(out.upiIds, id);
	}

	for (auto it = std::sregex_iterator(lower.begin(), lower.end(), email_); it != std::sregex_iterator(); ++it) {
		std::string mail = (*it)[0].str();
		if (std::find(out.upiIds.begin(), out.upiIds.end(), mail) != out.upiIds.end()) continue;
		pushUnique(out.emailAddresses, mail);
	}

	for (const auto &re : link_) {
		for (auto it = std::sregex_iterator(lower.begin(), lower.end(), re); it != std::sregex_iterator(); ++it) {
			std::string link = stripLinkTail((*it)[0].str());
			bool covered = false;
			for (const auto &existing : out.phishingLinks) {
				if (existing.find(link) != std::string::npos) covered = true;
			}
			if (!covered) pushUnique(out.phishingLinks, link);
		}
	}

	for (auto it = std::sregex_iterator(upper.begin(), upper.end(), ifsc_); it != std::sregex_iterator(); ++it) {
		pushUnique(out.ifscCodes, (*it)[0].str());
	}

	for (const auto &re : caseId_) {
		for (auto it = std::sregex_iterator(upper.begin(), upper.end(), re); it != std::sregex_iterator(); ++it) {
			std::string id = (*it)[1].str();
			if (!hasDigit(id)) continue;
			pushUnique(out.caseIds, id);
		}
	}
	for (const auto &re : policy_) {
		for (auto it = std::sregex_iterator(upper.begin(), upper.end(), re); it != std::sregex_iterator(); ++it) {
			std::string id = (*it)[1].str();
			if (!hasDigit(id)) continue;
			pushUnique(out.policyNumbers, id);
		}
	}
	for (auto it = std::sregex_iterator(upper.begin(), upper.end(), order_); it != std::sregex_iterator(); ++it) {
		std::string id = (*it)[1].str();
		if (!hasDigit(id)) continue;
		pushUnique(out.orderNumbers, id);
	}

	for (const auto &kw : keywords_) {
		if (lower.find(kw) != std::string::npos) pushUnique(out.suspiciousKeywords, kw);
	}
	return out;
}

} // namespace honeypot
