#pragma once

#include <regex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace honeypot {

using json = nlohmann::json;

struct Intelligence {
	std::vector<std::string> phoneNumbers;
	std::vector<std::string> bankAccounts;
	std::vector<std::string> upiIds;
	std::vector<std::string> phishingLinks;
	std::vector<std::string> emailAddresses;
	std::vector<std::string> ifscCodes;
	std::vector<std::string> caseIds;
	std::vector<std::string> policyNumbers;
	std::vector<std::string> orderNumbers;
	std::vector<std::string> suspiciousKeywords;

	// Appends values not already present. Returns true if anything was added.
	bool merge(const Intelligence &other);
	bool empty() const;
	json toJson() const;
};

// Pulls canonical identifiers out of a scammer message.
class EntityExtractor {
public:
	virtual ~EntityExtractor() = default;
	virtual Intelligence extract(const std::string &text) const = 0;
};

class RegexEntityExtractor : public EntityExtractor {
public:
	RegexEntityExtractor();
	Intelligence extract(const std::string &text) const override;

	static std::string canonicalPhone(const std::string &raw);

private:
	std::regex phone_;
	std::regex tollFree_;
	std::vector<std::regex> account_;
	std::regex upi_;
	std::regex email_;
	std::vector<std::regex> link_;
	std::regex ifsc_;
	std::vector<std::regex> caseId_;
	std::vector<std::regex> policy_;
	std::regex order_;
	std::vector<std::string> keywords_;
	std::vector<std::string> upiHandles_;
};

} // namespace honeypot
