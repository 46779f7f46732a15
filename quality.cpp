#include "quality.hpp"

#include <algorithm>
#include <cctype>
#include <map>

#include "util.hpp"

namespace honeypot {

static const std::vector<std::string> kInvestigative = {
	"Can you please tell me your company name and official registration number?",
	"What is your full name and employee ID? I need it for my records.",
	"Which department are you calling from? What is the department code?",
	"Can you give me a callback number and your direct extension?",
	"What is your official website address? I want to verify online.",
	"Can you share your office address and branch location?",
	"What is the case reference ID or complaint number for this matter?",
	"Can you tell me the IFSC code of your branch?",
	"What is the order number or policy number you are referring to?",
	"Who is your supervisor? Can you give me their contact details?",
	"What is the official toll-free number I can use to verify this call?",
	"Can you send me this information on your official letterhead by email?",
	"What is your badge number or official designation?",
	"Which branch manager can I speak to for confirmation?",
	"What is the registration number of your organization?",
	"Can you provide the official case file number?",
	"Can you tell me your employee ID and department name for my notes?",
	"What is the tracking ID or reference number for this request?",
	"Can you share your official email ID? I'll send a written request.",
	"What is the complaint reference number assigned to my case?",
	"What's your team's email address? I want to verify with your office.",
	"Which department are you from exactly? What is the full department name?",
	"Could you share your license ID or official government identification number?",
	"What is your direct supervisor's name and phone number?",
	"Can you confirm the name of your organisation and its headquarters location?",
	"What is the exact case number you mentioned? Please spell it out for me.",
	"Could you give me the reference ID for this complaint? I want to track it.",
	"What government ministry issued this notice? What is the notice number?",
	"What is the official helpline I can use to confirm your identity?",
	"What is your jurisdiction code or posting location?",
	"Could you spell out the policy number and the issuing authority for me?",
	"What is the transaction reference number you are currently investigating?",
};

static const std::vector<std::string> kElicitation = {
	"What account should I transfer to? Give me all the details slowly.",
	"Can you give me your UPI ID, phone number and the exact amount?",
	"Can you spell out the account number for me, and the IFSC code?",
	"What is the beneficiary name and bank branch?",
	"Can you tell me the exact UPI ID letter by letter? I'm writing it down.",
	"What is your direct contact number in case we get disconnected?",
	"What email should I send the documents to? And your phone number?",
	"I have my banking app open. What are the complete transfer details?",
	"What is the reference number, and where exactly do I send the payment?",
	"What phone number will the OTP come from? And your callback number?",
	"Can you share the IFSC code again? I didn't catch it properly.",
	"Can you give me the exact UPI ID once more so I can double-check it?",
	"What is the account holder's full name as registered with the bank?",
	"Can you tell me the complete bank details with account number and IFSC?",
	"Can you repeat the UPI address letter by letter? I need to enter it carefully.",
	"What is the exact amount I need to send? Please confirm the figure.",
	"Which case ID or reference number should I quote for this payment?",
	"What is the policy number associated with this claim?",
	"Can you tell me the order ID or transaction reference again for my records?",
	"What is your registered mobile number on this account?",
};

static const std::map<std::string, std::vector<std::string>> &redFlagTemplates() {
	static const std::map<std::string, std::vector<std::string>> table = {
		{"urgency", {
			"I notice you're creating urgency, which makes me a bit uncomfortable.",
			"This urgency feels concerning to me. Let me take my time.",
			"Why is there such a rush? Legitimate matters don't require such pressure.",
			"The time pressure is making me anxious. Can we slow down?",
		}},
		{"otp_request", {
			"I notice you're asking for OTP which is usually confidential. My bank says never share it.",
			"OTP requests concern me. Banks always say not to share these codes.",
			"Why would I need to share my OTP? That seems unusual.",
			"My son told me OTPs should never be shared with anyone.",
		}},
		{"payment_request", {
			"This payment request seems unusual. Why do I need to pay first?",
			"Processing fees before receiving anything doesn't sound right to me.",
			"Why should I transfer money for this? Real organizations don't ask like this.",
			"Payment demands make me suspicious. Let me verify first.",
		}},
		{"authority_impersonation", {
			"You're claiming to be from a government agency, but how can I verify?",
			"This sounds official, but I've heard scammers impersonate authorities.",
			"I want to verify your identity with the actual department first.",
			"Let me call the official number to confirm you work there.",
		}},
		{"suspension", {
			"Account blocking threats seem excessive. Is this really necessary?",
			"This suspension warning feels like pressure tactics to me.",
			"My bank has never threatened me like this before.",
			"Let me visit the branch to verify this account issue.",
		}},
		{"legal_threat", {
			"Legal threats over the phone concern me. Can you send an official notice?",
			"Arrest threats seem extreme. My lawyer would advise differently.",
			"I've never heard of digital arrest. This sounds concerning.",
			"Real legal matters come through proper mail, not phone calls.",
		}},
		{"suspicious_url", {
			"This link doesn't look like an official website to me.",
			"I'm hesitant to click unknown links. Can you provide official documentation?",
			"The domain looks suspicious. Real organizations use proper websites.",
			"My son warned me about clicking links from unknown callers.",
		}},
		{"emotional_pressure", {
			"I feel like you're trying to scare me. Please explain calmly.",
			"This emotional pressure is making me uncomfortable.",
			"Let me take a moment to calm down before proceeding.",
			"Why are you making this sound so frightening?",
		}},
		{"courier", {
			"I haven't ordered anything that would require customs clearance.",
			"Parcel with drugs sounds like a scam I've heard about.",
			"Why would illegal items be addressed to me? This seems wrong.",
			"Let me check with the actual courier company first.",
		}},
		{"tech_support", {
			"Unsolicited tech support calls are often scams. How do I verify you?",
			"Microsoft doesn't usually call people directly about viruses.",
			"Remote access requests make me very nervous.",
			"My grandson said never to let strangers access my computer.",
		}},
		{"job_fraud", {
			"Work from home with high pay sounds too good to be true.",
			"Training fees for jobs don't seem right. Real companies pay you.",
			"This job offer sounds suspicious. Can you send an official letter?",
			"Telegram jobs often turn out to be scams, I've heard.",
		}},
		{"investment", {
			"Guaranteed returns sound unrealistic. Every investment has risk.",
			"Double money schemes remind me of fraud warnings I've seen.",
			"My financial advisor says such returns are impossible legally.",
			"This sounds like the schemes that people get cheated by.",
		}},
		{"identity_theft", {
			"Why do you need my Aadhaar number? It's very personal.",
			"Document requests over phone make me uncomfortable.",
			"I've been warned about sharing ID proofs with strangers.",
			"Let me verify with the department before sharing any documents.",
		}},
		{"phishing", {
			"This link doesn't look genuine to me. Why isn't it an official domain?",
			"I'm worried about entering my details on an unknown website.",
			"That URL looks suspicious. Real banks don't send such links.",
			"My son told me never to click links from unknown callers.",
		}},
		{"fees", {
			"Why would I need to pay a fee to receive something I'm owed?",
			"Processing charges before a refund are a classic fraud tactic.",
			"Real government bodies do not collect money over phone calls.",
			"This demand for advance payment is making me very suspicious.",
		}},
		{"impersonation", {
			"You sound very official but I cannot verify you are who you claim.",
			"Real officers send written notices first before calling.",
			"I have heard of many people being cheated by fake officials.",
			"Let me call the official number of your department to confirm.",
		}},
	};
	return table;
}

// Keys tried in this order once every triggered category is acknowledged.
static const std::vector<std::string> kRedFlagRotation = {
	"urgency", "fees", "impersonation", "phishing", "emotional_pressure", "payment_request",
	"authority_impersonation", "suspension", "otp_request", "suspicious_url", "legal_threat",
	"identity_theft", "courier", "tech_support", "job_fraud", "investment",
};

static const std::vector<std::string> kConnectors = {
	" Also, ", " And one more thing, ", " By the way, ", " While we are on this, ", " Oh and also, ", " Before I forget, ",
};

static const std::map<std::string, std::vector<std::string>> kIntelKeywords = {
	{"phoneNumbers", {"phone number", "phone", "contact number", "mobile number", "callback number", "direct number", "registered mobile"}},
	{"upiIds", {"upi id", "upi", "upi address"}},
	{"bankAccounts", {"account number", "ifsc", "bank account", "bank details", "beneficiary", "bank branch"}},
	{"emailAddresses", {"email"}},
};

std::string QualityTracker::redFlagKey(const std::string &category) {
	static const std::map<std::string, std::string> mapping = {
		{"urgency", "urgency"},
		{"authority_impersonation", "authority_impersonation"},
		{"otp_request", "otp_request"},
		{"payment_request", "payment_request"},
		{"account_suspension", "suspension"},
		{"legal_threat", "legal_threat"},
		{"suspicious_url", "suspicious_url"},
		{"courier", "courier"},
		{"job_loan_lure", "job_fraud"},
		{"digital_arrest", "legal_threat"},
		{"identity_document", "identity_theft"},
		{"bank_details", "payment_request"},
		{"upi_specific", "payment_request"},
		{"prize_lure", "payment_request"},
		{"investment", "investment"},
		{"tech_support", "tech_support"},
		{"emotional_pressure", "emotional_pressure"},
		{"behavioral_escalation", "urgency"},
	};
	auto it = mapping.find(category);
	return it == mapping.end() ? std::string("urgency") : it->second;
}

std::vector<std::string> QualityTracker::filterByIntel(const std::vector<std::string> &templates, const Intelligence &intel) {
	std::vector<std::string> exclude;
	auto addKeys = [&](const char *kind, bool have) {
		if (!have) return;
		const auto &kws = kIntelKeywords.at(kind);
		exclude.insert(exclude.end(), kws.begin(), kws.end());
	};
	addKeys("phoneNumbers", !intel.phoneNumbers.empty());
	addKeys("upiIds", !intel.upiIds.empty());
	addKeys("bankAccounts", !intel.bankAccounts.empty());
	addKeys("emailAddresses", !intel.emailAddresses.empty());
	if (exclude.empty()) return templates;

	std::vector<std::string> out;
	for (const auto &t : templates) {
		if (!containsAny(toLowerAscii(t), exclude)) out.push_back(t);
	}
	return out.empty() ? templates : out;
}

int QualityTracker::shortCounters(const QualityMetrics &q, const EngineParams &params) const {
	int n = 0;
	if (q.questionsAsked < params.minQuestions) n++;
	if (q.investigativeProbes < params.minInvestigative) n++;
	if ((int)q.redFlags.size() < params.minRedFlags) n++;
	if (q.elicitationAttempts < params.minElicitation) n++;
	return n;
}

bool QualityTracker::thresholdsMet(const QualityMetrics &q, const EngineParams &params) const {
	return q.turns >= params.minTurns && shortCounters(q, params) == 0;
}

json QualityTracker::missing(const QualityMetrics &q, const EngineParams &params) const {
	json j = json::object();
	if (q.turns < params.minTurns) j["turns"] = params.minTurns - q.turns;
	if (q.questionsAsked < params.minQuestions) j["questions"] = params.minQuestions - q.questionsAsked;
	if (q.investigativeProbes < params.minInvestigative) j["investigative"] = params.minInvestigative - q.investigativeProbes;
	if ((int)q.redFlags.size() < params.minRedFlags) j["redFlags"] = params.minRedFlags - (int)q.redFlags.size();
	if (q.elicitationAttempts < params.minElicitation) j["elicitation"] = params.minElicitation - q.elicitationAttempts;
	return j;
}

// Next template of a family in round-robin order, skipping templates that ask
// for intelligence the session already holds.
static std::string nextTemplate(const std::vector<std::string> &family, size_t &cursor, const Intelligence &intel) {
	const auto allowed = QualityTracker::filterByIntel(family, intel);
	for (size_t step = 0; step < family.size(); step++) {
		const std::string &candidate = family[cursor % family.size()];
		cursor++;
		if (std::find(allowed.begin(), allowed.end(), candidate) != allowed.end()) return candidate;
	}
	return family[cursor++ % family.size()];
}

static std::string nextRedFlag(const SessionState &state, QualityMetrics &q, std::string &key) {
	key.clear();
	for (const auto &category : state.triggeredSignals) {
		std::string k = QualityTracker::redFlagKey(category);
		if (!q.redFlags.count(k)) {
			key = k;
			break;
		}
	}
	if (key.empty()) {
		for (size_t step = 0; step < kRedFlagRotation.size(); step++) {
			const std::string &k = kRedFlagRotation[q.redFlagCursor % kRedFlagRotation.size()];
			q.redFlagCursor++;
			if (!q.redFlags.count(k)) {
				key = k;
				break;
			}
		}
	}
	if (key.empty()) return "";
	const auto &templates = redFlagTemplates().at(key);
	size_t &variant = q.redFlagVariant[key];
	std::string text = templates[variant % templates.size()];
	variant++;
	q.redFlags.insert(key);
	return text;
}

static std::string lowerFirst(std::string s) {
	if (!s.empty()) s[0] = (char)std::tolower((unsigned char)s[0]);
	return s;
}

ProbePlan QualityTracker::planProbe(const SessionState &state, const EngineParams &params) const {
	ProbePlan plan;
	if (state.turnIndex < params.probeStartTurn) return plan;
	const int shortCount = shortCounters(state.quality, params);
	if (shortCount == 0) return plan;

	QualityMetrics q = state.quality;
	if (!q.cursorsSeeded) {
		uint32_t h = hashStrSimple(state.sessionId);
		q.investigativeCursor = h % kInvestigative.size();
		q.elicitationCursor = (h >> 8) % kElicitation.size();
		q.connectorCursor = (h >> 16) % kConnectors.size();
		q.cursorsSeeded = true;
	}

	const bool redShort = (int)q.redFlags.size() < params.minRedFlags;
	const bool invShort = q.investigativeProbes < params.minInvestigative;
	const bool questionShort = q.questionsAsked < params.minQuestions;
	const bool elicitShort = q.elicitationAttempts < params.minElicitation;
	const bool elicitAllowed = stageNumber(state.stage) >= stageNumber(Stage::Verifying);

	std::vector<std::string> texts;
	auto addInvestigative = [&]() {
		texts.push_back(nextTemplate(kInvestigative, q.investigativeCursor, state.intel));
		plan.parts.push_back("investigative");
		q.investigativeProbes++;
	};
	auto addElicitation = [&]() {
		texts.push_back(nextTemplate(kElicitation, q.elicitationCursor, state.intel));
		plan.parts.push_back("elicitation");
		q.elicitationAttempts++;
	};
	auto addRedFlag = [&]() {
		std::string key;
		std::string text = nextRedFlag(state, q, key);
		if (text.empty()) return;
		texts.push_back(text);
		plan.parts.push_back("red_flag:" + key);
	};

	plan.compound = shortCount >= 2;
	if (plan.compound) {
		if (redShort) addRedFlag();
		if (invShort || questionShort) addInvestigative();
		if (elicitShort && elicitAllowed) addElicitation();
	} else if (redShort) {
		addRedFlag();
	} else if (elicitShort && elicitAllowed) {
		addElicitation();
	} else {
		addInvestigative();
	}
	if (texts.empty()) addInvestigative();

	std::string text = texts[0];
	for (size_t i = 1; i < texts.size(); i++) {
		text += kConnectors[q.connectorCursor % kConnectors.size()] + lowerFirst(texts[i]);
		q.connectorCursor++;
	}

	plan.active = true;
	plan.text = text;
	plan.after = q;
	return plan;
}

void QualityTracker::recordReply(QualityMetrics &q, const std::string &reply, ThemeClass themeClass, bool probe) const {
	if (reply.find('?') != std::string::npos) {
		uint32_t h = fnv1a(reply);
		if (q.askedQuestionHashes.insert(h).second) q.questionsAsked++;
	}
	if (probe) return;
	if (themeClass == ThemeClass::Probing) q.investigativeProbes++;
	else if (themeClass == ThemeClass::Extraction) q.elicitationAttempts++;
}

bool QualityTracker::readyToReport(const SessionState &state, const EngineParams &params, int64_t nowMs) const {
	if (!state.scamConfirmed) return false;
	if (!thresholdsMet(state.quality, params)) return false;
	if (state.turnIndex < params.reportMinTurns) return false;
	int64_t elapsedSec = (nowMs - state.createdAtMs) / 1000;
	return elapsedSec >= params.reportMinDurationSec;
}

CandidateResponse QualityTracker::toCandidate(const ProbePlan &plan, int turnIndex) {
	CandidateResponse c;
	c.id = "probe-" + std::to_string(turnIndex);
	c.text = plan.text;
	c.theme = "probe";
	c.themeClass = ThemeClass::Probing;
	c.probe = true;
	return c;
}

} // namespace honeypot
