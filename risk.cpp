#include "risk.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

#include "util.hpp"

namespace honeypot {

namespace {

struct RuleDef {
	const char *pattern;
	int weight;
	const char *category;
};

struct LayerDef {
	const char *name;
	bool core;
	std::vector<RuleDef> rules;
};

// Rules with a null category inherit the layer name.
std::vector<LayerDef> layerTable() {
	return {
		{"urgency", true, {
			{R"(\b(urgent|urgently|immediate(?:ly)?|right\s*now|asap)\b)", 12, nullptr},
			{R"(\b(hurry|quickly|rush|rushing)\b)", 10, nullptr},
			{R"(\b(within\s*\d+\s*(?:hour|minute|min|day|hr)s?|today\s*only)\b)", 14, nullptr},
			{R"(\b(last\s*chance|final\s*(?:notice|warning|chance)|expir(?:e|ing|ed))\b)", 16, nullptr},
			{R"(\b(deadline|time\s*(?:running|left)|before\s*\d+)\b)", 12, nullptr},
			{R"(\b(act\s*now|don.t\s*wait|limited\s*time|time\s*sensitive)\b)", 14, nullptr},
			{R"(\b(?:only|just)\s*\d+\s*(?:hour|minute|min|slot|seat)s?\s*(?:left|remaining)\b)", 16, nullptr},
			{R"(\b(respond\s*(?:now|immediately|urgently)|clock\s*is\s*ticking)\b)", 12, nullptr},
		}},
		{"authority_impersonation", true, {
			{R"(\b(rbi|reserve\s*bank(?:\s*of\s*india)?)\b)", 18, nullptr},
			{R"(\b(income\s*tax|it\s*department)\b)", 16, nullptr},
			{R"(\b(police|cbi|enforcement\s*directorate)\b)", 18, nullptr},
			{R"(\b(trai|department\s*of\s*telecom(?:munications)?)\b)", 16, nullptr},
			{R"(\b(customs|ministry|government|govt)\b)", 14, nullptr},
			{R"(\b(officer|inspector|commissioner|superintendent)\b)", 12, nullptr},
			{R"(\b(uidai|npci|sebi|irdai?)\b)", 14, nullptr},
			{R"(\b(cyber\s*(?:cell|crime|police|branch))\b)", 16, nullptr},
			{R"(\b(narcotics?\s*(?:bureau|department|control)|ncb)\b)", 18, nullptr},
			{R"(\b(sbi|state\s*bank|hdfc|icici|axis\s*bank|kotak|pnb)\b)", 10, nullptr},
			{R"(\b(airtel|jio|vodafone|bsnl)\b)", 10, nullptr},
		}},
		{"otp_request", true, {
			{R"(\b(otp|one\s*time\s*password|verification\s*code)\b)", 20, nullptr},
			{R"(\b(?:share|send|tell|give|provide|forward)\s*(?:me\s*)?(?:the\s*)?(?:otp|code|pin)\b)", 25, nullptr},
			{R"(\b\d[\s\-]?digit\s*(?:code|otp|pin|password)\b)", 22, nullptr},
			{R"(\b(?:enter|type|input|submit)\s*(?:the\s*)?(?:otp|code|pin)\b)", 22, nullptr},
			{R"(\b(?:read\s*(?:out|me)\s*(?:the\s*)?(?:otp|code))\b)", 25, nullptr},
			{R"(\b(?:what\s*(?:is|was)\s*(?:the\s*)?(?:otp|code))\b)", 22, nullptr},
		}},
		{"payment_request", true, {
			{R"(\b(?:send|transfer|pay)\s*(?:me|us|now|rs|inr|\d+)\b)", 18, nullptr},
			{R"(\b(processing\s*fee|registration\s*fee|advance\s*payment)\b)", 20, nullptr},
			{R"(\b(pay\s*now|transfer\s*now|send\s*money|make\s*(?:the\s*)?payment)\b)", 18, nullptr},
			{R"(\b(?:amount|money|payment)\s*(?:of|is|due|required|pending)\b)", 14, nullptr},
			{R"(\b(?:rs\.?|inr)\s*\d[\d,]*\b)", 12, nullptr},
			{R"(\b\d[\d,]*\s*(?:rs|rupees?|inr)\b)", 12, nullptr},
			{R"(\b(security\s*deposit|verification\s*(?:fee|charge)|clearance\s*(?:fee|charge))\b)", 18, nullptr},
			{R"(\b(neft|rtgs|imps|wire\s*transfer|demand\s*draft)\b)", 10, nullptr},
		}},
		{"account_suspension", true, {
			{R"(\b(?:account|a/c)\s*(?:will\s*be\s*|has\s*been\s*|is\s*)?(?:suspend|block|deactivat|freez|terminat|lock)\w*)", 18, nullptr},
			{R"(\b(?:kyc|ekyc|re[\s\-]?kyc)\s*(?:update|expir|fail|mandatory|required|pending|incomplete)\w*)", 18, nullptr},
			{R"(\b(?:sim|number|mobile)\s*(?:will\s*be\s*)?(?:block|deactivat|suspend|disconnect)\w*)", 16, nullptr},
			{R"(\b(?:your\s*(?:card|debit\s*card|credit\s*card)\s*(?:is|will\s*be|has\s*been))\s*(?:block|suspend|deactivat|freez)\w*)", 18, nullptr},
			{R"(\b(?:unauthori[sz]ed|suspicious)\s*(?:access|transaction|activity|login)\b)", 16, nullptr},
			{R"(\b(suspended|blocked|deactivated|frozen)\b)", 14, nullptr},
		}},
		{"legal_threat", true, {
			{R"(\b(legal\s*action|legal\s*notice|legal\s*proceedings?)\b)", 16, nullptr},
			{R"(\b(arrest(?:ed)?|warrant|fir)\b)", 16, nullptr},
			{R"(\b(jail|prison|imprison(?:ment)?|custody)\b)", 18, nullptr},
			{R"(\b(penalty|prosecution|heavy\s*fine)\b)", 14, nullptr},
			{R"(\b(?:case\s*(?:filed|registered|pending)|under\s*investigation)\b)", 16, nullptr},
			{R"(\b(money\s*laundering|terror(?:ist)?\s*funding|hawala)\b)", 20, nullptr},
			{R"(\b(non[\s\-]?bailable|criminal\s*(?:case|offence|charge))\b)", 18, nullptr},
			{R"(\b(summons?|court\s*order|contempt\s*of\s*court)\b)", 16, nullptr},
		}},
		{"suspicious_url", true, {
			{R"(https?://[^\s]+)", 12, nullptr},
			{R"(\b(?:bit\.ly|tinyurl|goo\.gl|rb\.gy|is\.gd|cutt\.ly|shorturl|ow\.ly|tiny\.cc)\b)", 16, nullptr},
			{R"(\b(?:click\s*(?:here|this|below|the\s*link)|tap\s*(?:here|this|below)|open\s*(?:this|the\s*link))\b)", 14, nullptr},
			{R"(\b(?:wa\.me|t\.me|telegram\.me)\b)", 10, nullptr},
			{R"(\b[a-z0-9\-]{1,63}\.(?:xyz|top|online|site|work|click|live|club|icu|buzz)\b)", 14, nullptr},
			{R"(\b[a-z0-9\-]{0,40}(?:secure|verify|account|update|login|claim)[a-z0-9\-]{0,40}\.(?:in|com|org|net)/)", 16, nullptr},
			{R"(\b(?:download|install)\s*(?:from|the|this|our)\s*(?:link|app|apk)\b)", 14, nullptr},
		}},
		{"courier", true, {
			{R"(\b(?:parcel|courier|package|shipment|consignment)\b.{0,30}(?:seiz|held|illegal|drugs|contraband|suspicious))", 20, nullptr},
			{R"(\b(?:customs?\s*(?:duty|clearance|fee|charge)))", 14, nullptr},
			{R"(\b(?:drugs?|contraband|illegal\s*(?:items?|goods?))\b.{0,30}(?:found|detected|seized))", 20, nullptr},
			{R"(\b(?:fedex|dhl|blue\s*dart|dtdc|india\s*post|speed\s*post)\b)", 12, nullptr},
			{R"(\b(?:parcel|courier|package)\b)", 10, nullptr},
			{R"(\b(?:tracking|consignment)\s*(?:number|id|no)\b)", 10, nullptr},
		}},
		{"job_loan_lure", true, {
			{R"(\b(?:work\s*from\s*home|online\s*(?:job|work|earning))\b)", 14, nullptr},
			{R"(\b(?:data\s*entry|typing\s*(?:job|work)|part[\s\-]?time\s*(?:job|work))\b)", 14, nullptr},
			{R"(\b(?:earn\s*(?:from\s*home|daily|weekly|monthly|lakhs?|thousands?))\b)", 16, nullptr},
			{R"(\b(?:training\s*(?:fee|charge)|joining\s*fee)\b)", 18, nullptr},
			{R"(\b(?:telegram\s*(?:group|channel|job)|task[\s\-]?based|per[\s\-]?task)\b)", 12, nullptr},
			{R"(\b(?:instant\s*(?:loan|credit)|pre[\s\-]?approved\s*(?:loan|credit))\b)", 16, nullptr},
			{R"(\b(?:loan\s*(?:approved|sanction\w*|disburs\w*|offer))\b)", 14, nullptr},
			{R"(\b(?:no\s*(?:cibil|credit\s*score|collateral)\s*(?:needed|required|check))\b)", 18, nullptr},
		}},
		{"digital_arrest", true, {
			{R"(\b(digital\s*arrest|video\s*call\s*arrest|online\s*arrest)\b)", 22, nullptr},
			{R"(\b(?:video|zoom|skype)\b.{0,30}(?:arrest|custody|investigation|statement))", 20, nullptr},
			{R"(\b(stay\s*on\s*(?:the\s*)?(?:call|video|line)|don.t\s*disconnect)\b)", 16, nullptr},
			{R"(\b(?:do\s*not|don.t)\s*tell\s*(?:anyone|your\s*family)\b)", 14, nullptr},
		}},
		{"identity_document", true, {
			{R"(\b(?:aadhaar|aadhar)\s*(?:number|no|card|id|details|copy)\b)", 14, nullptr},
			{R"(\b(?:pan\s*(?:card|number|no|details))\b)", 14, nullptr},
			{R"(\b(?:voter\s*id|driving\s*licen[cs]e|passport\s*(?:number|no|details))\b)", 14, nullptr},
			{R"(\b(?:date\s*of\s*birth|mother.s?\s*maiden)\b)", 12, nullptr},
			{R"(\b(?:share\s*(?:your\s*)?(?:aadhaar|pan|voter|passport)\s*(?:number|details|copy|photo)?)\b)", 18, nullptr},
			{R"(\b(?:selfie|photo)\s*(?:of|with)\s*(?:your|the)\s*(?:aadhaar|pan|id)\b)", 16, nullptr},
		}},
		{"bank_details", true, {
			{R"(\b(bank\s*account|account\s*number|a/c\s*(?:no|number))\b)", 16, nullptr},
			{R"(\b(ifsc|cvv|card\s*number|debit\s*card|credit\s*card|expiry\s*date)\b)", 16, nullptr},
			{R"(\b(?:share\s*(?:your\s*)?(?:bank|account|card)\s*(?:details|number)?)\b)", 18, nullptr},
			{R"(\b(account\s*details|banking\s*details|net\s*banking\s*(?:password|id)|passbook)\b)", 14, nullptr},
			{R"(\b(atm\s*pin|card\s*pin|mpin|upi\s*pin)\b)", 20, nullptr},
		}},
		{"upi_specific", false, {
			{R"(\b(?:upi\s*(?:id|address|handle)|bhim\s*id|vpa)\b)", 12, nullptr},
			{R"([\w.\-]{1,64}@(?:paytm|ybl|oksbi|okaxis|okicici|upi|phonepe|gpay|ibl|axl|apl|freecharge|airtel|jio|kotak|sbi|hdfc|icici|pnb|bob|barodapay|aubank)\b)", 16, nullptr},
			{R"(\b(?:scan\s*(?:the\s*)?(?:qr|code)|upi\s*transfer|qr\s*code)\b)", 12, nullptr},
			{R"(\b(?:google\s*pay|phone\s*pe|paytm|bhim)\b)", 8, nullptr},
			{R"(\b(?:collect\s*request|payment\s*(?:request|link))\b)", 14, nullptr},
		}},
		{"prize_lure", false, {
			{R"(\b(?:won|winner|winning|congratulat\w*)\b)", 16, nullptr},
			{R"(\b(prize|lottery|lucky\s*draw|jackpot|bumper\s*draw)\b)", 18, nullptr},
			{R"(\b(?:cashback|cash\s*back|bonus|reward)\b)", 14, nullptr},
			{R"(\b(?:claim|collect|receive|redeem)\s*(?:your\s*)?(?:prize|reward|money|amount|gift|refund)\b)", 16, nullptr},
			{R"(\b(?:selected|chosen|shortlisted)\s*(?:for|as)\b)", 14, nullptr},
			{R"(\b(?:free\s*(?:gift|iphone|laptop|car|bike|gold|trip))\b)", 16, nullptr},
			{R"(\b(?:kbc|kaun\s*banega\s*crorepati)\b)", 20, nullptr},
		}},
		{"investment", false, {
			{R"(\b(?:invest\w*|trading|forex|crypto|bitcoin)\b.{0,30}(?:guaranteed|profit|returns?|income))", 18, nullptr},
			{R"(\b(?:double|triple)\s*(?:your\s*)?(?:money|investment|capital))", 20, nullptr},
			{R"(\b(?:guaranteed\s*returns?|high\s*returns?|risk[\s\-]?free|zero\s*risk)\b)", 18, nullptr},
			{R"(\b(?:stock\s*(?:tip|market)|insider\s*(?:info|tip)|share\s*trading|ipo)\b)", 12, nullptr},
			{R"(\b(?:mlm|ponzi|pyramid\s*scheme|binary\s*option)\b)", 20, nullptr},
		}},
		{"tech_support", false, {
			{R"(\b(?:virus|malware|trojan|spyware)\b.{0,20}(?:detected|found|infected|attack))", 18, nullptr},
			{R"(\b(?:computer|system|device|laptop)\b.{0,20}(?:hacked|compromised|infected))", 18, nullptr},
			{R"(\b(?:microsoft|apple|windows)\b.{0,15}(?:support|helpdesk|team|security))", 16, nullptr},
			{R"(\b(?:anydesk|teamviewer|quicksupport|ultraviewer)\b)", 20, nullptr},
			{R"(\b(?:screen\s*shar(?:e|ing)|remote\s*(?:access|control|desktop))\b)", 18, nullptr},
		}},
		{"emotional_pressure", false, {
			{R"(\b(scared|afraid|worried|dangerous|destroy|ruin)\b)", 10, nullptr},
			{R"(\b(?:your\s*(?:family|children|parents|reputation|career|future))\b)", 12, nullptr},
			{R"(\b(embarrass\w*|shame|disgrace|humiliat\w*)\b)", 12, nullptr},
			{R"(\b(confidential|between\s*us|keep\s*(?:this|it)\s*secret)\b)", 10, nullptr},
			{R"(\b(?:trust\s*me|believe\s*me|rest\s*assured)\b)", 6, nullptr},
			{R"(\b(?:no\s*one\s*(?:will\s*know|can\s*help)|no\s*other\s*(?:choice|option))\b)", 12, nullptr},
		}},
		{"compound_template", false, {
			{R"(\b(?:rbi|reserve\s*bank|bank)\b.{0,30}(?:kyc|verify|update|suspend|block))", 18, "authority_impersonation"},
			{R"(\b(?:account|card)\b.{0,20}(?:block|suspend|deactivat|terminat))", 16, "account_suspension"},
			{R"(\b(?:police|cbi|cyber)\b.{0,30}(?:case|arrest|warrant|investigation))", 20, "legal_threat"},
			{R"(\b(?:aadhaar|aadhar|pan)\b.{0,30}(?:block|suspend|deactivat|illegal|misuse))", 18, "identity_document"},
			{R"(\b(?:parcel|courier|package)\b.{0,30}(?:drugs|illegal|seiz|customs))", 20, "courier"},
			{R"(\b(?:won|winner|prize|lottery)\b.{0,30}(?:claim|collect|receive))", 18, "prize_lure"},
			{R"(\b(?:otp|password|pin|cvv)\b.{0,20}(?:share|send|enter|provide))", 20, "otp_request"},
			{R"(\bshare\b.{0,20}(?:otp|password|pin|cvv)\b)", 20, "otp_request"},
			{R"(\b(?:urgent|immediate|asap)\w*\b.{0,30}(?:pay|transfer|send|click))", 16, "urgency"},
			{R"(\b(?:job|work|earn)\b.{0,30}(?:from\s*home|online|daily|weekly|guaranteed))", 14, "job_loan_lure"},
		}},
		{"behavioral_escalation", false, {
			{R"(\b(last\s*warning|final\s*reminder|we\s*tried\s*to\s*contact|this\s*is\s*your\s*last))", 12, nullptr},
			{R"(\b(if\s*you\s*(?:don.t|do\s*not)\s*(?:respond|pay|comply)|action\s*will\s*be\s*taken))", 12, nullptr},
			{R"(\b(we\s*are\s*forced\s*to|compelled\s*to\s*proceed|no\s*other\s*option))", 12, nullptr},
		}},
		{"regional_language", false, {
			{R"(\b(jaldi|turant|fauran|fatafat|jald\s*se\s*jald)\b)", 12, "urgency"},
			{R"(\b(aakhri\s*(?:mauka|chance|moka)|antim\s*chetavani)\b)", 14, "urgency"},
			{R"(\b(?:otp|code)\s*(?:batao|bhejo|dijiye|bataiye)\b)", 22, "otp_request"},
			{R"(\b(paisa\s*bhejo|paise\s*bhejo|transfer\s*karo|payment\s*karo|shulk)\b)", 14, "payment_request"},
			{R"(\b(khata\s*(?:band|block|freeze)|sim\s*band|band\s*ho\s*jayega)\b)", 14, "account_suspension"},
			{R"(\b(giraftaar\w*|hathkadi|kaarwahi|mukadma|adalat)\b)", 18, "legal_threat"},
			{R"(\b(inaam|lakhpati|crorepati|muft)\b)", 14, "prize_lure"},
			{R"(\b(badnaam|izzat|beizzati|barbad)\b)", 12, "emotional_pressure"},
			{R"(\b(sarkari\s*adhikari|thanedar|thana)\b)", 12, "authority_impersonation"},
		}},
	};
}

constexpr size_t kMaxRunChars = 96;
constexpr size_t kRunTailChars = 24;

// Any whitespace-free run longer than kMaxRunChars keeps only its head and
// tail, which bounds the backtracking of the rules on a single long token.
std::string shortenLongRuns(const std::string &s) {
	std::string out;
	out.reserve(s.size());
	size_t i = 0;
	while (i < s.size()) {
		if (std::isspace((unsigned char)s[i])) {
			out.push_back(s[i++]);
			continue;
		}
		size_t end = i;
		while (end < s.size() && !std::isspace((unsigned char)s[end])) end++;
		const size_t len = end - i;
		if (len <= kMaxRunChars) {
			out.append(s, i, len);
		} else {
			out.append(s, i, kMaxRunChars - kRunTailChars);
			out.push_back(' ');
			out.append(s, end - kRunTailChars, kRunTailChars);
		}
		i = end;
	}
	return out;
}

} // namespace

std::string TurnRisk::dominantCategory() const {
	const SignalMatch *best = nullptr;
	for (const auto &m : matches) {
		if (!best || m.weight > best->weight) best = &m;
	}
	return best ? best->category : std::string();
}

RiskScorer::RiskScorer() {
	const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
	for (const auto &def : layerTable()) {
		RiskLayer layer;
		layer.name = def.name;
		layer.core = def.core;
		for (const auto &r : def.rules) {
			RiskRule rule;
			rule.re = std::regex(r.pattern, flags);
			rule.weight = r.weight;
			rule.category = r.category ? r.category : def.name;
			layer.rules.push_back(std::move(rule));
		}
		layers_.push_back(std::move(layer));
	}
	const char *greetings[] = {
		R"(^\s*(hello|hi|hey|namaste|namaskar|good\s*(?:morning|afternoon|evening|day))[\s!.,?]*$)",
		R"(^\s*(greetings|howdy|salam|jai\s*hind)[\s!.,?]*$)",
		R"(^\s*(how\s*are\s*you|hope\s*you.?re\s*well|are\s*you\s*there)[\s?.!]*$)",
		R"(^\s*(dear\s*(?:sir|ma.?am|customer|user|friend))[\s,!.]*$)",
		R"(^\s*(kaise\s*ho|kya\s*haal|sab\s*theek)[\s?!.]*$)",
	};
	for (const char *g : greetings) greetings_.emplace_back(g, flags);
}

bool RiskScorer::isPureGreeting(const std::string &text) const {
	const std::string lowered = toLowerAscii(trimCopy(text));
	for (const auto &re : greetings_) {
		if (std::regex_match(lowered, re)) return true;
	}
	return false;
}

TurnRisk RiskScorer::scoreMessage(const std::string &text, bool firstTurn, const EngineParams &params) const {
	TurnRisk out;
	if (trimCopy(text).empty()) return out;
	if (firstTurn && params.greetingSuppression && isPureGreeting(text)) {
		out.greetingSuppressed = true;
		return out;
	}
	std::string lowered = toLowerAscii(text);
	if ((int)lowered.size() > params.maxMessageChars) lowered.resize((size_t)params.maxMessageChars);
	lowered = shortenLongRuns(lowered);

	for (const auto &layer : layers_) {
		const RiskRule *best = nullptr;
		for (const auto &rule : layer.rules) {
			if (best && rule.weight <= best->weight) continue;
			if (std::regex_search(lowered, rule.re)) best = &rule;
		}
		if (!best) continue;
		out.matches.push_back({layer.name, best->weight, best->category});
		out.categories.insert(best->category);
		out.delta += (float)best->weight;
	}
	if (out.categories.size() >= 2) {
		out.escalationBonus = params.escalationBonus;
		out.delta += out.escalationBonus;
	}
	return out;
}

void RiskScorer::applyTurn(SessionState &state, const TurnRisk &turn, const EngineParams &params) const {
	float delta = std::max(0.0f, turn.delta);
	state.cumulativeRiskScore += delta;
	for (const auto &c : turn.categories) {
		state.triggeredSignals.insert(c);
		state.signalCounts[c] += 1;
	}
	if (!state.scamConfirmed && state.cumulativeRiskScore >= params.scamThreshold) {
		state.scamConfirmed = true;
		std::cerr << "[Risk] session " << state.sessionId << " confirmed as scam at score "
				  << state.cumulativeRiskScore << " (turn " << state.turnIndex << ")" << std::endl;
	}
	if (state.scamConfirmed) state.scamType = classifyScamType(state.triggeredSignals);
}

float RiskScorer::confidence(float cumulative, float threshold) {
	if (cumulative <= 0.0f) return 0.0f;
	if (threshold <= 0.0f || cumulative >= threshold) {
		double over = (double)cumulative - (double)std::max(0.0f, threshold);
		double c = 70.0 + 29.0 * (1.0 - std::exp(-over / 60.0));
		return (float)std::min(99.0, c);
	}
	return 50.0f * cumulative / threshold;
}

std::string RiskScorer::riskLevel(float cumulative, float threshold) {
	if (cumulative >= 120.0f) return "critical";
	if (cumulative >= 80.0f) return "high";
	if (cumulative >= threshold) return "medium";
	if (cumulative >= 15.0f) return "low";
	return "minimal";
}

std::string RiskScorer::classifyScamType(const std::set<std::string> &c) {
	auto has = [&](const char *k) { return c.count(k) > 0; };
	if (has("courier")) return "courier";
	if (has("investment")) return "investment";
	if (has("tech_support")) return "tech_support";
	if (has("job_loan_lure")) return "job_fraud";
	if (has("upi_specific")) return "upi_fraud";
	if (has("prize_lure")) return "lottery";
	if (has("digital_arrest") || has("authority_impersonation") || has("legal_threat")) return "impersonation";
	if (has("otp_request") || has("suspicious_url") || has("identity_document")) return "phishing";
	if (has("account_suspension") || has("payment_request") || has("bank_details")) return "bank_fraud";
	return "unknown";
}

} // namespace honeypot
