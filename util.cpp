#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace honeypot {

uint32_t fnv1a(const std::string &s, uint32_t seed) {
	uint32_t h = seed;
	for (unsigned char c : s) {
		h ^= c;
		h *= 16777619u;
	}
	return h;
}

uint32_t hashStrSimple(const std::string &s, uint32_t seed) {
	uint32_t hash = seed;
	for (unsigned char c : s) {
		hash ^= ((hash << 5) + c + (hash >> 2));
	}
	return hash;
}

std::string toLowerAscii(const std::string &s) {
	std::string out = s;
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return (char)std::tolower(c); });
	return out;
}

std::string trimCopy(const std::string &s) {
	auto start = s.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return "";
	auto end = s.find_last_not_of(" \t\r\n");
	return s.substr(start, end - start + 1);
}

std::vector<std::string> splitWords(const std::string &s) {
	std::vector<std::string> out;
	std::istringstream iss(s);
	std::string w;
	while (iss >> w) out.push_back(w);
	return out;
}

bool containsAny(const std::string &haystack, const std::vector<std::string> &needles) {
	for (const auto &n : needles) {
		if (haystack.find(n) != std::string::npos) return true;
	}
	return false;
}

int countOccurrences(const std::string &haystack, const std::string &needle) {
	if (needle.empty()) return 0;
	int count = 0;
	size_t pos = haystack.find(needle);
	while (pos != std::string::npos) {
		count++;
		pos = haystack.find(needle, pos + needle.size());
	}
	return count;
}

static size_t utf8SequenceLength(const std::string &s, size_t i) {
	const unsigned char c = (unsigned char)s[i];
	size_t len = 0;
	unsigned char lo = 0x80, hi = 0xBF;
	if (c < 0x80) return 1;
	if (c >= 0xC2 && c <= 0xDF) len = 2;
	else if (c == 0xE0) { len = 3; lo = 0xA0; }
	else if (c == 0xED) { len = 3; hi = 0x9F; }
	else if (c >= 0xE1 && c <= 0xEF) len = 3;
	else if (c == 0xF0) { len = 4; lo = 0x90; }
	else if (c == 0xF4) { len = 4; hi = 0x8F; }
	else if (c >= 0xF1 && c <= 0xF3) len = 4;
	else return 0;
	if (i + len > s.size()) return 0;
	const unsigned char second = (unsigned char)s[i + 1];
	if (second < lo || second > hi) return 0;
	for (size_t k = 2; k < len; k++) {
		const unsigned char cc = (unsigned char)s[i + k];
		if (cc < 0x80 || cc > 0xBF) return 0;
	}
	return len;
}

std::string sanitizeUtf8(const std::string &s) {
	std::string out;
	out.reserve(s.size());
	size_t i = 0;
	while (i < s.size()) {
		size_t len = utf8SequenceLength(s, i);
		if (len == 0) {
			out += "\xEF\xBF\xBD";
			i++;
			continue;
		}
		out.append(s, i, len);
		i += len;
	}
	return out;
}

int64_t nowEpochMs() {
	return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string nowIso() {
	auto now = std::chrono::system_clock::now();
	auto t = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
	std::tm tm{};
#ifdef _WIN32
	gmtime_s(&tm, &t);
#else
	gmtime_r(&t, &tm);
#endif
	char buf[64];
	std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
	char out[80];
	std::snprintf(out, sizeof(out), "%s.%03dZ", buf, (int)ms.count());
	return out;
}

} // namespace honeypot
