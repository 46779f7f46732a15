#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace honeypot {

class Rng32 {
public:
	explicit Rng32(uint32_t seed) : x_(seed ? seed : 0x9e3779b9u) {}
	double next() {
		x_ ^= x_ << 13;
		x_ ^= x_ >> 17;
		x_ ^= x_ << 5;
		return (double)(x_ & 0xffffffffu) / (double)0xffffffffu;
	}
	uint32_t nextU32() {
		next();
		return x_;
	}

private:
	uint32_t x_{0x9e3779b9u};
};

uint32_t fnv1a(const std::string &s, uint32_t seed = 2166136261u);
uint32_t hashStrSimple(const std::string &s, uint32_t seed = 1315423911u);

std::string toLowerAscii(const std::string &s);
std::string trimCopy(const std::string &s);
std::vector<std::string> splitWords(const std::string &s);
bool containsAny(const std::string &haystack, const std::vector<std::string> &needles);
int countOccurrences(const std::string &haystack, const std::string &needle);

// Replaces every malformed UTF-8 sequence with U+FFFD.
std::string sanitizeUtf8(const std::string &s);

int64_t nowEpochMs();
std::string nowIso();

} // namespace honeypot
