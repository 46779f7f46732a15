#pragma once

#include <map>
#include <string>
#include <vector>

#include "neural.hpp"
#include "session.hpp"

namespace honeypot {

enum class ThemeClass {
	Confusion,
	Probing,
	Extraction,
	Neutral,
};

ThemeClass themeClassOf(const std::string &theme);

struct CandidateResponse {
	std::string id;
	std::string text;
	int stageAffinity{0}; // 0 when the reply is not tied to a stage
	std::string tactic;
	std::string theme;
	ThemeClass themeClass{ThemeClass::Neutral};
	bool probe{false};
	std::vector<float> embedding;
};

// The bounded set of pre-authored persona replies, grouped into stage pools,
// tactic pools and the empty-input pool. Embeddings are computed once at
// construction.
class ResponseCatalog {
public:
	explicit ResponseCatalog(const TextEncoder &encoder);

	std::vector<const CandidateResponse *> stagePool(Stage stage) const;
	std::vector<const CandidateResponse *> tacticPool(const std::string &tactic) const;
	std::vector<const CandidateResponse *> emptyInputPool() const;
	const CandidateResponse *find(const std::string &id) const;
	size_t size() const { return responses_.size(); }

	// Tactic tag from the scammer message keywords, falling back to the
	// dominant risk category of the turn.
	static std::string detectTactic(const std::string &text, const std::string &dominantCategory);

private:
	void addPool(const std::string &prefix, int stage, const std::string &tactic, const std::string &theme,
				 const std::vector<std::string> &texts, const TextEncoder &encoder);
	std::vector<const CandidateResponse *> collect(const std::vector<size_t> &idx) const;

	std::vector<CandidateResponse> responses_;
	std::map<int, std::vector<size_t>> byStage_;
	std::map<std::string, std::vector<size_t>> byTactic_;
	std::vector<size_t> emptyInput_;
	std::map<std::string, size_t> byId_;
};

} // namespace honeypot
