#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "session.hpp"

namespace honeypot {

constexpr int kEmbedDim = 128;
constexpr int kHeads = 4;
constexpr int kHeadDim = kEmbedDim / kHeads;
constexpr int kIntents = 15;
constexpr int kHandFeatures = 10;
constexpr int kScorerInput = kEmbedDim + kEmbedDim + kStateDim + kIntents + kHandFeatures;

extern const char *const kIntentNames[kIntents];
const std::vector<std::string> &intentKeywords(int intent);

struct Matrix {
	int rows{0};
	int cols{0};
	std::vector<float> data;

	Matrix() = default;
	Matrix(int r, int c, float v = 0.0f) : rows(r), cols(c), data((size_t)r * (size_t)c, v) {}

	float &operator()(int r, int c) { return data[(size_t)r * (size_t)cols + (size_t)c]; }
	float operator()(int r, int c) const { return data[(size_t)r * (size_t)cols + (size_t)c]; }
};

// Dense layer with fixed weights. The seed fully determines the weights, so
// every process builds bit-identical matrices.
struct Linear {
	Matrix w;
	std::vector<float> b;

	Linear() = default;
	Linear(int in, int out, uint32_t seed);
	std::vector<float> forward(const std::vector<float> &x) const;
};

struct LayerNorm {
	std::vector<float> gamma;
	std::vector<float> beta;
	float eps{1e-5f};

	LayerNorm() = default;
	explicit LayerNorm(int d);
	std::vector<float> forward(const std::vector<float> &x) const;
};

// x -> LayerNorm(x + W2 gelu(W1 x)).
struct FeedForward {
	Linear w1;
	Linear w2;
	LayerNorm ln;

	FeedForward() = default;
	FeedForward(int dModel, int dFF, uint32_t seed);
	std::vector<float> forward(const std::vector<float> &x) const;
};

float geluFn(float x);
float sigmoidFn(float x);
std::vector<float> softmax(const std::vector<float> &x);
float l2norm(const std::vector<float> &v);
float cosineSim(const std::vector<float> &a, const std::vector<float> &b);
bool allFinite(const std::vector<float> &v);

// Character trigrams and word unigrams/bigrams hashed into two signed 64-bucket
// halves, each L2-normalised, then projected through a fixed ReLU layer.
class TextEncoder {
public:
	TextEncoder();
	std::vector<float> hashFeatures(const std::string &text) const;
	std::vector<float> encode(const std::string &text) const;

private:
	Linear proj_;
};

// Treats the 128-d vector as 4 positions of 32 dims and attends across them.
class HeadAttention {
public:
	HeadAttention();
	std::vector<float> forward(const std::vector<float> &x) const;

private:
	Linear wq_;
	Linear wk_;
	Linear wv_;
	Linear wo_;
	LayerNorm ln_;
};

class ConversationGru {
public:
	ConversationGru();
	std::vector<float> step(const std::vector<float> &x, const std::vector<float> &h) const;

private:
	Linear wz_;
	Linear wr_;
	Linear wh_;
};

class IntentClassifier {
public:
	explicit IntentClassifier(const TextEncoder &encoder);

	// 0.35 projection head + 0.30 anchor similarity + 0.35 keyword overlap.
	std::vector<float> classify(const std::vector<float> &attended,
								const std::vector<float> &state,
								const std::vector<float> &encoded,
								const std::string &rawText) const;
	static std::vector<float> keywordOverlap(const std::string &text);

private:
	Linear l1_;
	Linear l2_;
	Linear l3_;
	std::vector<std::vector<float>> anchors_;
};

// 345 -> 128 -> 64 -> 1 with ReLU hidden layers and a sigmoid output.
class EngagementScorer {
public:
	EngagementScorer();
	float score(const std::vector<float> &features) const;

private:
	Linear l1_;
	Linear l2_;
	Linear l3_;
};

} // namespace honeypot
