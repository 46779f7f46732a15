#include <doctest/doctest.h>

#include "params.hpp"

using namespace honeypot;

TEST_CASE("EngineParams defaults match the documented tunables") {
	EngineParams p;
	CHECK(p.scamThreshold == doctest::Approx(40.0));
	CHECK(p.escalationBonus == doctest::Approx(10.0));
	CHECK(p.temperature == doctest::Approx(0.6));
	CHECK(p.minTurns == 8);
	CHECK(p.minQuestions == 5);
	CHECK(p.minInvestigative == 3);
	CHECK(p.minRedFlags == 5);
	CHECK(p.minElicitation == 5);
	CHECK(p.extractingTurn == 7);
	CHECK(p.tacticRepeatLimit == 1);
}

TEST_CASE("applyParams takes a partial patch and ignores unknown keys") {
	EngineParams p;
	std::string error;
	REQUIRE(p.applyParams(json{{"scamThreshold", 55}, {"temperature", 0.9}, {"somethingElse", true}}, &error));
	CHECK(p.scamThreshold == doctest::Approx(55.0));
	CHECK(p.temperature == doctest::Approx(0.9));
	CHECK(p.minTurns == 8);
	CHECK(p.toJson()["scamThreshold"].get<double>() == doctest::Approx(55.0));
}

TEST_CASE("applyParams rejects invalid values and keeps the previous state") {
	EngineParams p;
	std::string error;
	CHECK_FALSE(p.applyParams(json{{"scamThreshold", 70}, {"temperature", 0.0}}, &error));
	CHECK_FALSE(error.empty());
	CHECK(p.scamThreshold == doctest::Approx(40.0));
	CHECK(p.temperature == doctest::Approx(0.6));

	CHECK_FALSE(p.applyParams(json{{"suspiciousScore", 200}}, &error));
	CHECK(p.suspiciousScore == doctest::Approx(35.0));

	CHECK_FALSE(p.applyParams(json{{"minTurns", "eight"}}, &error));
	CHECK(p.minTurns == 8);

	CHECK_FALSE(p.applyParams(json::array(), &error));
}

TEST_CASE("patches carrying malformed UTF-8 are applied and can be logged") {
	EngineParams p;
	json patch{{"temperature", 0.9}, {"note\xff", "x\xfe"}};
	std::string error;
	CHECK(p.applyParams(patch, &error));
	CHECK(p.temperature == doctest::Approx(0.9));
	std::string logged;
	CHECK_NOTHROW(logged = patch.dump(-1, ' ', false, json::error_handler_t::replace));
	CHECK(logged.find("\"temperature\":0.9") != std::string::npos);
}
