#include <boost/test/unit_test.hpp>

#include <cstdio>

#include "test_nposim.h"
#include "../common/ElectionError.h"
#include "../engine/ElectionEngine.h"
#include "../io/JsonCodec.h"
#include "../io/ResultFormatter.h"

using namespace nposim;
using nposim::test::candidate;
using nposim::test::nominator;

BOOST_AUTO_TEST_SUITE(json_tests)

BOOST_AUTO_TEST_CASE(dataset_round_trip)
{
    ElectionData data;
    Candidate alice = candidate("alice", 0);
    alice.stake = Constants::loadScale() * 3;   // beyond 64 bits
    CandidateMetadata details;
    details.commissionRate = 5;
    details.onChainStatus = std::string("active");
    alice.metadata = details;
    data.addCandidate(alice);
    data.addCandidate(candidate("bob", 7));

    Nominator nina = nominator("nina", 12, {"bob", "alice"});
    nina.metadata = std::map<std::string, std::string>{{"label", "whale"}};
    data.addNominator(nina);
    data.addNominator(nominator("idle", 0, {}));

    ElectionMetadata metadata;
    metadata.blockNumber = 19000000;
    metadata.chain = std::string("polkadot");
    data.metadata = metadata;

    Json::Value json = JsonCodec::toJson(data);
    BOOST_CHECK(json["candidates"][0]["stake"].isString());
    BOOST_CHECK(!json["candidates"][1].isMember("metadata"));

    ElectionData parsed = JsonCodec::dataFromJson(JsonCodec::parse(JsonCodec::write(json)));
    BOOST_CHECK(parsed == data);
}

BOOST_AUTO_TEST_CASE(integer_stakes_accepted)
{
    const std::string text =
        "{ \"candidates\": [ { \"account_id\": \"a\", \"stake\": 1000 } ],"
        "  \"nominators\": [ { \"account_id\": \"n\", \"stake\": \"250\", \"targets\": [\"a\"] } ] }";

    ElectionData data = JsonCodec::dataFromJson(JsonCodec::parse(text));
    BOOST_CHECK_EQUAL(data.candidates[0].stake, Balance(1000));
    BOOST_CHECK_EQUAL(data.nominators[0].stake, Balance(250));
    BOOST_CHECK(!data.metadata);
}

BOOST_AUTO_TEST_CASE(malformed_input)
{
    BOOST_CHECK_THROW(JsonCodec::parse("{ \"candidates\": [ "), InvalidData);
    BOOST_CHECK_THROW(JsonCodec::dataFromJson(JsonCodec::parse("{}")), InvalidData);
    BOOST_CHECK_THROW(JsonCodec::dataFromJson(JsonCodec::parse("{ \"candidates\": {} }")), InvalidData);
    BOOST_CHECK_THROW(JsonCodec::dataFromJson(JsonCodec::parse(
        "{ \"candidates\": [ { \"account_id\": \"a\", \"stake\": -5 } ] }")), InvalidData);
    BOOST_CHECK_THROW(JsonCodec::dataFromJson(JsonCodec::parse(
        "{ \"candidates\": [ { \"account_id\": \"a\", \"stake\": \"-5\" } ] }")), ValidationError);
    BOOST_CHECK_THROW(JsonCodec::dataFromJson(JsonCodec::parse(
        "{ \"candidates\": [ { \"account_id\": \"a\", \"stake\": \"1\" },"
        "                    { \"account_id\": \"a\", \"stake\": \"2\" } ] }")), ValidationError);
}

BOOST_AUTO_TEST_CASE(load_file_validates)
{
    const std::string path = "json_tests_dangling.json";
    JsonCodec::writeTextFile(
        "{ \"candidates\": [ { \"account_id\": \"a\", \"stake\": \"1\" } ],"
        "  \"nominators\": [ { \"account_id\": \"n\", \"stake\": \"1\", \"targets\": [\"b\"] } ] }",
        path);

    try {
        JsonCodec::loadDataFile(path);
        BOOST_FAIL("dangling target loaded");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.field(), "nominators.targets");
    }
    std::remove(path.c_str());

    BOOST_CHECK_THROW(JsonCodec::loadDataFile("does/not/exist.json"), InvalidData);
}

BOOST_AUTO_TEST_CASE(save_and_load_file)
{
    ElectionData data;
    data.addCandidate(candidate("a", 5));
    data.addNominator(nominator("n", 9, {"a"}));

    const std::string path = "json_tests_saved.json";
    JsonCodec::saveDataFile(data, path);
    BOOST_CHECK(JsonCodec::loadDataFile(path) == data);
    std::remove(path.c_str());
}

BOOST_AUTO_TEST_CASE(configuration_round_trip)
{
    ElectionOverrides overrides;
    overrides.setCandidateStake("a", Balance(10));
    overrides.setNominatorStake("n", Balance(20));
    overrides.addVotingEdge("n", "b");
    overrides.modifyVotingEdge("n", "a", Balance(3));
    overrides.setActiveSetSize(4);

    ElectionConfiguration config = ElectionConfigBuilder()
        .algorithm(AlgorithmType::MULTI_PHASE)
        .activeSetSize(16)
        .overrides(overrides)
        .blockNumber(123)
        .balancing(BalancingConfig(3, 1000))
        .build();

    Json::Value json = JsonCodec::toJson(config);
    BOOST_CHECK_EQUAL(json["algorithm"].asString(), "multi-phase");
    BOOST_CHECK_EQUAL(json["overrides"]["voting_edges"][1]["action"].asString(), "modify");

    BOOST_CHECK(JsonCodec::configFromJson(json) == config);

    Json::Value bad = json;
    bad["algorithm"] = "borda";
    BOOST_CHECK_THROW(JsonCodec::configFromJson(bad), ValidationError);
    bad = json;
    bad["active_set_size"] = 0;
    BOOST_CHECK_THROW(JsonCodec::configFromJson(bad), ValidationError);
}

BOOST_AUTO_TEST_CASE(malformed_balancing_section)
{
    const std::string scalar =
        "{ \"algorithm\": \"sequential\", \"active_set_size\": 1, \"balancing\": 5 }";
    BOOST_CHECK_THROW(JsonCodec::configFromJson(JsonCodec::parse(scalar)), InvalidData);

    const std::string array =
        "{ \"algorithm\": \"sequential\", \"active_set_size\": 1, \"balancing\": [10, 0] }";
    BOOST_CHECK_THROW(JsonCodec::configFromJson(JsonCodec::parse(array)), InvalidData);

    const std::string iterations =
        "{ \"algorithm\": \"sequential\", \"active_set_size\": 1, \"balancing\": { \"iterations\": \"ten\" } }";
    BOOST_CHECK_THROW(JsonCodec::configFromJson(JsonCodec::parse(iterations)), InvalidData);
}

BOOST_AUTO_TEST_CASE(result_fields)
{
    ElectionData data;
    data.addCandidate(candidate("alice", 1000000000));
    data.addNominator(nominator("nina", 500000000, {"alice"}));

    ElectionEngine engine;
    engine.setClock([]() { return std::string("2026-01-01T00:00:00Z"); });
    ElectionResult result = engine.execute(ElectionConfigBuilder().activeSetSize(1).build(), data);

    Json::Value json = JsonCodec::toJson(result);
    BOOST_CHECK_EQUAL(json["total_stake"].asString(), "1500000000");
    BOOST_CHECK_EQUAL(json["algorithm_used"].asString(), "sequential-phragmen");
    BOOST_CHECK_EQUAL(json["selected_validators"][0]["rank"].asUInt(), 1u);
    BOOST_CHECK(json["stake_distribution"][0]["self_stake"].asBool());
    BOOST_CHECK(!json["stake_distribution"][1].isMember("self_stake"));
    BOOST_CHECK(!json["execution_metadata"].isMember("block_number"));
    BOOST_CHECK(!json["execution_metadata"].isMember("data_source"));

    BOOST_CHECK(JsonCodec::resultFromJson(JsonCodec::parse(JsonCodec::write(json))) == result);
}

BOOST_AUTO_TEST_CASE(output_formats)
{
    BOOST_CHECK(ResultFormatter::parseFormat("JSON") == OutputFormat::JSON);
    BOOST_CHECK(ResultFormatter::parseFormat("human-readable") == OutputFormat::HUMAN_READABLE);
    try {
        ResultFormatter::parseFormat("yaml");
        BOOST_FAIL("unknown format accepted");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.field(), "output_format");
    }

    std::vector<SelectedValidator> validators(12);
    for (size_t i = 0; i < validators.size(); ++i) {
        validators[i].accountID = "v" + std::to_string(i);
        validators[i].rank = static_cast<uint32_t>(i + 1);
    }
    ElectionResult result(validators, std::vector<StakeAllocation>(), Balance(0),
                          AlgorithmType::PARALLEL_PHRAGMEN);

    std::string text = ResultFormatter::format(result, OutputFormat::HUMAN_READABLE);
    BOOST_CHECK(text.find("Election Results") != std::string::npos);
    BOOST_CHECK(text.find("Algorithm: parallel-phragmen") != std::string::npos);
    BOOST_CHECK(text.find("10. v9") != std::string::npos);
    BOOST_CHECK(text.find("v10") == std::string::npos);
    BOOST_CHECK(text.find("... and 2 more") != std::string::npos);

    std::string json = ResultFormatter::format(result, OutputFormat::JSON);
    BOOST_CHECK(JsonCodec::resultFromJson(JsonCodec::parse(json)) == result);
}

BOOST_AUTO_TEST_SUITE_END()
