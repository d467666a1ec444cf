#include <boost/test/unit_test.hpp>

#include <random>

#include "test_nposim.h"
#include "../common/ElectionError.h"
#include "../engine/ElectionEngine.h"
#include "../engine/ResultAssembler.h"
#include "../io/SyntheticDataBuilder.h"

using namespace nposim;
using nposim::test::allocatedBy;
using nposim::test::candidate;
using nposim::test::config;
using nposim::test::nominator;
using nposim::test::winnerIDs;

namespace {

const AlgorithmType ALL_ALGORITHMS[] = {
    AlgorithmType::SEQUENTIAL_PHRAGMEN,
    AlgorithmType::PARALLEL_PHRAGMEN,
    AlgorithmType::MULTI_PHASE
};

struct EngineFixture {
    ElectionEngine engine;

    EngineFixture() {
        engine.setClock([]() { return std::string("2026-01-01T00:00:00Z"); });
    }
};

ElectionData syntheticData(uint64_t seed)
{
    std::mt19937_64 rng(seed);
    SyntheticDataBuilder builder;
    builder.populate(30, 200, 6, 0, 1000000000000ULL, [&rng](uint64_t bound) {
        return std::uniform_int_distribution<uint64_t>(0, bound - 1)(rng);
    });
    return builder.build();
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(engine_tests, EngineFixture)

BOOST_AUTO_TEST_CASE(single_candidate_single_nominator)
{
    ElectionData data;
    data.addCandidate(candidate("alice", 1000000000));
    data.addNominator(nominator("nina", 500000000, {"alice"}));

    for (AlgorithmType algorithm : ALL_ALGORITHMS) {
        ElectionResult result = engine.execute(config(algorithm, 1), data);

        BOOST_REQUIRE_EQUAL(result.selectedValidators().size(), 1u);
        const SelectedValidator& winner = result.selectedValidators()[0];
        BOOST_CHECK_EQUAL(winner.accountID, "alice");
        BOOST_CHECK_EQUAL(winner.totalBackingStake, Balance(1500000000));
        BOOST_CHECK_EQUAL(winner.nominatorCount, 1u);
        BOOST_CHECK_EQUAL(*winner.rank, 1u);
        BOOST_CHECK_EQUAL(result.totalStake(), Balance(1500000000));
        BOOST_CHECK(result.algorithmUsed() == algorithm);

        BOOST_REQUIRE_EQUAL(result.stakeDistribution().size(), 2u);
        BOOST_CHECK(result.stakeDistribution()[0].selfStake);
        BOOST_CHECK_EQUAL(result.stakeDistribution()[0].amount, Balance(1000000000));
        BOOST_CHECK(!result.stakeDistribution()[1].selfStake);
        BOOST_CHECK_EQUAL(result.stakeDistribution()[1].nominatorID, "nina");
        BOOST_CHECK_EQUAL(result.stakeDistribution()[1].proportion, 1.0);
    }
}

BOOST_AUTO_TEST_CASE(self_stake_only_election)
{
    ElectionData data;
    data.addCandidate(candidate("low", 100));
    data.addCandidate(candidate("high", 300));
    data.addCandidate(candidate("mid", 200));

    for (AlgorithmType algorithm : ALL_ALGORITHMS) {
        ElectionResult result = engine.execute(config(algorithm, 2), data);

        const std::vector<std::string> expected = {"high", "mid"};
        BOOST_CHECK(winnerIDs(result) == expected);
        BOOST_CHECK_EQUAL(*result.selectedValidators()[0].rank, 1u);
        BOOST_CHECK_EQUAL(*result.selectedValidators()[1].rank, 2u);
        BOOST_CHECK(result.selectedValidators()[0].totalBackingStake >
                    result.selectedValidators()[1].totalBackingStake);
        BOOST_CHECK_EQUAL(result.selectedValidators()[0].nominatorCount, 0u);
        BOOST_CHECK_EQUAL(result.totalStake(), Balance(500));
    }
}

BOOST_AUTO_TEST_CASE(self_stake_ties_follow_ingestion_order)
{
    ElectionData data;
    data.addCandidate(candidate("x", 100));
    data.addCandidate(candidate("y", 100));
    data.addCandidate(candidate("z", 50));

    for (AlgorithmType algorithm : ALL_ALGORITHMS) {
        const std::vector<std::string> expected = {"x", "y"};
        BOOST_CHECK(winnerIDs(engine.execute(config(algorithm, 2), data)) == expected);
    }
}

BOOST_AUTO_TEST_CASE(dangling_target_rejected_before_election)
{
    ElectionData data;
    data.addCandidate(candidate("alice", 100));
    data.addNominator(nominator("nina", 10, {"ghost"}));

    try {
        engine.execute(config(AlgorithmType::SEQUENTIAL_PHRAGMEN, 1), data);
        BOOST_FAIL("dangling target accepted");
    } catch (const ValidationError& e) {
        std::string message = e.what();
        BOOST_CHECK(message.find("non-existent") != std::string::npos);
        BOOST_CHECK(message.find("ghost") != std::string::npos);
        BOOST_CHECK_EQUAL(e.field(), "nominators.targets");
    }
}

BOOST_AUTO_TEST_CASE(stake_override_changes_winner)
{
    ElectionData data;
    data.addCandidate(candidate("big", 1000));
    data.addCandidate(candidate("small", 10));
    data.addNominator(nominator("nina", 50, {"big", "small"}));
    const ElectionData original = data;

    ElectionOverrides overrides;
    overrides.setCandidateStake("small", Balance(5000));

    for (AlgorithmType algorithm : ALL_ALGORITHMS) {
        ElectionConfiguration withOverride = ElectionConfigBuilder()
            .algorithm(algorithm).activeSetSize(1).overrides(overrides).build();

        ElectionResult before = engine.execute(config(algorithm, 1), data);
        ElectionResult overridden = engine.execute(withOverride, data);
        ElectionResult after = engine.execute(config(algorithm, 1), data);

        BOOST_CHECK_EQUAL(before.selectedValidators()[0].accountID, "big");
        BOOST_REQUIRE_EQUAL(overridden.selectedValidators().size(), 1u);
        BOOST_CHECK_EQUAL(overridden.selectedValidators()[0].accountID, "small");
        BOOST_CHECK(data == original);
        BOOST_CHECK(after == before);
    }
}

BOOST_AUTO_TEST_CASE(edge_override_changes_backing)
{
    ElectionData data;
    data.addCandidate(candidate("a", 100));
    data.addCandidate(candidate("b", 100));
    data.addNominator(nominator("nina", 1000, {"a"}));

    ElectionOverrides overrides;
    overrides.removeVotingEdge("nina", "a");
    overrides.addVotingEdge("nina", "b");

    ElectionResult result = engine.execute(
        ElectionConfigBuilder().activeSetSize(1).overrides(overrides).build(), data);
    BOOST_CHECK_EQUAL(result.selectedValidators()[0].accountID, "b");
    BOOST_CHECK_EQUAL(result.selectedValidators()[0].totalBackingStake, Balance(1100));
}

BOOST_AUTO_TEST_CASE(active_set_override_applies)
{
    ElectionData data;
    data.addCandidate(candidate("a", 3));
    data.addCandidate(candidate("b", 2));
    data.addCandidate(candidate("c", 1));

    ElectionOverrides overrides;
    overrides.setActiveSetSize(3);
    ElectionResult result = engine.execute(
        ElectionConfigBuilder().activeSetSize(1).overrides(overrides).build(), data);
    BOOST_CHECK_EQUAL(result.selectedValidators().size(), 3u);
}

BOOST_AUTO_TEST_CASE(override_to_missing_candidate_rejected)
{
    ElectionData data;
    data.addCandidate(candidate("a", 3));
    data.addNominator(nominator("nina", 10, {"a"}));

    ElectionOverrides overrides;
    overrides.addVotingEdge("nina", "ghost");
    BOOST_CHECK_THROW(engine.execute(
        ElectionConfigBuilder().activeSetSize(1).overrides(overrides).build(), data), ValidationError);
}

BOOST_AUTO_TEST_CASE(insufficient_candidates)
{
    ElectionData data;
    for (int i = 0; i < 5; ++i) {
        data.addCandidate(candidate("c" + std::to_string(i), 100));
    }

    for (AlgorithmType algorithm : ALL_ALGORITHMS) {
        try {
            engine.execute(config(algorithm, 10), data);
            BOOST_FAIL("oversized active set accepted");
        } catch (const InsufficientCandidates& e) {
            BOOST_CHECK_EQUAL(e.requested(), 10u);
            BOOST_CHECK_EQUAL(e.available(), 5u);
            BOOST_CHECK_EQUAL(e.code(), "INSUFFICIENT_CANDIDATES");
        }
    }
}

BOOST_AUTO_TEST_CASE(zero_electorate_fails)
{
    ElectionData data;
    data.addCandidate(candidate("a", 0));
    data.addCandidate(candidate("b", 0));

    for (AlgorithmType algorithm : ALL_ALGORITHMS) {
        BOOST_CHECK_THROW(engine.execute(config(algorithm, 1), data), AlgorithmError);
    }
}

BOOST_AUTO_TEST_CASE(deterministic_and_conserving)
{
    ElectionData data = syntheticData(7);

    for (AlgorithmType algorithm : ALL_ALGORITHMS) {
        ElectionResult first = engine.execute(config(algorithm, 10), data);
        ElectionResult second = engine.execute(config(algorithm, 10), data);

        BOOST_CHECK(first == second);
        BOOST_CHECK_EQUAL(first.selectedValidators().size(), 10u);
        BOOST_CHECK_EQUAL(first.allocatedStake(), first.totalStake());

        // Each voter that backs a winner spends its whole stake
        for (const Nominator& n : data.nominators) {
            Balance spent = allocatedBy(first, n.accountID);
            BOOST_CHECK(spent == 0 || spent == n.stake);
        }
        for (const StakeAllocation& allocation : first.stakeDistribution()) {
            BOOST_CHECK(first.isSelected(allocation.validatorID));
            BOOST_CHECK(allocation.amount > 0);
            BOOST_CHECK(allocation.proportion >= 0.0 && allocation.proportion <= 1.0);
        }
    }
}

BOOST_AUTO_TEST_CASE(execution_metadata)
{
    ElectionData data;
    data.addCandidate(candidate("a", 10));
    ElectionMetadata metadata;
    metadata.blockNumber = 77;
    data.metadata = metadata;

    engine.setDataSource("synthetic");
    ElectionResult fromData = engine.execute(config(AlgorithmType::SEQUENTIAL_PHRAGMEN, 1), data);
    BOOST_CHECK_EQUAL(*fromData.executionMetadata().blockNumber, 77u);
    BOOST_CHECK_EQUAL(*fromData.executionMetadata().executionTimestamp, "2026-01-01T00:00:00Z");
    BOOST_CHECK_EQUAL(*fromData.executionMetadata().dataSource, "synthetic");

    ElectionResult fromConfig = engine.execute(
        ElectionConfigBuilder().activeSetSize(1).blockNumber(5).build(), data);
    BOOST_CHECK_EQUAL(*fromConfig.executionMetadata().blockNumber, 5u);
    BOOST_CHECK(fromConfig.sameOutcome(fromData));
}

BOOST_AUTO_TEST_CASE(system_timestamp_format)
{
    std::string stamp = ElectionEngine::systemTimestamp();
    BOOST_CHECK_EQUAL(stamp.size(), 20u);
    BOOST_CHECK_EQUAL(stamp[10], 'T');
    BOOST_CHECK_EQUAL(stamp[19], 'Z');
    BOOST_CHECK_EQUAL(stamp[4], '-');
    BOOST_CHECK_EQUAL(stamp[13], ':');
    BOOST_CHECK(stamp.substr(0, 2) == "20");
}

BOOST_AUTO_TEST_CASE(assembler_gates)
{
    std::vector<SelectedValidator> validators(1);
    validators[0].accountID = "a";
    validators[0].totalBackingStake = 10;

    std::vector<StakeAllocation> allocations(1);
    allocations[0].nominatorID = "a";
    allocations[0].validatorID = "a";
    allocations[0].amount = 9;

    ResultAssembler assembler(AlgorithmType::SEQUENTIAL_PHRAGMEN);
    ElectionResult leaking(validators, allocations, Balance(10), AlgorithmType::SEQUENTIAL_PHRAGMEN);
    BOOST_CHECK_THROW(assembler.validate(leaking, 1), AlgorithmError);

    allocations[0].amount = 10;
    ElectionResult balanced(validators, allocations, Balance(10), AlgorithmType::SEQUENTIAL_PHRAGMEN);
    BOOST_CHECK_NO_THROW(assembler.validate(balanced, 1));
    BOOST_CHECK_THROW(assembler.validate(balanced, 2), AlgorithmError);

    BOOST_CHECK_EQUAL(ResultAssembler::proportionOf(Balance(1), Balance(3)), 0.333333333);
    BOOST_CHECK_EQUAL(ResultAssembler::proportionOf(Balance(5), Balance(0)), 0.0);
}

BOOST_AUTO_TEST_SUITE_END()
