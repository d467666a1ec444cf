#include <boost/test/unit_test.hpp>

#include "test_nposim.h"
#include "../common/ElectionError.h"

using namespace nposim;
using nposim::test::candidate;
using nposim::test::nominator;

namespace {

ElectionData sampleData()
{
    ElectionData data;
    data.addCandidate(candidate("alice", 1000));
    data.addCandidate(candidate("bob", 500));
    data.addCandidate(candidate("carol", 10));
    data.addNominator(nominator("nina", 300, {"alice", "bob"}));
    data.addNominator(nominator("oscar", 200, {"bob"}));
    return data;
}

} // namespace

BOOST_AUTO_TEST_SUITE(overrides_tests)

BOOST_AUTO_TEST_CASE(stake_directives)
{
    auto parsed = ElectionOverrides::parseStakeDirective(" carol = 5000 ", "candidate");
    BOOST_CHECK_EQUAL(parsed.first, "carol");
    BOOST_CHECK_EQUAL(parsed.second, Balance(5000));

    try {
        ElectionOverrides::parseStakeDirective("carol:5000", "candidate");
        BOOST_FAIL("malformed directive accepted");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.field(), "override_candidate_stake");
    }

    try {
        ElectionOverrides::parseStakeDirective("nina=lots", "nominator");
        BOOST_FAIL("non-numeric stake accepted");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.field(), "override_nominator_stake");
    }

    BOOST_CHECK_THROW(ElectionOverrides::parseStakeDirective("=10", "candidate"), ValidationError);
    BOOST_CHECK_THROW(ElectionOverrides::parseStakeDirective("a=1=2", "candidate"), ValidationError);
}

BOOST_AUTO_TEST_CASE(edge_directives)
{
    EdgeModification add = ElectionOverrides::parseEdgeDirective("add:nina=carol");
    BOOST_CHECK(add.action == EdgeAction::ADD);
    BOOST_CHECK_EQUAL(add.nominatorID, "nina");
    BOOST_CHECK_EQUAL(add.candidateID, "carol");

    BOOST_CHECK(ElectionOverrides::parseEdgeDirective("Remove:nina=alice").action == EdgeAction::REMOVE);
    BOOST_CHECK(ElectionOverrides::parseEdgeDirective("replace:nina=alice").action == EdgeAction::MODIFY);

    try {
        ElectionOverrides::parseEdgeDirective("swap:nina=alice");
        BOOST_FAIL("unknown action accepted");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.field(), "override_voting_edge");
    }
    BOOST_CHECK_THROW(ElectionOverrides::parseEdgeDirective("add nina=alice"), ValidationError);
    BOOST_CHECK_THROW(ElectionOverrides::parseEdgeDirective("add:nina="), ValidationError);
}

BOOST_AUTO_TEST_CASE(apply_leaves_input_untouched)
{
    const ElectionData original = sampleData();
    ElectionData input = original;

    ElectionOverrides overrides;
    overrides.setCandidateStake("carol", Balance(5000));
    overrides.setNominatorStake("oscar", Balance(1));
    overrides.addVotingEdge("oscar", "carol");
    overrides.removeVotingEdge("nina", "alice");

    ElectionData working = overrides.applyTo(input);

    BOOST_CHECK(input == original);
    BOOST_CHECK_EQUAL(working.findCandidate("carol")->stake, Balance(5000));
    BOOST_CHECK_EQUAL(working.findNominator("oscar")->stake, Balance(1));
    BOOST_CHECK(working.findNominator("oscar")->hasTarget("carol"));
    BOOST_CHECK(!working.findNominator("nina")->hasTarget("alice"));
    BOOST_CHECK(working.findNominator("nina")->hasTarget("bob"));
}

BOOST_AUTO_TEST_CASE(unknown_ids_skipped)
{
    ElectionOverrides overrides;
    overrides.setCandidateStake("zed", Balance(1));
    overrides.setNominatorStake("nobody", Balance(1));
    overrides.addVotingEdge("nobody", "alice");

    const ElectionData data = sampleData();
    BOOST_CHECK(overrides.applyTo(data) == data);
}

BOOST_AUTO_TEST_CASE(edits_apply_in_order)
{
    ElectionOverrides overrides;
    overrides.addVotingEdge("oscar", "carol");
    overrides.removeVotingEdge("oscar", "carol");
    overrides.addVotingEdge("oscar", "alice");

    ElectionData working = overrides.applyTo(sampleData());
    const std::vector<AccountID> expected = {"bob", "alice"};
    BOOST_CHECK(working.findNominator("oscar")->targets == expected);
}

BOOST_AUTO_TEST_CASE(modify_keeps_approval_list)
{
    ElectionOverrides overrides;
    overrides.modifyVotingEdge("nina", "alice", Balance(10));

    const ElectionData data = sampleData();
    ElectionData working = overrides.applyTo(data);
    BOOST_CHECK(working.findNominator("nina")->targets == data.findNominator("nina")->targets);

    // Modifying an absent edge adds it
    ElectionOverrides absent;
    absent.modifyVotingEdge("oscar", "carol");
    BOOST_CHECK(absent.applyTo(data).findNominator("oscar")->hasTarget("carol"));
}

BOOST_AUTO_TEST_CASE(edge_to_missing_candidate_fails_validation)
{
    ElectionOverrides overrides;
    overrides.addVotingEdge("nina", "ghost");

    ElectionData working = overrides.applyTo(sampleData());
    try {
        working.validate();
        BOOST_FAIL("dangling override accepted");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.field(), "nominators.targets");
    }
}

BOOST_AUTO_TEST_CASE(empty_overrides)
{
    ElectionOverrides overrides;
    BOOST_CHECK(overrides.empty());
    overrides.setActiveSetSize(3);
    BOOST_CHECK(!overrides.empty());
}

BOOST_AUTO_TEST_SUITE_END()
