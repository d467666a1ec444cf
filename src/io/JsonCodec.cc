#include "JsonCodec.h"
#include "../common/ElectionError.h"
#include <fstream>
#include <sstream>
#include <memory>

namespace nposim {

// ============================================================================
// HELPERS
// ============================================================================

Balance JsonCodec::readBalance(const Json::Value& value, const std::string& field) {
    if (value.isString()) {
        return parseBalance(value.asString(), field);
    }
    if (value.isUInt64()) {
        return Balance(value.asUInt64());
    }
    throw InvalidData("Field '" + field + "' must be a decimal string or unsigned integer");
}

const Json::Value& JsonCodec::require(const Json::Value& object, const char* key, const std::string& context) {
    if (!object.isObject()) {
        throw InvalidData(context + " must be an object");
    }
    if (!object.isMember(key)) {
        throw InvalidData(context + " is missing field '" + key + "'");
    }
    return object[key];
}

std::string JsonCodec::readString(const Json::Value& object, const char* key, const std::string& context) {
    const Json::Value& value = require(object, key, context);
    if (!value.isString()) {
        throw InvalidData(context + "." + key + " must be a string");
    }
    return value.asString();
}

namespace {

const Json::Value& requireArray(const Json::Value& value, const std::string& context) {
    if (!value.isArray()) {
        throw InvalidData(context + " must be an array");
    }
    return value;
}

uint64_t readUnsigned(const Json::Value& value, const std::string& context) {
    if (!value.isUInt64()) {
        throw InvalidData(context + " must be an unsigned integer");
    }
    return value.asUInt64();
}

uint32_t readUnsigned32(const Json::Value& value, const std::string& context) {
    if (!value.isUInt()) {
        throw InvalidData(context + " must be an unsigned 32-bit integer");
    }
    return value.asUInt();
}

} // namespace

// ============================================================================
// DATASET
// ============================================================================

Json::Value JsonCodec::toJson(const ElectionData& data) {
    Json::Value root(Json::objectValue);

    Json::Value candidates(Json::arrayValue);
    for (const Candidate& candidate : data.candidates) {
        Json::Value entry(Json::objectValue);
        entry["account_id"] = candidate.accountID;
        entry["stake"] = balanceToString(candidate.stake);
        if (candidate.metadata) {
            Json::Value metadata(Json::objectValue);
            if (candidate.metadata->commissionRate) {
                metadata["commission_rate"] = static_cast<Json::UInt>(*candidate.metadata->commissionRate);
            }
            if (candidate.metadata->onChainStatus) {
                metadata["on_chain_status"] = *candidate.metadata->onChainStatus;
            }
            entry["metadata"] = metadata;
        }
        candidates.append(entry);
    }
    root["candidates"] = candidates;

    Json::Value nominators(Json::arrayValue);
    for (const Nominator& nominator : data.nominators) {
        Json::Value entry(Json::objectValue);
        entry["account_id"] = nominator.accountID;
        entry["stake"] = balanceToString(nominator.stake);
        Json::Value targets(Json::arrayValue);
        for (const AccountID& target : nominator.targets) {
            targets.append(target);
        }
        entry["targets"] = targets;
        if (nominator.metadata) {
            Json::Value metadata(Json::objectValue);
            for (const auto& item : *nominator.metadata) {
                metadata[item.first] = item.second;
            }
            entry["metadata"] = metadata;
        }
        nominators.append(entry);
    }
    root["nominators"] = nominators;

    if (data.metadata) {
        Json::Value metadata(Json::objectValue);
        if (data.metadata->blockNumber) {
            metadata["block_number"] = static_cast<Json::UInt64>(*data.metadata->blockNumber);
        }
        if (data.metadata->chain) {
            metadata["chain"] = *data.metadata->chain;
        }
        root["metadata"] = metadata;
    }

    return root;
}

ElectionData JsonCodec::dataFromJson(const Json::Value& value) {
    ElectionData data;

    const Json::Value& candidates = requireArray(require(value, "candidates", "dataset"), "candidates");
    for (const Json::Value& entry : candidates) {
        Candidate candidate(readString(entry, "account_id", "candidate"),
                            readBalance(require(entry, "stake", "candidate"), "candidates.stake"));
        if (entry.isMember("metadata")) {
            const Json::Value& raw = entry["metadata"];
            if (!raw.isObject()) {
                throw InvalidData("candidate.metadata must be an object");
            }
            CandidateMetadata metadata;
            if (raw.isMember("commission_rate")) {
                uint32_t rate = readUnsigned32(raw["commission_rate"], "candidate.metadata.commission_rate");
                if (rate > 100) {
                    throw ValidationError("Commission rate must be between 0 and 100",
                                          "candidates.metadata.commission_rate");
                }
                metadata.commissionRate = static_cast<uint8_t>(rate);
            }
            if (raw.isMember("on_chain_status")) {
                metadata.onChainStatus = readString(raw, "on_chain_status", "candidate.metadata");
            }
            candidate.metadata = metadata;
        }
        data.addCandidate(candidate);
    }

    if (value.isMember("nominators")) {
        const Json::Value& nominators = requireArray(value["nominators"], "nominators");
        for (const Json::Value& entry : nominators) {
            Nominator nominator(readString(entry, "account_id", "nominator"),
                                readBalance(require(entry, "stake", "nominator"), "nominators.stake"));
            if (entry.isMember("targets")) {
                for (const Json::Value& target : requireArray(entry["targets"], "nominator.targets")) {
                    if (!target.isString()) {
                        throw InvalidData("nominator.targets entries must be strings");
                    }
                    nominator.addTarget(target.asString());
                }
            }
            if (entry.isMember("metadata")) {
                const Json::Value& raw = entry["metadata"];
                if (!raw.isObject()) {
                    throw InvalidData("nominator.metadata must be an object");
                }
                std::map<std::string, std::string> metadata;
                for (const std::string& key : raw.getMemberNames()) {
                    metadata[key] = raw[key].isString() ? raw[key].asString() : write(raw[key]);
                }
                nominator.metadata = metadata;
            }
            data.addNominator(nominator);
        }
    }

    if (value.isMember("metadata")) {
        const Json::Value& raw = value["metadata"];
        if (!raw.isObject()) {
            throw InvalidData("dataset.metadata must be an object");
        }
        ElectionMetadata metadata;
        if (raw.isMember("block_number")) {
            metadata.blockNumber = readUnsigned(raw["block_number"], "metadata.block_number");
        }
        if (raw.isMember("chain")) {
            metadata.chain = readString(raw, "chain", "metadata");
        }
        data.metadata = metadata;
    }

    return data;
}

// ============================================================================
// CONFIGURATION
// ============================================================================

Json::Value JsonCodec::toJson(const ElectionOverrides& overrides) {
    Json::Value root(Json::objectValue);

    if (!overrides.candidateStakes().empty()) {
        Json::Value stakes(Json::objectValue);
        for (const auto& item : overrides.candidateStakes()) {
            stakes[item.first] = balanceToString(item.second);
        }
        root["candidate_stakes"] = stakes;
    }
    if (!overrides.nominatorStakes().empty()) {
        Json::Value stakes(Json::objectValue);
        for (const auto& item : overrides.nominatorStakes()) {
            stakes[item.first] = balanceToString(item.second);
        }
        root["nominator_stakes"] = stakes;
    }
    if (!overrides.votingEdges().empty()) {
        Json::Value edges(Json::arrayValue);
        for (const EdgeModification& modification : overrides.votingEdges()) {
            Json::Value entry(Json::objectValue);
            entry["action"] = edgeActionName(modification.action);
            entry["nominator_id"] = modification.nominatorID;
            entry["candidate_id"] = modification.candidateID;
            if (modification.weight) {
                entry["weight"] = balanceToString(*modification.weight);
            }
            edges.append(entry);
        }
        root["voting_edges"] = edges;
    }
    if (overrides.activeSetSize()) {
        root["active_set_size"] = static_cast<Json::UInt>(*overrides.activeSetSize());
    }

    return root;
}

ElectionOverrides JsonCodec::overridesFromJson(const Json::Value& value) {
    if (!value.isObject()) {
        throw InvalidData("overrides must be an object");
    }
    ElectionOverrides overrides;

    if (value.isMember("candidate_stakes")) {
        const Json::Value& stakes = value["candidate_stakes"];
        if (!stakes.isObject()) {
            throw InvalidData("overrides.candidate_stakes must be an object");
        }
        for (const std::string& key : stakes.getMemberNames()) {
            overrides.setCandidateStake(key, readBalance(stakes[key], "overrides.candidate_stakes"));
        }
    }
    if (value.isMember("nominator_stakes")) {
        const Json::Value& stakes = value["nominator_stakes"];
        if (!stakes.isObject()) {
            throw InvalidData("overrides.nominator_stakes must be an object");
        }
        for (const std::string& key : stakes.getMemberNames()) {
            overrides.setNominatorStake(key, readBalance(stakes[key], "overrides.nominator_stakes"));
        }
    }
    if (value.isMember("voting_edges")) {
        for (const Json::Value& entry : requireArray(value["voting_edges"], "overrides.voting_edges")) {
            EdgeModification modification(parseEdgeAction(readString(entry, "action", "voting_edge")),
                                          readString(entry, "nominator_id", "voting_edge"),
                                          readString(entry, "candidate_id", "voting_edge"));
            if (entry.isMember("weight")) {
                modification.weight = readBalance(entry["weight"], "overrides.voting_edges.weight");
            }
            overrides.addEdgeModification(modification);
        }
    }
    if (value.isMember("active_set_size")) {
        overrides.setActiveSetSize(readUnsigned32(value["active_set_size"], "overrides.active_set_size"));
    }

    return overrides;
}

Json::Value JsonCodec::toJson(const ElectionConfiguration& config) {
    Json::Value root(Json::objectValue);
    root["algorithm"] = algorithmName(config.algorithm());
    root["active_set_size"] = static_cast<Json::UInt>(config.activeSetSize());
    if (config.overrides()) {
        root["overrides"] = toJson(*config.overrides());
    }
    if (config.blockNumber()) {
        root["block_number"] = static_cast<Json::UInt64>(*config.blockNumber());
    }
    Json::Value balancing(Json::objectValue);
    balancing["iterations"] = config.balancing().iterations;
    balancing["tolerance"] = balanceToString(config.balancing().tolerance);
    root["balancing"] = balancing;
    return root;
}

ElectionConfiguration JsonCodec::configFromJson(const Json::Value& value) {
    ElectionConfigBuilder builder;
    builder.algorithm(readString(value, "algorithm", "configuration"));
    builder.activeSetSize(readUnsigned32(require(value, "active_set_size", "configuration"),
                                         "configuration.active_set_size"));
    if (value.isMember("overrides")) {
        builder.overrides(overridesFromJson(value["overrides"]));
    }
    if (value.isMember("block_number")) {
        builder.blockNumber(readUnsigned(value["block_number"], "configuration.block_number"));
    }
    if (value.isMember("balancing")) {
        const Json::Value& raw = value["balancing"];
        if (!raw.isObject()) {
            throw InvalidData("configuration.balancing must be an object");
        }
        BalancingConfig balancing;
        if (raw.isMember("iterations")) {
            if (!raw["iterations"].isInt()) {
                throw InvalidData("balancing.iterations must be an integer");
            }
            balancing.iterations = raw["iterations"].asInt();
        }
        if (raw.isMember("tolerance")) {
            balancing.tolerance = readBalance(raw["tolerance"], "balancing.tolerance");
        }
        builder.balancing(balancing);
    }
    return builder.build();
}

// ============================================================================
// RESULT
// ============================================================================

Json::Value JsonCodec::toJson(const ElectionResult& result) {
    Json::Value root(Json::objectValue);

    Json::Value validators(Json::arrayValue);
    for (const SelectedValidator& validator : result.selectedValidators()) {
        Json::Value entry(Json::objectValue);
        entry["account_id"] = validator.accountID;
        entry["total_backing_stake"] = balanceToString(validator.totalBackingStake);
        entry["nominator_count"] = static_cast<Json::UInt>(validator.nominatorCount);
        if (validator.rank) {
            entry["rank"] = static_cast<Json::UInt>(*validator.rank);
        }
        validators.append(entry);
    }
    root["selected_validators"] = validators;

    Json::Value distribution(Json::arrayValue);
    for (const StakeAllocation& allocation : result.stakeDistribution()) {
        Json::Value entry(Json::objectValue);
        entry["nominator_id"] = allocation.nominatorID;
        entry["validator_id"] = allocation.validatorID;
        entry["amount"] = balanceToString(allocation.amount);
        entry["proportion"] = allocation.proportion;
        if (allocation.selfStake) {
            entry["self_stake"] = true;
        }
        distribution.append(entry);
    }
    root["stake_distribution"] = distribution;

    root["total_stake"] = balanceToString(result.totalStake());
    root["algorithm_used"] = algorithmName(result.algorithmUsed());

    Json::Value metadata(Json::objectValue);
    const ExecutionMetadata& execution = result.executionMetadata();
    if (execution.blockNumber) {
        metadata["block_number"] = static_cast<Json::UInt64>(*execution.blockNumber);
    }
    if (execution.executionTimestamp) {
        metadata["execution_timestamp"] = *execution.executionTimestamp;
    }
    if (execution.dataSource) {
        metadata["data_source"] = *execution.dataSource;
    }
    root["execution_metadata"] = metadata;

    return root;
}

ElectionResult JsonCodec::resultFromJson(const Json::Value& value) {
    std::vector<SelectedValidator> validators;
    for (const Json::Value& entry : requireArray(require(value, "selected_validators", "result"),
                                                 "selected_validators")) {
        SelectedValidator validator;
        validator.accountID = readString(entry, "account_id", "selected_validator");
        validator.totalBackingStake = readBalance(require(entry, "total_backing_stake", "selected_validator"),
                                                  "selected_validators.total_backing_stake");
        validator.nominatorCount = readUnsigned32(require(entry, "nominator_count", "selected_validator"),
                                                  "selected_validator.nominator_count");
        if (entry.isMember("rank")) {
            validator.rank = readUnsigned32(entry["rank"], "selected_validator.rank");
        }
        validators.push_back(validator);
    }

    std::vector<StakeAllocation> distribution;
    for (const Json::Value& entry : requireArray(require(value, "stake_distribution", "result"),
                                                 "stake_distribution")) {
        StakeAllocation allocation;
        allocation.nominatorID = readString(entry, "nominator_id", "stake_allocation");
        allocation.validatorID = readString(entry, "validator_id", "stake_allocation");
        allocation.amount = readBalance(require(entry, "amount", "stake_allocation"), "stake_distribution.amount");
        const Json::Value& proportion = require(entry, "proportion", "stake_allocation");
        if (!proportion.isNumeric()) {
            throw InvalidData("stake_allocation.proportion must be a number");
        }
        allocation.proportion = proportion.asDouble();
        if (entry.isMember("self_stake")) {
            if (!entry["self_stake"].isBool()) {
                throw InvalidData("stake_allocation.self_stake must be a boolean");
            }
            allocation.selfStake = entry["self_stake"].asBool();
        }
        distribution.push_back(allocation);
    }

    ExecutionMetadata metadata;
    if (value.isMember("execution_metadata")) {
        const Json::Value& raw = value["execution_metadata"];
        if (!raw.isObject()) {
            throw InvalidData("execution_metadata must be an object");
        }
        if (raw.isMember("block_number")) {
            metadata.blockNumber = readUnsigned(raw["block_number"], "execution_metadata.block_number");
        }
        if (raw.isMember("execution_timestamp")) {
            metadata.executionTimestamp = readString(raw, "execution_timestamp", "execution_metadata");
        }
        if (raw.isMember("data_source")) {
            metadata.dataSource = readString(raw, "data_source", "execution_metadata");
        }
    }

    return ElectionResult(validators, distribution,
                          readBalance(require(value, "total_stake", "result"), "total_stake"),
                          parseAlgorithm(readString(value, "algorithm_used", "result")),
                          metadata);
}

// ============================================================================
// TEXT AND FILES
// ============================================================================

Json::Value JsonCodec::parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw InvalidData("Malformed JSON: " + errors);
    }
    return root;
}

std::string JsonCodec::write(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

ElectionData JsonCodec::loadDataFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidData("Cannot open dataset file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    ElectionData data = dataFromJson(parse(buffer.str()));
    data.validate();
    return data;
}

void JsonCodec::saveDataFile(const ElectionData& data, const std::string& path) {
    writeTextFile(write(toJson(data)) + "\n", path);
}

void JsonCodec::writeResultFile(const ElectionResult& result, const std::string& path) {
    writeTextFile(write(toJson(result)) + "\n", path);
}

void JsonCodec::writeTextFile(const std::string& text, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw InvalidData("Cannot open '" + path + "' for writing");
    }
    out << text;
    if (!out) {
        throw InvalidData("Failed writing '" + path + "'");
    }
}

} // namespace nposim
