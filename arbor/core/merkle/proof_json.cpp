// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof_json.hpp"

#include <stdexcept>
#include <string>

#include <arbor/core/common/util.hpp>

namespace arbor::merkle {

namespace {

    constexpr std::string_view kLeft{"left"};
    constexpr std::string_view kRight{"right"};

}  // namespace

void to_json(nlohmann::json& json, const ProofStep& step) {
    json["hash"] = to_hex(step.hash, /*with_prefix=*/true);
    json["direction"] = std::string{step.direction == ProofDirection::kLeft ? kLeft : kRight};
}

void from_json(const nlohmann::json& json, ProofStep& step) {
    const auto hex = json.at("hash").get<std::string>();
    auto hash{from_hex(hex)};
    if (!hash) {
        throw std::invalid_argument{"step hash is not valid hex: " + hex};
    }
    const auto direction = json.at("direction").get<std::string>();
    if (direction != kLeft && direction != kRight) {
        throw std::invalid_argument{"unknown step direction: " + direction};
    }
    step = ProofStep{
        .hash = std::move(*hash),
        .direction = direction == kLeft ? ProofDirection::kLeft : ProofDirection::kRight};
}

void to_json(nlohmann::json& json, const MerkleProof& proof) {
    json["leafIndex"] = proof.leaf_index;
    json["steps"] = proof.steps;
}

void from_json(const nlohmann::json& json, MerkleProof& proof) {
    // get<uint64_t>() would wrap negative numbers and truncate fractional ones
    const auto& leaf_index = json.at("leafIndex");
    if (!leaf_index.is_number_unsigned()) {
        throw std::invalid_argument{"leaf index is not an unsigned integer: " + leaf_index.dump()};
    }
    proof = MerkleProof{
        .leaf_index = leaf_index.get<uint64_t>(),
        .steps = json.at("steps").get<std::vector<ProofStep>>()};
}

nlohmann::json proof_to_json(const MerkleProof& proof) {
    return proof;
}

Result<MerkleProof> proof_from_json(const nlohmann::json& json) {
    try {
        return json.get<MerkleProof>();
    } catch (const nlohmann::json::exception& ex) {
        return tl::unexpected{Error::serialization_error(ex.what())};
    } catch (const std::invalid_argument& ex) {
        return tl::unexpected{Error::serialization_error(ex.what())};
    }
}

Result<MerkleProof> parse_proof(std::string_view text) {
    const auto json = nlohmann::json::parse(text, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        return tl::unexpected{Error::serialization_error("malformed JSON document")};
    }
    return proof_from_json(json);
}

}  // namespace arbor::merkle
