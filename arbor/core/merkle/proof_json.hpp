// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include <arbor/core/common/error.hpp>
#include <arbor/core/merkle/proof.hpp>

namespace arbor::merkle {

void to_json(nlohmann::json& json, const ProofStep& step);
void from_json(const nlohmann::json& json, ProofStep& step);

void to_json(nlohmann::json& json, const MerkleProof& proof);
void from_json(const nlohmann::json& json, MerkleProof& proof);

nlohmann::json proof_to_json(const MerkleProof& proof);

//! \brief Decodes a proof from its JSON form
//! \return kSerializationError when fields are missing, mistyped or not valid hex
Result<MerkleProof> proof_from_json(const nlohmann::json& json);

//! \brief Parses text and decodes a proof from it
Result<MerkleProof> parse_proof(std::string_view text);

}  // namespace arbor::merkle
