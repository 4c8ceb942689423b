// Copyright 2025 The Arbor Authors
// SPDX-License-Identifier: Apache-2.0

#include "sparse_tree.hpp"

#include <limits>
#include <string>
#include <vector>

#include <absl/strings/match.h>
#include <catch2/catch.hpp>

#include <arbor/core/common/empty_hashes.hpp>
#include <arbor/core/common/util.hpp>
#include <arbor/core/crypto/sha256.hpp>
#include <arbor/core/crypto/sha3.hpp>
#include <arbor/core/merkle/binary_tree.hpp>
#include <arbor/infra/test_util/log.hpp>

namespace arbor::merkle {

static ByteView as_bytes(std::string_view s) { return string_view_to_byte_view(s); }

static SparseMerkleTree make_tree(size_t depth) {
    auto tree = SparseMerkleTree::create(depth, std::make_shared<crypto::Sha256Hasher>());
    REQUIRE(tree);
    return std::move(*tree);
}

static Bytes empty_root(const crypto::Hasher& hasher, size_t depth) {
    Bytes node(hasher.output_size(), uint8_t{0});
    for (size_t level{0}; level < depth; ++level) {
        node = hasher.hash_pair(node, node);
    }
    return node;
}

TEST_CASE("SparseMerkleTree create", "[arbor][merkle][sparse_tree]") {
    const auto hasher{std::make_shared<crypto::Sha256Hasher>()};

    for (const size_t depth : {size_t{0}, size_t{65}}) {
        const auto tree = SparseMerkleTree::create(depth, hasher);
        REQUIRE_FALSE(tree);
        CHECK(tree.error().code == ErrorCode::kTreeConstructionError);
    }
    CHECK(SparseMerkleTree::create(0, hasher).error().to_string() ==
          "Tree construction failed: Invalid depth: 0. Must be between 1 and 64");
    CHECK_FALSE(SparseMerkleTree::create(8, nullptr));

    for (const size_t depth : {kMinSparseDepth, size_t{16}, kMaxSparseDepth}) {
        auto tree = SparseMerkleTree::create(depth, hasher);
        REQUIRE(tree);
        CHECK(tree->depth() == depth);
        CHECK(tree->empty());
        CHECK(tree->size() == 0);
        CHECK(tree->capacity() == intx::uint128{1} << depth);
        CHECK(tree->default_hash() == ByteView{kDefaultHash});
        CHECK(tree->root() == ByteView{empty_root(*hasher, depth)});
    }
}

TEST_CASE("SparseMerkleTree root follows the leaves", "[arbor][merkle][sparse_tree]") {
    const crypto::Sha256Hasher hasher;
    auto tree{make_tree(2)};
    REQUIRE(tree.update(2, as_bytes("v")));

    const Bytes zero(32, uint8_t{0});
    const Bytes expected{hasher.hash_pair(hasher.hash_pair(zero, zero),
                                          hasher.hash_pair(hasher.hash(as_bytes("v")), zero))};
    CHECK(tree.root() == ByteView{expected});
}

TEST_CASE("SparseMerkleTree matches a full binary tree", "[arbor][merkle][sparse_tree]") {
    const auto hasher{std::make_shared<crypto::Sha256Hasher>()};
    std::vector<std::string> items;
    auto sparse = SparseMerkleTree::create(3, hasher);
    REQUIRE(sparse);
    for (uint64_t i{0}; i < 8; ++i) {
        items.push_back("value_" + std::to_string(i));
        REQUIRE(sparse->update(i, as_bytes(items.back())));
    }
    const auto binary = BinaryMerkleTree::build(items, hasher);
    REQUIRE(binary);
    CHECK(sparse->root() == binary->root());

    const auto sparse_proof = sparse->generate_proof(5);
    const auto binary_proof = binary->generate_proof(5);
    REQUIRE(sparse_proof);
    REQUIRE(binary_proof);
    CHECK(*sparse_proof == *binary_proof);
}

TEST_CASE("SparseMerkleTree update and remove", "[arbor][merkle][sparse_tree]") {
    const crypto::Sha256Hasher hasher;
    auto tree{make_tree(4)};
    const Bytes initial_root{tree.root()};

    REQUIRE(tree.update(3, as_bytes("three")));
    CHECK(tree.contains(3));
    CHECK_FALSE(tree.contains(4));
    CHECK(tree.size() == 1);
    REQUIRE(tree.get(3));
    CHECK(*tree.get(3) == ByteView{hasher.hash(as_bytes("three"))});
    CHECK_FALSE(tree.get(4));
    CHECK(tree.root() != ByteView{initial_root});

    SECTION("overwrite") {
        const Bytes first_root{tree.root()};
        REQUIRE(tree.update(3, as_bytes("tres")));
        CHECK(tree.size() == 1);
        CHECK(tree.root() != ByteView{first_root});
        REQUIRE(tree.update(3, as_bytes("three")));
        CHECK(tree.root() == ByteView{first_root});
    }

    SECTION("idempotent remove") {
        const auto removed = tree.remove(3);
        REQUIRE(removed);
        CHECK(*removed);
        CHECK(tree.root() == ByteView{initial_root});

        const auto removed_again = tree.remove(3);
        REQUIRE(removed_again);
        CHECK_FALSE(*removed_again);
        CHECK(tree.root() == ByteView{initial_root});
        CHECK(tree.empty());
    }

    SECTION("clear") {
        REQUIRE(tree.update(9, as_bytes("nine")));
        tree.clear();
        CHECK(tree.empty());
        CHECK(tree.cached_node_count() == 0);
        CHECK(tree.root() == ByteView{initial_root});
    }
}

TEST_CASE("SparseMerkleTree removal restores the empty root", "[arbor][merkle][sparse_tree]") {
    const crypto::Sha256Hasher hasher;
    auto tree{make_tree(4)};
    const Bytes empty{tree.root()};
    CHECK(empty == empty_root(hasher, 4));

    REQUIRE(tree.update(0, as_bytes("test")));
    CHECK(tree.root() != ByteView{empty});

    const auto removed = tree.remove(0);
    REQUIRE(removed);
    CHECK(*removed);
    CHECK(tree.root() == ByteView{empty});
}

TEST_CASE("SparseMerkleTree leaf listing", "[arbor][merkle][sparse_tree]") {
    const crypto::Sha256Hasher hasher;
    auto tree{make_tree(8)};
    for (const uint64_t index : {200u, 3u, 77u, 0u}) {
        REQUIRE(tree.update(index, as_bytes(std::to_string(index))));
    }
    CHECK(tree.leaf_indices() == std::vector<uint64_t>{0, 3, 77, 200});

    const auto leaves{tree.leaves()};
    REQUIRE(leaves.size() == 4);
    CHECK(leaves[2].first == 77);
    CHECK(leaves[2].second == hasher.hash(as_bytes("77")));
}

TEST_CASE("SparseMerkleTree membership proofs", "[arbor][merkle][sparse_tree]") {
    auto tree{make_tree(16)};
    const std::vector<uint64_t> indices{0, 100, 5000, 10000, 65535};
    for (const uint64_t index : indices) {
        REQUIRE(tree.update(index, as_bytes("value_" + std::to_string(index))));
    }

    for (const uint64_t index : indices) {
        const auto proof = tree.generate_proof(index);
        REQUIRE(proof);
        CHECK(proof->size() == 16);
        CHECK(tree.validate_proof(*proof));
        CHECK(tree.verify_proof(*proof, index, as_bytes("value_" + std::to_string(index))));
        CHECK_FALSE(tree.verify_proof(*proof, index, as_bytes("other")));
        CHECK_FALSE(tree.verify_non_membership(*proof, index));
    }

    SECTION("proof must match the queried index") {
        const auto proof = tree.generate_proof(100);
        REQUIRE(proof);
        CHECK_FALSE(tree.verify_proof(*proof, 101, as_bytes("value_100")));
    }

    SECTION("stored digest") {
        const auto proof = tree.generate_proof(5000);
        REQUIRE(proof);
        const auto digest = tree.get(5000);
        REQUIRE(digest);
        CHECK(tree.verify_leaf_hash(*proof, 5000, *digest));
    }
}

TEST_CASE("SparseMerkleTree non-membership proofs", "[arbor][merkle][sparse_tree]") {
    auto tree{make_tree(16)};
    for (const uint64_t index : {0u, 100u, 5000u, 10000u, 65535u}) {
        REQUIRE(tree.update(index, as_bytes("x")));
    }

    for (const uint64_t index : {1u, 99u, 101u, 4096u, 65534u}) {
        const auto proof = tree.generate_proof(index);
        REQUIRE(proof);
        CHECK(proof->size() == 16);
        CHECK(tree.verify_proof(*proof, index, ByteView{kDefaultHash}));
        CHECK(tree.verify_non_membership(*proof, index));
        CHECK_FALSE(tree.verify_proof(*proof, index, as_bytes("x")));
    }

    SECTION("empty tree") {
        auto empty{make_tree(4)};
        for (uint64_t index{0}; index < 16; ++index) {
            const auto proof = empty.generate_proof(index);
            REQUIRE(proof);
            CHECK(empty.verify_non_membership(*proof, index));
        }
    }
}

TEST_CASE("SparseMerkleTree depth 64", "[arbor][merkle][sparse_tree]") {
    auto tree{make_tree(64)};
    constexpr uint64_t kMax{std::numeric_limits<uint64_t>::max()};
    const std::vector<uint64_t> indices{0, 1, uint64_t{1} << 63, kMax};
    for (const uint64_t index : indices) {
        REQUIRE(tree.update(index, as_bytes(std::to_string(index))));
    }
    CHECK(tree.capacity() == intx::uint128{1} << 64);

    for (const uint64_t index : indices) {
        const auto proof = tree.generate_proof(index);
        REQUIRE(proof);
        CHECK(proof->size() == 64);
        CHECK(tree.verify_proof(*proof, index, as_bytes(std::to_string(index))));
    }

    const auto absent = tree.generate_proof(12345);
    REQUIRE(absent);
    CHECK(tree.verify_non_membership(*absent, 12345));

    const auto removed = tree.remove(kMax);
    REQUIRE(removed);
    CHECK(*removed);
    const auto proof = tree.generate_proof(kMax);
    REQUIRE(proof);
    CHECK(tree.verify_non_membership(*proof, kMax));
}

TEST_CASE("SparseMerkleTree index out of range", "[arbor][merkle][sparse_tree]") {
    auto tree{make_tree(8)};

    const auto updated = tree.update(256, as_bytes("x"));
    REQUIRE_FALSE(updated);
    CHECK(updated.error() == Error::invalid_index(256, 256));
    CHECK(updated.error().to_string() == "Invalid index: 256, tree size: 256");

    const auto proof = tree.generate_proof(1000);
    REQUIRE_FALSE(proof);
    CHECK(proof.error().code == ErrorCode::kInvalidIndex);

    const auto removed = tree.remove(256);
    REQUIRE(removed);
    CHECK_FALSE(*removed);

    CHECK(tree.update(255, as_bytes("x")));
}

TEST_CASE("SparseMerkleTree proofs are bound to the current root", "[arbor][merkle][sparse_tree]") {
    auto tree{make_tree(8)};
    REQUIRE(tree.update(5, as_bytes("five")));
    const auto proof = tree.generate_proof(5);
    REQUIRE(proof);
    REQUIRE(tree.verify_proof(*proof, 5, as_bytes("five")));

    REQUIRE(tree.update(6, as_bytes("six")));
    CHECK_FALSE(tree.verify_proof(*proof, 5, as_bytes("five")));

    const auto fresh = tree.generate_proof(5);
    REQUIRE(fresh);
    CHECK(tree.verify_proof(*fresh, 5, as_bytes("five")));
}

TEST_CASE("SparseMerkleTree validate_proof", "[arbor][merkle][sparse_tree]") {
    auto tree{make_tree(8)};
    REQUIRE(tree.update(42, as_bytes("answer")));
    const auto proof = tree.generate_proof(42);
    REQUIRE(proof);
    CHECK(tree.validate_proof(*proof));

    MerkleProof out_of_range{*proof};
    out_of_range.leaf_index = 256;
    const auto r1 = tree.validate_proof(out_of_range);
    REQUIRE_FALSE(r1);
    CHECK(r1.error().code == ErrorCode::kInvalidProof);

    MerkleProof too_long{*proof};
    too_long.steps.push_back(too_long.steps.back());
    const auto r2 = tree.validate_proof(too_long);
    REQUIRE_FALSE(r2);
    CHECK(r2.error().to_string() == "Invalid proof: expected 8 steps, got 9");

    MerkleProof short_digest{*proof};
    short_digest.steps[3].hash.pop_back();
    const auto r3 = tree.validate_proof(short_digest);
    REQUIRE_FALSE(r3);
    CHECK(r3.error().code == ErrorCode::kInvalidProof);
}

TEST_CASE("SparseMerkleTree node cache", "[arbor][merkle][sparse_tree]") {
    auto tree{make_tree(16)};
    CHECK(tree.cached_node_count() == 0);

    // Empty subtrees are never cached
    static_cast<void>(tree.root());
    CHECK(tree.cached_node_count() == 0);

    REQUIRE(tree.update(7, as_bytes("a")));
    REQUIRE(tree.update(40000, as_bytes("b")));
    static_cast<void>(tree.root());
    const size_t populated{tree.cached_node_count()};
    CHECK(populated > 0);

    // Only the ancestors of the touched slot are evicted
    REQUIRE(tree.update(7, as_bytes("c")));
    CHECK(tree.cached_node_count() < populated);
    CHECK(tree.cached_node_count() > 0);

    SECTION("incremental eviction gives the same root as a rebuild") {
        const std::vector<std::pair<uint64_t, std::string>> writes{
            {1, "one"}, {2, "two"}, {7, "seven"}, {65535, "max"}, {40000, "b2"}, {3, "three"}};
        for (const auto& [index, value] : writes) {
            REQUIRE(tree.update(index, as_bytes(value)));
            static_cast<void>(tree.root());
        }
        REQUIRE(tree.remove(2));
        static_cast<void>(tree.root());

        auto rebuilt{make_tree(16)};
        for (const auto& [index, value] : writes) {
            if (index != 2) {
                REQUIRE(rebuilt.update(index, as_bytes(value)));
            }
        }
        CHECK(tree.root() == rebuilt.root());
    }
}

TEST_CASE("SparseMerkleTree stats", "[arbor][merkle][sparse_tree]") {
    auto tree = SparseMerkleTree::create(10, std::make_shared<crypto::Sha3Hasher>());
    REQUIRE(tree);
    REQUIRE(tree->update(1, as_bytes("a")));
    REQUIRE(tree->update(1023, as_bytes("b")));

    const SparseTreeStats stats{tree->stats()};
    CHECK(stats.depth == 10);
    CHECK(stats.leaf_count == 2);
    CHECK(stats.max_leaves == intx::uint128{1024});
    CHECK(stats.hasher_name == "SHA3-256");
    CHECK(stats.root_hash == to_hex(tree->root()));
    CHECK(stats.cached_nodes == tree->cached_node_count());
    CHECK(stats.cached_nodes > 0);
}

TEST_CASE("SparseMerkleTree slot holding zero bytes", "[arbor][merkle][sparse_tree]") {
    const crypto::Sha256Hasher hasher;
    auto tree{make_tree(8)};
    const Bytes zeros(32, uint8_t{0});
    REQUIRE(tree.update(9, zeros));

    const auto proof = tree.generate_proof(9);
    REQUIRE(proof);

    // A value equal to the default digest stands for the empty slot, so the stored hash(zeros) is not matched
    CHECK_FALSE(tree.verify_proof(*proof, 9, zeros));
    CHECK_FALSE(tree.verify_non_membership(*proof, 9));

    const auto digest = tree.get(9);
    REQUIRE(digest);
    CHECK(*digest == ByteView{hasher.hash(zeros)});
    CHECK(tree.verify_leaf_hash(*proof, 9, *digest));
}

TEST_CASE("SparseMerkleTree logging", "[arbor][merkle][sparse_tree]") {
    test_util::LogCapture capture{log::Level::kTrace};
    auto tree{make_tree(4)};
    CHECK(absl::StrContains(capture.err(), "SparseMerkleTree: created depth=4 hasher=SHA-256"));

    REQUIRE(tree.update(3, as_bytes("a")));
    static_cast<void>(tree.root());
    REQUIRE(tree.update(3, as_bytes("b")));
    CHECK(absl::StrContains(capture.err(), "SparseMerkleTree: invalidated path index=3 evicted=4"));

    CHECK_FALSE(tree.update(16, as_bytes("c")));
    CHECK(absl::StrContains(capture.err(), "SparseMerkleTree: rejected update index=16 depth=4"));
}

}  // namespace arbor::merkle
