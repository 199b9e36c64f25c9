#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <vector>

#include "Identity/CallTree.hpp"

using Rooted::CallSite;
using Rooted::CallTree;
using Rooted::PositionId;

namespace {

	PositionId Here(CallTree& tree, const std::source_location& location = std::source_location::current()) {
		return tree.EnterScope(CallSite::From(location), [&] { return tree.CurrentPosition(); });
	}

	void CollectRecursive(CallTree& tree, int depth, std::vector<PositionId>& out) {
		tree.EnterScope(CallSite::From(std::source_location::current()), [&] {
			out.push_back(tree.CurrentPosition());
			if (depth > 0) {
				CollectRecursive(tree, depth - 1, out);
			}
		});
	}

}

TEST(CallTreeTest, TraversalStartsAtRoot) {
	CallTree tree;
	tree.Root([&] {
		EXPECT_EQ(tree.CurrentPosition(), PositionId::Root());
		EXPECT_EQ(tree.Depth(), 0u);
	});
}

TEST(CallTreeTest, SiblingCallSitesGetDistinctIds) {
	CallTree tree;
	tree.Root([&] {
		PositionId first = Here(tree);
		PositionId second = Here(tree);
		EXPECT_NE(first, second);
		EXPECT_NE(first, PositionId::Root());
	});
}

TEST(CallTreeTest, IdsAreStableAcrossTraversals) {
	CallTree tree;
	auto traverse = [&] {
		return tree.Root([&] {
			std::vector<PositionId> ids;
			for (int i = 0; i < 3; ++i) {
				ids.push_back(Here(tree));
			}
			return ids;
		});
	};

	std::vector<PositionId> firstFrame = traverse();
	std::vector<PositionId> secondFrame = traverse();

	EXPECT_EQ(firstFrame, secondFrame);
	std::set<PositionId> unique(firstFrame.begin(), firstFrame.end());
	EXPECT_EQ(unique.size(), 3u) << "loop iterations at one call site must not collide";
}

TEST(CallTreeTest, RecursionDepthsAreDistinct) {
	CallTree tree;
	std::vector<PositionId> ids;
	tree.Root([&] { CollectRecursive(tree, 4, ids); });

	ASSERT_EQ(ids.size(), 5u);
	std::set<PositionId> unique(ids.begin(), ids.end());
	EXPECT_EQ(unique.size(), 5u);
}

TEST(CallTreeTest, ScopeIsRestoredWhenBodyThrows) {
	CallTree tree;
	tree.Root([&] {
		PositionId before = tree.CurrentPosition();
		EXPECT_THROW(tree.EnterScope(CallSite::From(std::source_location::current()), [&] {
			EXPECT_EQ(tree.Depth(), 1u);
			throw std::runtime_error("early exit");
		}), std::runtime_error);

		EXPECT_EQ(tree.CurrentPosition(), before);
		EXPECT_EQ(tree.Depth(), 0u);
	});
}

TEST(CallTreeTest, CallInSlotFollowsKeyRatherThanOrder) {
	CallTree tree;
	const CallSite site = CallSite::From(std::source_location::current());
	auto idFor = [&](const std::vector<int>& keys, int wanted) {
		return tree.Root([&] {
			PositionId found;
			for (int key : keys) {
				tree.CallInSlot(site, key, [&] {
					if (key == wanted) {
						found = tree.CurrentPosition();
					}
				});
			}
			return found;
		});
	};

	EXPECT_EQ(idFor({ 1, 2, 3 }, 2), idFor({ 3, 2, 1 }, 2));
	EXPECT_NE(idFor({ 1, 2, 3 }, 1), idFor({ 1, 2, 3 }, 2));
}

TEST(CallTreeTest, NestedTraversalRestoresOuterTraversal) {
	CallTree tree;
	tree.Root([&] {
		tree.EnterScope(CallSite::From(std::source_location::current()), [&] {
			PositionId outer = tree.CurrentPosition();
			size_t outerDepth = tree.Depth();

			tree.Root([&] {
				EXPECT_EQ(tree.CurrentPosition(), PositionId::Root());
				EXPECT_EQ(tree.Depth(), 0u);
				Here(tree);
			});

			EXPECT_EQ(tree.CurrentPosition(), outer);
			EXPECT_EQ(tree.Depth(), outerDepth);
		});
	});
}

TEST(CallTreeTest, PositionScopeMacroUsesThreadTree) {
	CallTree& tree = CallTree::Current();
	tree.Root([&] {
		PositionId first;
		{
			ROOTED_SCOPE();
			first = tree.CurrentPosition();
			EXPECT_EQ(tree.Depth(), 1u);
		}
		EXPECT_EQ(tree.Depth(), 0u);
		EXPECT_NE(first, PositionId::Root());
	});
}

TEST(CallTreeTest, EnterScopeReturnsBodyResult) {
	CallTree tree;
	int result = tree.EnterScope(CallSite::From(std::source_location::current()), [] { return 7; });
	EXPECT_EQ(result, 7);
}
