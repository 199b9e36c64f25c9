#include <gtest/gtest.h>

#include <memory>

#include "Rooted.h"

using namespace Rooted;

namespace Rooted {

	class SlotStoreTestAccess {
	public:
		// Registers a slot holding From under the key of type To.
		template <typename From, typename To>
		static void PlantMismatchedSlot(SlotStore& store, PositionId position, From value) {
			const SlotKey key{ position, TypeTags::Of<To>() };
			store.InsertOrGet(key, std::make_shared<Slot<From>>(TypeTags::Of<From>(), std::move(value)));
		}
	};

}

namespace {

	const PositionId P = PositionId::Root().Child(7, 0);

}

TEST(InvariantDeathTest, ScopesExitedOutOfOrderAbort) {
	EXPECT_DEATH({
		CallTree tree;
		auto outer = std::make_unique<PositionScope>(tree, 1);
		auto inner = std::make_unique<PositionScope>(tree, 2);
		outer.reset();
	}, "scopes were exited out of order");
}

TEST(InvariantDeathTest, PoppingTraversalRootAborts) {
	EXPECT_DEATH({
		CallTree tree;
		std::unique_ptr<PositionScope> leaked;
		tree.Root([&] { leaked = std::make_unique<PositionScope>(tree, 1); });

		// The leaked scope's depth now lands on a nested traversal's root.
		tree.Root([&] {
			tree.Root([&] { leaked.reset(); });
		});
	}, "pop the root scope");
}

TEST(InvariantDeathTest, TraversalsEndedOutOfOrderAbort) {
	EXPECT_DEATH({
		CallTree tree;
		auto outer = std::make_unique<TraversalScope>(tree);
		auto inner = std::make_unique<TraversalScope>(tree);
		outer.reset();
	}, "traversals were ended out of order");
}

TEST(InvariantDeathTest, OverridesPoppedOutOfOrderAbort) {
	EXPECT_DEATH({
		SlotStore store;
		auto context = store.CreateContext<int>(1);
		auto outer = std::make_unique<ContextOverride<int>>(context, 2);
		auto inner = std::make_unique<ContextOverride<int>>(context, 3);
		outer.reset();
	}, "popped out of order");
}

TEST(InvariantDeathTest, SlotWithWrongTypeAborts) {
	EXPECT_DEATH({
		SlotStore store;
		(SlotStoreTestAccess::PlantMismatchedSlot<int, double>(store, P, 1));
		store.RootAt(P, [] { return 2.0; });
	}, "slot registered under type double holds int");
}

TEST(InvariantTest, BalancedScopesRestoreThePosition) {
	CallTree tree;
	{
		auto outer = std::make_unique<PositionScope>(tree, 1);
		auto inner = std::make_unique<PositionScope>(tree, 2);
		inner.reset();
		outer.reset();
	}
	EXPECT_EQ(tree.CurrentPosition(), PositionId::Root());
}
