#include "pch.h"
#include "Identity/CallTree.hpp"
#include "Invariant.hpp"

namespace Rooted {

	// ===== PositionScope Implementation =====

	PositionScope::PositionScope(const std::source_location& location)
		: tree(CallTree::Current())
		, depth(tree.Push(CallSite::From(location).Token())) {
	}

	PositionScope::PositionScope(CallTree& tree, uint64_t component)
		: tree(tree)
		, depth(tree.Push(component)) {
	}

	PositionScope::~PositionScope() {
		tree.Pop(depth);
	}

	// ===== TraversalScope Implementation =====

	TraversalScope::TraversalScope(CallTree& tree)
		: tree(tree)
		, savedFrameCount(tree.BeginTraversal()) {
	}

	TraversalScope::~TraversalScope() {
		tree.EndTraversal(savedFrameCount);
	}

	// ===== CallTree Implementation =====

	CallTree::CallTree() {
		frames.push_back(Frame{ PositionId::Root(), {} });
		traversalBases.push_back(0);
	}

	CallTree& CallTree::Current() {
		thread_local CallTree instance;
		return instance;
	}

	PositionId CallTree::CurrentPosition() const {
		assert(!frames.empty() && "CallTree always holds a root frame");
		return frames.back().id;
	}

	size_t CallTree::Depth() const {
		return frames.size() - 1 - traversalBases.back();
	}

	size_t CallTree::Push(uint64_t component) {
		Frame& parent = frames.back();
		uint32_t occurrence = parent.occurrences[component]++;
		PositionId child = parent.id.Child(component, occurrence);

		frames.push_back(Frame{ child, {} });
		return frames.size();
	}

	void CallTree::Pop(size_t expectedDepth) {
		if (frames.size() != expectedDepth) {
			FatalInvariant("CallTree scopes were exited out of order");
		}
		if (frames.size() - 1 <= traversalBases.back()) {
			FatalInvariant("CallTree attempted to pop the root scope of a traversal");
		}

		frames.pop_back();
	}

	size_t CallTree::BeginTraversal() {
		size_t saved = frames.size();
		traversalBases.push_back(saved);
		frames.push_back(Frame{ PositionId::Root(), {} });
		return saved;
	}

	void CallTree::EndTraversal(size_t savedFrameCount) {
		if (traversalBases.size() < 2 || traversalBases.back() != savedFrameCount) {
			FatalInvariant("CallTree traversals were ended out of order");
		}

		frames.erase(frames.begin() + static_cast<std::ptrdiff_t>(savedFrameCount), frames.end());
		traversalBases.pop_back();
	}

}
