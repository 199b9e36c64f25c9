#pragma once

#include <cstddef>
#include <functional>
#include <source_location>
#include <unordered_map>
#include <vector>

#include "RootedAPI.h"
#include "Identity/PositionId.hpp"

namespace Rooted {

	class CallTree;

	// RAII scope: pushes a child position on construction and pops it on
	// destruction, so the parent position is restored on every exit path.
	class ROOTED_API PositionScope {
	public:
		// Enters the calling thread's tree at the declaring call site.
		explicit PositionScope(const std::source_location& location = std::source_location::current());
		PositionScope(CallTree& tree, uint64_t component);
		~PositionScope();

		// Disable copy and move
		PositionScope(const PositionScope&) = delete;
		PositionScope& operator=(const PositionScope&) = delete;

	private:
		CallTree& tree;
		size_t depth;
	};

	// RAII traversal: swaps in a fresh root scope and restores the previous
	// traversal (the whole scope stack) on destruction.
	class ROOTED_API TraversalScope {
	public:
		explicit TraversalScope(CallTree& tree);
		~TraversalScope();

		// Disable copy and move
		TraversalScope(const TraversalScope&) = delete;
		TraversalScope& operator=(const TraversalScope&) = delete;

	private:
		CallTree& tree;
		size_t savedFrameCount;
	};

	// Explicit scope stack producing PositionIds.
	//
	// Each entered scope derives its id from the parent id, the entered
	// component (a call-site token, optionally mixed with a slot key) and the
	// number of times that component was already entered under the same
	// parent in this traversal. Repeated traversals of the same control flow
	// therefore see the same ids, while siblings, loop iterations and
	// recursion depths see distinct ones.
	//
	// A CallTree is not thread safe. CallTree::Current() hands out one per
	// thread that lives for the thread's duration.
	class ROOTED_API CallTree {
	public:
		CallTree();

		static CallTree& Current();

		PositionId CurrentPosition() const;

		// Number of entered scopes above the root of the current traversal.
		size_t Depth() const;

		// Runs body with the position extended by the call site.
		template <typename F>
		decltype(auto) EnterScope(const CallSite& site, F&& body);

		// Like EnterScope, but the child identity also follows 'key', so items
		// of a reordered list keep their state.
		template <typename Key, typename F>
		decltype(auto) CallInSlot(const CallSite& site, const Key& key, F&& body);

		// Runs body as a fresh traversal starting from PositionId::Root().
		template <typename F>
		decltype(auto) Root(F&& body);

	private:
		friend class PositionScope;
		friend class TraversalScope;

		struct Frame {
			PositionId id;
			std::unordered_map<uint64_t, uint32_t> occurrences; // Times each component was entered under this frame.
		};

		size_t Push(uint64_t component);
		void Pop(size_t expectedDepth);

		size_t BeginTraversal();
		void EndTraversal(size_t savedFrameCount);

		// Frames of suspended traversals sit below the active one.
		std::vector<Frame> frames;
		std::vector<size_t> traversalBases;
	};

	template <typename F>
	decltype(auto) CallTree::EnterScope(const CallSite& site, F&& body) {
		PositionScope scope(*this, site.Token());
		return std::forward<F>(body)();
	}

	template <typename Key, typename F>
	decltype(auto) CallTree::CallInSlot(const CallSite& site, const Key& key, F&& body) {
		PositionScope scope(*this, HashCombine(site.Token(), static_cast<uint64_t>(std::hash<Key>{}(key))));
		return std::forward<F>(body)();
	}

	template <typename F>
	decltype(auto) CallTree::Root(F&& body) {
		TraversalScope traversal(*this);
		return std::forward<F>(body)();
	}

}

#define ROOTED_CONCAT_INNER(a, b) a##b
#define ROOTED_CONCAT(a, b) ROOTED_CONCAT_INNER(a, b)

// Extends the calling thread's position until the end of the enclosing block
#define ROOTED_SCOPE() Rooted::PositionScope ROOTED_CONCAT(rootedScope, __LINE__)
