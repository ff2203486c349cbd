#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "rlscript/env.hpp"

namespace rlscript {

struct heap_stats_snapshot {
    std::size_t total_allocated_envs = 0;
    std::size_t live_envs = 0;
    std::size_t next_collect_threshold = 0;
    std::size_t collections = 0;
    std::size_t reclaimed_envs = 0;
};

// Tracks the environments one interpreter allocates. Ownership stays with the
// shared pointers handed out; the heap only holds weak references.
//
// Reference counting frees acyclic garbage on its own. collect() finds the
// cycles a closure forms with the scope it captured: an environment or
// function referenced only from other tracked environments and functions is
// unreachable, so its bindings and parent link are cleared. Anything the host
// or a running frame still holds is a root and is never touched, including at
// teardown. Cycles the host keeps past the interpreter's lifetime are no
// longer tracked and are freed only if the host clears them itself.
class heap {
public:
    heap() = default;
    ~heap();

    heap(const heap&) = delete;
    heap& operator=(const heap&) = delete;

    env_ptr make_env(env_ptr parent = nullptr);

    void collect();

    [[nodiscard]] heap_stats_snapshot stats();

private:
    void maybe_collect();
    void drop_expired();

    std::vector<std::weak_ptr<env>> tracked_;
    std::size_t total_allocated_envs_ = 0;
    std::size_t next_collect_threshold_ = 256;
    std::size_t collections_ = 0;
    std::size_t reclaimed_envs_ = 0;
};

}  // namespace rlscript
