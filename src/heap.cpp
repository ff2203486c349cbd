#include "rlscript/heap.hpp"

#include <algorithm>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rlscript {
namespace {

// Reference graph between the tracked environments and the functions bound in them.
// Edges: scope -> parent, scope -> bound function, function -> closure scope.
class reference_graph {
public:
    explicit reference_graph(std::vector<env_ptr> envs) : envs_(std::move(envs)) {
        for (std::size_t i = 0; i < envs_.size(); ++i) {
            env_index_.emplace(envs_[i].get(), i);
        }
        env_internal_.assign(envs_.size(), 0);

        for (const env_ptr& scope : envs_) {
            if (const auto parent = find_env(scope->parent.get())) {
                ++env_internal_[*parent];
            }
            for (const auto& [name, bound] : scope->bindings) {
                if (is_function(bound)) {
                    const std::size_t index = intern(function_value(bound));
                    ++fn_internal_[index];
                }
            }
        }
        for (const function_ptr& fn : fns_) {
            if (const auto closure = find_env(fn->closure.get())) {
                ++env_internal_[*closure];
            }
        }
    }

    // Marks everything reachable from a node that holds references from outside the graph.
    void mark_from_external_roots() {
        env_marked_.assign(envs_.size(), false);
        fn_marked_.assign(fns_.size(), false);

        for (std::size_t i = 0; i < envs_.size(); ++i) {
            if (held_externally(envs_[i].use_count(), env_internal_[i])) {
                mark_env(i);
            }
        }
        for (std::size_t i = 0; i < fns_.size(); ++i) {
            if (held_externally(fns_[i].use_count(), fn_internal_[i])) {
                mark_fn(i);
            }
        }

        while (!env_stack_.empty() || !fn_stack_.empty()) {
            if (!env_stack_.empty()) {
                const env_ptr& scope = envs_[env_stack_.back()];
                env_stack_.pop_back();
                if (const auto parent = find_env(scope->parent.get())) {
                    mark_env(*parent);
                }
                for (const auto& [name, bound] : scope->bindings) {
                    if (is_function(bound)) {
                        mark_fn(fn_index_.at(function_value(bound).get()));
                    }
                }
                continue;
            }

            const function_ptr& fn = fns_[fn_stack_.back()];
            fn_stack_.pop_back();
            if (const auto closure = find_env(fn->closure.get())) {
                mark_env(*closure);
            }
        }
    }

    // Clears every unmarked environment. The detached values are released after all
    // scopes are cleared so no destructor observes a half-cleared cycle.
    std::size_t clear_unreachable() {
        std::vector<value> detached;
        std::vector<env_ptr> detached_parents;
        std::size_t reclaimed = 0;

        for (std::size_t i = 0; i < envs_.size(); ++i) {
            if (env_marked_[i]) {
                continue;
            }
            env& scope = *envs_[i];
            for (auto& [name, bound] : scope.bindings) {
                detached.push_back(std::move(bound));
            }
            scope.bindings.clear();
            detached_parents.push_back(std::move(scope.parent));
            scope.parent = nullptr;
            ++reclaimed;
        }

        detached.clear();
        detached_parents.clear();
        fns_.clear();
        envs_.clear();
        return reclaimed;
    }

private:
    // `use_count` includes the graph's own copy.
    [[nodiscard]] static bool held_externally(long use_count, std::size_t internal) {
        return static_cast<std::size_t>(use_count) > internal + 1;
    }

    [[nodiscard]] std::optional<std::size_t> find_env(const env* scope) const {
        if (!scope) {
            return std::nullopt;
        }
        const auto it = env_index_.find(scope);
        if (it == env_index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t intern(const function_ptr& fn) {
        const auto [it, inserted] = fn_index_.emplace(fn.get(), fns_.size());
        if (inserted) {
            fns_.push_back(fn);
            fn_internal_.push_back(0);
        }
        return it->second;
    }

    void mark_env(std::size_t index) {
        if (env_marked_[index]) {
            return;
        }
        env_marked_[index] = true;
        env_stack_.push_back(index);
    }

    void mark_fn(std::size_t index) {
        if (fn_marked_[index]) {
            return;
        }
        fn_marked_[index] = true;
        fn_stack_.push_back(index);
    }

    std::vector<env_ptr> envs_;
    std::vector<function_ptr> fns_;
    std::unordered_map<const env*, std::size_t> env_index_;
    std::unordered_map<const function_object*, std::size_t> fn_index_;
    std::vector<std::size_t> env_internal_;
    std::vector<std::size_t> fn_internal_;
    std::vector<bool> env_marked_;
    std::vector<bool> fn_marked_;
    std::vector<std::size_t> env_stack_;
    std::vector<std::size_t> fn_stack_;
};

}  // namespace

heap::~heap() {
    collect();
}

env_ptr heap::make_env(env_ptr parent) {
    env_ptr scope = rlscript::make_env(std::move(parent));
    tracked_.push_back(scope);
    ++total_allocated_envs_;

    maybe_collect();
    return scope;
}

void heap::maybe_collect() {
    if (tracked_.size() > next_collect_threshold_) {
        collect();
    }
}

void heap::collect() {
    std::vector<env_ptr> survivors;
    survivors.reserve(tracked_.size());
    for (const auto& entry : tracked_) {
        if (env_ptr scope = entry.lock()) {
            survivors.push_back(std::move(scope));
        }
    }

    reference_graph graph(std::move(survivors));
    graph.mark_from_external_roots();
    reclaimed_envs_ += graph.clear_unreachable();
    ++collections_;

    drop_expired();
    const std::size_t min_threshold = 256;
    const std::size_t grown = tracked_.size() * 2;
    next_collect_threshold_ = grown > min_threshold ? grown : min_threshold;
}

void heap::drop_expired() {
    tracked_.erase(std::remove_if(tracked_.begin(), tracked_.end(),
                                  [](const std::weak_ptr<env>& entry) { return entry.expired(); }),
                   tracked_.end());
}

heap_stats_snapshot heap::stats() {
    drop_expired();

    heap_stats_snapshot snapshot;
    snapshot.total_allocated_envs = total_allocated_envs_;
    snapshot.live_envs = tracked_.size();
    snapshot.next_collect_threshold = next_collect_threshold_;
    snapshot.collections = collections_;
    snapshot.reclaimed_envs = reclaimed_envs_;
    return snapshot;
}

}  // namespace rlscript
