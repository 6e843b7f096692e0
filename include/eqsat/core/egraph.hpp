/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/analysis.hpp>
#include <eqsat/core/common.hpp>
#include <eqsat/core/explain.hpp>
#include <eqsat/core/node.hpp>
#include <eqsat/core/term.hpp>
#include <eqsat/core/union_find.hpp>

#include <gap/core/generator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <concepts>
#include <iterator>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace eqsat::graph
{
    //
    // eclass
    //
    template< typename node_type, typename data_type >
    struct eclass {
        using parent_type = std::pair< node_type, eclass_id >;

        std::size_t size() const { return nodes.size(); }

        auto begin() const { return nodes.begin(); }
        auto end() const { return nodes.end(); }

        eclass_id id;
        std::vector< node_type > nodes;
        data_type data;
        // nodes elsewhere in the graph that use this class as a child
        std::vector< parent_type > parents;
    };

    //
    // egraph
    //
    template< storage_like storage, typename analysis_t = no_analysis >
    struct egraph {
        using storage_type  = storage;
        using node_type     = node< storage >;
        using analysis_type = analysis_t;
        using data_type     = typename analysis_t::data_type;
        using eclass_type   = graph::eclass< node_type, data_type >;
        using expr_type     = rec_expr< storage >;
        using node_hash_type = node_hash< storage >;

        egraph() = default;

        explicit egraph(analysis_t analysis) : _analysis(std::move(analysis)) {}

        egraph(egraph &&)            = default;
        egraph &operator=(egraph &&) = default;

        egraph(const egraph &)            = delete;
        egraph &operator=(const egraph &) = delete;

        analysis_t &analysis() { return _analysis; }
        const analysis_t &analysis() const { return _analysis; }

        //
        // insertion
        //

        eclass_id add(node_type n) {
            for (auto child : n.children) {
                check_id(child);
            }

            canonicalize(n);
            if (auto it = _memo.find(n); it != _memo.end()) {
                return find(it->second);
            }

            auto id = _unions.make_set();
            if (_explain) {
                _proofs.make_set();
            }

            auto data = _analysis.make(std::as_const(*this), n);
            for (auto child : n.children) {
                class_at(child).parents.emplace_back(n, id);
            }

            _memo.emplace(n, id);
            _classes.emplace_back(eclass_type{ id, { std::move(n) }, std::move(data), {} });

            if constexpr (modifying_analysis< analysis_t, egraph >) {
                _analysis.modify(*this, id);
            }

            return find(id);
        }

        eclass_id add_expr(const expr_type &expr) {
            if (expr.empty()) {
                throw invalid_id("cannot add an empty term");
            }

            std::vector< eclass_id > ids;
            ids.reserve(expr.size());
            for (const auto &n : expr) {
                auto canon = n.map_children([&] (eclass_id idx) { return ids[idx.ref()]; });
                ids.push_back(add(std::move(canon)));
            }

            return find(ids.back());
        }

        std::optional< eclass_id > lookup(node_type n) const {
            for (auto &child : n.children) {
                check_id(child);
                child = find(child);
            }

            if (auto it = _memo.find(n); it != _memo.end()) {
                return find(it->second);
            }

            return std::nullopt;
        }

        std::optional< eclass_id > lookup_expr(const expr_type &expr) const {
            std::vector< eclass_id > ids;
            for (const auto &n : expr) {
                auto id = lookup(n.map_children([&] (eclass_id idx) { return ids[idx.ref()]; }));
                if (!id) {
                    return std::nullopt;
                }
                ids.push_back(*id);
            }

            if (ids.empty()) {
                return std::nullopt;
            }

            return ids.back();
        }

        //
        // union
        //

        // Merges classes of 'a' and 'b', returns the surviving canonical id.
        // Invariants are restored by the next rebuild.
        eclass_id merge(eclass_id a, eclass_id b, justification why = by_user{}) {
            auto into = find(a);
            auto from = find(b);

            if (into == from) {
                return into;
            }

            if (_unions.set_size(into) < _unions.set_size(from)) {
                std::swap(into, from);
            }

            // analysis merge may throw, graph stays untouched in that case
            auto merged = class_at(into).data;
            auto did = _analysis.merge(merged, class_at(from).data);

            auto root = _unions.merge(into, from);
            if (root != into) {
                fatal("union-find picked {} as root instead of {}", root.ref(), into.ref());
            }

            if (_explain) {
                _proofs.merge(a, b, std::move(why));
            }

            auto absorbed = std::move(*_classes[from.ref()]);
            _classes[from.ref()].reset();

            auto &survivor = class_at(root);
            if (did.lhs) {
                enqueue_analysis(survivor.parents);
            }

            if (did.rhs) {
                enqueue_analysis(absorbed.parents);
            }

            survivor.data = std::move(merged);
            std::move(absorbed.nodes.begin(), absorbed.nodes.end(), std::back_inserter(survivor.nodes));
            std::move(absorbed.parents.begin(), absorbed.parents.end(), std::back_inserter(survivor.parents));

            _pending.push_back(root);
            ++_union_count;
            return root;
        }

        //
        // rebuild
        //

        // Restores hashcons, congruence and analysis invariants. Work is
        // limited to parents of classes touched since the last rebuild.
        // Returns the number of repaired classes.
        std::size_t rebuild() {
            std::size_t repairs = 0;

            while (!is_clean()) {
                std::vector< eclass_id > touched;

                while (!is_clean()) {
                    while (!_pending.empty()) {
                        auto id = _pending.back();
                        _pending.pop_back();

                        repair_parents(id, touched);
                        ++repairs;
                    }

                    while (!_analysis_pending.empty()) {
                        auto [n, id] = std::move(_analysis_pending.back());
                        _analysis_pending.pop_back();
                        update_analysis(std::move(n), id, touched);
                    }
                }

                repair_classes(touched);
            }

            if (repairs) {
                spdlog::debug("[eqsat] rebuild repaired {} classes, {} classes {} nodes",
                    repairs, num_of_eclasses(), num_of_nodes()
                );
            }

            return repairs;
        }

        bool is_clean() const { return _pending.empty() && _analysis_pending.empty(); }

        //
        // canonical ids
        //

        eclass_id find(eclass_id id) const {
            check_id(id);
            return _unions.find(id);
        }

        eclass_id find(eclass_id id) {
            check_id(id);
            return _unions.find_compress(id);
        }

        node_type canonical(node_type n) const {
            n.update_children([&] (eclass_id child) { return find(child); });
            return n;
        }

        //
        // observers
        //

        const eclass_type &eclass(eclass_id id) const { return class_at(find(id)); }

        const data_type &data(eclass_id id) const { return eclass(id).data; }

        gap::generator< const eclass_type & > eclasses() const {
            for (const auto &cls : _classes) {
                if (cls) {
                    co_yield *cls;
                }
            }
        }

        std::size_t num_of_eclasses() const {
            return std::size_t(std::count_if(_classes.begin(), _classes.end(), [] (const auto &cls) {
                return cls.has_value();
            }));
        }

        std::size_t num_of_nodes() const {
            std::size_t count = 0;
            for (const auto &cls : _classes) {
                if (cls) {
                    count += cls->size();
                }
            }
            return count;
        }

        // number of ids ever allocated
        std::size_t num_of_ids() const { return _unions.size(); }

        std::size_t num_of_unions() const { return _union_count; }

        bool contains(eclass_id id) const { return _unions.contains(id); }

        // Validates all invariants of a rebuilt graph, any violation is fatal.
        void check_invariants() const {
            if (!is_clean()) {
                fatal("invariants checked on a graph with pending repairs");
            }

            for (const auto &cls : eclasses()) {
                if (find(cls.id) != cls.id) {
                    fatal("eclass {} is stored under a non-canonical id", cls.id.ref());
                }

                std::unordered_set< node_type, node_hash_type > seen;
                for (const auto &n : cls.nodes) {
                    if (!seen.insert(n).second) {
                        fatal("eclass {} holds duplicate node {}", cls.id.ref(), node_name(n));
                    }

                    for (auto child : n.children) {
                        if (find(child) != child) {
                            fatal("node {} in eclass {} is not canonical", node_name(n), cls.id.ref());
                        }
                    }

                    auto it = _memo.find(n);
                    if (it == _memo.end() || find(it->second) != cls.id) {
                        fatal("hashcons does not map node {} to eclass {}", node_name(n), cls.id.ref());
                    }
                }

                for (const auto &[parent, id] : cls.parents) {
                    if (!_classes[find(id).ref()]) {
                        fatal("eclass {} has a dangling parent {}", cls.id.ref(), id.ref());
                    }
                }

                if constexpr (std::equality_comparable< data_type >) {
                    if (!(cls.data == recompute_data(cls))) {
                        fatal("analysis data of eclass {} is stale", cls.id.ref());
                    }
                }
            }
        }

        //
        // explanations
        //

        void enable_explanations() {
            if (_unions.size() != 0) {
                throw error("explanations must be enabled on an empty egraph");
            }
            _explain = true;
        }

        bool explanations_enabled() const { return _explain; }

        std::optional< explanation > explain_equivalence(eclass_id a, eclass_id b) const {
            if (!_explain) {
                throw error("explanations are not enabled");
            }

            if (find(a) != find(b)) {
                return std::nullopt;
            }

            return _proofs.explain(a, b);
        }

      private:

        void check_id(eclass_id id) const {
            if (!_unions.contains(id)) {
                throw invalid_id(fmt::format("unknown eclass id {}", id.ref()));
            }
        }

        eclass_type &class_at(eclass_id root) {
            auto &cls = _classes[root.ref()];
            if (!cls) {
                fatal("eclass {} is not live", root.ref());
            }
            return *cls;
        }

        const eclass_type &class_at(eclass_id root) const {
            const auto &cls = _classes[root.ref()];
            if (!cls) {
                fatal("eclass {} is not live", root.ref());
            }
            return *cls;
        }

        void canonicalize(node_type &n) {
            n.update_children([&] (eclass_id child) { return find(child); });
        }

        void enqueue_analysis(const std::vector< typename eclass_type::parent_type > &parents) {
            _analysis_pending.insert(_analysis_pending.end(), parents.begin(), parents.end());
        }

        // Re-canonicalizes parents of a merged class, colliding parents are
        // congruent and get merged. The class and every class owning one of
        // its parents end up in 'touched'.
        void repair_parents(eclass_id id, std::vector< eclass_id > &touched) {
            auto root = find(id);
            auto parents = std::exchange(class_at(root).parents, {});

            try {
                for (const auto &[n, pid] : parents) {
                    _memo.erase(n);
                }

                for (auto &[n, pid] : parents) {
                    canonicalize(n);
                    pid = find(pid);

                    auto [it, inserted] = _memo.try_emplace(n, pid);
                    if (!inserted && find(it->second) != pid) {
                        merge(it->second, pid, by_congruence{});
                    }
                }
            } catch (const merge_conflict &) {
                auto &cls = class_at(find(root));
                cls.parents.insert(cls.parents.end(), parents.begin(), parents.end());
                _pending.push_back(find(root));
                throw;
            }

            touched.push_back(root);

            std::unordered_set< node_type, node_hash_type > seen;
            auto &cls = class_at(find(root));
            for (auto &[n, pid] : parents) {
                touched.push_back(pid);
                if (seen.insert(n).second) {
                    cls.parents.emplace_back(std::move(n), find(pid));
                }
            }
        }

        void update_analysis(node_type n, eclass_id id, std::vector< eclass_id > &touched) {
            canonicalize(n);
            auto root = find(id);

            auto data = _analysis.make(std::as_const(*this), n);
            auto &cls = class_at(root);
            if (_analysis.merge(cls.data, std::move(data)).lhs) {
                enqueue_analysis(cls.parents);
                touched.push_back(root);
            }
        }

        // Canonicalizes and deduplicates member nodes of touched classes,
        // then lets the analysis modify them. Member nodes of other classes
        // refer only to classes that were not merged and stay canonical.
        void repair_classes(const std::vector< eclass_id > &touched) {
            std::vector< eclass_id > roots;
            std::unordered_set< eclass_id, eclass_id_hash > visited;
            for (auto id : touched) {
                if (auto root = find(id); visited.insert(root).second) {
                    roots.push_back(root);
                }
            }

            for (auto root : roots) {
                auto &cls = class_at(root);

                std::unordered_set< node_type, node_hash_type > seen;
                std::vector< node_type > nodes;
                for (auto &n : cls.nodes) {
                    auto canon = canonical(n);
                    if (!(canon == n)) {
                        if (auto it = _memo.find(n); it != _memo.end() && find(it->second) == root) {
                            _memo.erase(it);
                        }
                    }

                    if (seen.insert(canon).second) {
                        nodes.push_back(std::move(canon));
                    }
                }

                for (const auto &n : nodes) {
                    _memo.insert_or_assign(n, root);
                }

                cls.nodes = std::move(nodes);
            }

            if constexpr (modifying_analysis< analysis_t, egraph >) {
                for (auto root : roots) {
                    _analysis.modify(*this, find(root));
                }
            }
        }

        data_type recompute_data(const eclass_type &cls) const {
            // user analyses may declare merge non-const
            auto analysis = _analysis;
            auto data = analysis.make(*this, cls.nodes.front());
            for (std::size_t i = 1; i < cls.nodes.size(); ++i) {
                analysis.merge(data, analysis.make(*this, cls.nodes[i]));
            }
            return data;
        }

        analysis_t _analysis;

        // classes arena indexed by id, absorbed slots are empty
        std::vector< std::optional< eclass_type > > _classes;

        // canonical node -> class
        std::unordered_map< node_type, eclass_id, node_hash_type > _memo;

        union_find _unions;

        // classes merged since the last rebuild
        std::vector< eclass_id > _pending;

        // parent nodes whose analysis data needs recomputation
        std::vector< typename eclass_type::parent_type > _analysis_pending;

        std::size_t _union_count = 0;

        bool _explain = false;
        proof_forest _proofs;
    };

} // namespace eqsat::graph
