/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */
/**
 * @file DisjointPartition.hpp
 * @brief Maximal partition of keyed sets into mutually disjoint parts.
 *
 * Each inserted set is identified by a key. The partition maintains two
 * properties:
 *  1. the element union of every part is disjoint from every other part;
 *  2. the number of parts is maximal subject to (1).
 *
 * It behaves like a union-find (disjoint-set forest) over the inserted keys,
 * where two keys are united whenever their element sets intersect, but it
 * additionally remembers which keys contributed to each part. The router
 * uses it to find terminal groups that share a terminal and must therefore
 * be checked for disjointness as one unit.
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <set>
#include <utility>
#include <vector>

/**
 * @class DisjointPartition
 * @tparam Key Identifier of an inserted set (copyable).
 * @tparam Element Element type (ordered).
 */
template <typename Key, typename Element>
class DisjointPartition
{
   public:
    /**
     * @brief Insert `elements` under `key`, merging every intersecting part.
     *
     * @return Keys of the part that now contains `key`: `key` first, then
     * the keys of the merged parts in the order those parts were created.
     */
    std::vector<Key> insert(const std::set<Element> &elements, const Key &key)
    {
        std::size_t slot = slotKeys.size();
        slotKeys.push_back(key);
        parent.push_back(slot);
        rank.push_back(0);

        // Roots of the parts hit by the new elements, oldest part first.
        std::vector<std::size_t> roots;
        for (const auto &element : elements) {
            auto it = owner.find(element);
            if (it == owner.end()) continue;
            std::size_t root = find(it->second);
            if (std::find(roots.begin(), roots.end(), root) == roots.end())
                roots.push_back(root);
        }
        std::sort(roots.begin(), roots.end(),
                  [this](std::size_t a, std::size_t b) {
                      return parts.at(a).order < parts.at(b).order;
                  });

        Part merged;
        merged.keys.push_back(key);
        merged.elements = elements;
        std::size_t root = slot;
        for (std::size_t other : roots) {
            Part &part = parts.at(other);
            merged.keys.insert(merged.keys.end(), part.keys.begin(),
                               part.keys.end());
            merged.elements.insert(part.elements.begin(), part.elements.end());
            parts.erase(other);
            root = unite(root, other);
        }
        merged.order = nextOrder++;

        for (const auto &element : elements) owner.emplace(element, slot);
        parts[root] = merged;
        return merged.keys;
    }

    /** @brief Key lists of all parts, in part creation order. */
    std::vector<std::vector<Key>> keys() const
    {
        std::vector<std::vector<Key>> result;
        for (const Part *part : ordered()) result.push_back(part->keys);
        return result;
    }

    /** @brief Element sets of all parts, in part creation order. */
    std::vector<std::set<Element>> values() const
    {
        std::vector<std::set<Element>> result;
        for (const Part *part : ordered()) result.push_back(part->elements);
        return result;
    }

    /** @brief Number of parts. */
    std::size_t size() const { return parts.size(); }

   private:
    struct Part
    {
        std::vector<Key> keys;
        std::set<Element> elements;
        std::size_t order = 0;
    };

    std::vector<Key> slotKeys;
    std::vector<std::size_t> parent;
    std::vector<std::size_t> rank;
    std::map<std::size_t, Part> parts;     /**< root slot -> part */
    std::map<Element, std::size_t> owner;  /**< element -> any slot */
    std::size_t nextOrder = 0;

    std::size_t find(std::size_t slot)
    {
        while (parent[slot] != slot) {
            parent[slot] = parent[parent[slot]];
            slot = parent[slot];
        }
        return slot;
    }

    std::size_t unite(std::size_t a, std::size_t b)
    {
        a = find(a);
        b = find(b);
        if (a == b) return a;
        if (rank[a] < rank[b]) std::swap(a, b);
        parent[b] = a;
        if (rank[a] == rank[b]) ++rank[a];
        return a;
    }

    std::vector<const Part *> ordered() const
    {
        std::vector<const Part *> result;
        for (const auto &entry : parts) result.push_back(&entry.second);
        std::sort(result.begin(), result.end(),
                  [](const Part *a, const Part *b) {
                      return a->order < b->order;
                  });
        return result;
    }
};
