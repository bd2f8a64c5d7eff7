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
 * @file LazySequence.hpp
 * @brief Cached pull sequences and a backtracking Cartesian product.
 *
 * Route search enumerates products of sequences that are expensive to
 * produce (shortest simple paths) and potentially very long, while usually
 * only the first few combinations are ever inspected. `LazySequence` pulls
 * items from a generator on demand and caches them so a product can revisit
 * an earlier item of one dimension while advancing another. `LazyProduct`
 * walks the product space in lexicographic order (last dimension fastest)
 * using a vector of indices, without materializing the space.
 *
 * Example:
 * @code
 * auto a = LazySequence<int>::fromVector({1, 2});
 * auto b = LazySequence<int>::fromVector({3, 4});
 * LazyProduct<int> product({a, b});
 * std::vector<int> combination;
 * while (product.next(combination)) {
 *   // (1,3) (1,4) (2,3) (2,4)
 * }
 * @endcode
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

/**
 * @class LazySequence
 * @brief Finite or unbounded sequence produced on demand and cached.
 *
 * @tparam T Item type; must be copyable.
 */
template <typename T>
class LazySequence
{
   public:
    /**
     * @brief Generator callback. Writes the next item into its argument and
     * returns true, or returns false once the sequence is exhausted.
     */
    using Generator = std::function<bool(T &)>;

    explicit LazySequence(Generator generator)
        : generator(std::move(generator))
    {
    }

    /** @brief Sequence over an already materialized vector. */
    static std::shared_ptr<LazySequence<T>> fromVector(std::vector<T> items)
    {
        auto sequence = std::make_shared<LazySequence<T>>(Generator());
        sequence->cache = std::move(items);
        sequence->exhausted = true;
        return sequence;
    }

    /**
     * @brief Fetch the item at `index`, pulling from the generator as
     * needed.
     *
     * @return false when the sequence ends before `index`.
     */
    bool get(std::size_t index, T &out)
    {
        while (cache.size() <= index && !exhausted) {
            T item;
            if (generator && generator(item)) {
                cache.push_back(std::move(item));
            } else {
                exhausted = true;
                generator = Generator();
            }
        }
        if (index >= cache.size()) return false;
        out = cache[index];
        return true;
    }

    /** @brief Number of items pulled so far. */
    std::size_t materialized() const { return cache.size(); }

   private:
    Generator generator;
    std::vector<T> cache;
    bool exhausted = false;
};

/**
 * @class LazyProduct
 * @brief Lexicographic Cartesian product over lazy sequences.
 *
 * A product with zero dimensions yields exactly one empty combination; a
 * product with any empty dimension yields nothing.
 */
template <typename T>
class LazyProduct
{
   public:
    explicit LazyProduct(
        std::vector<std::shared_ptr<LazySequence<T>>> dimensions)
        : dimensions(std::move(dimensions))
    {
    }

    /**
     * @brief Advance to the next combination.
     * @param[out] combination One item per dimension.
     * @return false once the product is exhausted.
     */
    bool next(std::vector<T> &combination)
    {
        if (done) return false;

        if (!started) {
            started = true;
            indices.assign(dimensions.size(), 0);
            current.resize(dimensions.size());
            for (std::size_t k = 0; k < dimensions.size(); ++k) {
                if (!dimensions[k]->get(0, current[k])) {
                    done = true;
                    return false;
                }
            }
            combination = current;
            if (dimensions.empty()) done = true;
            return true;
        }

        // Odometer step: bump the last dimension, carry leftwards.
        for (std::size_t k = dimensions.size(); k-- > 0;) {
            if (dimensions[k]->get(indices[k] + 1, current[k])) {
                ++indices[k];
                for (std::size_t j = k + 1; j < dimensions.size(); ++j) {
                    indices[j] = 0;
                    dimensions[j]->get(0, current[j]);
                }
                combination = current;
                return true;
            }
        }
        done = true;
        return false;
    }

   private:
    std::vector<std::shared_ptr<LazySequence<T>>> dimensions;
    std::vector<std::size_t> indices;
    std::vector<T> current;
    bool started = false;
    bool done = false;
};

/**
 * @brief Wrap a lazy product as a lazy sequence of combinations so that it
 * can itself be a dimension of an outer product.
 */
template <typename T>
std::shared_ptr<LazySequence<std::vector<T>>> lazyProductOf(
    std::vector<std::shared_ptr<LazySequence<T>>> dimensions)
{
    auto product = std::make_shared<LazyProduct<T>>(std::move(dimensions));
    return std::make_shared<LazySequence<std::vector<T>>>(
        [product](std::vector<T> &combination) {
            return product->next(combination);
        });
}
