// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file term_map.hpp
 * @brief Sparse key -> coefficient container with enforced invariants.
 *
 * Shared base (CRTP) for every energy-model flavour. Only invariant-preserving
 * mutations are exposed:
 *   - no stored coefficient is zero (set/add/arithmetic erase such entries)
 *   - keys are canonical (key types canonicalize on construction;
 *     Derived::check_key rejects keys the flavour forbids)
 *
 * Arithmetic accepts another map of the same flavour or any range of
 * (key, coefficient) pairs, on either side.
 *
 * Derived hooks (optional, found via CRTP; declare Base a friend if private):
 *   static void check_key(const Key&)     - throw InvalidTerm on forbidden keys
 *   void merge_extra(const Derived&, double sign)
 *   template<class Op> void apply_extra(Op op)
 *   void clear_extra() noexcept
 *   bool extra_equal(const Derived&) const
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <ranges>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>

namespace spinsim {

namespace detail {
struct TermMapTag {};
} // namespace detail

/**
 * Plain collection of (key, coefficient) pairs, e.g. std::vector<std::pair<...>>
 * or std::unordered_map<Key, double>. Keys may be raw (non-canonical) values
 * that Key can be built from.
 */
template<typename R, typename Key>
concept CoefficientRange =
    std::ranges::input_range<R> &&
    !std::derived_from<std::remove_cvref_t<R>, detail::TermMapTag> &&
    requires(std::ranges::range_reference_t<R> item) {
        { Key(item.first) };
        { static_cast<double>(item.second) };
    };

template<typename Derived, typename Key, typename Hash = std::hash<Key>>
class TermMap : public detail::TermMapTag {
public:
    using key_type = Key;
    using storage_type = std::unordered_map<Key, double, Hash>;
    using const_iterator = typename storage_type::const_iterator;

    // --- Element access ---

    /// Stored coefficient, or 0 when absent.
    [[nodiscard]] double get(const Key& key) const {
        auto it = terms_.find(key);
        return (it != terms_.end()) ? it->second : 0.0;
    }

    /// Store coefficient; a zero coefficient removes the entry.
    void set(const Key& key, double coeff) {
        Derived::check_key(key);
        if (coeff == 0.0) {
            terms_.erase(key);
        } else {
            terms_.insert_or_assign(key, coeff);
        }
    }

    /// Accumulate coefficient; entries summing to zero are removed.
    void add(const Key& key, double coeff) {
        Derived::check_key(key);
        if (coeff == 0.0) return;
        auto it = terms_.try_emplace(key, 0.0).first;
        it->second += coeff;
        if (it->second == 0.0) {
            terms_.erase(it);
        }
    }

    /// Bulk set: later entries overwrite earlier ones.
    template<CoefficientRange<Key> R>
    void update(const R& items) {
        for (auto&& [k, v] : items) {
            set(Key(k), static_cast<double>(v));
        }
    }

    [[nodiscard]] bool contains(const Key& key) const {
        return terms_.find(key) != terms_.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return terms_.size(); }
    [[nodiscard]] bool empty() const noexcept { return terms_.empty(); }

    void clear() noexcept {
        terms_.clear();
        derived().clear_extra();
    }

    [[nodiscard]] const_iterator begin() const noexcept { return terms_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return terms_.end(); }

    // --- In-place arithmetic ---

    Derived& operator+=(const Derived& other) {
        return merge(other, 1.0);
    }

    Derived& operator-=(const Derived& other) {
        return merge(other, -1.0);
    }

    template<CoefficientRange<Key> R>
    Derived& operator+=(const R& items) {
        for (auto&& [k, v] : items) {
            add(Key(k), static_cast<double>(v));
        }
        return derived();
    }

    template<CoefficientRange<Key> R>
    Derived& operator-=(const R& items) {
        for (auto&& [k, v] : items) {
            add(Key(k), -static_cast<double>(v));
        }
        return derived();
    }

    Derived& operator*=(double factor) {
        return apply([factor](double c) { return c * factor; });
    }

    Derived& operator/=(double divisor) {
        if (divisor == 0.0) {
            throw std::invalid_argument("TermMap: division by zero");
        }
        return apply([divisor](double c) { return c / divisor; });
    }

    // --- Binary arithmetic ---

    friend Derived operator+(Derived lhs, const Derived& rhs) {
        lhs += rhs;
        return lhs;
    }

    template<CoefficientRange<Key> R>
    friend Derived operator+(Derived lhs, const R& rhs) {
        lhs += rhs;
        return lhs;
    }

    template<CoefficientRange<Key> R>
    friend Derived operator+(const R& lhs, Derived rhs) {
        rhs += lhs;
        return rhs;
    }

    friend Derived operator-(Derived lhs, const Derived& rhs) {
        lhs -= rhs;
        return lhs;
    }

    template<CoefficientRange<Key> R>
    friend Derived operator-(Derived lhs, const R& rhs) {
        lhs -= rhs;
        return lhs;
    }

    template<CoefficientRange<Key> R>
    friend Derived operator-(const R& lhs, Derived rhs) {
        rhs *= -1.0;
        rhs += lhs;
        return rhs;
    }

    friend Derived operator-(Derived m) {
        m *= -1.0;
        return m;
    }

    friend Derived operator*(Derived m, double factor) {
        m *= factor;
        return m;
    }

    friend Derived operator*(double factor, Derived m) {
        m *= factor;
        return m;
    }

    friend Derived operator/(Derived m, double divisor) {
        m /= divisor;
        return m;
    }

    friend bool operator==(const Derived& a, const Derived& b) {
        const TermMap& lhs = a;
        return lhs.equals(b);
    }

protected:
    TermMap() = default;

    // Default hooks; Derived hides the ones it needs.
    static void check_key(const Key&) {}
    void merge_extra(const Derived&, double) {}
    template<class Op> void apply_extra(Op) {}
    void clear_extra() noexcept {}
    [[nodiscard]] bool extra_equal(const Derived&) const { return true; }

private:
    [[nodiscard]] Derived& derived() noexcept { return static_cast<Derived&>(*this); }
    [[nodiscard]] const Derived& derived() const noexcept {
        return static_cast<const Derived&>(*this);
    }

    [[nodiscard]] bool equals(const Derived& other) const {
        const TermMap& rhs = other;
        return terms_ == rhs.terms_ && derived().extra_equal(other);
    }

    Derived& merge(const Derived& other, double sign) {
        if (&other == &derived()) {
            const Derived copy = other;  // merging with self would erase while iterating
            return merge(copy, sign);
        }
        const TermMap& src = other;
        for (const auto& [k, v] : src.terms_) {
            add(k, sign * v);
        }
        derived().merge_extra(other, sign);
        return derived();
    }

    template<class Op>
    Derived& apply(Op op) {
        for (auto it = terms_.begin(); it != terms_.end();) {
            it->second = op(it->second);
            it = (it->second == 0.0) ? terms_.erase(it) : std::next(it);
        }
        derived().apply_extra(op);
        return derived();
    }

    storage_type terms_;
};

} // namespace spinsim
