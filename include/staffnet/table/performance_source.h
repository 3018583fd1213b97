// table/performance_source.h - Pluggable per-row performance values
// Part of the staff network library (C++20)
//
// Performance composites (wins, EPA and WAR over expected) are produced
// outside this library, one family per role.  Each family is exposed as
// a performance_source; sources are chained so the first one holding a
// value for a row wins, and rows that already carry a value are left
// alone.

#ifndef STAFFNET_TABLE_PERFORMANCE_SOURCE_H
#define STAFFNET_TABLE_PERFORMANCE_SOURCE_H

#include "../core/coach_types.h"

#include <concepts>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace staffnet {

// ─── performance_key ────────────────────────────────────────────────────
// Identifies one (coach, season, team, role) tenure for value lookup.

struct performance_key {
    coach_id coach{};
    int season = 0;
    std::string team;
    role_side role;
    std::string subcategory;
};

[[nodiscard]] inline performance_key key_of(staff_row const& r) {
    return performance_key{r.coach, r.year, r.team, r.role, r.subcategory};
}

// ─── performance_source concept ─────────────────────────────────────────

template <typename S>
concept performance_source = requires(S const& s, performance_key const& k) {
    { s.lookup(k) } -> std::same_as<std::optional<double>>;
    { s.name() } -> std::convertible_to<std::string>;
};

// ─── table_performance_source ───────────────────────────────────────────
// Values stored per key.  An empty side or subcategory in a stored key
// matches any side / subcategory; when several stored keys match, the
// most specific one wins, then the earliest inserted.

class table_performance_source {
public:
    explicit table_performance_source(std::string name = "table")
        : name_(std::move(name)) {}

    void add(performance_key const& key, double value) {
        auto& bucket = index_[bucket_key{key.coach, key.season, key.team, key.role.role}];
        bucket.push_back(stored{key.role.side, key.subcategory, value});
        ++size_;
    }

    [[nodiscard]] std::optional<double> lookup(performance_key const& key) const {
        auto it = index_.find(bucket_key{key.coach, key.season, key.team, key.role.role});
        if (it == index_.end()) return std::nullopt;

        std::optional<double> best;
        int best_specificity = -1;
        for (auto const& s : it->second) {
            if (!s.side.empty() && s.side != key.role.side) continue;
            if (!s.subcategory.empty() && s.subcategory != key.subcategory) continue;
            int const specificity = (s.side.empty() ? 0 : 1) + (s.subcategory.empty() ? 0 : 1);
            if (specificity > best_specificity) {
                best = s.value;
                best_specificity = specificity;
            }
        }
        return best;
    }

    [[nodiscard]] std::string name() const { return name_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

private:
    using bucket_key = std::tuple<coach_id, int, std::string, std::string>;

    struct stored {
        std::string side;
        std::string subcategory;
        double value = 0.0;
    };

    std::string name_;
    std::map<bucket_key, std::vector<stored>> index_;
    std::size_t size_ = 0;
};

static_assert(performance_source<table_performance_source>);

// ─── any_performance_source type-erased wrapper ─────────────────────────

class any_performance_source {
    struct concept_t {
        virtual ~concept_t() = default;
        virtual std::optional<double> lookup(performance_key const& k) const = 0;
        virtual std::string name() const = 0;
    };

    template <typename S>
    struct source_t final : concept_t {
        S source_;
        explicit source_t(S s) : source_(std::move(s)) {}
        std::optional<double> lookup(performance_key const& k) const override {
            return source_.lookup(k);
        }
        std::string name() const override { return source_.name(); }
    };

    std::shared_ptr<concept_t const> impl_;

public:
    any_performance_source() = default;

    template <typename S>
        requires (!std::same_as<std::remove_cvref_t<S>, any_performance_source> &&
                  performance_source<S>)
    explicit any_performance_source(S s)
        : impl_(std::make_shared<source_t<S>>(std::move(s))) {}

    /// Throws std::logic_error on an empty wrapper.
    std::optional<double> lookup(performance_key const& k) const {
        if (!impl_) throw std::logic_error("any_performance_source: empty source");
        return impl_->lookup(k);
    }
    std::string name() const { return impl_ ? impl_->name() : std::string{}; }
    explicit operator bool() const { return impl_ != nullptr; }
};

static_assert(performance_source<any_performance_source>);

// ─── source_chain ───────────────────────────────────────────────────────
// Tries each source in order; the first value found wins.

class source_chain {
public:
    source_chain() = default;
    explicit source_chain(std::vector<any_performance_source> sources)
        : sources_(std::move(sources)) {}

    [[nodiscard]] std::optional<double> lookup(performance_key const& k) const {
        for (auto const& s : sources_) {
            if (!s) continue;
            if (auto v = s.lookup(k)) return v;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::string name() const {
        std::string out;
        for (auto const& s : sources_) {
            if (!out.empty()) out += ",";
            out += s.name();
        }
        return out;
    }

    [[nodiscard]] std::size_t size() const noexcept { return sources_.size(); }

private:
    std::vector<any_performance_source> sources_;
};

static_assert(performance_source<source_chain>);

template <performance_source... S>
[[nodiscard]] source_chain coalesce_sources(S... sources) {
    std::vector<any_performance_source> v;
    v.reserve(sizeof...(S));
    (v.emplace_back(std::move(sources)), ...);
    return source_chain(std::move(v));
}

// ─── attach_performance ─────────────────────────────────────────────────
// Fills only rows whose value is empty.  Returns the number filled.

template <performance_source S>
std::size_t attach_performance(std::vector<staff_row>& rows, S const& source) {
    std::size_t filled = 0;
    for (auto& r : rows) {
        if (r.value) continue;
        if (auto v = source.lookup(key_of(r))) {
            r.value = *v;
            ++filled;
        }
    }
    return filled;
}

} // namespace staffnet

#endif // STAFFNET_TABLE_PERFORMANCE_SOURCE_H
