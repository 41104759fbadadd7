//
// Created by gregorian-rayne on 10/16/26.
//

#ifndef PPA_CATALOG_HPP
#define PPA_CATALOG_HPP

/**
 * @file catalog.hpp
 * @brief Name-based classification of call sites.
 *
 * Every classification is an ordered table of (predicate, label) entries.
 * A predicate matches either the resolved, fully qualified callee or the
 * name as written in the source. Lookup has two tiers:
 *
 * 1. When the resolver produced a qualified name, entries whose predicates
 *    all look at the resolved name are tried first, in table order.
 * 2. Otherwise, or when no resolved entry matched, entries that look at
 *    the written name decide, again in table order.
 *
 * The first matching entry wins. Tables are plain data, so a
 * configuration can add entries without touching the matching code.
 */

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ppa::patterns {

    enum class MatchTarget {
        Resolved,   ///< fully qualified callee from the resolver
        Written     ///< callee as it appears in the source
    };

    enum class MatchKind {
        Exact,
        Prefix,
        Suffix,
        Contains,
        QualifiedSuffix     ///< equal to the pattern or ending in "." + pattern
    };

    /**
     * Matches one of the two names against any of several patterns.
     */
    struct NamePredicate {
        MatchTarget target = MatchTarget::Written;
        MatchKind kind = MatchKind::Exact;
        std::vector<std::string> patterns;
        bool ignore_case = false;

        [[nodiscard]] bool matches(std::string_view written, const std::optional<std::string>& resolved) const;
    };

    /**
     * All predicates must hold for the entry to classify a call as `label`.
     */
    struct CatalogEntry {
        std::vector<NamePredicate> all_of;
        std::string label;

        /// True when every predicate inspects the resolved name.
        [[nodiscard]] bool resolved_tier() const noexcept;

        [[nodiscard]] bool matches(std::string_view written, const std::optional<std::string>& resolved) const;
    };

    class PatternTable {
    public:
        PatternTable() = default;
        explicit PatternTable(std::vector<CatalogEntry> entries)
            : entries_(std::move(entries)) {}

        void append(CatalogEntry entry) { entries_.push_back(std::move(entry)); }
        void prepend(CatalogEntry entry);

        /**
         * Label of the first matching entry, resolved tier first.
         */
        [[nodiscard]] std::optional<std::string> classify(std::string_view written,
                                                          const std::optional<std::string>& resolved) const;

        [[nodiscard]] const std::vector<CatalogEntry>& entries() const noexcept { return entries_; }

    private:
        std::vector<CatalogEntry> entries_;
    };

    // ============================================================================
    // Classification results
    // ============================================================================

    enum class OrmFramework {
        Django,
        SqlAlchemy,
        Generic
    };

    const char* to_string(OrmFramework framework) noexcept;

    struct BlockingIoMatch {
        /// Awaitable replacement, when one is known.
        std::optional<std::string> alternative;

        bool operator==(const BlockingIoMatch&) const = default;
    };

    enum class MemoryLoadKind {
        Json,
        Pickle,
        Readlines,
        Read,
        Other
    };

    const char* to_string(MemoryLoadKind kind) noexcept;

    /**
     * Entries added on top of the built-in tables.
     */
    struct CatalogExtensions {
        /// Written-name suffixes treated as generic ORM queries ("paginate").
        std::vector<std::string> orm_methods;

        /// Exact written or resolved names treated as blocking I/O.
        std::vector<std::string> blocking_calls;

        /// Exact names or dotted suffixes treated as whole-structure loads.
        std::vector<std::string> memory_calls;

        /// Replacement suggested for a blocking name.
        std::map<std::string, std::string> async_alternatives;

        [[nodiscard]] bool empty() const noexcept {
            return orm_methods.empty() && blocking_calls.empty() && memory_calls.empty() &&
                   async_alternatives.empty();
        }

        bool operator==(const CatalogExtensions&) const = default;
    };

    /**
     * The four classification tables.
     *
     * A default-constructed catalog holds the built-in entries. Instances
     * are immutable once built and may be shared.
     */
    class PatternCatalog {
    public:
        PatternCatalog();
        explicit PatternCatalog(const CatalogExtensions& extensions);

        [[nodiscard]] std::optional<OrmFramework> classify_orm_query(
            std::string_view written, const std::optional<std::string>& resolved) const;

        [[nodiscard]] std::optional<BlockingIoMatch> classify_blocking_io(
            std::string_view written, const std::optional<std::string>& resolved) const;

        [[nodiscard]] std::optional<MemoryLoadKind> classify_memory_load(
            std::string_view written, const std::optional<std::string>& resolved) const;

        [[nodiscard]] bool classify_type_conversion(
            std::string_view written, const std::optional<std::string>& resolved) const;

        [[nodiscard]] const PatternTable& orm_table() const noexcept { return orm_; }
        [[nodiscard]] const PatternTable& blocking_table() const noexcept { return blocking_; }
        [[nodiscard]] const PatternTable& memory_table() const noexcept { return memory_; }
        [[nodiscard]] const PatternTable& conversion_table() const noexcept { return conversions_; }

        /**
         * Shared instance holding only the built-in tables.
         */
        [[nodiscard]] static const PatternCatalog& builtin();

    private:
        PatternTable orm_;
        PatternTable blocking_;
        PatternTable memory_;
        PatternTable conversions_;
    };

    // Convenience wrappers over PatternCatalog::builtin().
    [[nodiscard]] bool is_orm_query(std::string_view written, const std::optional<std::string>& resolved);
    [[nodiscard]] bool is_blocking_io(std::string_view written, const std::optional<std::string>& resolved);
    [[nodiscard]] bool is_memory_intensive(std::string_view written, const std::optional<std::string>& resolved);
    [[nodiscard]] bool is_type_conversion(std::string_view written, const std::optional<std::string>& resolved);

    [[nodiscard]] std::optional<std::string> async_alternative(std::string_view written,
                                                               const std::optional<std::string>& resolved);

    // ============================================================================
    // Remediation text
    // ============================================================================

    [[nodiscard]] std::string orm_suggestion(std::optional<OrmFramework> framework);

    [[nodiscard]] std::string blocking_io_suggestion(const BlockingIoMatch& match);

    /**
     * @param operation the call as written, e.g. "json.load"
     */
    [[nodiscard]] std::string memory_load_description(MemoryLoadKind kind, std::string_view operation);

    [[nodiscard]] std::string memory_load_suggestion(MemoryLoadKind kind);

}  // namespace ppa::patterns

#endif //PPA_CATALOG_HPP
