//
// Created by gregorian-rayne on 10/16/26.
//

#include "ppa/patterns/catalog.hpp"
#include "ppa/utils/string_utils.hpp"

#include <algorithm>
#include <set>

namespace ppa::patterns
{
    namespace {

        constexpr auto kDjango = "django";
        constexpr auto kSqlAlchemy = "sqlalchemy";
        constexpr auto kGeneric = "generic";

        NamePredicate resolved(const MatchKind kind, std::vector<std::string> patterns, const bool ignore_case = false) {
            return {MatchTarget::Resolved, kind, std::move(patterns), ignore_case};
        }

        NamePredicate written(const MatchKind kind, std::vector<std::string> patterns, const bool ignore_case = false) {
            return {MatchTarget::Written, kind, std::move(patterns), ignore_case};
        }

        bool match_one(const MatchKind kind, const std::string_view name, const std::string_view pattern) {
            switch (kind) {
                case MatchKind::Exact:
                    return name == pattern;
                case MatchKind::Prefix:
                    return string_utils::starts_with(name, pattern);
                case MatchKind::Suffix:
                    return string_utils::ends_with(name, pattern);
                case MatchKind::Contains:
                    return string_utils::contains(name, pattern);
                case MatchKind::QualifiedSuffix:
                    return name == pattern ||
                           (name.size() > pattern.size() && string_utils::ends_with(name, pattern) &&
                            name[name.size() - pattern.size() - 1] == '.');
            }
            return false;
        }

        const std::vector<std::string>& django_methods() {
            static const std::vector<std::string> methods = {
                ".objects.all",
                ".objects.filter",
                ".objects.get",
                ".objects.exclude",
                ".objects.select_related",
                ".objects.prefetch_related"
            };
            return methods;
        }

        std::vector<CatalogEntry> builtin_orm_entries() {
            return {
                {{resolved(MatchKind::Contains, {"django", "models.", ".objects."}, true),
                  resolved(MatchKind::Contains, django_methods())},
                 kDjango},
                {{resolved(MatchKind::Contains, {"sqlalchemy"}, true),
                  resolved(MatchKind::Suffix, {".query", ".filter", ".filter_by", ".all", ".first", ".one",
                                               ".execute", ".scalars", ".get"})},
                 kSqlAlchemy},
                {{resolved(MatchKind::Contains, {"session.query"}, true)}, kSqlAlchemy},

                {{written(MatchKind::Contains, django_methods())}, kDjango},
                {{written(MatchKind::Contains, {"session.query"})}, kSqlAlchemy},
                {{written(MatchKind::Suffix, {".query", ".filter_by"})}, kSqlAlchemy},
                {{written(MatchKind::Suffix, {".execute", ".executemany", ".fetchall", ".fetchone"})}, kGeneric},
                {{written(MatchKind::Contains, {".objects.", "objects.all", "objects.filter"})}, kDjango},
                {{written(MatchKind::Suffix, {".all", ".filter", ".get", ".first", ".one"})}, kGeneric}
            };
        }

        struct BlockingName {
            const char* name;
            const char* alternative;
        };

        constexpr BlockingName kBlockingNames[] = {
            {"builtins.open", "aiofiles.open"},
            {"io.open", "aiofiles.open"},
            {"open", "aiofiles.open"},
            {"time.sleep", "asyncio.sleep"},
            {"requests.get", "aiohttp.ClientSession.get"},
            {"requests.post", "aiohttp.ClientSession.post"},
            {"requests.put", "aiohttp.ClientSession.put"},
            {"requests.delete", "aiohttp.ClientSession.delete"},
            {"urllib.request.urlopen", "aiohttp.ClientSession.request"},
            {"os.read", ""},
            {"os.write", ""},
            {"subprocess.run", "asyncio.create_subprocess_exec"},
            {"subprocess.call", "asyncio.create_subprocess_exec"},
            {"subprocess.check_output", "asyncio.create_subprocess_exec"}
        };

        std::vector<CatalogEntry> builtin_blocking_entries() {
            std::vector<CatalogEntry> entries;
            for (const auto& [name, alternative] : kBlockingNames) {
                entries.push_back({{resolved(MatchKind::Exact, {name})}, alternative});
            }
            entries.push_back({{resolved(MatchKind::Prefix, {"requests.", "urllib.request."})}, "aiohttp.ClientSession"});
            for (const auto& [name, alternative] : kBlockingNames) {
                entries.push_back({{written(MatchKind::Exact, {name})}, alternative});
            }
            entries.push_back({{written(MatchKind::Contains, {"requests.", "urllib.request"}, true)},
                               "aiohttp.ClientSession"});
            return entries;
        }

        constexpr auto kJson = "json";
        constexpr auto kPickle = "pickle";
        constexpr auto kReadlines = "readlines";
        constexpr auto kRead = "read";
        constexpr auto kOther = "other";

        std::vector<CatalogEntry> builtin_memory_entries() {
            std::vector<CatalogEntry> entries;
            for (const auto target : {MatchTarget::Resolved, MatchTarget::Written}) {
                entries.push_back({{{target, MatchKind::QualifiedSuffix, {"json.load"}}}, kJson});
                entries.push_back({{{target, MatchKind::QualifiedSuffix, {"pickle.load"}}}, kPickle});
                entries.push_back({{{target, MatchKind::QualifiedSuffix, {"readlines"}}}, kReadlines});
                entries.push_back({{{target, MatchKind::QualifiedSuffix, {"read"}}}, kRead});
            }
            return entries;
        }

        std::vector<CatalogEntry> builtin_conversion_entries() {
            static constexpr const char* kConversions[] = {
                "int", "str", "float", "bool", "list", "dict", "set", "tuple", "bytes", "bytearray"
            };
            std::vector<std::string> qualified;
            std::vector<std::string> plain;
            for (const char* name : kConversions) {
                qualified.push_back(std::string("builtins.") + name);
                plain.emplace_back(name);
            }
            return {
                {{resolved(MatchKind::Exact, std::move(qualified))}, "conversion"},
                {{written(MatchKind::Exact, std::move(plain))}, "conversion"}
            };
        }

        std::optional<OrmFramework> parse_framework(const std::string_view label) {
            if (label == kDjango) {
                return OrmFramework::Django;
            }
            if (label == kSqlAlchemy) {
                return OrmFramework::SqlAlchemy;
            }
            if (label == kGeneric) {
                return OrmFramework::Generic;
            }
            return std::nullopt;
        }

        MemoryLoadKind parse_memory_kind(const std::string_view label) {
            if (label == kJson) {
                return MemoryLoadKind::Json;
            }
            if (label == kPickle) {
                return MemoryLoadKind::Pickle;
            }
            if (label == kReadlines) {
                return MemoryLoadKind::Readlines;
            }
            if (label == kRead) {
                return MemoryLoadKind::Read;
            }
            return MemoryLoadKind::Other;
        }

    }  // namespace

    // ============================================================================
    // Tables
    // ============================================================================

    bool NamePredicate::matches(const std::string_view written, const std::optional<std::string>& resolved) const {
        if (target == MatchTarget::Resolved && !resolved.has_value()) {
            return false;
        }
        const std::string_view name = target == MatchTarget::Resolved ? std::string_view(*resolved) : written;
        const std::string folded = ignore_case ? string_utils::to_lower(name) : std::string();
        const std::string_view subject = ignore_case ? std::string_view(folded) : name;

        return std::ranges::any_of(patterns, [&](const std::string& pattern) {
            if (ignore_case) {
                return match_one(kind, subject, string_utils::to_lower(pattern));
            }
            return match_one(kind, subject, pattern);
        });
    }

    bool CatalogEntry::resolved_tier() const noexcept {
        return !all_of.empty() && std::ranges::all_of(all_of, [](const NamePredicate& p) {
            return p.target == MatchTarget::Resolved;
        });
    }

    bool CatalogEntry::matches(const std::string_view written, const std::optional<std::string>& resolved) const {
        return !all_of.empty() && std::ranges::all_of(all_of, [&](const NamePredicate& p) {
            return p.matches(written, resolved);
        });
    }

    void PatternTable::prepend(CatalogEntry entry) {
        entries_.insert(entries_.begin(), std::move(entry));
    }

    std::optional<std::string> PatternTable::classify(const std::string_view written,
                                                      const std::optional<std::string>& resolved) const {
        if (resolved.has_value()) {
            for (const auto& entry : entries_) {
                if (entry.resolved_tier() && entry.matches(written, resolved)) {
                    return entry.label;
                }
            }
        }
        for (const auto& entry : entries_) {
            if (!entry.resolved_tier() && entry.matches(written, resolved)) {
                return entry.label;
            }
        }
        return std::nullopt;
    }

    // ============================================================================
    // Catalog
    // ============================================================================

    const char* to_string(const OrmFramework framework) noexcept {
        switch (framework) {
            case OrmFramework::Django:     return "django";
            case OrmFramework::SqlAlchemy: return "sqlalchemy";
            case OrmFramework::Generic:    return "generic";
        }
        return "generic";
    }

    const char* to_string(const MemoryLoadKind kind) noexcept {
        switch (kind) {
            case MemoryLoadKind::Json:      return "json";
            case MemoryLoadKind::Pickle:    return "pickle";
            case MemoryLoadKind::Readlines: return "readlines";
            case MemoryLoadKind::Read:      return "read";
            case MemoryLoadKind::Other:     return "other";
        }
        return "other";
    }

    PatternCatalog::PatternCatalog()
        : orm_(builtin_orm_entries())
        , blocking_(builtin_blocking_entries())
        , memory_(builtin_memory_entries())
        , conversions_(builtin_conversion_entries()) {}

    PatternCatalog::PatternCatalog(const CatalogExtensions& extensions)
        : PatternCatalog() {
        for (const auto& method : extensions.orm_methods) {
            const std::string suffix = string_utils::starts_with(method, ".") ? method : "." + method;
            orm_.append({{written(MatchKind::Suffix, {suffix})}, kGeneric});
        }

        // Configured names take precedence over the built-in alternatives.
        std::set<std::string> blocking(extensions.blocking_calls.begin(), extensions.blocking_calls.end());
        for (const auto& [name, alternative] : extensions.async_alternatives) {
            blocking.insert(name);
        }
        for (const auto& name : blocking) {
            const auto it = extensions.async_alternatives.find(name);
            const std::string alternative = it != extensions.async_alternatives.end() ? it->second : std::string();
            blocking_.prepend({{written(MatchKind::Exact, {name})}, alternative});
            blocking_.prepend({{resolved(MatchKind::Exact, {name})}, alternative});
        }

        for (const auto& name : extensions.memory_calls) {
            memory_.append({{resolved(MatchKind::QualifiedSuffix, {name})}, kOther});
            memory_.append({{written(MatchKind::QualifiedSuffix, {name})}, kOther});
        }
    }

    const PatternCatalog& PatternCatalog::builtin() {
        static const PatternCatalog catalog;
        return catalog;
    }

    std::optional<OrmFramework> PatternCatalog::classify_orm_query(const std::string_view written,
                                                                   const std::optional<std::string>& resolved) const {
        const auto label = orm_.classify(written, resolved);
        if (!label) {
            return std::nullopt;
        }
        return parse_framework(*label).value_or(OrmFramework::Generic);
    }

    std::optional<BlockingIoMatch> PatternCatalog::classify_blocking_io(const std::string_view written,
                                                                        const std::optional<std::string>& resolved) const {
        const auto label = blocking_.classify(written, resolved);
        if (!label) {
            return std::nullopt;
        }
        BlockingIoMatch match;
        if (!label->empty()) {
            match.alternative = *label;
        }
        return match;
    }

    std::optional<MemoryLoadKind> PatternCatalog::classify_memory_load(const std::string_view written,
                                                                       const std::optional<std::string>& resolved) const {
        const auto label = memory_.classify(written, resolved);
        if (!label) {
            return std::nullopt;
        }
        return parse_memory_kind(*label);
    }

    bool PatternCatalog::classify_type_conversion(const std::string_view written,
                                                  const std::optional<std::string>& resolved) const {
        return conversions_.classify(written, resolved).has_value();
    }

    bool is_orm_query(const std::string_view written, const std::optional<std::string>& resolved) {
        return PatternCatalog::builtin().classify_orm_query(written, resolved).has_value();
    }

    bool is_blocking_io(const std::string_view written, const std::optional<std::string>& resolved) {
        return PatternCatalog::builtin().classify_blocking_io(written, resolved).has_value();
    }

    bool is_memory_intensive(const std::string_view written, const std::optional<std::string>& resolved) {
        return PatternCatalog::builtin().classify_memory_load(written, resolved).has_value();
    }

    bool is_type_conversion(const std::string_view written, const std::optional<std::string>& resolved) {
        return PatternCatalog::builtin().classify_type_conversion(written, resolved);
    }

    std::optional<std::string> async_alternative(const std::string_view written,
                                                 const std::optional<std::string>& resolved) {
        const auto match = PatternCatalog::builtin().classify_blocking_io(written, resolved);
        if (!match) {
            return std::nullopt;
        }
        return match->alternative;
    }

    // ============================================================================
    // Remediation text
    // ============================================================================

    std::string orm_suggestion(const std::optional<OrmFramework> framework) {
        switch (framework.value_or(OrmFramework::Generic)) {
            case OrmFramework::Django:
                return "Use select_related() for foreign keys or prefetch_related() for many-to-many "
                       "relationships to fetch related objects in a single query";
            case OrmFramework::SqlAlchemy:
                return "Use joinedload() or subqueryload() to eager load related objects and reduce query count";
            case OrmFramework::Generic:
                break;
        }
        return "Consider fetching all required data before the loop or using a JOIN query to reduce "
               "database round-trips";
    }

    std::string blocking_io_suggestion(const BlockingIoMatch& match) {
        if (match.alternative) {
            return "Replace with " + *match.alternative + " and use await";
        }
        return "Replace with async alternative";
    }

    std::string memory_load_description(const MemoryLoadKind kind, const std::string_view operation) {
        const std::string op(operation);
        switch (kind) {
            case MemoryLoadKind::Json:
                return "Loading entire JSON file with " + op + "() loads all data into memory";
            case MemoryLoadKind::Pickle:
                return "Loading entire pickle file with " + op + "() loads all data into memory";
            case MemoryLoadKind::Readlines:
                return "Reading all lines with " + op + "() loads entire file into memory";
            case MemoryLoadKind::Read:
                return "Reading entire file with " + op + "() loads all data into memory";
            case MemoryLoadKind::Other:
                break;
        }
        return "Memory-intensive operation " + op + "() loads large amount of data into memory";
    }

    std::string memory_load_suggestion(const MemoryLoadKind kind) {
        switch (kind) {
            case MemoryLoadKind::Json:
                return "Use ijson for streaming JSON parsing to avoid loading entire file into memory";
            case MemoryLoadKind::Pickle:
                return "Consider streaming pickle data or using memory-mapped files for large pickle files";
            case MemoryLoadKind::Readlines:
                return "Iterate over the file object directly instead of readlines() to process line-by-line";
            case MemoryLoadKind::Read:
                return "Read file in chunks or line-by-line for large files to reduce memory usage";
            case MemoryLoadKind::Other:
                break;
        }
        return "Consider streaming or chunked processing to reduce memory usage";
    }
}  // namespace ppa::patterns
