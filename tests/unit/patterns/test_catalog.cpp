//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/patterns/catalog.hpp"

#include <gtest/gtest.h>

namespace ppa::patterns
{
    namespace {
        const std::optional<std::string> kUnresolved = std::nullopt;
    }

    TEST(NamePredicateTest, QualifiedSuffixNeedsDotBoundary) {
        const NamePredicate predicate{MatchTarget::Written, MatchKind::QualifiedSuffix, {"json.load"}};

        EXPECT_TRUE(predicate.matches("json.load", kUnresolved));
        EXPECT_TRUE(predicate.matches("lib.json.load", kUnresolved));
        EXPECT_FALSE(predicate.matches("myjson.load", kUnresolved));
        EXPECT_FALSE(predicate.matches("json.loads", kUnresolved));
    }

    TEST(NamePredicateTest, ResolvedTargetNeedsResolution) {
        const NamePredicate predicate{MatchTarget::Resolved, MatchKind::Exact, {"time.sleep"}};

        EXPECT_FALSE(predicate.matches("time.sleep", kUnresolved));
        EXPECT_TRUE(predicate.matches("sleep", std::string("time.sleep")));
    }

    TEST(NamePredicateTest, IgnoreCase) {
        const NamePredicate predicate{MatchTarget::Written, MatchKind::Contains, {"Requests."}, true};

        EXPECT_TRUE(predicate.matches("REQUESTS.get", kUnresolved));
    }

    TEST(PatternTableTest, ResolvedTierWinsOverEarlierWrittenEntry) {
        PatternTable table;
        table.append({{{MatchTarget::Written, MatchKind::Suffix, {".get"}}}, "written"});
        table.append({{{MatchTarget::Resolved, MatchKind::Prefix, {"requests."}}}, "resolved"});

        EXPECT_EQ(table.classify("requests.get", std::string("requests.get")), "resolved");
        EXPECT_EQ(table.classify("client.get", kUnresolved), "written");
        EXPECT_FALSE(table.classify("client.put", kUnresolved).has_value());
    }

    TEST(PatternTableTest, FirstMatchingEntryWins) {
        PatternTable table;
        table.append({{{MatchTarget::Written, MatchKind::Contains, {"a"}}}, "first"});
        table.append({{{MatchTarget::Written, MatchKind::Contains, {"ab"}}}, "second"});
        table.prepend({{{MatchTarget::Written, MatchKind::Exact, {"abc"}}}, "front"});

        EXPECT_EQ(table.classify("abc", kUnresolved), "front");
        EXPECT_EQ(table.classify("ab", kUnresolved), "first");
        EXPECT_EQ(table.entries().size(), 3u);
    }

    TEST(PatternTableTest, EntryNeedsAllPredicates) {
        const CatalogEntry entry{{{MatchTarget::Resolved, MatchKind::Contains, {"django"}},
                                  {MatchTarget::Resolved, MatchKind::Suffix, {".filter"}}},
                                 "django"};

        EXPECT_TRUE(entry.resolved_tier());
        EXPECT_TRUE(entry.matches("x", std::string("django.models.X.objects.filter")));
        EXPECT_FALSE(entry.matches("x", std::string("django.models.X.objects.all")));
        EXPECT_FALSE(CatalogEntry{}.matches("x", kUnresolved));
    }

    TEST(PatternCatalogTest, OrmFrameworks) {
        const PatternCatalog& catalog = PatternCatalog::builtin();

        EXPECT_EQ(catalog.classify_orm_query("User.objects.filter", std::string("app.models.User.objects.filter")),
                  OrmFramework::Django);
        EXPECT_EQ(catalog.classify_orm_query("User.objects.get", kUnresolved), OrmFramework::Django);
        EXPECT_EQ(catalog.classify_orm_query("session.query", kUnresolved), OrmFramework::SqlAlchemy);
        EXPECT_EQ(catalog.classify_orm_query("q.filter_by", kUnresolved), OrmFramework::SqlAlchemy);
        EXPECT_EQ(catalog.classify_orm_query("cursor.execute", kUnresolved), OrmFramework::Generic);
        EXPECT_EQ(catalog.classify_orm_query("results.first", kUnresolved), OrmFramework::Generic);
        EXPECT_FALSE(catalog.classify_orm_query("print", std::string("builtins.print")).has_value());
    }

    TEST(PatternCatalogTest, BlockingIoWithAlternatives) {
        const PatternCatalog& catalog = PatternCatalog::builtin();

        const auto sleep = catalog.classify_blocking_io("time.sleep", std::string("time.sleep"));
        ASSERT_TRUE(sleep.has_value());
        EXPECT_EQ(sleep->alternative, "asyncio.sleep");

        const auto opened = catalog.classify_blocking_io("open", std::string("builtins.open"));
        ASSERT_TRUE(opened.has_value());
        EXPECT_EQ(opened->alternative, "aiofiles.open");

        const auto session = catalog.classify_blocking_io("requests.Session", std::string("requests.Session"));
        ASSERT_TRUE(session.has_value());
        EXPECT_EQ(session->alternative, "aiohttp.ClientSession");

        const auto raw = catalog.classify_blocking_io("os.write", kUnresolved);
        ASSERT_TRUE(raw.has_value());
        EXPECT_FALSE(raw->alternative.has_value());

        EXPECT_FALSE(catalog.classify_blocking_io("asyncio.sleep", std::string("asyncio.sleep")).has_value());
    }

    TEST(PatternCatalogTest, WrittenNameFallbackWithoutResolution) {
        EXPECT_TRUE(is_blocking_io("requests.get", kUnresolved));
        EXPECT_TRUE(is_blocking_io("time.sleep", kUnresolved));
        EXPECT_EQ(async_alternative("requests.get", kUnresolved), "aiohttp.ClientSession.get");
        EXPECT_FALSE(is_blocking_io("client.get", kUnresolved));
    }

    TEST(PatternCatalogTest, MemoryLoadKinds) {
        const PatternCatalog& catalog = PatternCatalog::builtin();

        EXPECT_EQ(catalog.classify_memory_load("json.load", std::string("json.load")), MemoryLoadKind::Json);
        EXPECT_EQ(catalog.classify_memory_load("pickle.load", kUnresolved), MemoryLoadKind::Pickle);
        EXPECT_EQ(catalog.classify_memory_load("f.readlines", kUnresolved), MemoryLoadKind::Readlines);
        EXPECT_EQ(catalog.classify_memory_load("f.read", kUnresolved), MemoryLoadKind::Read);
        EXPECT_FALSE(catalog.classify_memory_load("f.readline", kUnresolved).has_value());
        EXPECT_FALSE(catalog.classify_memory_load("json.loads", std::string("json.loads")).has_value());
    }

    TEST(PatternCatalogTest, TypeConversions) {
        EXPECT_TRUE(is_type_conversion("int", std::string("builtins.int")));
        EXPECT_TRUE(is_type_conversion("str", kUnresolved));
        EXPECT_FALSE(is_type_conversion("len", std::string("builtins.len")));
    }

    TEST(PatternCatalogTest, ExtensionsAddEntries) {
        CatalogExtensions extensions;
        extensions.orm_methods = {"paginate"};
        extensions.blocking_calls = {"mylib.fetch"};
        extensions.async_alternatives = {{"mylib.fetch", "mylib.async_fetch"}, {"time.sleep", "trio.sleep"}};
        extensions.memory_calls = {"yaml.safe_load"};
        EXPECT_FALSE(extensions.empty());

        const PatternCatalog catalog(extensions);

        EXPECT_EQ(catalog.classify_orm_query("Model.paginate", kUnresolved), OrmFramework::Generic);

        const auto fetch = catalog.classify_blocking_io("fetch", std::string("mylib.fetch"));
        ASSERT_TRUE(fetch.has_value());
        EXPECT_EQ(fetch->alternative, "mylib.async_fetch");

        const auto sleep = catalog.classify_blocking_io("time.sleep", std::string("time.sleep"));
        ASSERT_TRUE(sleep.has_value());
        EXPECT_EQ(sleep->alternative, "trio.sleep");

        EXPECT_EQ(catalog.classify_memory_load("yaml.safe_load", kUnresolved), MemoryLoadKind::Other);

        // The shared built-in catalog is untouched.
        EXPECT_FALSE(is_orm_query("Model.paginate", kUnresolved));
        EXPECT_EQ(async_alternative("time.sleep", std::string("time.sleep")), "asyncio.sleep");
    }

    TEST(PatternCatalogTest, RemediationText) {
        EXPECT_NE(orm_suggestion(OrmFramework::Django).find("select_related()"), std::string::npos);
        EXPECT_NE(orm_suggestion(OrmFramework::SqlAlchemy).find("joinedload()"), std::string::npos);
        EXPECT_EQ(orm_suggestion(std::nullopt), orm_suggestion(OrmFramework::Generic));

        EXPECT_EQ(blocking_io_suggestion(BlockingIoMatch{std::string("aiofiles.open")}),
                  "Replace with aiofiles.open and use await");
        EXPECT_EQ(blocking_io_suggestion(BlockingIoMatch{}), "Replace with async alternative");

        EXPECT_EQ(memory_load_description(MemoryLoadKind::Json, "json.load"),
                  "Loading entire JSON file with json.load() loads all data into memory");
        EXPECT_NE(memory_load_suggestion(MemoryLoadKind::Json).find("ijson"), std::string::npos);
    }

    TEST(PatternCatalogTest, EnumNames) {
        EXPECT_STREQ(to_string(OrmFramework::SqlAlchemy), "sqlalchemy");
        EXPECT_STREQ(to_string(MemoryLoadKind::Readlines), "readlines");
    }
}  // namespace ppa::patterns
