// End-to-end resolution: online against the mock driver, then offline from the cache
#include <gtest/gtest.h>
#include "resolver/query_resolver.hpp"
#include "core/odbc_error.hpp"
#include "core/resolve_error.hpp"
#include "mock_connection.hpp"
#include <filesystem>

using namespace querylens;
using core::ResolveError;
using core::ResolveErrorKind;

namespace fs = std::filesystem;

class QueryResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache_dir = fs::temp_directory_path() /
                    ("querylens_resolver_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(cache_dir);
    }
    
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(cache_dir, ec);
    }
    
    config::ResolverConfig online_config(const std::string& options = "") {
        config::ResolverConfig config;
        config.connection_string = test::get_mock_connection(options);
        config.offline_dir = cache_dir;
        config.save_to_cache = true;
        return config;
    }
    
    config::ResolverConfig offline_config() {
        config::ResolverConfig config;
        config.offline = true;
        config.offline_dir = cache_dir;
        return config;
    }
    
    // Online resolver, or nullptr when the driver manager cannot load the mock
    std::unique_ptr<resolver::QueryResolver> online(const std::string& options = "") {
        auto resolver = std::make_unique<resolver::QueryResolver>(online_config(options));
        try {
            resolver->connect();
        } catch (const core::OdbcError&) {
            return nullptr;
        }
        return resolver;
    }
    
    static sources::QuerySource source(const std::string& name, const std::string& sql,
                                       std::vector<std::string> params = {}) {
        sources::QuerySource s;
        s.name = name;
        s.sql = sql;
        s.param_names = std::move(params);
        s.file = name + ".sql";
        s.line = 1;
        return s;
    }
    
    fs::path cache_dir;
};

TEST_F(QueryResolverTest, ModeFollowsConfiguration) {
    resolver::QueryResolver with_connection(online_config());
    EXPECT_EQ(with_connection.mode(), config::ResolveMode::Online);
    EXPECT_TRUE(with_connection.db_name().empty());
    
    resolver::QueryResolver forced_offline(offline_config());
    EXPECT_EQ(forced_offline.mode(), config::ResolveMode::Offline);
}

TEST_F(QueryResolverTest, ResolvesOnline) {
    auto resolver = online();
    if (!resolver) GTEST_SKIP() << "Mock ODBC driver not loadable";
    
    auto resolved = resolver->resolve(source("find_user",
        "SELECT USER_ID, USERNAME, EMAIL AS \"email!\", CREATED_DATE FROM USERS WHERE USER_ID = ?",
        {"user_id"}));
    
    EXPECT_EQ(resolver->db_name(), "MockDB");
    EXPECT_EQ(resolved.data.db_name, "MockDB");
    
    ASSERT_EQ(resolved.parameters.size(), 1u);
    EXPECT_EQ(resolved.parameters[0].field_name, "user_id");
    EXPECT_EQ(resolved.parameters[0].host_type, "std::int32_t");
    
    ASSERT_EQ(resolved.columns.size(), 4u);
    EXPECT_EQ(resolved.columns[0].field_name, "USER_ID");
    EXPECT_EQ(resolved.columns[0].host_type, "std::int32_t");
    EXPECT_FALSE(resolved.columns[0].nullable);
    
    EXPECT_EQ(resolved.columns[2].field_name, "email");
    EXPECT_FALSE(resolved.columns[2].nullable);
    EXPECT_TRUE(resolved.columns[2].nullable_overridden);
    
    EXPECT_EQ(resolved.columns[3].host_type, "SQL_DATE_STRUCT");
    EXPECT_TRUE(resolved.columns[3].nullable);
}

TEST_F(QueryResolverTest, OnlineWritesCacheThenOfflineReadsIt) {
    const std::string sql = "SELECT O.ORDER_ID, O.TOTAL_AMOUNT FROM ORDERS O WHERE O.STATUS = ?";
    
    {
        auto resolver = online();
        if (!resolver) GTEST_SKIP() << "Mock ODBC driver not loadable";
        resolver->resolve(source("open_orders", sql));
        EXPECT_EQ(resolver->cache().list_hashes().size(), 1u);
    }
    
    resolver::QueryResolver offline(offline_config());
    auto resolved = offline.resolve(source("open_orders", sql));
    
    EXPECT_EQ(resolved.data.db_name, "MockDB");
    ASSERT_EQ(resolved.parameters.size(), 1u);
    EXPECT_EQ(resolved.parameters[0].field_name, "p1");
    EXPECT_EQ(resolved.parameters[0].host_type, "std::string");
    ASSERT_EQ(resolved.columns.size(), 2u);
    EXPECT_EQ(resolved.columns[1].field_name, "TOTAL_AMOUNT");
    EXPECT_EQ(resolved.columns[1].host_type, "std::string");
    EXPECT_TRUE(resolved.columns[1].nullable);
}

TEST_F(QueryResolverTest, OfflineMissingEntry) {
    fs::create_directories(cache_dir);
    resolver::QueryResolver offline(offline_config());
    
    try {
        offline.resolve(source("missing", "SELECT 1"));
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::OfflineDataMissing);
        EXPECT_NE(std::string(e.what()).find("QUERYLENS_OFFLINE=true"), std::string::npos);
    }
}

TEST_F(QueryResolverTest, AutomaticOfflineMissingEntry) {
    fs::create_directories(cache_dir);
    config::ResolverConfig config;
    config.offline_dir = cache_dir;
    resolver::QueryResolver offline(config);
    ASSERT_EQ(offline.mode(), config::ResolveMode::Offline);
    
    try {
        offline.resolve(source("missing", "SELECT 1"));
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::OfflineDataMissing);
        EXPECT_NE(std::string(e.what()).find("QUERYLENS_CONNECTION"), std::string::npos);
    }
}

TEST_F(QueryResolverTest, RejectedQueryIsOdbcError) {
    auto resolver = online();
    if (!resolver) GTEST_SKIP() << "Mock ODBC driver not loadable";
    
    EXPECT_THROW(resolver->resolve(source("bad", "SELECT * FROM NO_SUCH_TABLE")), core::OdbcError);
    EXPECT_TRUE(resolver->cache().list_hashes().empty());
}

TEST_F(QueryResolverTest, UnsupportedColumnType) {
    auto resolver = online();
    if (!resolver) GTEST_SKIP() << "Mock ODBC driver not loadable";
    
    try {
        resolver->resolve(source("shelf", "SELECT PRODUCT_ID, SHELF_LIFE FROM PRODUCTS"));
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::UnsupportedType);
    }
    
    auto resolved = resolver->resolve(
        source("shelf_text", "SELECT PRODUCT_ID, SHELF_LIFE AS \"shelf_life: std::string\" FROM PRODUCTS"));
    EXPECT_EQ(resolved.columns[1].host_type, "std::string");
    EXPECT_TRUE(resolved.columns[1].type_overridden);
}

TEST_F(QueryResolverTest, DescribeParamUnsupportedFallsBackToText) {
    auto resolver = online("DescribeParam=Unsupported;");
    if (!resolver) GTEST_SKIP() << "Mock ODBC driver not loadable";
    
    auto resolved = resolver->resolve(source("by_id", "SELECT NAME FROM PRODUCTS WHERE PRODUCT_ID = ?"));
    EXPECT_FALSE(resolved.data.describe.parameter_types_known);
    ASSERT_EQ(resolved.parameters.size(), 1u);
    EXPECT_EQ(resolved.parameters[0].host_type, "std::string");
    EXPECT_TRUE(resolved.parameters[0].nullable);
}

TEST(QueryResolverBuildTest, ParameterCountMismatch) {
    describe::QueryDescription desc;
    desc.parameters.resize(2);
    desc.parameters[0].ordinal = 1;
    desc.parameters[1].ordinal = 2;
    
    sources::QuerySource source;
    source.name = "q";
    source.sql = "SELECT ? , ?";
    source.param_names = {"only_one"};
    
    try {
        resolver::QueryResolver::build(source, cache::QueryData::make("MockDB", source.sql, desc));
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::ParameterCount);
        EXPECT_STREQ(e.what(), "expected 2 parameters, got 1");
    }
}

TEST(QueryResolverBuildTest, DuplicateFieldNames) {
    describe::QueryDescription desc;
    for (int i = 1; i <= 2; ++i) {
        describe::ColumnDescription column;
        column.ordinal = i;
        column.name = i == 1 ? "id" : "id!";
        column.type.data_type = SQL_INTEGER;
        column.nullable = false;
        desc.columns.push_back(column);
    }
    
    sources::QuerySource source;
    source.name = "q";
    source.sql = "SELECT a AS id, b AS \"id!\" FROM t";
    
    try {
        resolver::QueryResolver::build(source, cache::QueryData::make("MockDB", source.sql, desc));
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::InvalidOverride);
        EXPECT_NE(std::string(e.what()).find("columns #1 and #2"), std::string::npos);
    }
}

TEST(QueryResolverBuildTest, DuplicateParameterNames) {
    describe::QueryDescription desc;
    desc.parameters.resize(2);
    desc.parameters[0].ordinal = 1;
    desc.parameters[1].ordinal = 2;
    
    sources::QuerySource source;
    source.name = "find_user";
    source.sql = "SELECT USER_ID FROM USERS WHERE USER_ID = ? OR USER_ID = ?";
    source.param_names = {"id", "id"};
    source.file = "users.sql";
    source.line = 1;
    
    try {
        resolver::QueryResolver::build(source, cache::QueryData::make("MockDB", source.sql, desc));
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::SourceSyntax);
        EXPECT_NE(std::string(e.what()).find("users.sql:1"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("parameters #1 and #2"), std::string::npos);
    }
}
