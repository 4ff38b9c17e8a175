#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "DatasourceConnectionProvider.hpp"
#include "NamingDirectory.hpp"
#include "SQLiteDataSource.hpp"
#include <filesystem>
#include <limits>

using namespace dsconn;
using ::testing::HasSubstr;

class SQLiteDataSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir_ = std::filesystem::temp_directory_path() /
                   (std::string("dsconn_sqlite_") + info->name());
        std::filesystem::create_directories(tempDir_);
        dbPath_ = (tempDir_ / "test.db").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;
    std::string dbPath_;
};

TEST_F(SQLiteDataSourceTest, PreCreatesConnections) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_, 4);

    EXPECT_EQ(source->availableCount(), 2u);
    EXPECT_EQ(source->totalCount(), 2u);
    EXPECT_TRUE(std::filesystem::exists(dbPath_));
}

TEST_F(SQLiteDataSourceTest, ConnectionExecutesStatements) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_);
    auto conn = source->getConnection();

    ASSERT_NE(conn, nullptr);
    EXPECT_FALSE(conn->isClosed());
    EXPECT_NO_THROW(conn->execute("CREATE TABLE t (id INTEGER)"));
    EXPECT_NO_THROW(conn->execute("INSERT INTO t VALUES (1)"));
}

TEST_F(SQLiteDataSourceTest, ClosedConnectionReturnsToPool) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_, 2);
    auto conn = source->getConnection();
    EXPECT_EQ(source->availableCount(), 1u);

    conn->close();
    EXPECT_TRUE(conn->isClosed());
    EXPECT_EQ(source->availableCount(), 2u);

    EXPECT_NO_THROW(conn->close());
    EXPECT_EQ(source->availableCount(), 2u);
}

TEST_F(SQLiteDataSourceTest, DestroyedConnectionReturnsToPool) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_, 2);
    {
        auto conn = source->getConnection();
        EXPECT_EQ(source->availableCount(), 1u);
    }
    EXPECT_EQ(source->availableCount(), 2u);
}

TEST_F(SQLiteDataSourceTest, PoolGrowsBeyondIdleAndCapsReturns) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_, 2);
    auto a = source->getConnection();
    auto b = source->getConnection();
    auto c = source->getConnection();

    EXPECT_EQ(source->availableCount(), 0u);
    EXPECT_EQ(source->totalCount(), 3u);

    a->close();
    b->close();
    c->close();
    EXPECT_EQ(source->availableCount(), 2u);
}

TEST_F(SQLiteDataSourceTest, ConnectionOutlivesSource) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_, 2);
    auto conn = source->getConnection();
    source.reset();

    EXPECT_NO_THROW(conn->execute("SELECT 1"));
    EXPECT_NO_THROW(conn->close());
}

TEST_F(SQLiteDataSourceTest, InvalidSqlRaisesWithSqliteCode) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_);
    auto conn = source->getConnection();

    try {
        conn->execute("SELEC nothing");
        FAIL() << "Expected DataSourceException";
    } catch (const DataSourceException& e) {
        EXPECT_EQ(e.errorCode(), SQLITE_ERROR);
    }
}

TEST_F(SQLiteDataSourceTest, ExecuteAfterCloseRaises) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_);
    auto conn = source->getConnection();
    conn->close();

    try {
        conn->execute("SELECT 1");
        FAIL() << "Expected DataSourceException";
    } catch (const DataSourceException& e) {
        EXPECT_EQ(e.errorCode(), SQLITE_MISUSE);
    }
}

TEST_F(SQLiteDataSourceTest, UnopenableDatabaseRaisesOnAcquire) {
    auto source = std::make_shared<SQLiteDataSource>(
        (tempDir_ / "missing" / "dir" / "test.db").string(), 2);
    EXPECT_EQ(source->availableCount(), 0u);

    try {
        source->getConnection();
        FAIL() << "Expected DataSourceException";
    } catch (const DataSourceException& e) {
        EXPECT_EQ(e.errorCode(), SQLITE_CANTOPEN);
        EXPECT_THAT(e.what(), HasSubstr("Unable to open"));
    }
}

// Credentials
TEST_F(SQLiteDataSourceTest, CredentialsRequiredWhenConfigured) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_);
    source->setCredentials(std::string("app"), std::string("secret"));

    try {
        source->getConnection();
        FAIL() << "Expected DataSourceException";
    } catch (const DataSourceException& e) {
        EXPECT_EQ(e.errorCode(), SQLITE_AUTH);
    }
    EXPECT_THROW(source->getConnection("app", "wrong"), DataSourceException);
    EXPECT_NE(source->getConnection("app", "secret"), nullptr);
}

TEST_F(SQLiteDataSourceTest, CredentialsIgnoredWhenNotConfigured) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_);
    EXPECT_NE(source->getConnection("anyone", "anything"), nullptr);
}

// Capture
TEST_F(SQLiteDataSourceTest, CapturedSourceRebuildsOnSameFile) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_, 3);
    source->setCredentials(std::string("app"), std::nullopt);

    StateWriter out;
    out.writeObject(source.get());

    CollaboratorRegistry registry;
    SQLiteDataSource::registerFactory(registry);
    StateReader in(out.bytes());
    auto rebuilt = in.readObject<SQLiteDataSource>(registry);

    ASSERT_NE(rebuilt, nullptr);
    EXPECT_NE(rebuilt, source);
    EXPECT_EQ(rebuilt->path(), dbPath_);
    EXPECT_EQ(rebuilt->poolSize(), 3u);
    EXPECT_THROW(rebuilt->getConnection(), DataSourceException);
    EXPECT_NE(rebuilt->getConnection("app", ""), nullptr);
}

// Behind a provider
TEST_F(SQLiteDataSourceTest, ProviderHandsOutSQLiteConnections) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_, 2);
    source->setCredentials(std::string("app"), std::string("secret"));

    auto directory = std::make_shared<NamingDirectory>("env");
    directory->bind("jdbc/appDS", source);

    DatasourceConnectionProvider provider;
    provider.injectLookupService(directory);
    provider.configure({{settings::DATASOURCE, std::string("java:comp/env/jdbc/appDS")},
                        {settings::USER, std::string("app")},
                        {settings::PASS, std::string("secret")}});

    auto conn = provider.getConnection();
    conn->execute("CREATE TABLE t (id INTEGER)");
    provider.closeConnection(std::move(conn));
    EXPECT_EQ(source->availableCount(), 2u);

    provider.stop();
    EXPECT_THROW(provider.getConnection(), IllegalStateError);
}

TEST_F(SQLiteDataSourceTest, ProviderWrapsAuthenticationFailure) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_);
    source->setCredentials(std::string("app"), std::string("secret"));

    DatasourceConnectionProvider provider;
    provider.configure({{settings::DATASOURCE, std::shared_ptr<DataSource>(source)},
                        {settings::USER, std::string("app")}});

    try {
        provider.getConnection();
        FAIL() << "Expected ConnectionAcquisitionError";
    } catch (const ConnectionAcquisitionError& e) {
        EXPECT_EQ(e.errorCode(), SQLITE_AUTH);
    }
}

TEST_F(SQLiteDataSourceTest, DrainKeepsCheckedOutHandlesCounted) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_, 2);
    auto conn = source->getConnection();
    EXPECT_EQ(source->totalCount(), 2u);

    source->drain();
    EXPECT_EQ(source->availableCount(), 0u);
    EXPECT_EQ(source->totalCount(), 1u);

    conn->close();
    EXPECT_EQ(source->availableCount(), 1u);
    EXPECT_EQ(source->totalCount(), 1u);
}

TEST_F(SQLiteDataSourceTest, HandlesDroppedOnFullPoolLeaveTheCount) {
    auto source = std::make_shared<SQLiteDataSource>(dbPath_, 1);
    auto a = source->getConnection();
    auto b = source->getConnection();
    EXPECT_EQ(source->totalCount(), 2u);

    a->close();
    b->close();
    EXPECT_EQ(source->availableCount(), 1u);
    EXPECT_EQ(source->totalCount(), 1u);
}

TEST_F(SQLiteDataSourceTest, OversizedPoolCannotBeCaptured) {
    if (sizeof(size_t) <= sizeof(uint32_t)) {
        GTEST_SKIP() << "size_t cannot exceed the encoded range";
    }
    auto poolSize = static_cast<size_t>(std::numeric_limits<uint32_t>::max()) + 1;
    auto source = std::make_shared<SQLiteDataSource>(dbPath_, poolSize);

    StateWriter out;
    EXPECT_THROW(out.writeObject(source.get()), StateFormatError);
}
