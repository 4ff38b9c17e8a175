#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "DatasourceConnectionProvider.hpp"
#include "NamingDirectory.hpp"
#include "SQLiteDataSource.hpp"
#include "StateInspector.hpp"
#include "TestDoubles.hpp"
#include <filesystem>

using namespace dsconn;
using namespace dsconn::test;

class StateInspectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir_ = std::filesystem::temp_directory_path() /
                   (std::string("dsconn_inspector_") + info->name());
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;
};

TEST_F(StateInspectorTest, UnconfiguredProvider) {
    DatasourceConnectionProvider provider;
    auto state = StateInspector::describe(provider.captureState());

    EXPECT_EQ(state["version"], 1);
    EXPECT_EQ(state["available"], false);
    EXPECT_TRUE(state["user"].is_null());
    EXPECT_TRUE(state["password"].is_null());
    EXPECT_TRUE(state["lookup_service"].is_null());
    EXPECT_FALSE(state.contains("lookup_name"));
    EXPECT_FALSE(state.contains("injected_source"));
}

TEST_F(StateInspectorTest, NamedProviderShowsDirectoryAndName) {
    auto directory = std::make_shared<NamingDirectory>("env");
    directory->bind("jdbc/myDS", std::make_shared<FakeDataSource>("primary"));

    DatasourceConnectionProvider provider;
    provider.injectLookupService(directory);
    provider.configure({{settings::DATASOURCE, std::string("jdbc/myDS")},
                        {settings::USER, std::string("app")},
                        {settings::PASS, std::string("secret")}});

    auto state = StateInspector::describe(provider.captureState());

    EXPECT_EQ(state["available"], true);
    EXPECT_EQ(state["user"], "app");
    EXPECT_EQ(state["password"], "********");
    EXPECT_EQ(state["lookup_service"]["type"], NamingDirectory::kTypeName);
    EXPECT_EQ(state["lookup_service"]["name"], "env");
    EXPECT_EQ(state["lookup_name"], "jdbc/myDS");
    EXPECT_FALSE(state.contains("injected_source"));
}

TEST_F(StateInspectorTest, InjectedSQLiteSourceIsDecoded) {
    auto dbPath = (tempDir_ / "inspect.db").string();
    auto source = std::make_shared<SQLiteDataSource>(dbPath, 3);
    source->setCredentials(std::string("app"), std::string("secret"));

    DatasourceConnectionProvider provider;
    provider.setDataSource(source);
    provider.configure({});

    auto state = StateInspector::describe(provider.captureState());
    const auto& injected = state["injected_source"];

    EXPECT_TRUE(state["lookup_name"].is_null());
    EXPECT_EQ(injected["type"], SQLiteDataSource::kTypeName);
    EXPECT_EQ(injected["path"], dbPath);
    EXPECT_EQ(injected["pool_size"], 3);
    EXPECT_EQ(injected["user"], "app");
    EXPECT_EQ(injected["password"], "********");

    auto text = StateInspector::toString(state);
    EXPECT_EQ(text.find("secret"), std::string::npos);
}

TEST_F(StateInspectorTest, UnknownCollaboratorShowsTypeAndSize) {
    DatasourceConnectionProvider provider;
    provider.configure({{settings::DATASOURCE,
                         std::shared_ptr<DataSource>(std::make_shared<FakeDataSource>("ds1"))}});

    auto state = StateInspector::describe(provider.captureState());

    EXPECT_EQ(state["injected_source"]["type"], FakeDataSource::kTypeName);
    EXPECT_EQ(state["injected_source"]["payload_bytes"], 5);
}

TEST_F(StateInspectorTest, CompactOutputIsSingleLine) {
    DatasourceConnectionProvider provider;
    auto state = StateInspector::describe(provider.captureState());

    EXPECT_EQ(StateInspector::toString(state, false).find('\n'), std::string::npos);
    EXPECT_NE(StateInspector::toString(state, true).find('\n'), std::string::npos);
}

TEST_F(StateInspectorTest, GarbageIsRejected) {
    EXPECT_THROW(StateInspector::describe("not a state"), StateFormatError);
}

TEST_F(StateInspectorTest, TrailingBytesAreRejected) {
    DatasourceConnectionProvider provider;
    auto bytes = provider.captureState() + std::string(1, '\x00');

    EXPECT_THROW(StateInspector::describe(bytes), StateFormatError);
}

TEST_F(StateInspectorTest, UnreadDirectoryPayloadIsRejected) {
    std::string type = NamingDirectory::kTypeName;
    const std::string bytes = std::string("DSCP\x01", 5) +
                              std::string("\x00\x00\x00", 3) +  // stopped, no credentials
                              std::string(1, '\x01') +
                              std::string{0, static_cast<char>(type.size())} + type +
                              std::string("\x00\x00\x00\x06", 4) +
                              std::string("\x00\x03" "env" "\x00", 6);

    EXPECT_THROW(StateInspector::describe(bytes), StateFormatError);
}
