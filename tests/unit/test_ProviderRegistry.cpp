#include <gtest/gtest.h>
#include "model/Credential.hpp"
#include "model/Task.hpp"
#include "provider/Registry.hpp"
#include "validation/Errors.hpp"

#include <algorithm>
#include <cctype>

using namespace cs;
using namespace cs::provider;
using json = nlohmann::json;

class ProviderRegistryTest : public ::testing::Test {
protected:
    Registry registry = Registry::builtin();

    static model::CloudSyncTask taskWith(const json& attrs) {
        model::CloudSyncTask t;
        t.attributes = attrs;
        return t;
    }
};

TEST_F(ProviderRegistryTest, ContainsEveryBuiltinRemote) {
    EXPECT_EQ(registry.size(), 12u);
    for (const auto* name : {"S3", "B2", "AZUREBLOB", "GOOGLE_CLOUD_STORAGE", "DROPBOX", "GOOGLE_DRIVE",
                             "ONEDRIVE", "FTP", "SFTP", "WEBDAV", "HTTP", "MEGA"})
        EXPECT_TRUE(registry.contains(name)) << name;

    EXPECT_THROW((void)registry.get("NOPE"), std::invalid_argument);
    EXPECT_EQ(registry.find("NOPE"), nullptr);
}

TEST_F(ProviderRegistryTest, ListIsSortedByLowerCaseTitle) {
    const auto list = registry.list();
    ASSERT_EQ(list.size(), registry.size());

    const auto lower = [](std::string s) {
        std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
        return s;
    };
    for (size_t i = 1; i < list.size(); ++i)
        EXPECT_LE(lower(list[i - 1]->title()), lower(list[i]->title()));
    EXPECT_EQ(list.front()->title(), "Amazon S3");
}

TEST_F(ProviderRegistryTest, FlagsMatchBackends) {
    EXPECT_TRUE(registry.get("S3").usesBuckets());
    EXPECT_TRUE(registry.get("B2").usesBuckets());
    EXPECT_FALSE(registry.get("DROPBOX").usesBuckets());
    EXPECT_TRUE(registry.get("HTTP").readonly());
    EXPECT_FALSE(registry.get("SFTP").readonly());
    EXPECT_EQ(registry.get("GOOGLE_DRIVE").rcloneType(), "drive");
}

TEST_F(ProviderRegistryTest, DuplicateNamesAreRejected) {
    std::vector<std::unique_ptr<Provider>> dup;
    struct Fake final : Provider {
        Fake() : Provider("X", "X", "x", {}) {}
    };
    dup.push_back(std::make_unique<Fake>());
    dup.push_back(std::make_unique<Fake>());
    EXPECT_THROW(Registry{std::move(dup)}, std::invalid_argument);
}

TEST_F(ProviderRegistryTest, S3ExtrasAndBucketRule) {
    const auto& s3 = registry.get("S3");

    model::Credential cred;
    cred.attributes = {{"access_key_id", "a"}, {"secret_access_key", "b"}};
    EXPECT_EQ(s3.getCredentialsExtra(cred)["provider"], "AWS");
    cred.attributes["endpoint"] = "https://minio.local";
    EXPECT_EQ(s3.getCredentialsExtra(cred)["provider"], "Other");

    EXPECT_EQ(s3.getTaskExtra(taskWith({{"encryption", "AES256"}}))["server_side_encryption"], "AES256");
    EXPECT_TRUE(s3.getTaskExtra(taskWith({{"encryption", ""}})).empty());

    validation::ValidationErrors ok;
    s3.preSaveTask(taskWith({{"bucket", "my-bucket.01"}}), cred, ok);
    EXPECT_TRUE(ok.empty());

    validation::ValidationErrors bad;
    s3.preSaveTask(taskWith({{"bucket", "Bad_Bucket"}}), cred, bad);
    EXPECT_TRUE(bad.has("bucket"));
}

TEST_F(ProviderRegistryTest, DropboxChunkSizeAndVendorLowercasing) {
    EXPECT_EQ(registry.get("DROPBOX").getTaskExtra(taskWith({{"chunk_size", 16}}))["chunk_size"], "16M");

    model::Credential cred;
    cred.attributes = {{"url", "https://dav"}, {"vendor", "NEXTCLOUD"}};
    EXPECT_EQ(registry.get("WEBDAV").getCredentialsExtra(cred)["vendor"], "nextcloud");
}

TEST_F(ProviderRegistryTest, DescribeListsSchemas) {
    const auto d = registry.get("S3").describe();
    EXPECT_EQ(d["name"], "S3");
    EXPECT_EQ(d["buckets"], true);
    EXPECT_EQ(d["readonly"], false);
    EXPECT_EQ(d["credentials_schema"][0]["property"], "access_key_id");
    EXPECT_TRUE(d["task_schema"].is_array());
}
