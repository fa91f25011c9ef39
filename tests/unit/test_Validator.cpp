#include <gtest/gtest.h>
#include "model/Task.hpp"
#include "provider/Registry.hpp"
#include "rclone/Executor.hpp"
#include "validation/Validator.hpp"

using namespace cs;
using namespace cs::validation;
using json = nlohmann::json;

class ValidatorTest : public ::testing::Test {
protected:
    provider::Registry registry = provider::Registry::builtin();
    Validator validator{registry};

    model::Credential s3, http, dropbox;

    void SetUp() override {
        s3.id = 1;
        s3.provider = "S3";
        s3.attributes = {{"access_key_id", "a"}, {"secret_access_key", "b"}};
        http.id = 2;
        http.provider = "HTTP";
        http.attributes = {{"url", "https://example.com"}};
        dropbox.id = 3;
        dropbox.provider = "DROPBOX";
        dropbox.attributes = {{"token", "t"}};
    }

    static model::CloudSyncTask task(const model::Direction d, const json& attrs) {
        model::CloudSyncTask t;
        t.direction = d;
        t.path = "/data";
        t.attributes = attrs;
        return t;
    }

    ValidationErrors stage1(model::CloudSyncTask t, const model::Credential* c) const {
        ValidationErrors verrors;
        validator.validate(verrors, "cloud_sync", t, c);
        return verrors;
    }

    ValidationErrors stage2(const model::CloudSyncTask& t, const std::vector<json>& listing) const {
        ValidationErrors verrors;
        validator.validateFolder(verrors, "cloud_sync", t, [&](const model::CloudSyncTask&) { return listing; });
        return verrors;
    }
};

TEST_F(ValidatorTest, EncryptionRequiresPassword) {
    for (const auto d : {model::Direction::Push, model::Direction::Pull}) {
        for (const auto* c : {&s3, &dropbox}) {
            auto t = task(d, {{"bucket", "bkt"}, {"folder", ""}});
            t.encryption = true;
            const auto errors = stage1(t, c);
            ASSERT_NE(errors.find("cloud_sync.encryption_password"), nullptr);
            EXPECT_EQ(errors.find("cloud_sync.encryption_password")->message,
                      "This field is required when encryption is enabled");
        }
    }
}

TEST_F(ValidatorTest, BucketRequiredOnlyForBucketProviders) {
    EXPECT_TRUE(stage1(task(model::Direction::Push, {{"folder", ""}}), &s3).has("cloud_sync.attributes.bucket"));
    EXPECT_TRUE(stage1(task(model::Direction::Push, {{"folder", ""}}), &dropbox).empty());
    EXPECT_TRUE(stage1(task(model::Direction::Push, {}), &dropbox).has("cloud_sync.attributes.folder"));
}

TEST_F(ValidatorTest, AdditionalAttributesAllowed) {
    EXPECT_TRUE(stage1(task(model::Direction::Push, {{"folder", "x"}, {"whatever", 1}}), &dropbox).empty());
}

TEST_F(ValidatorTest, PreSaveHookRunsOnlyOnCleanAttributes) {
    const auto bad = stage1(task(model::Direction::Push, {{"bucket", "Not_Valid"}, {"folder", ""}}), &s3);
    EXPECT_TRUE(bad.has("cloud_sync.attributes.bucket"));

    // schema failure (folder missing) suppresses the bucket naming check
    const auto schemaOnly = stage1(task(model::Direction::Push, {{"bucket", "Not_Valid"}}), &s3);
    EXPECT_TRUE(schemaOnly.has("cloud_sync.attributes.folder"));
    EXPECT_FALSE(schemaOnly.has("cloud_sync.attributes.bucket"));
}

TEST_F(ValidatorTest, UnknownCredentialOrProvider) {
    EXPECT_TRUE(stage1(task(model::Direction::Push, {{"folder", ""}}), nullptr).has("cloud_sync.credentials"));

    model::Credential bogus;
    bogus.provider = "NOPE";
    const auto errors = stage1(task(model::Direction::Push, {}), &bogus);
    EXPECT_TRUE(errors.has("cloud_sync.credentials"));
    EXPECT_FALSE(errors.has("cloud_sync.attributes.folder"));
}

TEST_F(ValidatorTest, PushToReadonlyRemoteIsRejected) {
    const auto withGoodAttrs = stage1(task(model::Direction::Push, {{"folder", "x"}}), &http);
    ASSERT_NE(withGoodAttrs.find("cloud_sync.direction"), nullptr);
    EXPECT_EQ(withGoodAttrs.find("cloud_sync.direction")->message, "This remote is read-only");

    EXPECT_TRUE(stage1(task(model::Direction::Push, {{"folder", 5}}), &http).has("cloud_sync.direction"));
    EXPECT_FALSE(stage1(task(model::Direction::Pull, {{"folder", "x"}}), &http).has("cloud_sync.direction"));
}

TEST_F(ValidatorTest, InvalidScheduleFieldsAreReported) {
    auto t = task(model::Direction::Push, {{"folder", ""}});
    t.schedule.hour = "25";
    EXPECT_TRUE(stage1(t, &dropbox).has("cloud_sync.schedule.hour"));
}

TEST_F(ValidatorTest, PullRequiresExistingDirectory) {
    const auto t = task(model::Direction::Pull, {{"folder", "/photos/2024/"}});

    EXPECT_TRUE(stage2(t, {{{"Name", "2024"}, {"IsDir", true}}}).empty());

    const auto notDir = stage2(t, {{{"Name", "2024"}, {"IsDir", false}}});
    ASSERT_NE(notDir.find("cloud_sync.attributes.folder"), nullptr);
    EXPECT_EQ(notDir.find("cloud_sync.attributes.folder")->message, "This is not a directory");

    const auto missing = stage2(t, {{{"Name", "2023"}, {"IsDir", true}}});
    ASSERT_NE(missing.find("cloud_sync.attributes.folder"), nullptr);
    EXPECT_EQ(missing.find("cloud_sync.attributes.folder")->message, "Directory does not exist");
}

TEST_F(ValidatorTest, PullListsTheParentFolder) {
    const auto t = task(model::Direction::Pull, {{"bucket", "b"}, {"folder", "a/b/c"}});
    std::string listed;

    ValidationErrors verrors;
    validator.validateFolder(verrors, "cloud_sync", t, [&](const model::CloudSyncTask& spec) {
        listed = spec.attribute("folder");
        return std::vector<json>{{{"Name", "c"}, {"IsDir", true}}};
    });
    EXPECT_TRUE(verrors.empty());
    EXPECT_EQ(listed, "a/b");

    const auto top = task(model::Direction::Pull, {{"folder", "c"}});
    validator.validateFolder(verrors, "cloud_sync", top, [&](const model::CloudSyncTask& spec) {
        listed = spec.attribute("folder");
        return std::vector<json>{{{"Name", "c"}, {"IsDir", true}}};
    });
    EXPECT_EQ(listed, "");
}

TEST_F(ValidatorTest, PullWithEmptyFolderOrPushSkipsListing) {
    bool called = false;
    const auto lister = [&](const model::CloudSyncTask&) {
        called = true;
        return std::vector<json>{};
    };

    ValidationErrors verrors;
    validator.validateFolder(verrors, "cloud_sync", task(model::Direction::Pull, {{"folder", "/"}}), lister);
    validator.validateFolder(verrors, "cloud_sync", task(model::Direction::Push, {{"folder", "x"}}), lister);
    EXPECT_FALSE(called);
    EXPECT_TRUE(verrors.empty());
}

TEST_F(ValidatorTest, ListingFailureIsAFolderError) {
    ValidationErrors verrors;
    validator.validateFolder(verrors, "cloud_sync", task(model::Direction::Pull, {{"folder", "x"}}),
                             [](const model::CloudSyncTask&) -> std::vector<json> {
                                 throw rclone::ExecutionError("directory not found");
                             });
    ASSERT_NE(verrors.find("cloud_sync.attributes.folder"), nullptr);
    EXPECT_EQ(verrors.find("cloud_sync.attributes.folder")->message, "directory not found");
}

TEST_F(ValidatorTest, CredentialAttributesAgainstProviderSchema) {
    ValidationErrors verrors;
    model::Credential c;
    c.provider = "S3";
    c.attributes = {{"access_key_id", "a"}};
    validator.validateCredential(verrors, "cloud_sync_credentials", c);
    EXPECT_TRUE(verrors.has("cloud_sync_credentials.attributes.secret_access_key"));

    ValidationErrors unknown;
    c.provider = "NOPE";
    validator.validateCredential(unknown, "cloud_sync_credentials", c);
    ASSERT_NE(unknown.find("cloud_sync_credentials.provider"), nullptr);
    EXPECT_EQ(unknown.find("cloud_sync_credentials.provider")->message, "Invalid provider");
}
