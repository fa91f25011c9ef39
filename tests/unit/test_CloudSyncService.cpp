#include <gtest/gtest.h>
#include "crypto/KeyFileSecretStore.hpp"
#include "db/Store.hpp"
#include "job/Job.hpp"
#include "job/Manager.hpp"
#include "services/CloudSyncService.hpp"
#include "services/CredentialService.hpp"
#include "test_utils.hpp"
#include "validation/Errors.hpp"

#include <chrono>
#include <sstream>
#include <thread>

using namespace cs;
using namespace cs::services;
using json = nlohmann::json;

class CloudSyncServiceTest : public ::testing::Test {
protected:
    test::TempDir dir;
    std::filesystem::path argsFile = dir / "args";
    std::filesystem::path listFile = dir / "listed";
    std::shared_ptr<test::RecordingScheduler> scheduler = std::make_shared<test::RecordingScheduler>();

    runtime::Deps deps = test::makeDeps(dir.path(), test::writeFakeRclone(dir.path(),
        "case \"$3\" in\n"
        "  lsjson)\n"
        "    echo \"$4\" >> '" + listFile.string() + "'\n"
        "    echo '[{\"Name\":\"2024\",\"IsDir\":true},{\"Name\":\"notes.txt\",\"IsDir\":false}]' ;;\n"
        "  *)\n"
        "    echo \"$@\" > '" + argsFile.string() + "'\n"
        "    echo 'Transferred:   1 KiB / 1 KiB, 100%, 1 KiB/s, ETA 0s' ;;\n"
        "esac"), scheduler);

    CloudSyncService tasks{deps};
    CredentialService credentials{deps};

    uint32_t dropboxId = 0;
    uint32_t s3Id = 0;

    void SetUp() override {
        dropboxId = credentials.create({{"name", "Dropbox"}, {"provider", "DROPBOX"}, {"attributes", {{"token", "t0k"}}}}).id;
        s3Id = credentials.create({{"name", "AWS"}, {"provider", "S3"},
                                   {"attributes", {{"access_key_id", "AK"}, {"secret_access_key", "SK"}}}}).id;
    }

    static json pushTask(const uint32_t credentialId, const std::string& folder = "backup") {
        return {
            {"description", "nightly"},
            {"direction", "PUSH"},
            {"transfer_mode", "SYNC"},
            {"path", "/data"},
            {"credentials", credentialId},
            {"attributes", {{"folder", folder}}},
            {"schedule", {{"minute", "30"}, {"hour", "2"}}}
        };
    }

    static validation::ValidationErrors errorsOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const validation::ValidationErrors& e) {
            return e;
        }
        ADD_FAILURE() << "expected ValidationErrors";
        return {};
    }
};

TEST_F(CloudSyncServiceTest, CredentialCrud) {
    EXPECT_EQ(credentials.query().size(), 2u);

    const auto updated = credentials.update(dropboxId, {{"name", "Team Dropbox"}});
    EXPECT_EQ(updated.name, "Team Dropbox");
    EXPECT_EQ(updated.attributes["token"], "t0k");
    EXPECT_EQ(credentials.get(dropboxId).name, "Team Dropbox");

    credentials.remove(dropboxId);
    EXPECT_FALSE(credentials.find(dropboxId).has_value());
    EXPECT_THROW((void)credentials.get(dropboxId), std::runtime_error);
}

TEST_F(CloudSyncServiceTest, CredentialValidation) {
    auto e = errorsOf([&] { credentials.create({{"name", "x"}, {"provider", "NOPE"}}); });
    EXPECT_TRUE(e.has("cloud_sync_credentials.provider"));

    e = errorsOf([&] { credentials.create({{"name", "x"}, {"provider", "DROPBOX"}, {"attributes", json::object()}}); });
    EXPECT_TRUE(e.has("cloud_sync_credentials.attributes.token"));

    e = errorsOf([&] { credentials.create({{"provider", 5}}); });
    EXPECT_TRUE(e.has("cloud_sync_credentials.name"));
    EXPECT_TRUE(e.has("cloud_sync_credentials.provider"));
}

TEST_F(CloudSyncServiceTest, CreatePersistsAndRefreshesSchedule) {
    const auto t = tasks.create(pushTask(dropboxId));

    EXPECT_GT(t.id, 0u);
    ASSERT_TRUE(t.credential.has_value());
    EXPECT_EQ(t.credential->name, "Dropbox");
    EXPECT_EQ(t.schedule.minute, "30");
    EXPECT_EQ(t.attribute("folder"), "backup");

    EXPECT_EQ(scheduler->refreshCount(), 1u);
    EXPECT_EQ(scheduler->lastTaskIds(), std::vector<uint32_t>{t.id});

    const auto record = deps.store->get(db::TASKS_TABLE, t.id);
    EXPECT_EQ(record["credential"], dropboxId);
    EXPECT_EQ(record["minute"], "30");
}

TEST_F(CloudSyncServiceTest, InvalidTaskIsNotPersisted) {
    auto bad = pushTask(9999);
    const auto e = errorsOf([&] { tasks.create(bad); });
    EXPECT_TRUE(e.has("cloud_sync.credentials"));

    EXPECT_TRUE(tasks.query().empty());
    EXPECT_EQ(scheduler->refreshCount(), 0u);
}

TEST_F(CloudSyncServiceTest, SecretsAreEncryptedAtRest) {
    auto data = pushTask(dropboxId);
    data["encryption"] = true;
    data["encryption_password"] = "hunter2";
    data["encryption_salt"] = "pepper";

    const auto t = tasks.create(data);
    EXPECT_EQ(t.encryption_password, "hunter2");
    EXPECT_EQ(t.encryption_salt, "pepper");

    const auto record = deps.store->get(db::TASKS_TABLE, t.id);
    EXPECT_NE(record["encryption_password"], "hunter2");
    EXPECT_FALSE(record["encryption_password"].get<std::string>().empty());
    EXPECT_NE(record["encryption_salt"], "pepper");

    EXPECT_EQ(tasks.get(t.id).encryption_password, "hunter2");
}

TEST_F(CloudSyncServiceTest, UpdateIsAPatch) {
    const auto t = tasks.create(pushTask(dropboxId));

    const auto u = tasks.update(t.id, {{"description", "weekly"}, {"schedule", {{"minute", "0"}, {"hour", "3"}, {"dow", "sun"}}}});
    EXPECT_EQ(u.description, "weekly");
    EXPECT_EQ(u.path, "/data");
    EXPECT_EQ(u.credential_id, dropboxId);
    EXPECT_EQ(u.schedule.dow, "sun");
    EXPECT_EQ(scheduler->refreshCount(), 2u);

    const auto e = errorsOf([&] { tasks.update(t.id, {{"direction", "SIDEWAYS"}}); });
    EXPECT_TRUE(e.has("cloud_sync_update.direction"));
    EXPECT_EQ(tasks.get(t.id).direction, model::Direction::Push);
}

TEST_F(CloudSyncServiceTest, RemoveDropsTaskFromSchedule) {
    const auto a = tasks.create(pushTask(dropboxId, "a"));
    const auto b = tasks.create(pushTask(dropboxId, "b"));

    tasks.remove(a.id);
    EXPECT_EQ(scheduler->lastTaskIds(), std::vector<uint32_t>{b.id});
    EXPECT_THROW((void)tasks.get(a.id), std::runtime_error);
    EXPECT_EQ(tasks.query().size(), 1u);
}

TEST_F(CloudSyncServiceTest, BucketProvidersRequireBucket) {
    const auto e = errorsOf([&] { tasks.create(pushTask(s3Id)); });
    EXPECT_TRUE(e.has("cloud_sync.attributes.bucket"));

    auto data = pushTask(s3Id);
    data["attributes"]["bucket"] = "Not_A_Bucket";
    EXPECT_TRUE(errorsOf([&] { tasks.create(data); }).has("cloud_sync.attributes.bucket"));

    data["attributes"]["bucket"] = "my-backups";
    EXPECT_EQ(tasks.create(data).attribute("bucket"), "my-backups");
}

TEST_F(CloudSyncServiceTest, PullChecksTheRemoteFolder) {
    auto data = pushTask(dropboxId, "archive/2024");
    data["direction"] = "PULL";
    EXPECT_NO_THROW(tasks.create(data));
    EXPECT_EQ(test::readFile(listFile), "remote:archive\n");

    data["attributes"]["folder"] = "archive/notes.txt";
    EXPECT_EQ(errorsOf([&] { tasks.create(data); }).find("cloud_sync.attributes.folder")->message, "This is not a directory");

    data["attributes"]["folder"] = "archive/2023";
    EXPECT_EQ(errorsOf([&] { tasks.create(data); }).find("cloud_sync.attributes.folder")->message, "Directory does not exist");
}

TEST_F(CloudSyncServiceTest, ListBuckets) {
    EXPECT_THROW((void)tasks.listBuckets(dropboxId), std::runtime_error);

    const auto entries = tasks.listBuckets(s3Id);
    EXPECT_EQ(entries.size(), 2u);
    EXPECT_EQ(test::readFile(listFile), "remote:\n");
}

TEST_F(CloudSyncServiceTest, ListDirectoryJoinsBucketAndFolder) {
    const auto entries = tasks.listDirectory({{"credentials", s3Id}, {"attributes", {{"bucket", "my-backups"}, {"folder", "photos"}}}});
    EXPECT_EQ(entries.size(), 2u);
    EXPECT_EQ(test::readFile(listFile), "remote:my-backups/photos\n");

    EXPECT_TRUE(errorsOf([&] { (void)tasks.listDirectory({{"credentials", 4242}}); }).has("cloud_sync.credentials"));
}

TEST_F(CloudSyncServiceTest, RunSyncsThroughRclone) {
    const auto t = tasks.create(pushTask(dropboxId));

    const auto job = tasks.run(t.id);
    ASSERT_EQ(job->wait(), job::State::Success);
    EXPECT_EQ(job->result(), true);
    EXPECT_EQ(job->progress().description, "1 KiB / 1 KiB, 100%, 1 KiB/s, ETA 0s");

    const auto args = test::readFile(argsFile);
    EXPECT_NE(args.find("sync /data remote:backup"), std::string::npos);

    EXPECT_THROW((void)tasks.run(4242), std::runtime_error);
}

TEST_F(CloudSyncServiceTest, RunFailsWhenCredentialsVanish) {
    const auto t = tasks.create(pushTask(dropboxId));
    credentials.remove(dropboxId);

    const auto job = tasks.run(t.id);
    EXPECT_EQ(job->wait(), job::State::Failed);
    EXPECT_EQ(job->error(), "Credentials " + std::to_string(dropboxId) + " not found");
}

TEST_F(CloudSyncServiceTest, RunRefusesEncryptedTaskWhosePasswordCannotBeDecrypted) {
    auto request = pushTask(dropboxId);
    request["encryption"] = true;
    request["encryption_password"] = "hunter2";
    request["encryption_salt"] = "pepper";
    const auto t = tasks.create(request);

    // Same database, different master key: every stored secret decrypts to ""
    auto rekeyed = deps;
    rekeyed.secrets = std::make_shared<crypto::KeyFileSecretStore>(dir / "other_secret");
    CloudSyncService other{rekeyed};

    const auto job = other.run(t.id);
    EXPECT_EQ(job->wait(), job::State::Failed);
    EXPECT_NE(job->error().find("encryption password"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(argsFile));
}

TEST_F(CloudSyncServiceTest, RunsOfOneTaskFromSeparateManagersDoNotOverlap) {
    const auto t = tasks.create(pushTask(dropboxId));

    const auto events = dir / "events";
    test::writeFakeRclone(dir.path(),
        "echo \"start $$\" >> '" + events.string() + "'\n"
        "sleep 1\n"
        "echo \"end $$\" >> '" + events.string() + "'");

    // Each cloudsyncctl invocation builds its own Manager over the same lock directory
    auto secondDeps = deps;
    secondDeps.jobs = std::make_shared<job::Manager>(dir / "log" / "jobs", dir / "run" / "locks");
    auto thirdDeps = deps;
    thirdDeps.jobs = std::make_shared<job::Manager>(dir / "log" / "jobs", dir / "run" / "locks");
    CloudSyncService second{secondDeps};
    CloudSyncService third{thirdDeps};

    const auto first = tasks.run(t.id);
    for (int i = 0; i < 300 && first->state() != job::State::Running; ++i) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    const auto waiting = second.run(t.id);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    const auto coalesced = third.run(t.id);

    EXPECT_EQ(coalesced->wait(), job::State::Success);
    EXPECT_EQ(coalesced->result(), job::Manager::ALREADY_QUEUED);
    EXPECT_EQ(first->wait(), job::State::Success);
    EXPECT_EQ(waiting->wait(), job::State::Success);

    std::vector<std::string> lines;
    std::istringstream in(test::readFile(events));
    for (std::string line; std::getline(in, line);) lines.push_back(line.substr(0, line.find(' ')));
    const std::vector<std::string> expected = {"start", "end", "start", "end"};
    EXPECT_EQ(lines, expected);
}

TEST_F(CloudSyncServiceTest, ProvidersAreDescribed) {
    const auto p = tasks.providers();
    ASSERT_TRUE(p.is_array());
    EXPECT_EQ(p.size(), 12u);
    for (const auto& entry : p) EXPECT_TRUE(entry.contains("name"));
}
