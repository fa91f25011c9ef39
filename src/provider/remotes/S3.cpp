#include "provider/remotes/S3.hpp"
#include "model/Credential.hpp"
#include "model/Task.hpp"
#include "validation/Errors.hpp"

#include <regex>

using namespace cs::provider;
using namespace cs::provider::remotes;

S3::S3()
    : Provider("S3", "Amazon S3", "s3",
               {
                   Field::str("access_key_id", true).withTitle("Access Key ID"),
                   Field::str("secret_access_key", true).withTitle("Secret Access Key").asSecret(),
                   Field::str("endpoint").withTitle("Endpoint URL"),
                   Field::boolean("skip_region", false).withTitle("Disable Endpoint Region")
               },
               {
                   Field::str("region").withTitle("Region"),
                   Field::str("encryption").withChoices({"", "AES256"}).withTitle("Server-Side Encryption")
               },
               true) {}

nlohmann::json S3::getCredentialsExtra(const model::Credential& credential) const {
    const auto endpoint = credential.attributes.value("endpoint", "");
    return {
        {"provider", endpoint.empty() ? "AWS" : "Other"},
        {"env_auth", false}
    };
}

nlohmann::json S3::getTaskExtra(const model::CloudSyncTask& task) const {
    nlohmann::json extra = nlohmann::json::object();
    if (const auto enc = task.attribute("encryption"); !enc.empty()) extra["server_side_encryption"] = enc;
    return extra;
}

void S3::preSaveTask(const model::CloudSyncTask& task, const model::Credential&,
                     validation::ValidationErrors& verrors) const {
    static const std::regex bucketRe("^[a-z0-9][a-z0-9.-]{1,61}[a-z0-9]$");

    const auto bucket = task.attribute("bucket");
    if (!std::regex_match(bucket, bucketRe) || bucket.find("..") != std::string::npos)
        verrors.add("bucket", "Invalid bucket name");
}
