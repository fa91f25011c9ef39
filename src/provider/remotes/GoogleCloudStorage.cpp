#include "provider/remotes/GoogleCloudStorage.hpp"

using namespace cs::provider;
using namespace cs::provider::remotes;

GoogleCloudStorage::GoogleCloudStorage()
    : Provider("GOOGLE_CLOUD_STORAGE", "Google Cloud Storage", "google cloud storage",
               {
                   Field::str("service_account_credentials", true).withTitle("JSON Service Account Key").asSecret()
               },
               {
                   Field::str("bucket_policy_only").withChoices({"", "true", "false"}).withTitle("Bucket Policy Only")
               },
               true) {}
