#include "provider/remotes/AzureBlob.hpp"
#include "model/Task.hpp"
#include "validation/Errors.hpp"

#include <regex>

using namespace cs::provider;
using namespace cs::provider::remotes;

AzureBlob::AzureBlob()
    : Provider("AZUREBLOB", "Microsoft Azure Blob Storage", "azureblob",
               {
                   Field::str("account", true).withTitle("Account Name"),
                   Field::str("key", true).withTitle("Account Key").asSecret()
               },
               {},
               true) {}

void AzureBlob::preSaveTask(const model::CloudSyncTask& task, const model::Credential&,
                            validation::ValidationErrors& verrors) const {
    // 3-63 chars, lowercase letters, digits and single hyphens
    static const std::regex containerRe("^[a-z0-9](?!.*--)[a-z0-9-]{1,61}[a-z0-9]$");

    if (!std::regex_match(task.attribute("bucket"), containerRe))
        verrors.add("bucket", "Invalid container name");
}
