#include "provider/remotes/SFTP.hpp"
#include "model/Credential.hpp"
#include "validation/Errors.hpp"

using namespace cs::provider;
using namespace cs::provider::remotes;

SFTP::SFTP()
    : Provider("SFTP", "SFTP", "sftp",
               {
                   Field::str("host", true).withTitle("Host"),
                   Field::integer("port").withDefault(22).withTitle("Port"),
                   Field::str("user", true).withTitle("Username"),
                   Field::str("pass").withTitle("Password").asSecret(),
                   Field::str("key_file").withTitle("PEM-encoded private key file path")
               }) {}

void SFTP::preSaveTask(const model::CloudSyncTask&, const model::Credential& credential,
                       validation::ValidationErrors& verrors) const {
    if (credential.attributes.value("pass", "").empty() && credential.attributes.value("key_file", "").empty())
        verrors.add("", "Selected credentials have neither a password nor a private key file", EINVAL);
}
