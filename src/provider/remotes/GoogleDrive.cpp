#include "provider/remotes/GoogleDrive.hpp"
#include "model/Credential.hpp"

using namespace cs::provider;
using namespace cs::provider::remotes;

GoogleDrive::GoogleDrive()
    : Provider("GOOGLE_DRIVE", "Google Drive", "drive",
               {
                   Field::str("client_id").withTitle("OAuth Client ID"),
                   Field::str("client_secret").withTitle("OAuth Client Secret").asSecret(),
                   Field::str("token", true).withTitle("Access Token").asSecret(),
                   Field::str("team_drive").withTitle("Team Drive ID (if connecting to Team Drive)")
               },
               {
                   Field::boolean("acknowledge_abuse", false).withTitle("Allow files which return cannotDownloadAbusiveFile to be downloaded")
               }) {}

nlohmann::json GoogleDrive::getCredentialsExtra(const model::Credential& credential) const {
    nlohmann::json extra = {{"scope", "drive"}};
    if (!credential.attributes.value("team_drive", "").empty()) extra["root_folder_id"] = "";
    return extra;
}
