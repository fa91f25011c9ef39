#include "provider/remotes/OneDrive.hpp"
#include "model/Credential.hpp"

#include <algorithm>
#include <cctype>

using namespace cs::provider;
using namespace cs::provider::remotes;

OneDrive::OneDrive()
    : Provider("ONEDRIVE", "Microsoft OneDrive", "onedrive",
               {
                   Field::str("client_id").withTitle("OAuth Client ID"),
                   Field::str("client_secret").withTitle("OAuth Client Secret").asSecret(),
                   Field::str("token", true).withTitle("Access Token").asSecret(),
                   Field::str("drive_type", true).withChoices({"PERSONAL", "BUSINESS", "DOCUMENT_LIBRARY"}).withTitle("Drive Account Type"),
                   Field::str("drive_id", true).withTitle("Drive ID")
               }) {}

nlohmann::json OneDrive::getCredentialsExtra(const model::Credential& credential) const {
    auto type = credential.attributes.value("drive_type", "PERSONAL");
    std::ranges::transform(type, type.begin(), [](const unsigned char c) { return std::tolower(c); });
    return {{"drive_type", type}};
}
