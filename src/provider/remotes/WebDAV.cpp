#include "provider/remotes/WebDAV.hpp"
#include "model/Credential.hpp"

#include <algorithm>
#include <cctype>

using namespace cs::provider;
using namespace cs::provider::remotes;

WebDAV::WebDAV()
    : Provider("WEBDAV", "WebDAV", "webdav",
               {
                   Field::str("url", true).withTitle("URL"),
                   Field::str("vendor", true).withChoices({"NEXTCLOUD", "OWNCLOUD", "SHAREPOINT", "OTHER"}).withTitle("Name of the WebDAV site/service/software"),
                   Field::str("user").withTitle("Username"),
                   Field::str("pass").withTitle("Password").asSecret()
               }) {}

nlohmann::json WebDAV::getCredentialsExtra(const model::Credential& credential) const {
    auto vendor = credential.attributes.value("vendor", "OTHER");
    std::ranges::transform(vendor, vendor.begin(), [](const unsigned char c) { return std::tolower(c); });
    return {{"vendor", vendor}};
}
