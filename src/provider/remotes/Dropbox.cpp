#include "provider/remotes/Dropbox.hpp"
#include "model/Task.hpp"

using namespace cs::provider;
using namespace cs::provider::remotes;

Dropbox::Dropbox()
    : Provider("DROPBOX", "Dropbox", "dropbox",
               {
                   Field::str("token", true).withTitle("Access Token").asSecret()
               },
               {
                   Field::integer("chunk_size").withDefault(48).withTitle("Upload chunk size (in mebibytes)")
               }) {}

nlohmann::json Dropbox::getTaskExtra(const model::CloudSyncTask& task) const {
    auto chunk = task.attribute("chunk_size");
    if (chunk.empty()) chunk = "48";
    return {{"chunk_size", chunk + "M"}};
}
