#include "provider/remotes/B2.hpp"

using namespace cs::provider;
using namespace cs::provider::remotes;

B2::B2()
    : Provider("B2", "Backblaze B2", "b2",
               {
                   Field::str("account", true).withTitle("Account ID or Application Key ID"),
                   Field::str("key", true).withTitle("Master Application Key or Application Key").asSecret()
               },
               {},
               true) {}
