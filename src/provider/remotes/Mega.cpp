#include "provider/remotes/Mega.hpp"

using namespace cs::provider;
using namespace cs::provider::remotes;

Mega::Mega()
    : Provider("MEGA", "Mega", "mega",
               {
                   Field::str("user", true).withTitle("Username"),
                   Field::str("pass", true).withTitle("Password").asSecret()
               }) {}
