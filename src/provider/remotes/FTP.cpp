#include "provider/remotes/FTP.hpp"

using namespace cs::provider;
using namespace cs::provider::remotes;

FTP::FTP()
    : Provider("FTP", "FTP", "ftp",
               {
                   Field::str("host", true).withTitle("Host"),
                   Field::integer("port").withDefault(21).withTitle("Port"),
                   Field::str("user", true).withTitle("Username"),
                   Field::str("pass").withTitle("Password").asSecret()
               }) {}
