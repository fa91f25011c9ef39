#include "provider/remotes/HTTP.hpp"

using namespace cs::provider;
using namespace cs::provider::remotes;

HTTP::HTTP()
    : Provider("HTTP", "HTTP", "http",
               {
                   Field::str("url", true).withTitle("URL")
               },
               {},
               false, true) {}
