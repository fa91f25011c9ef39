#pragma once

#include "validation/Errors.hpp"

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::model {
struct Credential;
struct CloudSyncTask;
}

namespace cs::provider { class Registry; }

namespace cs::validation {

class Validator {
public:
    // Lists the directory named by spec's bucket/folder attributes
    using Lister = std::function<std::vector<nlohmann::json>(const model::CloudSyncTask& spec)>;

    explicit Validator(const provider::Registry& registry);

    // Credential provider + attributes. Cleans credential.attributes in place.
    void validateCredential(ValidationErrors& verrors, const std::string& name, model::Credential& credential) const;

    // Checks that need no remote access, including the read-only provider
    // rule for PUSH. `credential` is null when the referenced id does not
    // exist. Cleans task.attributes in place.
    void validate(ValidationErrors& verrors, const std::string& name,
                  model::CloudSyncTask& task, const model::Credential* credential) const;

    // PULL pre-flight: the folder must exist on the remote as a directory.
    // Only meaningful once validate() passed.
    void validateFolder(ValidationErrors& verrors, const std::string& name,
                        const model::CloudSyncTask& task, const Lister& lister) const;

private:
    const provider::Registry& registry_;
};

}
