#pragma once

#include <cerrno>
#include <exception>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace cs::validation {

struct Error {
    std::string attribute;
    std::string message;
    int errnum = EINVAL;
};

// Field-addressed errors, collected across a whole request and thrown once.
class ValidationErrors : public std::exception {
public:
    ValidationErrors() = default;

    void add(const std::string& attribute, const std::string& message, int errnum = EINVAL);

    // Re-parent every error of `child` under `prefix` ("prefix.attr")
    void addChild(const std::string& prefix, const ValidationErrors& child);

    void extend(const ValidationErrors& other);

    [[nodiscard]] bool empty() const { return errors_.empty(); }
    [[nodiscard]] size_t size() const { return errors_.size(); }
    explicit operator bool() const { return !errors_.empty(); }

    [[nodiscard]] const std::vector<Error>& errors() const { return errors_; }
    [[nodiscard]] bool has(const std::string& attribute) const;
    [[nodiscard]] const Error* find(const std::string& attribute) const;

    // Throws *this if any error was recorded
    void raiseIfAny() const;

    [[nodiscard]] const char* what() const noexcept override;

private:
    std::vector<Error> errors_;
    std::string message_;

    void rebuildMessage();
};

void to_json(nlohmann::json& j, const Error& e);
void to_json(nlohmann::json& j, const ValidationErrors& e);

}
