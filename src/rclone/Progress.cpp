#include "rclone/Progress.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <fmt/core.h>

namespace cs::rclone {

namespace {

std::string trim(const std::string& s) {
    const auto first = std::ranges::find_if_not(s, [](const unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(), [](const unsigned char c) { return std::isspace(c); }).base();
    if (first >= last) return {};
    return {first, last};
}

}

std::optional<std::string> parseTransferred(const std::string& line) {
    static const std::regex re(R"(Transferred:\s*(.+)$)");

    std::smatch m;
    if (!std::regex_search(line, m, re)) return std::nullopt;

    auto transferred = trim(m[1].str());
    if (transferred.empty()) return std::nullopt;
    if (std::ranges::all_of(transferred, [](const unsigned char c) { return std::isdigit(c); })) return std::nullopt;
    return transferred;
}

Diagnostics::Diagnostics(const size_t tailLines, const size_t maxErrorLines)
    : tailLines_(tailLines), maxErrorLines_(maxErrorLines) {}

void Diagnostics::add(const std::string& line) {
    if (line.find("ERROR") != std::string::npos || line.find("Failed") != std::string::npos) {
        if (errors_.size() < maxErrorLines_) errors_.push_back(line);
        else ++droppedErrors_;
    }

    if (line.empty() || tailLines_ == 0) return;
    if (tail_.size() == tailLines_) tail_.pop_front();
    tail_.push_back(line);
}

std::string Diagnostics::text() const {
    std::string out;
    const auto append = [&out](const std::string& l) {
        if (!out.empty()) out += '\n';
        out += l;
    };

    if (!errors_.empty()) {
        for (const auto& l : errors_) append(l);
        if (droppedErrors_ > 0) append(fmt::format("({} more error lines in the job log)", droppedErrors_));
        return out;
    }

    for (const auto& l : tail_) append(l);
    return out.empty() ? "rclone failed" : out;
}

std::string diagnostics(const std::vector<std::string>& lines, const size_t tailLines) {
    Diagnostics d(tailLines);
    for (const auto& l : lines) d.add(l);
    return d.text();
}

}
