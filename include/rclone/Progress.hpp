#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace cs::rclone {

// Text after "Transferred:" in an rclone stats line, trimmed. Lines whose
// capture is a bare number (the file count line) yield nullopt.
std::optional<std::string> parseTransferred(const std::string& line);

// Collects what a failed run should report while rclone is still talking:
// the first ERROR / Failed lines and the last few lines, nothing else.
class Diagnostics {
public:
    static constexpr size_t DEFAULT_TAIL_LINES = 10;
    static constexpr size_t MAX_ERROR_LINES = 50;

    explicit Diagnostics(size_t tailLines = DEFAULT_TAIL_LINES, size_t maxErrorLines = MAX_ERROR_LINES);

    void add(const std::string& line);

    // ERROR / Failed lines, or the last lines when there were none
    [[nodiscard]] std::string text() const;

private:
    size_t tailLines_;
    size_t maxErrorLines_;
    std::vector<std::string> errors_;
    size_t droppedErrors_{0};
    std::deque<std::string> tail_;
};

std::string diagnostics(const std::vector<std::string>& lines, size_t tailLines = Diagnostics::DEFAULT_TAIL_LINES);

}
